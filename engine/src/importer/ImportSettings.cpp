#include "vrmi/importer/ImportSettings.hpp"

#include "vrmi/core/cvar.hpp"

#include <algorithm>

namespace vrmi::importer {

AUTO_CVAR_INT(import_yield_every, "Mesh groups / renderers built between two yields", 1, core::CVarFlags::save);
AUTO_CVAR_BOOL(import_verbose_cache, "Log every texture cache hit and miss at info level", false, core::CVarFlags::save);
AUTO_CVAR_INT(texture_blank_size, "Edge of the texture created for missing image data", 2, core::CVarFlags::save);
AUTO_CVAR_STRING(import_root_name, "Name given to the root of an imported avatar", "VRM1", core::CVarFlags::save);

ImportSettings ImportSettings::fromCVars() {
    ImportSettings settings;
    settings.yieldEvery = static_cast<uint32_t>(std::max(1, import_yield_every.get()));
    settings.verboseCache = import_verbose_cache.get();
    settings.textureBlankSize = static_cast<uint32_t>(std::max(2, texture_blank_size.get()));
    settings.rootName = import_root_name.get();
    if (settings.rootName.empty()) {
        settings.rootName = "VRM1";
    }
    return settings;
}

} // namespace vrmi::importer
