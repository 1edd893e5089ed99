#pragma once

#include <cstdint>
#include <string>

namespace vrmi::importer {

// Knobs of one import. fromCVars() snapshots the console variables
// (import_yield_every, import_verbose_cache, texture_blank_size,
// import_root_name); tests build the struct directly.
struct ImportSettings {
    uint32_t yieldEvery = 1;      // items processed between yields in the mesh and renderer passes
    bool verboseCache = false;
    uint32_t textureBlankSize = 2;
    std::string rootName = "VRM1";

    static ImportSettings fromCVars();
};

} // namespace vrmi::importer
