#include <doctest/doctest.h>

#include "vrmi/core/cvar.hpp"
#include "vrmi/importer/ImportSettings.hpp"

#include <filesystem>
#include <fstream>

using namespace vrmi;

namespace {

// Restores a console variable when the test ends
struct CVarGuard {
    core::ICVar* cvar;
    std::string saved;

    explicit CVarGuard(const std::string& name) : cvar(core::CVarSystem::find(name)) {
        REQUIRE(cvar != nullptr);
        saved = cvar->toString();
    }
    ~CVarGuard() { cvar->setFromString(saved); }
};

} // namespace

TEST_CASE("Import settings come from console variables") {
    CVarGuard yield("import_yield_every");
    CVarGuard blank("texture_blank_size");
    CVarGuard rootName("import_root_name");
    CVarGuard verbose("import_verbose_cache");

    SUBCASE("Defaults") {
        const auto settings = importer::ImportSettings::fromCVars();
        CHECK(settings.yieldEvery == 1);
        CHECK(settings.textureBlankSize == 2);
        CHECK(settings.rootName == "VRM1");
        CHECK_FALSE(settings.verboseCache);
    }

    SUBCASE("Overrides and clamping") {
        yield.cvar->setFromString("4");
        blank.cvar->setFromString("0");
        rootName.cvar->setFromString("");
        verbose.cvar->setFromString("true");

        const auto settings = importer::ImportSettings::fromCVars();
        CHECK(settings.yieldEvery == 4);
        CHECK(settings.textureBlankSize == 2);
        CHECK(settings.rootName == "VRM1");
        CHECK(settings.verboseCache);

        yield.cvar->setFromString("-3");
        CHECK(importer::ImportSettings::fromCVars().yieldEvery == 1);
    }

    SUBCASE("Loading an ini file") {
        const auto path = std::filesystem::temp_directory_path() / "vrmi_cvar_test.ini";
        {
            std::ofstream f(path, std::ios::trunc);
            f << "; import settings\n";
            f << "import_yield_every=3\n";
            f << "import_root_name=Hero\n";
            f << "not_a_cvar=1\n";
            f << "garbage line\n";
        }

        CHECK(core::CVarSystem::loadFromIni(path) == 2);
        const auto settings = importer::ImportSettings::fromCVars();
        CHECK(settings.yieldEvery == 3);
        CHECK(settings.rootName == "Hero");

        std::filesystem::remove(path);
    }

    SUBCASE("Bad values are rejected without throwing") {
        const auto path = std::filesystem::temp_directory_path() / "vrmi_cvar_bad.ini";
        {
            std::ofstream f(path, std::ios::trunc);
            f << "import_yield_every=lots\n";
        }
        CHECK(core::CVarSystem::loadFromIni(path) == 0);
        CHECK(importer::ImportSettings::fromCVars().yieldEvery == 1);
        std::filesystem::remove(path);
    }
}
