#include "vrmi/assets/VrmReader.hpp"
#include "vrmi/core/Timer.h"
#include "vrmi/core/cvar.hpp"
#include "vrmi/core/logger.hpp"
#include "vrmi/importer/ImportOrchestrator.hpp"
#include "vrmi/runtime/RuntimeFactory.hpp"
#include "vrmi/runtime/null/NullRuntimeDevice.hpp"

#include <cpptrace/cpptrace.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace vrmi;

namespace {

struct Arguments {
    std::filesystem::path input;
    std::filesystem::path ini;
    double fps = 0.0;
};

bool parseArguments(int argc, char** argv, Arguments& args)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--ini" && i + 1 < argc)
        {
            args.ini = argv[++i];
        }
        else if (arg == "--fps" && i + 1 < argc)
        {
            args.fps = std::atof(argv[++i]);
        }
        else if (!arg.starts_with("--") && args.input.empty())
        {
            args.input = arg;
        }
        else
        {
            return false;
        }
    }
    return !args.input.empty();
}

void printStatistics(const runtime::NullRuntimeDevice& device, const scene::ModelAsset& asset,
                     const assets::TextureFactory& textures, uint32_t steps, double ms)
{
    const auto& stats = textures.stats();
    const auto& avatar = device.avatar(asset.avatar);
    size_t boundBones = 0;
    for (const auto& binding : avatar.bindings)
    {
        if (binding.bone != scene::HumanoidBone::Unknown)
        {
            ++boundBones;
        }
    }

    std::cout << "Imported '" << asset.name << "' in " << steps << " steps (" << ms << " ms)\n"
              << "  transforms: " << device.transformCount() << "\n"
              << "  meshes:     " << device.meshCount() << "\n"
              << "  renderers:  " << asset.map.renderers().size() << "\n"
              << "  materials:  " << asset.materials.size() << "\n"
              << "  textures:   " << device.liveTextureCount() << " (" << stats.decodes << " decoded, "
              << stats.conversions << " converted, " << stats.hits << " cache hits)\n"
              << "  humanoid:   " << boundBones << " of " << scene::kHumanoidBoneCount << " bones bound\n";
}

} // namespace

int main(int argc, char** argv)
{
    Arguments args;
    if (!parseArguments(argc, argv, args))
    {
        std::cerr << "Usage: vrmImport <model.vrm> [--ini settings.ini] [--fps N]\n";
        return 1;
    }

    core::Logger::init();

    int result = 0;
    try
    {
        if (!args.ini.empty())
        {
            core::CVarSystem::loadFromIni(args.ini);
        }

        auto document = assets::VrmReader::readFile(args.input);
        if (!document)
        {
            throw cpptrace::runtime_error(document.error());
        }

        auto device = runtime::RuntimeFactory::createDevice(runtime::RuntimeBackend::Null);
        auto& nullDevice = static_cast<runtime::NullRuntimeDevice&>(*device);

        core::Timer timer;
        importer::ImportOrchestrator importer(*device, std::move(*document),
                                              importer::ImportSettings::fromCVars());

        std::unique_ptr<importer::AwaitCaller> caller;
        if (args.fps > 0.0)
        {
            caller = std::make_unique<importer::FramePacedAwaitCaller>(args.fps);
        }
        else
        {
            caller = std::make_unique<importer::ImmediateAwaitCaller>();
        }

        if (!importer.runToCompletion(*caller))
        {
            throw cpptrace::runtime_error("import stopped before completion");
        }
        const double ms = timer.elapsedMs();

        // The avatar keeps every texture its materials reference
        std::vector<TextureHandle> owned;
        importer.textureFactory().transferOwnership([&owned](TextureHandle texture) {
            owned.push_back(texture);
            return true;
        });

        const auto asset = importer.takeModelAsset();
        printStatistics(nullDevice, asset, importer.textureFactory(), importer.stepCount(), ms);
    }
    catch (const std::exception& e)
    {
        core::Logger::error("Import failed: {}", e.what());
        result = 1;
    }

    core::Logger::shutdown();
    return result;
}
