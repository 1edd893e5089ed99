#pragma once

#include "vrmi/core/result.hpp"
#include "vrmi/scene/Model.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include <fastgltf/types.hpp>
#include <nlohmann/json_fwd.hpp>

namespace vrmi::assets {

    // A parsed file: the source model plus the glTF asset its textures are read from
    struct VrmDocument {
        scene::Model model;
        std::shared_ptr<const fastgltf::Asset> gltf; // null for models assembled in code
        std::filesystem::path baseDir;
    };

    /**
     * @brief Reads .vrm / .glb / .gltf files into a VrmDocument
     *
     * glTF node i becomes model node i. A synthetic root, named after the
     * asset, parents the scene's root nodes. The VRMC_vrm block is optional
     * here; the importer rejects documents without it.
     */
    class VrmReader {
    public:
        static core::Result<VrmDocument> readFile(const std::filesystem::path& path);

        static core::Result<VrmDocument> readBytes(std::span<const std::uint8_t> bytes,
                                                   const std::filesystem::path& baseDir,
                                                   std::string name);

        // JSON text of a GLB container, or the bytes themselves for .gltf
        static std::optional<std::string> extractJson(std::span<const std::uint8_t> bytes);

        static std::optional<scene::VrmExtension> parseVrmExtension(const nlohmann::json& document);

        // Throws cpptrace::out_of_range when a child, scene root or skin names a
        // node the file does not declare
        static scene::Model buildModel(const fastgltf::Asset& gltf, const nlohmann::json& document,
                                       std::string name);
    };

} // namespace vrmi::assets
