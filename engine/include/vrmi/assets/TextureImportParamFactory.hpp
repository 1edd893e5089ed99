#pragma once

#include "vrmi/assets/TextureImportParam.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <fastgltf/types.hpp>

namespace vrmi::assets {

    /**
     * @brief Builds texture requests for the textures of a parsed glTF asset
     *
     * The asset must outlive every request created here; byte sources read
     * from it lazily.
     */
    class TextureImportParamFactory {
    public:
        TextureImportParamFactory(const fastgltf::Asset& gltf, std::filesystem::path baseDir);

        TextureImportParam createSRGB(size_t textureIndex) const;
        TextureImportParam createLinear(size_t textureIndex) const;
        TextureImportParam createNormal(size_t textureIndex) const;
        TextureImportParam createStandard(std::optional<size_t> metallicRoughnessIndex,
                                          std::optional<size_t> occlusionIndex,
                                          float metallicFactor,
                                          float roughnessFactor) const;

        // Throws cpptrace::out_of_range for a bad texture index or image source
        TextureImportName createName(size_t textureIndex, TextureImportKind kind) const;
        SamplerParam createSampler(size_t textureIndex) const;

        const std::string& rawName(size_t textureIndex) const;

        static std::vector<WrapEntry> toWrapEntries(fastgltf::Wrap wrapS, fastgltf::Wrap wrapT);
        static runtime::WrapMode toWrapMode(fastgltf::Wrap wrap);
        static runtime::FilterMode toFilterMode(const fastgltf::Optional<fastgltf::Filter>& filter);

    private:
        size_t checkedImageIndex(size_t textureIndex) const;
        TextureSource createSource(size_t textureIndex) const;
        TextureImportParam createSingle(size_t textureIndex, TextureImportKind kind) const;

        const fastgltf::Asset* m_gltf;
        std::filesystem::path m_baseDir;
        std::vector<std::string> m_rawNames;
    };

} // namespace vrmi::assets
