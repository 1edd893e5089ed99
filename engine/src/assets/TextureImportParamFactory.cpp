#include "vrmi/assets/TextureImportParamFactory.hpp"

#include "vrmi/assets/GltfUtils.hpp"
#include "vrmi/core/common.hpp"
#include "vrmi/core/errors.hpp"

#include <cpptrace/cpptrace.hpp>
#include <unordered_map>

namespace vrmi::assets {

    TextureImportParamFactory::TextureImportParamFactory(const fastgltf::Asset& gltf,
                                                         std::filesystem::path baseDir)
        : m_gltf(&gltf), m_baseDir(std::move(baseDir)) {
        std::unordered_map<std::string, uint32_t> seen;
        m_rawNames.reserve(gltf.textures.size());

        for (size_t i = 0; i < gltf.textures.size(); ++i) {
            const auto& texture = gltf.textures[i];
            std::string name(texture.name);
            if (name.empty()) {
                const auto image = pickImageIndex(texture);
                if (image && *image < gltf.images.size()) {
                    name = gltf.images[*image].name;
                }
            }
            if (name.empty()) {
                name = fmt::format("texture_{}", i);
            }

            // Raw names are cache keys and must not collide
            const uint32_t count = seen[name]++;
            if (count > 0) {
                name = fmt::format("{}_{}", name, count);
            }
            m_rawNames.push_back(std::move(name));
        }
    }

    const std::string& TextureImportParamFactory::rawName(size_t textureIndex) const {
        if (textureIndex >= m_rawNames.size()) {
            throw cpptrace::out_of_range(fmt::format("texture index {} out of range ({} textures)",
                                                     textureIndex, m_rawNames.size()));
        }
        return m_rawNames[textureIndex];
    }

    size_t TextureImportParamFactory::checkedImageIndex(size_t textureIndex) const {
        const auto& texture = m_gltf->textures[textureIndex];
        const auto image = pickImageIndex(texture);
        if (!image || *image >= m_gltf->images.size()) {
            throw cpptrace::out_of_range(
                fmt::format("texture {} has no valid image source ({} images)", textureIndex,
                            m_gltf->images.size()));
        }
        return *image;
    }

    TextureImportName TextureImportParamFactory::createName(size_t textureIndex, TextureImportKind kind) const {
        const std::string& name = rawName(textureIndex);
        checkedImageIndex(textureIndex);
        return TextureImportName::make(kind, name);
    }

    SamplerParam TextureImportParamFactory::createSampler(size_t textureIndex) const {
        const auto& texture = m_gltf->textures[textureIndex];
        if (!texture.samplerIndex.has_value() || texture.samplerIndex.value() >= m_gltf->samplers.size()) {
            return SamplerParam{};
        }

        const auto& sampler = m_gltf->samplers[texture.samplerIndex.value()];
        SamplerParam param;
        param.wrapModes = toWrapEntries(sampler.wrapS, sampler.wrapT);
        param.filter = toFilterMode(sampler.minFilter);
        return param;
    }

    TextureSource TextureImportParamFactory::createSource(size_t textureIndex) const {
        const size_t imageIndex = checkedImageIndex(textureIndex);
        const fastgltf::Asset* gltf = m_gltf;
        std::filesystem::path baseDir = m_baseDir;

        TextureSource source;
        source.name = rawName(textureIndex);
        source.bytes = [gltf, imageIndex, baseDir]() {
            return extractImageBytes(*gltf, gltf->images[imageIndex], baseDir);
        };
        return source;
    }

    TextureImportParam TextureImportParamFactory::createSingle(size_t textureIndex, TextureImportKind kind) const {
        TextureImportParam param;
        param.name = createName(textureIndex, kind);
        param.sampler = createSampler(textureIndex);
        param.source0 = createSource(textureIndex);
        return param;
    }

    TextureImportParam TextureImportParamFactory::createSRGB(size_t textureIndex) const {
        return createSingle(textureIndex, TextureImportKind::sRGB);
    }

    TextureImportParam TextureImportParamFactory::createLinear(size_t textureIndex) const {
        return createSingle(textureIndex, TextureImportKind::Linear);
    }

    TextureImportParam TextureImportParamFactory::createNormal(size_t textureIndex) const {
        return createSingle(textureIndex, TextureImportKind::NormalMap);
    }

    TextureImportParam TextureImportParamFactory::createStandard(std::optional<size_t> metallicRoughnessIndex,
                                                                 std::optional<size_t> occlusionIndex,
                                                                 float metallicFactor,
                                                                 float roughnessFactor) const {
        TextureImportParam param;
        param.metallicFactor = metallicFactor;
        param.roughnessFactor = roughnessFactor;

        std::string gltfName;
        std::string occlusionName;

        if (metallicRoughnessIndex) {
            createName(*metallicRoughnessIndex, TextureImportKind::StandardMap);
            gltfName = rawName(*metallicRoughnessIndex);
            param.sampler = createSampler(*metallicRoughnessIndex);
            param.source0 = createSource(*metallicRoughnessIndex);
        }
        if (occlusionIndex) {
            createName(*occlusionIndex, TextureImportKind::StandardMap);
            occlusionName = rawName(*occlusionIndex);
            if (gltfName.empty()) {
                gltfName = occlusionName;
            }
            // The occlusion sampler wins when both are present
            param.sampler = createSampler(*occlusionIndex);
            param.source1 = createSource(*occlusionIndex);
        }

        param.name = TextureImportName::make(TextureImportKind::StandardMap, std::move(gltfName), occlusionName);
        return param;
    }

    std::vector<WrapEntry> TextureImportParamFactory::toWrapEntries(fastgltf::Wrap wrapS, fastgltf::Wrap wrapT) {
        if (wrapS == wrapT) {
            return {WrapEntry{runtime::SamplerWrapType::All, toWrapMode(wrapS)}};
        }
        return {
            WrapEntry{runtime::SamplerWrapType::U, toWrapMode(wrapS)},
            WrapEntry{runtime::SamplerWrapType::V, toWrapMode(wrapT)},
        };
    }

    runtime::WrapMode TextureImportParamFactory::toWrapMode(fastgltf::Wrap wrap) {
        switch (wrap) {
        case fastgltf::Wrap::Repeat:
            return runtime::WrapMode::Repeat;
        case fastgltf::Wrap::ClampToEdge:
            return runtime::WrapMode::Clamp;
        case fastgltf::Wrap::MirroredRepeat:
            return runtime::WrapMode::Mirror;
        }
        throw core::ConfigurationError(fmt::format("unrecognized glTF wrap mode {}", util::underlying(wrap)));
    }

    runtime::FilterMode TextureImportParamFactory::toFilterMode(const fastgltf::Optional<fastgltf::Filter>& filter) {
        if (!filter.has_value()) {
            return runtime::FilterMode::Bilinear;
        }
        switch (filter.value()) {
        case fastgltf::Filter::Nearest:
        case fastgltf::Filter::NearestMipMapNearest:
        case fastgltf::Filter::NearestMipMapLinear:
            return runtime::FilterMode::Point;
        case fastgltf::Filter::Linear:
        case fastgltf::Filter::LinearMipMapNearest:
            return runtime::FilterMode::Bilinear;
        case fastgltf::Filter::LinearMipMapLinear:
            return runtime::FilterMode::Trilinear;
        }
        throw core::ConfigurationError(
            fmt::format("unrecognized glTF filter mode {}", util::underlying(filter.value())));
    }

} // namespace vrmi::assets
