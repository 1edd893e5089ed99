#include "vrmi/assets/TextureFactory.hpp"

#include "vrmi/assets/TextureConverter.hpp"
#include "vrmi/assets/TextureDecoder.hpp"
#include "vrmi/core/common.hpp"
#include "vrmi/core/errors.hpp"

#include <vector>

namespace vrmi::assets {

    namespace {
        runtime::WrapMode checkedWrapMode(runtime::WrapMode mode) {
            switch (mode) {
            case runtime::WrapMode::Repeat:
            case runtime::WrapMode::Clamp:
            case runtime::WrapMode::Mirror:
                return mode;
            }
            throw core::ConfigurationError(
                fmt::format("unrecognized wrap mode {}", util::underlying(mode)));
        }

        runtime::FilterMode checkedFilterMode(runtime::FilterMode mode) {
            switch (mode) {
            case runtime::FilterMode::Point:
            case runtime::FilterMode::Bilinear:
            case runtime::FilterMode::Trilinear:
                return mode;
            }
            throw core::ConfigurationError(
                fmt::format("unrecognized filter mode {}", util::underlying(mode)));
        }

        const TextureSource& requireSource(const TextureImportParam& param) {
            if (!param.source0) {
                throw core::ConfigurationError(
                    fmt::format("texture request '{}' ({}) has no image source",
                                param.name.resultName(), toString(param.kind())));
            }
            return *param.source0;
        }
    } // namespace

    TextureFactory::TextureFactory(runtime::RuntimeDevice& device, ExternalTextureMap externalMap,
                                   Settings settings)
        : m_device(device), m_externalMap(std::move(externalMap)), m_settings(settings) {
        // Null entries in the host map are never matched
        std::erase_if(m_externalMap, [](const auto& kv) { return !kv.second.isValid(); });
    }

    TextureFactory::~TextureFactory() {
        dispose();
    }

    void TextureFactory::dispose() {
        uint32_t destroyed = 0;
        for (const auto& [key, info] : m_textureCache) {
            if (!info.external) {
                m_device.destroyTexture(info.texture);
                ++destroyed;
            }
        }
        if (!m_textureCache.empty()) {
            core::Logger::Asset.debug("TextureFactory disposed {} of {} cached textures", destroyed,
                                      m_textureCache.size());
        }
        m_textureCache.clear();
    }

    void TextureFactory::transferOwnership(const TakeOwnershipFunc& take) {
        std::vector<TextureCacheKey> taken;
        for (const auto& [key, info] : m_textureCache) {
            if (info.isSubAsset() && take(info.texture)) {
                taken.push_back(key);
            }
        }
        for (const auto& key : taken) {
            m_textureCache.erase(key);
        }
        core::Logger::Asset.debug("Transferred ownership of {} textures", taken.size());
    }

    TextureCacheKey TextureCacheKey::of(const TextureImportParam& param) {
        TextureCacheKey key;
        switch (param.kind()) {
        case TextureImportKind::NormalMap:
            key.slot = TextureCacheSlot::NormalMap;
            break;
        case TextureImportKind::StandardMap:
            key.slot = TextureCacheSlot::StandardMap;
            if (param.source1) {
                key.occlusion = param.source1->name;
            }
            break;
        default:
            break;
        }
        if (param.source0) {
            key.source = param.source0->name;
        }
        return key;
    }

    const TextureLoadInfo* TextureFactory::find(const TextureCacheKey& key) const {
        auto it = m_textureCache.find(key);
        return it != m_textureCache.end() ? &it->second : nullptr;
    }

    const TextureLoadInfo* TextureFactory::find(const std::string& rawKey) const {
        return find(TextureCacheKey{TextureCacheSlot::Source, rawKey, {}});
    }

    TextureHandle TextureFactory::getTexture(const TextureImportParam& param) {
        VRMI_PROFILE_FUNCTION();

        if ((param.source0 || param.source1) && !m_externalMap.empty()) {
            auto it = m_externalMap.find(param.name.extractKey());
            if (it != m_externalMap.end()) {
                ++m_stats.externalHits;
                logCache("external", it->first);
                return it->second;
            }
        }

        switch (param.kind()) {
        case TextureImportKind::NormalMap: {
            const TextureSource& source = requireSource(param);
            auto key = TextureCacheKey::of(param);
            if (const TextureHandle cached = findCached(param, key); cached.isValid()) {
                return cached;
            }

            const TextureHandle base =
                getOrCreateBaseTexture(source, param.sampler, runtime::ColorSpace::Linear, false).texture;
            return insertConverted(param, std::move(key), TextureConverter::normalRepack(m_device.textureData(base)));
        }

        case TextureImportKind::StandardMap: {
            auto key = TextureCacheKey::of(param);
            if (const TextureHandle cached = findCached(param, key); cached.isValid()) {
                return cached;
            }

            TextureHandle metallicRoughness;
            if (param.source0) {
                metallicRoughness =
                    getOrCreateBaseTexture(*param.source0, param.sampler, runtime::ColorSpace::Linear, false)
                        .texture;
            }
            TextureHandle occlusion;
            if (param.source1) {
                occlusion =
                    getOrCreateBaseTexture(*param.source1, param.sampler, runtime::ColorSpace::Linear, false)
                        .texture;
            }

            // Fetch texel data only after both bases exist; creation may move it.
            const runtime::TextureData* mrData =
                metallicRoughness.isValid() ? &m_device.textureData(metallicRoughness) : nullptr;
            const runtime::TextureData* occData =
                occlusion.isValid() ? &m_device.textureData(occlusion) : nullptr;
            return insertConverted(param, std::move(key),
                                   TextureConverter::packStandard(mrData, occData, param.metallicFactor,
                                                                  param.roughnessFactor));
        }

        case TextureImportKind::Linear:
        case TextureImportKind::sRGB: {
            const TextureSource& source = requireSource(param);
            if (find(source.name) != nullptr) {
                ++m_stats.hits;
            } else {
                ++m_stats.misses;
            }
            const auto colorSpace = param.kind() == TextureImportKind::sRGB ? runtime::ColorSpace::sRGB
                                                                            : runtime::ColorSpace::Linear;
            return getOrCreateBaseTexture(source, param.sampler, colorSpace, true).texture;
        }
        }

        throw core::NotImplementedError(
            fmt::format("texture import kind {}", util::underlying(param.kind())));
    }

    TextureHandle TextureFactory::findCached(const TextureImportParam& param, const TextureCacheKey& key) {
        if (const auto* info = find(key)) {
            ++m_stats.hits;
            logCache("hit", param.name.resultName());
            return info->texture;
        }
        ++m_stats.misses;
        logCache("miss", param.name.resultName());
        return {};
    }

    TextureLoadInfo& TextureFactory::getOrCreateBaseTexture(const TextureSource& source,
                                                            const SamplerParam& sampler,
                                                            runtime::ColorSpace colorSpace, bool used) {
        TextureCacheKey key{TextureCacheSlot::Source, source.name, {}};
        auto it = m_textureCache.find(key);
        if (it != m_textureCache.end()) {
            logCache("hit", source.name);
            if (used && !it->second.used) {
                // An intermediate became user-visible
                it->second.used = true;
            }
            return it->second;
        }

        logCache("miss", source.name);

        std::vector<uint8_t> bytes;
        if (source.bytes) {
            bytes = source.bytes();
        }

        runtime::TextureDescriptor desc;
        desc.name = source.name;
        desc.data = TextureDecoder::decode(bytes, colorSpace, m_settings.blankSize);
        ++m_stats.decodes;

        const TextureHandle texture = m_device.createTexture(desc);
        applySampler(m_device, texture, sampler);

        return m_textureCache.emplace(std::move(key), TextureLoadInfo{texture, used, false}).first->second;
    }

    TextureHandle TextureFactory::insertConverted(const TextureImportParam& param, TextureCacheKey key,
                                                  runtime::TextureData data) {
        runtime::TextureDescriptor desc;
        desc.name = param.name.resultName();
        desc.data = std::move(data);

        const TextureHandle texture = m_device.createTexture(desc);
        applySampler(m_device, texture, param.sampler);
        ++m_stats.conversions;

        m_textureCache.emplace(std::move(key), TextureLoadInfo{texture, true, false});
        return texture;
    }

    void TextureFactory::applySampler(runtime::RuntimeDevice& device, TextureHandle texture,
                                      const SamplerParam& sampler) {
        runtime::SamplerState state;
        bool hasAll = false;
        bool hasAxis = false;

        for (const auto& entry : sampler.wrapModes) {
            const runtime::WrapMode mode = checkedWrapMode(entry.mode);
            switch (entry.type) {
            case runtime::SamplerWrapType::All:
                hasAll = true;
                state.wrapU = mode;
                state.wrapV = mode;
                state.wrapW = mode;
                break;
            case runtime::SamplerWrapType::U:
                hasAxis = true;
                state.wrapU = mode;
                break;
            case runtime::SamplerWrapType::V:
                hasAxis = true;
                state.wrapV = mode;
                break;
            case runtime::SamplerWrapType::W:
                hasAxis = true;
                state.wrapW = mode;
                break;
            default:
                throw core::ConfigurationError(
                    fmt::format("unrecognized sampler wrap type {}", util::underlying(entry.type)));
            }
        }
        if (hasAll && hasAxis) {
            throw core::ConfigurationError("sampler mixes an All wrap entry with per-axis entries");
        }

        state.filter = checkedFilterMode(sampler.filter);
        device.setTextureSampler(texture, state);
    }

    void TextureFactory::logCache(std::string_view what, std::string_view name) const {
        if (m_settings.verboseCache) {
            core::Logger::Asset.info("texture cache {}: {}", what, name);
        } else {
            core::Logger::Asset.debug("texture cache {}: {}", what, name);
        }
    }

} // namespace vrmi::assets
