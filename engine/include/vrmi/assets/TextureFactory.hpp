#pragma once

#include "vrmi/assets/TextureImportParam.hpp"
#include "vrmi/runtime/RuntimeDevice.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

namespace vrmi::assets {

    struct TextureLoadInfo {
        TextureHandle texture;
        bool used = false;     // referenced by at least one material
        bool external = false; // supplied by the host

        // Only sub-assets are owned by the factory
        [[nodiscard]] bool isSubAsset() const { return used && !external; }
    };

    enum class TextureCacheSlot : uint8_t {
        Source,     // decoded image, shared by sRGB, Linear and conversion inputs
        NormalMap,
        StandardMap
    };

    /**
     * @brief Identity of a cached texture
     *
     * Decoded images are keyed by their raw name, converted textures by their
     * slot and the raw names of their inputs. Converted names never take part.
     */
    struct TextureCacheKey {
        TextureCacheSlot slot = TextureCacheSlot::Source;
        std::string source;    // raw key of the image, or of the metallic-roughness input
        std::string occlusion; // raw key of the occlusion input, StandardMap only

        static TextureCacheKey of(const TextureImportParam& param);

        auto operator<=>(const TextureCacheKey&) const = default;
    };

    // Host callback deciding whether it takes over a texture's lifetime
    using TakeOwnershipFunc = std::function<bool(TextureHandle)>;

    using ExternalTextureMap = std::unordered_map<std::string, TextureHandle>;

    /**
     * @brief Decodes, converts and caches the textures of one import session
     *
     * Requests are deduplicated by their identity key. Textures the factory
     * created are destroyed by dispose() (also run by the destructor) unless
     * their ownership was transferred to the host first.
     */
    class TextureFactory {
    public:
        struct Settings {
            uint32_t blankSize = 2;    // edge of the texture made for empty byte sources
            bool verboseCache = false; // log hits and misses at info instead of debug
        };

        // Hits and misses count requests, not the base images a conversion reads
        struct Stats {
            uint32_t hits = 0;
            uint32_t misses = 0;
            uint32_t externalHits = 0;
            uint32_t decodes = 0;
            uint32_t conversions = 0;
        };

        explicit TextureFactory(runtime::RuntimeDevice& device, ExternalTextureMap externalMap = {},
                                Settings settings = {});
        ~TextureFactory();

        TextureFactory(const TextureFactory&) = delete;
        TextureFactory& operator=(const TextureFactory&) = delete;

        TextureHandle getTexture(const TextureImportParam& param);

        void dispose();

        // Offers every used, non-external entry to take(). Accepted entries
        // leave the cache and are never destroyed by it.
        void transferOwnership(const TakeOwnershipFunc& take);

        [[nodiscard]] const std::map<TextureCacheKey, TextureLoadInfo>& textures() const { return m_textureCache; }
        [[nodiscard]] const TextureLoadInfo* find(const TextureCacheKey& key) const;
        // Decoded image by raw key
        [[nodiscard]] const TextureLoadInfo* find(const std::string& rawKey) const;
        [[nodiscard]] const ExternalTextureMap& externalMap() const { return m_externalMap; }
        [[nodiscard]] const Stats& stats() const { return m_stats; }

        static void applySampler(runtime::RuntimeDevice& device, TextureHandle texture,
                                 const SamplerParam& sampler);

    private:
        TextureLoadInfo& getOrCreateBaseTexture(const TextureSource& source, const SamplerParam& sampler,
                                                runtime::ColorSpace colorSpace, bool used);
        TextureHandle insertConverted(const TextureImportParam& param, TextureCacheKey key,
                                      runtime::TextureData data);
        TextureHandle findCached(const TextureImportParam& param, const TextureCacheKey& key);
        void logCache(std::string_view what, std::string_view name) const;

        runtime::RuntimeDevice& m_device;
        ExternalTextureMap m_externalMap;
        Settings m_settings;
        std::map<TextureCacheKey, TextureLoadInfo> m_textureCache;
        Stats m_stats;
    };

} // namespace vrmi::assets
