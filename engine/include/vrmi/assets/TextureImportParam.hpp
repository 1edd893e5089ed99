#pragma once

#include "vrmi/runtime/runtime_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vrmi::assets {

    enum class TextureImportKind : uint8_t {
        sRGB,        // color data, decoded with perceptual interpretation
        Linear,      // non-color data used as-is
        NormalMap,   // repacked for the engine's normal-map layout
        StandardMap  // metallic-roughness + occlusion packed into one texture
    };

    std::string_view toString(TextureImportKind kind);

    /**
     * @brief Identity of a texture request
     *
     * gltfName is the raw key of the source image. convertedName is the key of
     * the derived texture for NormalMap / StandardMap and equals gltfName for
     * the other kinds.
     */
    struct TextureImportName {
        TextureImportKind kind = TextureImportKind::sRGB;
        std::string gltfName;
        std::string convertedName;

        // Key matched against the host's external texture map
        [[nodiscard]] const std::string& extractKey() const {
            return kind == TextureImportKind::StandardMap ? convertedName : gltfName;
        }

        // Name given to the resulting texture. The cache identifies entries
        // by TextureCacheKey, not by this string.
        [[nodiscard]] const std::string& resultName() const {
            return kind == TextureImportKind::NormalMap || kind == TextureImportKind::StandardMap
                ? convertedName
                : gltfName;
        }

        static TextureImportName make(TextureImportKind kind, std::string gltfName,
                                      std::string_view occlusionName = {});
    };

    struct WrapEntry {
        runtime::SamplerWrapType type = runtime::SamplerWrapType::All;
        runtime::WrapMode mode = runtime::WrapMode::Repeat;

        bool operator==(const WrapEntry&) const = default;
    };

    // Either a single All entry or independent U/V/W entries. An empty list
    // keeps the engine's default wrapping.
    struct SamplerParam {
        std::vector<WrapEntry> wrapModes;
        runtime::FilterMode filter = runtime::FilterMode::Bilinear;
    };

    // Produces the encoded image bytes. Empty means "no data".
    using ByteSource = std::function<std::vector<uint8_t>()>;

    struct TextureSource {
        std::string name; // raw key the decoded base texture is cached under
        ByteSource bytes;
    };

    struct TextureImportParam {
        TextureImportName name;
        SamplerParam sampler;

        // Image source. For StandardMap this is the metallic-roughness image.
        std::optional<TextureSource> source0;
        // Occlusion image, StandardMap only
        std::optional<TextureSource> source1;

        float metallicFactor = 1.0f;
        float roughnessFactor = 1.0f;

        [[nodiscard]] TextureImportKind kind() const { return name.kind; }
    };

} // namespace vrmi::assets
