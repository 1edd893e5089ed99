#include "vrmi/assets/TextureConverter.hpp"

#include "vrmi/core/errors.hpp"
#include "vrmi/core/profiler.hpp"

#include <algorithm>
#include <cmath>

namespace vrmi::assets {

    namespace {
        constexpr glm::u8vec4 kWhite{255, 255, 255, 255};

        float unorm(uint8_t v) {
            return static_cast<float>(v) / 255.0f;
        }

        uint8_t toByte(float v) {
            return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        }

        // Nearest texel of src for the texel (x, y) of a width x height target
        glm::u8vec4 sampleNearest(const runtime::TextureData& src, uint32_t x, uint32_t y,
                                  uint32_t width, uint32_t height) {
            if (src.width == width && src.height == height) {
                return src.texel(x, y);
            }
            const auto sx = static_cast<uint32_t>(static_cast<uint64_t>(x) * src.width / width);
            const auto sy = static_cast<uint32_t>(static_cast<uint64_t>(y) * src.height / height);
            return src.texel(std::min(sx, src.width - 1), std::min(sy, src.height - 1));
        }

        void writeTexel(runtime::TextureData& dst, uint32_t x, uint32_t y, glm::u8vec4 v) {
            const size_t offset = (static_cast<size_t>(y) * dst.width + x) * 4;
            dst.rgba[offset] = v.r;
            dst.rgba[offset + 1] = v.g;
            dst.rgba[offset + 2] = v.b;
            dst.rgba[offset + 3] = v.a;
        }
    } // namespace

    runtime::TextureData TextureConverter::normalRepack(const runtime::TextureData& source) {
        VRMI_PROFILE_FUNCTION();

        runtime::TextureData result;
        result.width = source.width;
        result.height = source.height;
        result.colorSpace = runtime::ColorSpace::Linear;
        result.rgba.resize(source.rgba.size());

        for (uint32_t y = 0; y < source.height; ++y) {
            for (uint32_t x = 0; x < source.width; ++x) {
                const glm::u8vec4 src = source.texel(x, y);
                writeTexel(result, x, y, {255, src.g, 255, src.r});
            }
        }
        return result;
    }

    runtime::TextureData TextureConverter::packStandard(const runtime::TextureData* metallicRoughness,
                                                        const runtime::TextureData* occlusion,
                                                        float metallicFactor,
                                                        float roughnessFactor) {
        VRMI_PROFILE_FUNCTION();

        const runtime::TextureData* sizeSource = metallicRoughness != nullptr ? metallicRoughness : occlusion;
        if (sizeSource == nullptr) {
            throw core::ConfigurationError("standard map conversion requires a metallic-roughness or occlusion source");
        }

        runtime::TextureData result;
        result.width = sizeSource->width;
        result.height = sizeSource->height;
        result.colorSpace = runtime::ColorSpace::Linear;
        result.rgba.resize(static_cast<size_t>(result.width) * result.height * 4);

        for (uint32_t y = 0; y < result.height; ++y) {
            for (uint32_t x = 0; x < result.width; ++x) {
                const glm::u8vec4 mr = metallicRoughness != nullptr ? metallicRoughness->texel(x, y) : kWhite;
                const glm::u8vec4 occ = occlusion != nullptr
                    ? sampleNearest(*occlusion, x, y, result.width, result.height)
                    : kWhite;

                const float metallic = unorm(mr.b) * metallicFactor;
                const float smoothness = 1.0f - std::clamp(unorm(mr.g) * roughnessFactor, 0.0f, 1.0f);
                writeTexel(result, x, y, {toByte(metallic), occ.r, 0, toByte(smoothness)});
            }
        }
        return result;
    }

} // namespace vrmi::assets
