#include "vrmi/assets/TextureDecoder.hpp"

#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <climits>
#include <cstring>

namespace vrmi::assets {

    runtime::TextureData TextureDecoder::blank(uint32_t size, runtime::ColorSpace colorSpace) {
        const uint32_t edge = std::max(size, kMinBlankSize);
        runtime::TextureData data;
        data.width = edge;
        data.height = edge;
        data.colorSpace = colorSpace;
        data.rgba.assign(static_cast<size_t>(edge) * edge * 4, 0xFF);
        return data;
    }

    runtime::TextureData TextureDecoder::decode(std::span<const uint8_t> bytes,
                                                runtime::ColorSpace colorSpace,
                                                uint32_t blankSize) {
        VRMI_PROFILE_FUNCTION();

        if (bytes.empty()) {
            return blank(blankSize, colorSpace);
        }
        if (bytes.size() > static_cast<size_t>(INT_MAX)) {
            core::Logger::Asset.warn("Image of {} bytes is too large to decode, using blank", bytes.size());
            return blank(blankSize, colorSpace);
        }

        int w = 0;
        int h = 0;
        int c = 0;
        stbi_uc* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &w, &h, &c, STBI_rgb_alpha);
        if (pixels == nullptr) {
            core::Logger::Asset.warn("Failed to decode image ({} bytes): {}", bytes.size(),
                                     stbi_failure_reason());
            return blank(blankSize, colorSpace);
        }

        runtime::TextureData data;
        data.width = static_cast<uint32_t>(w);
        data.height = static_cast<uint32_t>(h);
        data.colorSpace = colorSpace;

        const size_t size = static_cast<size_t>(data.width) * data.height * 4;
        data.rgba.resize(size);
        std::memcpy(data.rgba.data(), pixels, size);

        stbi_image_free(pixels);
        return data;
    }

} // namespace vrmi::assets
