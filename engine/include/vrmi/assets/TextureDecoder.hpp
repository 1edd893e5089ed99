#pragma once

#include "vrmi/runtime/runtime_types.hpp"

#include <cstdint>
#include <span>

namespace vrmi::assets {

    class TextureDecoder {
    public:
        static constexpr uint32_t kMinBlankSize = 2;

        // Decodes PNG/JPEG/... bytes into RGBA8. Empty or undecodable input
        // yields a white blank of blankSize x blankSize; this never throws.
        static runtime::TextureData decode(std::span<const uint8_t> bytes,
                                           runtime::ColorSpace colorSpace,
                                           uint32_t blankSize = kMinBlankSize);

        static runtime::TextureData blank(uint32_t size, runtime::ColorSpace colorSpace);
    };

} // namespace vrmi::assets
