#pragma once

#include "vrmi/runtime/runtime_types.hpp"

namespace vrmi::assets {

    struct TextureConverter {
        // (R, G, B, A) = (1, src.G, 1, src.R), linear
        static runtime::TextureData normalRepack(const runtime::TextureData& source);

        // R = metallic, G = occlusion, B = 0, A = smoothness.
        // Absent inputs read as white. Throws ConfigurationError when both
        // inputs are absent.
        static runtime::TextureData packStandard(const runtime::TextureData* metallicRoughness,
                                                 const runtime::TextureData* occlusion,
                                                 float metallicFactor,
                                                 float roughnessFactor);
    };

} // namespace vrmi::assets
