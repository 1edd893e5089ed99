#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/assets/TextureConverter.hpp"
#include "vrmi/core/errors.hpp"

using namespace vrmi;
using namespace vrmi::assets;

TEST_CASE("Normal repack swizzles into (1, G, 1, R)") {
    auto source = test::solidTexture(2, 1, {10, 20, 30, 40});
    source.colorSpace = runtime::ColorSpace::sRGB;

    auto result = TextureConverter::normalRepack(source);
    CHECK(result.width == 2);
    CHECK(result.height == 1);
    CHECK(result.colorSpace == runtime::ColorSpace::Linear);
    CHECK(result.texel(0, 0) == glm::u8vec4(255, 20, 255, 10));
    CHECK(result.texel(1, 0) == glm::u8vec4(255, 20, 255, 10));
}

TEST_CASE("Standard map packing") {
    // G = roughness, B = metallic
    const auto mr = test::solidTexture(2, 2, {0, 51, 255, 255});
    const auto occ = test::solidTexture(2, 2, {128, 0, 0, 255});

    SUBCASE("Metallic, occlusion and smoothness channels") {
        auto result = TextureConverter::packStandard(&mr, &occ, 1.0f, 1.0f);
        CHECK(result.width == 2);
        CHECK(result.colorSpace == runtime::ColorSpace::Linear);
        // smoothness = 1 - 0.2
        CHECK(result.texel(1, 1) == glm::u8vec4(255, 128, 0, 204));
    }

    SUBCASE("Factors scale metallic and roughness") {
        auto result = TextureConverter::packStandard(&mr, &occ, 0.5f, 5.0f);
        // roughness clamps to 1 -> smoothness 0
        CHECK(result.texel(0, 0) == glm::u8vec4(128, 128, 0, 0));
    }

    SUBCASE("Missing occlusion reads as white") {
        auto result = TextureConverter::packStandard(&mr, nullptr, 1.0f, 1.0f);
        CHECK(result.texel(0, 0).g == 255);
    }

    SUBCASE("Missing metallic-roughness reads as white, size from occlusion") {
        const auto smallOcc = test::solidTexture(1, 1, {64, 0, 0, 255});
        auto result = TextureConverter::packStandard(nullptr, &smallOcc, 1.0f, 1.0f);
        CHECK(result.width == 1);
        CHECK(result.texel(0, 0) == glm::u8vec4(255, 64, 0, 0));
    }

    SUBCASE("Occlusion of another size is resampled") {
        const auto bigOcc = test::solidTexture(4, 4, {32, 0, 0, 255});
        auto result = TextureConverter::packStandard(&mr, &bigOcc, 1.0f, 1.0f);
        CHECK(result.width == 2);
        CHECK(result.texel(1, 0).g == 32);
    }

    SUBCASE("Both sources missing") {
        CHECK_THROWS_AS(TextureConverter::packStandard(nullptr, nullptr, 1.0f, 1.0f), core::ConfigurationError);
    }
}
