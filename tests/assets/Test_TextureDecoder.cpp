#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/assets/GltfUtils.hpp"
#include "vrmi/assets/TextureDecoder.hpp"

using namespace vrmi;
using namespace vrmi::assets;

TEST_CASE("TextureDecoder decodes PNG to RGBA8") {
    const auto png = base64Decode(test::kPng1x1);
    REQUIRE_FALSE(png.empty());

    auto data = TextureDecoder::decode(png, runtime::ColorSpace::sRGB);
    CHECK(data.width == 1);
    CHECK(data.height == 1);
    CHECK(data.colorSpace == runtime::ColorSpace::sRGB);
    REQUIRE(data.rgba.size() == 4);
    CHECK(data.texel(0, 0) == glm::u8vec4(0, 255, 0, 127));
}

TEST_CASE("TextureDecoder falls back to a white blank") {
    SUBCASE("Empty input") {
        auto data = TextureDecoder::decode({}, runtime::ColorSpace::Linear, 4);
        CHECK(data.width == 4);
        CHECK(data.height == 4);
        CHECK(data.colorSpace == runtime::ColorSpace::Linear);
        CHECK(data.texel(3, 3) == glm::u8vec4(255, 255, 255, 255));
    }

    SUBCASE("Garbage input") {
        const std::vector<uint8_t> garbage{1, 2, 3, 4, 5, 6, 7, 8};
        auto data = TextureDecoder::decode(garbage, runtime::ColorSpace::sRGB);
        CHECK(data.width == TextureDecoder::kMinBlankSize);
        CHECK(data.texel(0, 0) == glm::u8vec4(255, 255, 255, 255));
    }

    SUBCASE("Blank size is clamped") {
        auto data = TextureDecoder::blank(0, runtime::ColorSpace::sRGB);
        CHECK(data.width == 2);
        CHECK(data.rgba.size() == 16);
    }
}
