#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/assets/TextureImportParamFactory.hpp"
#include "vrmi/assets/VrmReader.hpp"

#include <cpptrace/cpptrace.hpp>

using namespace vrmi;
using namespace vrmi::assets;

TEST_CASE("TextureImportParamFactory builds requests from glTF textures") {
    const std::string json = test::makeGltfJson(true);
    auto document = VrmReader::readBytes(test::bytesOf(json), ".", "avatar");
    REQUIRE(document.has_value());
    REQUIRE(document->gltf != nullptr);

    TextureImportParamFactory params(*document->gltf, document->baseDir);

    SUBCASE("Raw names fall back to the image name, then the index") {
        CHECK(params.rawName(0) == "albedo");
        CHECK(params.rawName(1) == "normal_img");
        CHECK(params.rawName(2) == "texture_2");
        CHECK_THROWS_AS(params.rawName(3), cpptrace::out_of_range);
    }

    SUBCASE("sRGB request") {
        auto param = params.createSRGB(0);
        CHECK(param.kind() == TextureImportKind::sRGB);
        CHECK(param.name.resultName() == "albedo");
        REQUIRE(param.source0.has_value());
        CHECK_FALSE(param.source1.has_value());
        CHECK(param.source0->name == "albedo");
        CHECK_FALSE(param.source0->bytes().empty());

        REQUIRE(param.sampler.wrapModes.size() == 1);
        CHECK((param.sampler.wrapModes[0] == WrapEntry{runtime::SamplerWrapType::All, runtime::WrapMode::Clamp}));
        CHECK(param.sampler.filter == runtime::FilterMode::Point);
    }

    SUBCASE("Normal request with per-axis wrapping") {
        auto param = params.createNormal(1);
        CHECK(param.name.resultName() == "normal_img.normal");
        CHECK(param.name.extractKey() == "normal_img");
        REQUIRE(param.sampler.wrapModes.size() == 2);
        CHECK((param.sampler.wrapModes[0] == WrapEntry{runtime::SamplerWrapType::U, runtime::WrapMode::Repeat}));
        CHECK((param.sampler.wrapModes[1] == WrapEntry{runtime::SamplerWrapType::V, runtime::WrapMode::Mirror}));
        CHECK(param.sampler.filter == runtime::FilterMode::Bilinear);
    }

    SUBCASE("Texture without sampler keeps the defaults") {
        auto param = params.createLinear(2);
        CHECK(param.kind() == TextureImportKind::Linear);
        CHECK(param.sampler.wrapModes.empty());
        CHECK(param.sampler.filter == runtime::FilterMode::Bilinear);
    }

    SUBCASE("Standard request") {
        auto param = params.createStandard(0, 2, 0.25f, 0.75f);
        CHECK(param.name.resultName() == "albedo+texture_2.standard");
        REQUIRE(param.source0.has_value());
        REQUIRE(param.source1.has_value());
        CHECK(param.source0->name == "albedo");
        CHECK(param.source1->name == "texture_2");
        CHECK(param.metallicFactor == doctest::Approx(0.25f));
        CHECK(param.roughnessFactor == doctest::Approx(0.75f));
        // Occlusion sampler wins
        CHECK(param.sampler.wrapModes.empty());

        auto occlusionOnly = params.createStandard(std::nullopt, 1, 1.0f, 1.0f);
        CHECK(occlusionOnly.name.resultName() == "normal_img.standard");
        CHECK_FALSE(occlusionOnly.source0.has_value());
    }

    SUBCASE("Bad indices throw") {
        CHECK_THROWS_AS(params.createSRGB(7), cpptrace::out_of_range);
        CHECK_THROWS_AS(params.createName(7, TextureImportKind::sRGB), cpptrace::out_of_range);
    }
}

TEST_CASE("glTF sampler conversion") {
    CHECK(TextureImportParamFactory::toWrapMode(fastgltf::Wrap::ClampToEdge) == runtime::WrapMode::Clamp);
    CHECK(TextureImportParamFactory::toWrapMode(fastgltf::Wrap::MirroredRepeat) == runtime::WrapMode::Mirror);
    CHECK(TextureImportParamFactory::toFilterMode(fastgltf::Filter::LinearMipMapLinear) ==
          runtime::FilterMode::Trilinear);
    CHECK(TextureImportParamFactory::toFilterMode(fastgltf::Optional<fastgltf::Filter>{}) ==
          runtime::FilterMode::Bilinear);

    auto same = TextureImportParamFactory::toWrapEntries(fastgltf::Wrap::Repeat, fastgltf::Wrap::Repeat);
    REQUIRE(same.size() == 1);
    CHECK(same[0].type == runtime::SamplerWrapType::All);
}
