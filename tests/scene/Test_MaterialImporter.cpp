#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/assets/TextureFactory.hpp"
#include "vrmi/assets/TextureImportParamFactory.hpp"
#include "vrmi/assets/VrmReader.hpp"
#include "vrmi/runtime/null/NullRuntimeDevice.hpp"
#include "vrmi/scene/MaterialImporter.hpp"

using namespace vrmi;
using namespace vrmi::scene;

TEST_CASE("MaterialImporter resolves glTF textures") {
    const std::string json = test::makeGltfJson(true);
    auto document = assets::VrmReader::readBytes(test::bytesOf(json), ".", "avatar");
    REQUIRE(document.has_value());

    runtime::NullRuntimeDevice device;
    assets::TextureFactory textures(device);
    assets::TextureImportParamFactory params(*document->gltf, document->baseDir);
    MaterialImporter importer(device, textures, &params);

    const auto materials = importer.importAll(document->model);
    REQUIRE(materials.size() == 2);
    CHECK(device.materialCount() == 2);

    const auto& skin = device.material(materials[0]);
    CHECK(skin.name == "skin");
    CHECK(device.textureName(skin.baseColorTexture) == "albedo");
    CHECK(device.textureName(skin.normalTexture) == "normal_img.normal");
    CHECK(device.textureName(skin.standardTexture) == "texture_2.standard");
    CHECK_FALSE(skin.emissiveTexture.isValid());
    CHECK(skin.metallicFactor == doctest::Approx(0.5f));

    // Second material shares the decoded base color
    const auto& cloth = device.material(materials[1]);
    CHECK(cloth.baseColorTexture == skin.baseColorTexture);
    CHECK_FALSE(cloth.normalTexture.isValid());
    CHECK_FALSE(cloth.standardTexture.isValid());

    // albedo, normal_img, normal_img.normal, texture_2, texture_2.standard
    CHECK(device.textureCount() == 5);
    // Only the cloth base color request is served from the cache
    CHECK(textures.stats().hits == 1);
    CHECK(textures.stats().misses == 3);
    CHECK(textures.stats().decodes == 3);
    CHECK(device.textureData(skin.baseColorTexture).colorSpace == runtime::ColorSpace::sRGB);
    CHECK(device.textureData(skin.standardTexture).colorSpace == runtime::ColorSpace::Linear);
}

TEST_CASE("MaterialImporter without a texture source") {
    runtime::NullRuntimeDevice device;
    assets::TextureFactory textures(device);
    MaterialImporter importer(device, textures, nullptr);

    MaterialDescription description;
    description.name = "orphan";
    description.baseColorTexture = 0;
    description.alphaMode = runtime::AlphaMode::Mask;
    description.alphaCutoff = 0.25f;
    description.doubleSided = true;

    const auto material = importer.importMaterial(description);
    const auto& desc = device.material(material);
    CHECK(desc.name == "orphan");
    CHECK_FALSE(desc.baseColorTexture.isValid());
    CHECK(desc.alphaMode == runtime::AlphaMode::Mask);
    CHECK(desc.alphaCutoff == doctest::Approx(0.25f));
    CHECK(desc.doubleSided);
    CHECK(device.textureCount() == 0);
}
