#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/assets/VrmReader.hpp"

#include <cstring>
#include <cpptrace/cpptrace.hpp>
#include <fastgltf/core.hpp>
#include <nlohmann/json.hpp>

using namespace vrmi;
using namespace vrmi::assets;

namespace {

// Two primitives over the same vertices, one without a material, a morph
// target named through mesh extras, and a skinned instance.
const char* kSharedPrimitivesGltf = R"({
  "asset": {"version": "2.0"},
  "nodes": [
    {"name": "Joint"},
    {"name": "Skinned", "mesh": 0, "skin": 0}
  ],
  "meshes": [{
    "primitives": [
      {"attributes": {"POSITION": 0}, "indices": 1, "targets": [{"POSITION": 0}]},
      {"attributes": {"POSITION": 0}, "indices": 1, "targets": [{"POSITION": 0}]}
    ],
    "extras": {"targetNames": ["smile"]}
  }],
  "skins": [{"name": "rig", "joints": [0], "skeleton": 0}],
  "buffers": [{"byteLength": 42, "uri": "data:application/octet-stream;base64,AAAAAAAAAAAAAAAAAACAPwAAAAAAAAAAAAAAAAAAgD8AAAAAAAABAAIA"}],
  "bufferViews": [
    {"buffer": 0, "byteOffset": 0, "byteLength": 36},
    {"buffer": 0, "byteOffset": 36, "byteLength": 6}
  ],
  "accessors": [
    {"bufferView": 0, "componentType": 5126, "count": 3, "type": "VEC3", "min": [0, 0, 0], "max": [1, 1, 0]},
    {"bufferView": 1, "componentType": 5123, "count": 3, "type": "SCALAR"}
  ]
})";

std::vector<uint8_t> makeGlb(const std::string& json) {
    std::string padded = json;
    while (padded.size() % 4 != 0) {
        padded.push_back(' ');
    }
    const auto put = [](std::vector<uint8_t>& out, uint32_t v) {
        uint8_t bytes[4];
        std::memcpy(bytes, &v, 4);
        out.insert(out.end(), bytes, bytes + 4);
    };

    std::vector<uint8_t> glb;
    put(glb, 0x46546C67);
    put(glb, 2);
    put(glb, static_cast<uint32_t>(12 + 8 + padded.size()));
    put(glb, static_cast<uint32_t>(padded.size()));
    put(glb, 0x4E4F534A);
    glb.insert(glb.end(), padded.begin(), padded.end());
    return glb;
}

fastgltf::Asset parseGltf(const std::string& json) {
    auto data = fastgltf::GltfDataBuffer::FromBytes(reinterpret_cast<const std::byte*>(json.data()), json.size());
    REQUIRE(data.error() == fastgltf::Error::None);
    fastgltf::Parser parser;
    auto asset = parser.loadGltf(data.get(), ".", fastgltf::Options::LoadExternalBuffers);
    REQUIRE(asset.error() == fastgltf::Error::None);
    return std::move(asset.get());
}

} // namespace

TEST_CASE("VrmReader extracts the JSON chunk") {
    const std::string json = R"({"asset": {"version": "2.0"}})";

    SUBCASE("GLB container") {
        auto extracted = VrmReader::extractJson(makeGlb(json));
        REQUIRE(extracted.has_value());
        CHECK(nlohmann::json::parse(*extracted)["asset"]["version"] == "2.0");
    }

    SUBCASE("Plain glTF") {
        auto extracted = VrmReader::extractJson(test::bytesOf("  " + json));
        REQUIRE(extracted.has_value());
    }

    SUBCASE("Neither") {
        const std::string garbage = "not a model";
        CHECK_FALSE(VrmReader::extractJson(test::bytesOf(garbage)).has_value());
    }
}

TEST_CASE("VrmReader parses the VRMC_vrm block") {
    const auto document = nlohmann::json::parse(test::makeGltfJson(true));
    auto vrm = VrmReader::parseVrmExtension(document);
    REQUIRE(vrm.has_value());
    CHECK(vrm->specVersion == "1.0");
    CHECK(vrm->metaName == "Test Avatar");

    // "tail" is not a humanoid role
    CHECK(vrm->humanBones.size() == 3);
    CHECK(vrm->humanBones.at(scene::HumanoidBone::Hips) == 0);
    CHECK(vrm->humanBones.at(scene::HumanoidBone::Head) == 2);
    CHECK(vrm->humanBones.at(scene::HumanoidBone::LeftUpperArm) == 42);

    CHECK_FALSE(VrmReader::parseVrmExtension(nlohmann::json::parse(test::makeGltfJson(false))).has_value());
}

TEST_CASE("VrmReader builds the model") {
    const std::string json = test::makeGltfJson(true);
    auto document = VrmReader::readBytes(test::bytesOf(json), ".", "avatar");
    REQUIRE(document.has_value());

    const auto& model = document->model;
    CHECK(model.name == "avatar");
    REQUIRE(model.nodes.size() == 4);

    // Synthetic root appended after the glTF nodes
    CHECK(model.root == 3);
    CHECK(model.node(3).name == "avatar");
    CHECK(model.node(3).children == std::vector<uint32_t>{0});

    const auto& hips = model.node(0);
    CHECK(hips.name == "Hips");
    CHECK(hips.translation.y == doctest::Approx(1.0f));
    CHECK((hips.children == std::vector<uint32_t>{1, 2}));
    CHECK(model.node(1).meshGroup == 0u);

    REQUIRE(model.meshGroups.size() == 1);
    const auto& group = model.meshGroups[0];
    CHECK(group.name == "body");
    CHECK_FALSE(group.skin.has_value());
    REQUIRE(group.meshes.size() == 1);
    CHECK(group.meshes[0].positions.size() == 3);
    CHECK(group.meshes[0].positions[1].x == doctest::Approx(1.0f));
    CHECK((group.meshes[0].indices == std::vector<uint32_t>{0, 1, 2}));

    REQUIRE(model.materials.size() == 2);
    const auto& skin = model.materials[0];
    CHECK(skin.name == "skin");
    CHECK(skin.baseColorTexture == 0u);
    CHECK(skin.normalTexture == 1u);
    CHECK(skin.metallicRoughnessTexture == 2u);
    CHECK(skin.occlusionTexture == 2u);
    CHECK(skin.metallicFactor == doctest::Approx(0.5f));

    REQUIRE(model.vrm.has_value());
    CHECK(model.vrm->humanBones.size() == 3);
}

TEST_CASE("VrmReader merges primitives that share vertices") {
    auto document = VrmReader::readBytes(test::bytesOf(kSharedPrimitivesGltf), ".", "shared");
    REQUIRE(document.has_value());

    const auto& model = document->model;
    CHECK_FALSE(model.vrm.has_value());

    // No scene: root nodes are the ones nobody parents
    CHECK((model.node(model.root).children == std::vector<uint32_t>{0, 1}));

    REQUIRE(model.meshGroups.size() == 1);
    const auto& group = model.meshGroups[0];
    CHECK(group.name == "mesh_0");
    REQUIRE(group.meshes.size() == 1);

    const auto& mesh = group.meshes[0];
    REQUIRE(mesh.submeshes.size() == 2);
    CHECK(mesh.submeshes[1].firstIndex == 3);
    CHECK(mesh.indices.size() == 6);

    // Primitives without a material share an appended default
    REQUIRE(model.materials.size() == 1);
    CHECK(model.materials[0].name == "default");
    CHECK(mesh.submeshes[0].materialIndex == 0);

    REQUIRE(mesh.morphTargets.size() == 1);
    CHECK(mesh.morphTargets[0].name == "smile");
    CHECK(mesh.morphTargets[0].positionDeltas[2].y == doctest::Approx(1.0f));

    REQUIRE(group.skin.has_value());
    CHECK(group.skin->name == "rig");
    CHECK(group.skin->joints == std::vector<uint32_t>{0});
    CHECK(group.skin->root == 0u);
}

TEST_CASE("VrmReader rejects node references past the file's nodes") {
    // Two glTF nodes; index 2 is where the synthetic root goes
    auto gltf = parseGltf(kSharedPrimitivesGltf);
    const auto document = nlohmann::json::parse(kSharedPrimitivesGltf);

    SUBCASE("In range") {
        const auto model = VrmReader::buildModel(gltf, document, "rig");
        CHECK(model.sourceNodeCount == 2u);
        CHECK(model.root == 2);
        CHECK_FALSE(model.isSourceNode(model.root));
        CHECK(model.isSourceNode(1));
    }

    SUBCASE("Skin joint") {
        gltf.skins[0].joints[0] = 2;
        CHECK_THROWS_AS(VrmReader::buildModel(gltf, document, "rig"), cpptrace::out_of_range);
    }

    SUBCASE("Skin skeleton") {
        gltf.skins[0].skeleton = 2;
        CHECK_THROWS_AS(VrmReader::buildModel(gltf, document, "rig"), cpptrace::out_of_range);
    }

    SUBCASE("Node child") {
        gltf.nodes[0].children.push_back(2);
        CHECK_THROWS_AS(VrmReader::buildModel(gltf, document, "rig"), cpptrace::out_of_range);
    }
}

TEST_CASE("VrmReader reports unreadable input") {
    SUBCASE("Not glTF") {
        const std::string garbage = "garbage";
        auto result = VrmReader::readBytes(test::bytesOf(garbage), ".", "garbage");
        CHECK_FALSE(result.has_value());
    }

    SUBCASE("Malformed JSON") {
        const std::string broken = "{ \"asset\": ";
        auto result = VrmReader::readBytes(test::bytesOf(broken), ".", "broken");
        CHECK_FALSE(result.has_value());
    }

    SUBCASE("Missing file") {
        auto result = VrmReader::readFile("does/not/exist.vrm");
        CHECK_FALSE(result.has_value());
    }
}
