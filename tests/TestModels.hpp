#pragma once

#include "vrmi/assets/VrmReader.hpp"
#include "vrmi/runtime/runtime_types.hpp"
#include "vrmi/scene/Model.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace vrmi::test {

// 1x1 opaque PNG
inline constexpr const char* kPng1x1 =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNk+M9QDwADhgGAWjR9awAAAABJRU5ErkJggg==";

inline runtime::TextureData solidTexture(uint32_t width, uint32_t height, glm::u8vec4 value) {
    runtime::TextureData data;
    data.width = width;
    data.height = height;
    data.colorSpace = runtime::ColorSpace::Linear;
    data.rgba.reserve(static_cast<size_t>(width) * height * 4);
    for (uint32_t i = 0; i < width * height; ++i) {
        data.rgba.push_back(value.r);
        data.rgba.push_back(value.g);
        data.rgba.push_back(value.b);
        data.rgba.push_back(value.a);
    }
    return data;
}

inline scene::Mesh triangleMesh(std::string name, std::vector<uint32_t> submeshMaterials) {
    scene::Mesh mesh;
    mesh.name = std::move(name);
    mesh.positions = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
    mesh.normals = {{0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 1.0f}};
    mesh.uv0 = {{0.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 1.0f}};
    mesh.joints = {glm::u16vec4(0), glm::u16vec4(0), glm::u16vec4(1, 0, 0, 0)};
    mesh.weights = {glm::vec4(1, 0, 0, 0), glm::vec4(1, 0, 0, 0), glm::vec4(1, 0, 0, 0)};
    for (uint32_t material : submeshMaterials) {
        const auto first = static_cast<uint32_t>(mesh.indices.size());
        mesh.indices.insert(mesh.indices.end(), {0, 1, 2});
        mesh.submeshes.push_back({first, 3, material});
    }
    return mesh;
}

/*
 * Node layout:
 *   0 Root
 *   └─ 1 Hips
 *      ├─ 2 Body   (mesh group 0, skinned on Hips + Head, two submeshes)
 *      └─ 3 Spine
 *         └─ 4 Head
 *            └─ 5 Hat (mesh group 1, static)
 *
 * Humanoid: hips -> 1, spine -> 3, head -> 4, leftHand -> 99 (missing)
 */
inline scene::Model makeAvatarModel() {
    scene::Model model;
    model.name = "avatar";

    auto node = [&](std::string name, glm::vec3 translation) {
        scene::Node n;
        n.name = std::move(name);
        n.translation = translation;
        return model.addNode(std::move(n));
    };

    const uint32_t root = node("Root", {0, 0, 0});
    const uint32_t hips = node("Hips", {0, 1, 0});
    const uint32_t body = node("Body", {0, 0, 0});
    const uint32_t spine = node("Spine", {0, 0.2f, 0});
    const uint32_t head = node("Head", {0, 0.5f, 0});
    const uint32_t hat = node("Hat", {0, 0.3f, 0});
    model.root = root;

    model.addChild(root, hips);
    model.addChild(hips, body);
    model.addChild(hips, spine);
    model.addChild(spine, head);
    model.addChild(head, hat);

    scene::MaterialDescription skinMaterial;
    skinMaterial.name = "skin";
    scene::MaterialDescription clothMaterial;
    clothMaterial.name = "cloth";
    clothMaterial.baseColorFactor = glm::vec4(0.5f, 0.5f, 1.0f, 1.0f);
    model.materials = {skinMaterial, clothMaterial};

    scene::MeshGroup bodyGroup;
    bodyGroup.name = "body";
    bodyGroup.meshes.push_back(triangleMesh("body", {0, 1}));
    scene::Skin skin;
    skin.name = "skeleton";
    skin.joints = {hips, head};
    skin.root = hips;
    bodyGroup.skin = skin;

    scene::MeshGroup hatGroup;
    hatGroup.name = "hat";
    hatGroup.meshes.push_back(triangleMesh("hat", {1}));

    model.meshGroups = {bodyGroup, hatGroup};
    model.node(body).meshGroup = 0;
    model.node(hat).meshGroup = 1;

    scene::VrmExtension vrm;
    vrm.specVersion = "1.0";
    vrm.metaName = "avatar";
    vrm.humanBones[scene::HumanoidBone::Hips] = hips;
    vrm.humanBones[scene::HumanoidBone::Spine] = spine;
    vrm.humanBones[scene::HumanoidBone::Head] = head;
    vrm.humanBones[scene::HumanoidBone::LeftHand] = 99;
    model.vrm = vrm;

    return model;
}

inline assets::VrmDocument makeAvatarDocument() {
    assets::VrmDocument document;
    document.model = makeAvatarModel();
    return document;
}

inline std::span<const uint8_t> bytesOf(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

/*
 * Minimal glTF with one triangle, two materials and three textures backed by
 * embedded PNGs:
 *   texture 0 "albedo"  (sampler 0: clamp/clamp, nearest)
 *   texture 1 no name, image "normal_img" (sampler 1: repeat/mirror)
 *   texture 2 no name, no image name -> texture_2
 * Material 0 uses 0 as base color, 1 as normal, 2 as metallic-roughness
 * and occlusion. Material 1 reuses texture 0 as base color.
 */
inline std::string makeGltfJson(bool withVrm) {
    // Triangle: 3 vec3 positions (36 bytes) + 3 u16 indices (6 bytes)
    const std::string buffer =
        "AAAAAAAAAAAAAAAAAACAPwAAAAAAAAAAAAAAAAAAgD8AAAAAAAABAAIA";

    std::string json = R"({
  "asset": {"version": "2.0"},
  "scene": 0,
  "scenes": [{"nodes": [0]}],
  "nodes": [
    {"name": "Hips", "translation": [0, 1, 0], "children": [1, 2]},
    {"name": "Body", "mesh": 0},
    {"name": "Head", "translation": [0, 0.5, 0]}
  ],
  "meshes": [{
    "name": "body",
    "primitives": [{"attributes": {"POSITION": 0}, "indices": 1, "material": 0}],
    "extras": {"targetNames": []}
  }],
  "buffers": [{"byteLength": 42, "uri": "data:application/octet-stream;base64,)" + buffer + R"("}],
  "bufferViews": [
    {"buffer": 0, "byteOffset": 0, "byteLength": 36},
    {"buffer": 0, "byteOffset": 36, "byteLength": 6}
  ],
  "accessors": [
    {"bufferView": 0, "componentType": 5126, "count": 3, "type": "VEC3", "min": [0, 0, 0], "max": [1, 1, 0]},
    {"bufferView": 1, "componentType": 5123, "count": 3, "type": "SCALAR"}
  ],
  "materials": [
    {
      "name": "skin",
      "pbrMetallicRoughness": {
        "baseColorTexture": {"index": 0},
        "metallicRoughnessTexture": {"index": 2},
        "metallicFactor": 0.5,
        "roughnessFactor": 0.5
      },
      "normalTexture": {"index": 1},
      "occlusionTexture": {"index": 2}
    },
    {"name": "cloth", "pbrMetallicRoughness": {"baseColorTexture": {"index": 0}}}
  ],
  "samplers": [
    {"magFilter": 9728, "minFilter": 9728, "wrapS": 33071, "wrapT": 33071},
    {"wrapS": 10497, "wrapT": 33648}
  ],
  "images": [
    {"name": "albedo_img", "uri": "data:image/png;base64,)" + std::string(kPng1x1) + R"("},
    {"name": "normal_img", "uri": "data:image/png;base64,)" + std::string(kPng1x1) + R"("},
    {"uri": "data:image/png;base64,)" + std::string(kPng1x1) + R"("}
  ],
  "textures": [
    {"name": "albedo", "source": 0, "sampler": 0},
    {"source": 1, "sampler": 1},
    {"source": 2}
  ])";

    if (withVrm) {
        json += R"(,
  "extensionsUsed": ["VRMC_vrm"],
  "extensions": {
    "VRMC_vrm": {
      "specVersion": "1.0",
      "meta": {"name": "Test Avatar"},
      "humanoid": {
        "humanBones": {
          "hips": {"node": 0},
          "head": {"node": 2},
          "leftUpperArm": {"node": 42},
          "tail": {"node": 1}
        }
      }
    }
  })";
    }
    json += "\n}\n";
    return json;
}

} // namespace vrmi::test
