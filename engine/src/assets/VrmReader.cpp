#include "vrmi/assets/VrmReader.hpp"

#include "vrmi/assets/GltfUtils.hpp"
#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <utility>

#include <cpptrace/cpptrace.hpp>
#include <fastgltf/core.hpp>
#include <fastgltf/glm_element_traits.hpp>
#include <fastgltf/tools.hpp>
#include <nlohmann/json.hpp>

namespace vrmi::assets {

    namespace {
        constexpr std::uint32_t kGlbMagic = 0x46546C67;      // "glTF"
        constexpr std::uint32_t kGlbJsonChunk = 0x4E4F534A;  // "JSON"
        constexpr std::size_t kGlbHeaderSize = 12;
        constexpr std::size_t kGlbChunkHeaderSize = 8;

        std::uint32_t readU32(std::span<const std::uint8_t> bytes, std::size_t offset) {
            std::uint32_t v = 0;
            std::memcpy(&v, bytes.data() + offset, sizeof(v));
            return v;
        }

        using AttributeSet = std::vector<std::pair<std::string, std::size_t>>;

        AttributeSet attributeSet(const fastgltf::Primitive& primitive) {
            AttributeSet set;
            for (const auto& attribute : primitive.attributes) {
                set.emplace_back(std::string(attribute.name), attribute.accessorIndex);
            }
            std::ranges::sort(set);
            return set;
        }

        const fastgltf::Attribute* findTargetAttribute(const auto& target, std::string_view name) {
            auto it = std::ranges::find_if(target, [&](const fastgltf::Attribute& a) { return a.name == name; });
            return it != target.end() ? &*it : nullptr;
        }

        void readVertices(const fastgltf::Asset& gltf, const fastgltf::Primitive& primitive, scene::Mesh& mesh) {
            const auto* itPos = primitive.findAttribute("POSITION");
            if (itPos == primitive.attributes.end()) {
                return;
            }
            const auto& posAccessor = gltf.accessors[itPos->accessorIndex];
            const size_t vertexCount = posAccessor.count;

            mesh.positions.resize(vertexCount);
            fastgltf::iterateAccessorWithIndex<glm::vec3>(
                gltf, posAccessor, [&](glm::vec3 v, size_t i) { mesh.positions[i] = v; });

            if (const auto* it = primitive.findAttribute("NORMAL"); it != primitive.attributes.end()) {
                mesh.normals.resize(vertexCount, glm::vec3(0.0f, 1.0f, 0.0f));
                fastgltf::iterateAccessorWithIndex<glm::vec3>(
                    gltf, gltf.accessors[it->accessorIndex], [&](glm::vec3 v, size_t i) { mesh.normals[i] = v; });
            }
            if (const auto* it = primitive.findAttribute("TEXCOORD_0"); it != primitive.attributes.end()) {
                mesh.uv0.resize(vertexCount, glm::vec2(0.0f));
                fastgltf::iterateAccessorWithIndex<glm::vec2>(
                    gltf, gltf.accessors[it->accessorIndex], [&](glm::vec2 v, size_t i) { mesh.uv0[i] = v; });
            }
            if (const auto* it = primitive.findAttribute("JOINTS_0"); it != primitive.attributes.end()) {
                mesh.joints.resize(vertexCount, glm::u16vec4(0));
                fastgltf::iterateAccessorWithIndex<glm::uvec4>(
                    gltf, gltf.accessors[it->accessorIndex],
                    [&](glm::uvec4 v, size_t i) { mesh.joints[i] = glm::u16vec4(v); });
            }
            if (const auto* it = primitive.findAttribute("WEIGHTS_0"); it != primitive.attributes.end()) {
                mesh.weights.resize(vertexCount, glm::vec4(0.0f));
                fastgltf::iterateAccessorWithIndex<glm::vec4>(
                    gltf, gltf.accessors[it->accessorIndex], [&](glm::vec4 v, size_t i) { mesh.weights[i] = v; });
            }
        }

        std::vector<std::uint32_t> readIndices(const fastgltf::Asset& gltf, const fastgltf::Primitive& primitive,
                                               size_t vertexCount) {
            std::vector<std::uint32_t> indices;
            if (primitive.indicesAccessor.has_value()) {
                const auto& accessor = gltf.accessors[primitive.indicesAccessor.value()];
                indices.resize(accessor.count);
                fastgltf::iterateAccessorWithIndex<std::uint32_t>(
                    gltf, accessor, [&](std::uint32_t v, size_t i) { indices[i] = v; });
            } else {
                indices.resize(vertexCount);
                for (size_t i = 0; i < vertexCount; ++i) {
                    indices[i] = static_cast<std::uint32_t>(i);
                }
            }
            return indices;
        }

        std::vector<std::string> targetNames(const nlohmann::json& document, size_t meshIndex) {
            std::vector<std::string> names;
            const auto meshes = document.find("meshes");
            if (meshes == document.end() || !meshes->is_array() || meshIndex >= meshes->size()) {
                return names;
            }
            const auto& mesh = (*meshes)[meshIndex];

            auto collect = [&](const nlohmann::json& holder) {
                const auto extras = holder.find("extras");
                if (extras == holder.end() || !extras->is_object()) {
                    return false;
                }
                const auto list = extras->find("targetNames");
                if (list == extras->end() || !list->is_array()) {
                    return false;
                }
                for (const auto& n : *list) {
                    names.push_back(n.is_string() ? n.get<std::string>() : std::string());
                }
                return true;
            };

            if (!collect(mesh)) {
                const auto primitives = mesh.find("primitives");
                if (primitives != mesh.end() && primitives->is_array() && !primitives->empty()) {
                    collect((*primitives)[0]);
                }
            }
            return names;
        }

        std::vector<scene::MorphTarget> readMorphTargets(const fastgltf::Asset& gltf,
                                                         const fastgltf::Primitive& primitive,
                                                         const std::vector<std::string>& names,
                                                         size_t vertexCount) {
            std::vector<scene::MorphTarget> targets;
            targets.reserve(primitive.targets.size());
            for (size_t t = 0; t < primitive.targets.size(); ++t) {
                const auto& gTarget = primitive.targets[t];
                scene::MorphTarget target;
                target.name = t < names.size() && !names[t].empty() ? names[t] : fmt::format("target_{}", t);
                target.positionDeltas.resize(vertexCount, glm::vec3(0.0f));
                target.normalDeltas.resize(vertexCount, glm::vec3(0.0f));

                if (const auto* pos = findTargetAttribute(gTarget, "POSITION")) {
                    fastgltf::iterateAccessorWithIndex<glm::vec3>(
                        gltf, gltf.accessors[pos->accessorIndex],
                        [&](glm::vec3 v, size_t i) { target.positionDeltas[i] = v; });
                }
                if (const auto* norm = findTargetAttribute(gTarget, "NORMAL")) {
                    fastgltf::iterateAccessorWithIndex<glm::vec3>(
                        gltf, gltf.accessors[norm->accessorIndex],
                        [&](glm::vec3 v, size_t i) { target.normalDeltas[i] = v; });
                }
                targets.push_back(std::move(target));
            }
            return targets;
        }

        // The synthetic root follows the glTF nodes, so file data may never name it
        uint32_t checkedNodeIndex(const fastgltf::Asset& gltf, size_t index, std::string_view what) {
            if (index >= gltf.nodes.size()) {
                throw cpptrace::out_of_range(
                    fmt::format("{} references node {} but the file has {} nodes", what, index, gltf.nodes.size()));
            }
            return static_cast<uint32_t>(index);
        }

        runtime::AlphaMode toAlphaMode(fastgltf::AlphaMode mode) {
            switch (mode) {
            case fastgltf::AlphaMode::Mask:
                return runtime::AlphaMode::Mask;
            case fastgltf::AlphaMode::Blend:
                return runtime::AlphaMode::Blend;
            case fastgltf::AlphaMode::Opaque:
                break;
            }
            return runtime::AlphaMode::Opaque;
        }

        scene::MaterialDescription toMaterial(const fastgltf::Material& gMat) {
            scene::MaterialDescription material;
            material.name = std::string(gMat.name);

            const auto& pbr = gMat.pbrData;
            material.baseColorFactor = glm::vec4(pbr.baseColorFactor[0], pbr.baseColorFactor[1],
                                                 pbr.baseColorFactor[2], pbr.baseColorFactor[3]);
            if (pbr.baseColorTexture.has_value()) {
                material.baseColorTexture = static_cast<uint32_t>(pbr.baseColorTexture->textureIndex);
            }
            material.metallicFactor = pbr.metallicFactor;
            material.roughnessFactor = pbr.roughnessFactor;
            if (pbr.metallicRoughnessTexture.has_value()) {
                material.metallicRoughnessTexture =
                    static_cast<uint32_t>(pbr.metallicRoughnessTexture->textureIndex);
            }
            if (gMat.normalTexture.has_value()) {
                material.normalTexture = static_cast<uint32_t>(gMat.normalTexture->textureIndex);
                material.normalScale = gMat.normalTexture->scale;
            }
            if (gMat.occlusionTexture.has_value()) {
                material.occlusionTexture = static_cast<uint32_t>(gMat.occlusionTexture->textureIndex);
                material.occlusionStrength = gMat.occlusionTexture->strength;
            }
            if (gMat.emissiveTexture.has_value()) {
                material.emissiveTexture = static_cast<uint32_t>(gMat.emissiveTexture->textureIndex);
            }
            material.emissiveFactor = glm::vec3(gMat.emissiveFactor[0], gMat.emissiveFactor[1], gMat.emissiveFactor[2]);
            material.alphaMode = toAlphaMode(gMat.alphaMode);
            material.alphaCutoff = gMat.alphaCutoff;
            material.doubleSided = gMat.doubleSided;
            return material;
        }
    } // namespace

    std::optional<std::string> VrmReader::extractJson(std::span<const std::uint8_t> bytes) {
        if (bytes.size() >= kGlbHeaderSize + kGlbChunkHeaderSize && readU32(bytes, 0) == kGlbMagic) {
            const std::uint32_t chunkLength = readU32(bytes, kGlbHeaderSize);
            const std::uint32_t chunkType = readU32(bytes, kGlbHeaderSize + 4);
            const std::size_t begin = kGlbHeaderSize + kGlbChunkHeaderSize;
            if (chunkType != kGlbJsonChunk || begin + chunkLength > bytes.size()) {
                return std::nullopt;
            }
            return std::string(reinterpret_cast<const char*>(bytes.data() + begin), chunkLength);
        }

        auto first = std::ranges::find_if(bytes, [](std::uint8_t c) { return std::isspace(c) == 0; });
        if (first == bytes.end() || *first != '{') {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    std::optional<scene::VrmExtension> VrmReader::parseVrmExtension(const nlohmann::json& document) {
        const auto extensions = document.find("extensions");
        if (extensions == document.end() || !extensions->is_object()) {
            return std::nullopt;
        }
        const auto vrm = extensions->find("VRMC_vrm");
        if (vrm == extensions->end() || !vrm->is_object()) {
            return std::nullopt;
        }

        scene::VrmExtension result;
        result.specVersion = vrm->value("specVersion", std::string());
        if (const auto meta = vrm->find("meta"); meta != vrm->end() && meta->is_object()) {
            result.metaName = meta->value("name", std::string());
        }

        const auto humanoid = vrm->find("humanoid");
        if (humanoid == vrm->end() || !humanoid->is_object()) {
            return result;
        }
        const auto humanBones = humanoid->find("humanBones");
        if (humanBones == humanoid->end() || !humanBones->is_object()) {
            return result;
        }

        for (const auto& [key, value] : humanBones->items()) {
            const auto bone = scene::humanoidBoneFromName(key);
            if (!bone) {
                core::Logger::Asset.debug("VRMC_vrm: ignoring unknown humanoid bone '{}'", key);
                continue;
            }
            if (!value.is_object()) {
                continue;
            }
            const auto node = value.find("node");
            if (node == value.end() || !node->is_number_integer()) {
                continue;
            }
            result.humanBones[*bone] = node->get<std::int64_t>();
        }
        return result;
    }

    scene::Model VrmReader::buildModel(const fastgltf::Asset& gltf, const nlohmann::json& document,
                                       std::string name) {
        VRMI_PROFILE_FUNCTION();

        scene::Model model;
        model.name = std::move(name);

        // Nodes keep their glTF indices
        model.nodes.reserve(gltf.nodes.size() + 1);
        for (const auto& gNode : gltf.nodes) {
            scene::Node node;
            node.name = std::string(gNode.name);
            const NodePose pose = toNodePose(gNode);
            node.translation = pose.translation;
            node.rotation = pose.rotation;
            for (size_t child : gNode.children) {
                node.children.push_back(checkedNodeIndex(gltf, child, "child"));
            }
            if (gNode.meshIndex.has_value()) {
                node.meshGroup = static_cast<uint32_t>(gNode.meshIndex.value());
            }
            model.nodes.push_back(std::move(node));
        }

        // Synthetic root above the scene roots
        scene::Node root;
        root.name = model.name;
        if (!gltf.scenes.empty()) {
            const size_t sceneIndex = gltf.defaultScene.has_value() ? gltf.defaultScene.value() : 0;
            for (size_t n : gltf.scenes[std::min(sceneIndex, gltf.scenes.size() - 1)].nodeIndices) {
                root.children.push_back(checkedNodeIndex(gltf, n, "scene root"));
            }
        } else {
            std::vector<bool> isChild(gltf.nodes.size(), false);
            for (const auto& gNode : gltf.nodes) {
                for (size_t child : gNode.children) {
                    if (child < isChild.size()) {
                        isChild[child] = true;
                    }
                }
            }
            for (size_t n = 0; n < isChild.size(); ++n) {
                if (!isChild[n]) {
                    root.children.push_back(static_cast<uint32_t>(n));
                }
            }
        }
        model.sourceNodeCount = static_cast<uint32_t>(gltf.nodes.size());
        model.root = model.addNode(std::move(root));

        for (const auto& gMat : gltf.materials) {
            model.materials.push_back(toMaterial(gMat));
        }

        bool needsDefaultMaterial = false;
        const auto defaultMaterial = static_cast<uint32_t>(model.materials.size());

        model.meshGroups.reserve(gltf.meshes.size());
        for (size_t m = 0; m < gltf.meshes.size(); ++m) {
            const auto& gMesh = gltf.meshes[m];
            scene::MeshGroup group;
            group.name = std::string(gMesh.name);
            if (group.name.empty()) {
                group.name = fmt::format("mesh_{}", m);
            }

            const auto names = targetNames(document, m);
            auto materialOf = [&](const fastgltf::Primitive& p) {
                if (p.materialIndex.has_value()) {
                    return static_cast<uint32_t>(p.materialIndex.value());
                }
                needsDefaultMaterial = true;
                return defaultMaterial;
            };

            const bool sharedVertices =
                !gMesh.primitives.empty() &&
                std::ranges::all_of(gMesh.primitives, [&](const fastgltf::Primitive& p) {
                    return attributeSet(p) == attributeSet(gMesh.primitives.front());
                });

            if (sharedVertices) {
                scene::Mesh mesh;
                mesh.name = group.name;
                readVertices(gltf, gMesh.primitives.front(), mesh);
                for (const auto& primitive : gMesh.primitives) {
                    auto indices = readIndices(gltf, primitive, mesh.positions.size());
                    scene::Submesh submesh;
                    submesh.firstIndex = static_cast<uint32_t>(mesh.indices.size());
                    submesh.indexCount = static_cast<uint32_t>(indices.size());
                    submesh.materialIndex = materialOf(primitive);
                    mesh.indices.insert(mesh.indices.end(), indices.begin(), indices.end());
                    mesh.submeshes.push_back(submesh);
                }
                mesh.morphTargets =
                    readMorphTargets(gltf, gMesh.primitives.front(), names, mesh.positions.size());
                group.meshes.push_back(std::move(mesh));
            } else {
                for (size_t p = 0; p < gMesh.primitives.size(); ++p) {
                    const auto& primitive = gMesh.primitives[p];
                    scene::Mesh mesh;
                    mesh.name = fmt::format("{}_{}", group.name, p);
                    readVertices(gltf, primitive, mesh);
                    mesh.indices = readIndices(gltf, primitive, mesh.positions.size());
                    mesh.submeshes.push_back(
                        {0, static_cast<uint32_t>(mesh.indices.size()), materialOf(primitive)});
                    mesh.morphTargets = readMorphTargets(gltf, primitive, names, mesh.positions.size());
                    group.meshes.push_back(std::move(mesh));
                }
            }
            model.meshGroups.push_back(std::move(group));
        }

        if (needsDefaultMaterial) {
            scene::MaterialDescription material;
            material.name = "default";
            model.materials.push_back(std::move(material));
        }

        // A group's skin comes from the first node instancing it
        for (const auto& gNode : gltf.nodes) {
            if (!gNode.meshIndex.has_value() || !gNode.skinIndex.has_value()) {
                continue;
            }
            const size_t meshIndex = gNode.meshIndex.value();
            const size_t skinIndex = gNode.skinIndex.value();
            if (meshIndex >= model.meshGroups.size() || skinIndex >= gltf.skins.size() ||
                model.meshGroups[meshIndex].skin) {
                continue;
            }
            const auto& gSkin = gltf.skins[skinIndex];
            scene::Skin skin;
            skin.name = std::string(gSkin.name);
            for (size_t joint : gSkin.joints) {
                skin.joints.push_back(checkedNodeIndex(gltf, joint, "skin joint"));
            }
            if (gSkin.skeleton.has_value()) {
                skin.root = checkedNodeIndex(gltf, gSkin.skeleton.value(), "skin skeleton");
            }
            model.meshGroups[meshIndex].skin = std::move(skin);
        }

        model.vrm = parseVrmExtension(document);
        return model;
    }

    core::Result<VrmDocument> VrmReader::readBytes(std::span<const std::uint8_t> bytes,
                                                   const std::filesystem::path& baseDir,
                                                   std::string name) {
        VRMI_LOG_SCOPE("vrm:" + name);

        const auto json = extractJson(bytes);
        if (!json) {
            return core::Unexpected<std::string>(fmt::format("'{}' is neither a GLB container nor glTF JSON", name));
        }
        const nlohmann::json document = nlohmann::json::parse(*json, nullptr, false);
        if (document.is_discarded() || !document.is_object()) {
            return core::Unexpected<std::string>(fmt::format("'{}' has malformed JSON", name));
        }

        auto data = fastgltf::GltfDataBuffer::FromBytes(reinterpret_cast<const std::byte*>(bytes.data()),
                                                        bytes.size());
        if (data.error() != fastgltf::Error::None) {
            return core::Unexpected<std::string>(fmt::format("failed to buffer '{}': {}", name,
                                                fastgltf::getErrorMessage(data.error())));
        }

        fastgltf::Parser parser(fastgltf::Extensions::KHR_texture_transform |
                                fastgltf::Extensions::KHR_materials_unlit |
                                fastgltf::Extensions::KHR_materials_emissive_strength |
                                fastgltf::Extensions::KHR_mesh_quantization |
                                fastgltf::Extensions::EXT_texture_webp);

        auto asset = parser.loadGltf(data.get(), baseDir, fastgltf::Options::LoadExternalBuffers);
        if (asset.error() != fastgltf::Error::None) {
            return core::Unexpected<std::string>(fmt::format("failed to parse '{}': {}", name,
                                                fastgltf::getErrorMessage(asset.error())));
        }

        VrmDocument result;
        result.baseDir = baseDir;
        auto gltf = std::make_shared<fastgltf::Asset>(std::move(asset.get()));
        result.model = buildModel(*gltf, document, std::move(name));
        result.gltf = std::move(gltf);

        core::Logger::Asset.info("Read '{}': {} nodes, {} mesh groups, {} materials, VRMC_vrm {}",
                                 result.model.name, result.model.nodes.size(), result.model.meshGroups.size(),
                                 result.model.materials.size(), result.model.vrm ? "present" : "missing");
        return result;
    }

    core::Result<VrmDocument> VrmReader::readFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return core::Unexpected<std::string>(fmt::format("cannot open '{}'", path.string()));
        }
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (bytes.empty()) {
            return core::Unexpected<std::string>(fmt::format("'{}' is empty", path.string()));
        }
        return readBytes(bytes, path.parent_path(), path.stem().string());
    }

} // namespace vrmi::assets
