#pragma once

#include "vrmi/runtime/runtime_types.hpp"
#include "vrmi/scene/HumanoidBones.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace vrmi::scene
{
    struct MorphTarget
    {
        std::string name;
        std::vector<glm::vec3> positionDeltas;
        std::vector<glm::vec3> normalDeltas;
    };

    struct Submesh
    {
        uint32_t firstIndex = 0;
        uint32_t indexCount = 0;
        uint32_t materialIndex = 0;
    };

    struct Mesh
    {
        std::string name;

        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<glm::vec2> uv0;
        std::vector<glm::u16vec4> joints;
        std::vector<glm::vec4> weights;
        std::vector<uint32_t> indices;

        std::vector<Submesh> submeshes;
        std::vector<MorphTarget> morphTargets;
    };

    // Joints and root are node indices of the owning Model
    struct Skin
    {
        std::string name;
        std::vector<uint32_t> joints;
        std::optional<uint32_t> root;
    };

    struct MeshGroup
    {
        std::string name;
        std::vector<Mesh> meshes;
        std::optional<Skin> skin;

        [[nodiscard]] bool hasMorphTargets() const
        {
            for (const auto& mesh : meshes)
            {
                if (!mesh.morphTargets.empty())
                {
                    return true;
                }
            }
            return false;
        }
    };

    struct Node
    {
        std::string name;
        glm::vec3 translation{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

        std::vector<uint32_t> children;     // owned, in source order
        std::optional<uint32_t> meshGroup;  // shared
        HumanoidBone humanoidBone = HumanoidBone::Unknown;
    };

    struct MaterialDescription
    {
        std::string name;

        glm::vec4 baseColorFactor{1.0f};
        std::optional<uint32_t> baseColorTexture;

        float metallicFactor = 1.0f;
        float roughnessFactor = 1.0f;
        std::optional<uint32_t> metallicRoughnessTexture;

        std::optional<uint32_t> normalTexture;
        float normalScale = 1.0f;

        std::optional<uint32_t> occlusionTexture;
        float occlusionStrength = 1.0f;

        std::optional<uint32_t> emissiveTexture;
        glm::vec3 emissiveFactor{0.0f};

        runtime::AlphaMode alphaMode = runtime::AlphaMode::Opaque;
        float alphaCutoff = 0.5f;
        bool doubleSided = false;
    };

    // Contents of the VRMC_vrm extension block
    struct VrmExtension
    {
        std::string specVersion;
        std::string metaName;
        // Declared node index per role, as written in the file (may be out of range)
        std::map<HumanoidBone, int64_t> humanBones;
    };

    /**
     * @brief Parsed source description of an avatar
     *
     * Flat arena: nodes reference children, mesh groups and skin joints by
     * index. Immutable once parsed except for the humanoid role of each node.
     */
    struct Model
    {
        std::string name;
        std::vector<Node> nodes;
        std::vector<MeshGroup> meshGroups;
        std::vector<MaterialDescription> materials;
        uint32_t root = 0;
        // Nodes declared by the file. Nodes past it (the reader's synthetic
        // root) are not addressable from file data. Unset for models built in code.
        std::optional<uint32_t> sourceNodeCount;

        std::optional<VrmExtension> vrm;

        [[nodiscard]] bool isValidNode(int64_t index) const
        {
            return index >= 0 && static_cast<uint64_t>(index) < nodes.size();
        }

        // Index a file reference may name
        [[nodiscard]] bool isSourceNode(int64_t index) const
        {
            return isValidNode(index) && (!sourceNodeCount || index < static_cast<int64_t>(*sourceNodeCount));
        }

        // Throws cpptrace::out_of_range
        const Node& node(uint32_t index) const;
        Node& node(uint32_t index);
        const MeshGroup& meshGroup(uint32_t index) const;

        uint32_t addNode(Node node);
        void addChild(uint32_t parent, uint32_t child);
    };

} // namespace vrmi::scene
