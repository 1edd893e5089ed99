#pragma once

#include "vrmi/core/Handle.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vrmi::scene
{
    /**
     * @brief Correspondence between source entities and engine objects
     *
     * Nodes are kept in creation (pre-order) order next to lookups in both
     * directions. Source entities are referenced by their Model index.
     */
    class ModelMap
    {
    public:
        void addNode(uint32_t node, TransformHandle transform);
        // Points an existing node entry at another transform
        void rebindNode(uint32_t node, TransformHandle transform);

        [[nodiscard]] TransformHandle transformOf(uint32_t node) const; // throws cpptrace::out_of_range
        [[nodiscard]] std::optional<uint32_t> nodeOf(TransformHandle transform) const;
        [[nodiscard]] bool containsNode(uint32_t node) const { return m_nodeToTransform.contains(node); }
        [[nodiscard]] const std::vector<std::pair<uint32_t, TransformHandle>>& nodes() const { return m_nodes; }

        void addMesh(uint32_t meshGroup, MeshHandle mesh);
        [[nodiscard]] MeshHandle meshOf(uint32_t meshGroup) const; // throws cpptrace::out_of_range
        [[nodiscard]] std::optional<uint32_t> meshGroupOf(MeshHandle mesh) const;
        [[nodiscard]] size_t meshCount() const { return m_meshGroupToMesh.size(); }

        void addRenderer(uint32_t node, RendererHandle renderer);
        [[nodiscard]] const std::vector<RendererHandle>& renderers() const { return m_renderers; }
        [[nodiscard]] std::optional<RendererHandle> rendererOf(uint32_t node) const;

    private:
        std::vector<std::pair<uint32_t, TransformHandle>> m_nodes;
        std::unordered_map<uint32_t, TransformHandle> m_nodeToTransform;
        std::unordered_map<TransformHandle, uint32_t> m_transformToNode;

        std::unordered_map<uint32_t, MeshHandle> m_meshGroupToMesh;
        std::unordered_map<MeshHandle, uint32_t> m_meshToMeshGroup;

        std::vector<RendererHandle> m_renderers;
        std::unordered_map<uint32_t, RendererHandle> m_nodeToRenderer;
    };

    // Output of an import. Owned by the caller once the import completes.
    class ModelAsset
    {
    public:
        std::string name;
        TransformHandle root = INVALID_TRANSFORM_HANDLE;
        AvatarHandle avatar;
        std::vector<MaterialHandle> materials;
        ModelMap map;
    };

} // namespace vrmi::scene
