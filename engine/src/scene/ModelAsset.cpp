#include "vrmi/scene/ModelAsset.hpp"

#include "vrmi/core/common.hpp"

#include <algorithm>
#include <cpptrace/cpptrace.hpp>
#include <spdlog/fmt/fmt.h>

namespace vrmi::scene
{
    void ModelMap::addNode(uint32_t node, TransformHandle transform)
    {
        if (!m_nodeToTransform.emplace(node, transform).second)
        {
            throw cpptrace::logic_error(fmt::format("node {} is already mapped", node));
        }
        m_transformToNode[transform] = node;
        m_nodes.emplace_back(node, transform);
    }

    void ModelMap::rebindNode(uint32_t node, TransformHandle transform)
    {
        auto it = m_nodeToTransform.find(node);
        if (it == m_nodeToTransform.end())
        {
            throw cpptrace::out_of_range(fmt::format("node {} is not mapped", node));
        }
        m_transformToNode.erase(it->second);
        it->second = transform;
        m_transformToNode[transform] = node;

        auto entry = std::ranges::find(m_nodes, node, &std::pair<uint32_t, TransformHandle>::first);
        VRMI_ASSERT(entry != m_nodes.end(), "node order table is missing a mapped node");
        entry->second = transform;
    }

    TransformHandle ModelMap::transformOf(uint32_t node) const
    {
        auto it = m_nodeToTransform.find(node);
        if (it == m_nodeToTransform.end())
        {
            throw cpptrace::out_of_range(fmt::format("node {} has no transform", node));
        }
        return it->second;
    }

    std::optional<uint32_t> ModelMap::nodeOf(TransformHandle transform) const
    {
        auto it = m_transformToNode.find(transform);
        if (it == m_transformToNode.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void ModelMap::addMesh(uint32_t meshGroup, MeshHandle mesh)
    {
        m_meshGroupToMesh[meshGroup] = mesh;
        m_meshToMeshGroup[mesh] = meshGroup;
    }

    MeshHandle ModelMap::meshOf(uint32_t meshGroup) const
    {
        auto it = m_meshGroupToMesh.find(meshGroup);
        if (it == m_meshGroupToMesh.end())
        {
            throw cpptrace::out_of_range(fmt::format("mesh group {} has no mesh", meshGroup));
        }
        return it->second;
    }

    std::optional<uint32_t> ModelMap::meshGroupOf(MeshHandle mesh) const
    {
        auto it = m_meshToMeshGroup.find(mesh);
        if (it == m_meshToMeshGroup.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void ModelMap::addRenderer(uint32_t node, RendererHandle renderer)
    {
        m_renderers.push_back(renderer);
        m_nodeToRenderer[node] = renderer;
    }

    std::optional<RendererHandle> ModelMap::rendererOf(uint32_t node) const
    {
        auto it = m_nodeToRenderer.find(node);
        if (it == m_nodeToRenderer.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

} // namespace vrmi::scene
