#include "vrmi/scene/SceneGraphBuilder.hpp"

#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"

namespace vrmi::scene
{
    TransformHandle SceneGraphBuilder::buildHierarchy(const Model& model, uint32_t rootNode, ModelMap& map)
    {
        VRMI_PROFILE_FUNCTION();
        createNodes(model, rootNode, INVALID_TRANSFORM_HANDLE, map);
        core::Logger::Scene.debug("Built hierarchy of {} transforms", map.nodes().size());
        return map.transformOf(rootNode);
    }

    void SceneGraphBuilder::createNodes(const Model& model, uint32_t nodeIndex, TransformHandle parent,
                                        ModelMap& map)
    {
        const Node& node = model.node(nodeIndex);

        const TransformHandle transform = m_device.createTransform(node.name);
        m_device.setLocalPose(transform, node.translation, node.rotation);
        // Throws on a node reached twice, which also stops cycles
        map.addNode(nodeIndex, transform);
        if (parent.isValid())
        {
            m_device.setParent(transform, parent, false);
        }

        for (uint32_t child : node.children)
        {
            createNodes(model, child, transform, map);
        }
    }

    void SceneGraphBuilder::substituteRoot(uint32_t sourceRoot, TransformHandle hostRoot, ModelMap& map)
    {
        const TransformHandle createdRoot = map.transformOf(sourceRoot);
        if (createdRoot == hostRoot)
        {
            return;
        }

        // children() is a snapshot, reparenting below does not disturb it
        for (TransformHandle child : m_device.children(createdRoot))
        {
            m_device.setParent(child, hostRoot, true);
        }
        map.rebindNode(sourceRoot, hostRoot);

        core::Logger::Scene.debug("Grafted hierarchy under host root '{}'", m_device.name(hostRoot));
    }

} // namespace vrmi::scene
