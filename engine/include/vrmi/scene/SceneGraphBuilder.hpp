#pragma once

#include "vrmi/runtime/RuntimeDevice.hpp"
#include "vrmi/scene/Model.hpp"
#include "vrmi/scene/ModelAsset.hpp"

namespace vrmi::scene
{
    /**
     * @brief Instantiates the node tree of a Model as engine transforms
     */
    class SceneGraphBuilder
    {
    public:
        explicit SceneGraphBuilder(runtime::RuntimeDevice& device) : m_device(device) {}

        // Depth-first, pre-order. One transform per node reachable from
        // rootNode, each registered in map. Returns the transform of rootNode.
        TransformHandle buildHierarchy(const Model& model, uint32_t rootNode, ModelMap& map);

        // Moves every child of the transform created for sourceRoot under
        // hostRoot (keeping world poses) and rebinds sourceRoot to hostRoot.
        void substituteRoot(uint32_t sourceRoot, TransformHandle hostRoot, ModelMap& map);

    private:
        void createNodes(const Model& model, uint32_t nodeIndex, TransformHandle parent, ModelMap& map);

        runtime::RuntimeDevice& m_device;
    };

} // namespace vrmi::scene
