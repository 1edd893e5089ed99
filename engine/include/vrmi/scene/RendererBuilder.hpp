#pragma once

#include "vrmi/runtime/RuntimeDevice.hpp"
#include "vrmi/scene/Model.hpp"
#include "vrmi/scene/ModelAsset.hpp"

#include <span>

namespace vrmi::scene
{
    class RendererBuilder
    {
    public:
        explicit RendererBuilder(runtime::RuntimeDevice& device) : m_device(device) {}

        // Engine mesh of a single-mesh group. Throws NotImplementedError for
        // groups that would need their vertex buffers concatenated.
        MeshHandle createMesh(const MeshGroup& group);

        // Skinned when the group has a skin or morph targets, static otherwise.
        // Materials are assigned positionally by submesh material index.
        RendererHandle createRenderer(const Model& model, uint32_t nodeIndex, TransformHandle transform,
                                      const ModelMap& map, std::span<const MaterialHandle> materials);

        static void requireSingleMesh(const MeshGroup& group);

    private:
        runtime::RuntimeDevice& m_device;
    };

} // namespace vrmi::scene
