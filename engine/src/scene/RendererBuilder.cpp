#include "vrmi/scene/RendererBuilder.hpp"

#include "vrmi/core/errors.hpp"
#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"

#include <cpptrace/cpptrace.hpp>
#include <vector>

namespace vrmi::scene
{
    void RendererBuilder::requireSingleMesh(const MeshGroup& group)
    {
        if (group.meshes.size() != 1)
        {
            core::Logger::Scene.error("Mesh group '{}' has {} meshes; isolated vertex buffers are not supported",
                                      group.name, group.meshes.size());
            throw core::NotImplementedError(
                fmt::format("invalid isolated vertexbuffer: mesh group '{}' has {} meshes", group.name,
                            group.meshes.size()));
        }
    }

    MeshHandle RendererBuilder::createMesh(const MeshGroup& group)
    {
        VRMI_PROFILE_FUNCTION();
        requireSingleMesh(group);

        const Mesh& src = group.meshes.front();

        runtime::MeshDescriptor desc;
        desc.name = group.name;
        desc.positions = src.positions;
        desc.normals = src.normals;
        desc.uv0 = src.uv0;
        if (group.skin)
        {
            desc.joints = src.joints;
            desc.weights = src.weights;
        }
        desc.indices = src.indices;

        desc.submeshes.reserve(src.submeshes.size());
        for (const auto& submesh : src.submeshes)
        {
            desc.submeshes.push_back({submesh.firstIndex, submesh.indexCount});
        }

        desc.blendShapes.reserve(src.morphTargets.size());
        for (const auto& target : src.morphTargets)
        {
            desc.blendShapes.push_back({target.name, target.positionDeltas, target.normalDeltas});
        }

        return m_device.createMesh(desc);
    }

    RendererHandle RendererBuilder::createRenderer(const Model& model, uint32_t nodeIndex,
                                                   TransformHandle transform, const ModelMap& map,
                                                   std::span<const MaterialHandle> materials)
    {
        const Node& node = model.node(nodeIndex);
        if (!node.meshGroup)
        {
            throw cpptrace::logic_error(fmt::format("node '{}' has no mesh group", node.name));
        }
        const MeshGroup& group = model.meshGroup(*node.meshGroup);
        requireSingleMesh(group);

        const Mesh& mesh = group.meshes.front();
        const MeshHandle sharedMesh = map.meshOf(*node.meshGroup);

        RendererHandle renderer;
        if (group.skin || !mesh.morphTargets.empty())
        {
            renderer = m_device.addSkinnedRenderer(transform, sharedMesh);
            if (group.skin)
            {
                std::vector<TransformHandle> bones;
                bones.reserve(group.skin->joints.size());
                for (uint32_t joint : group.skin->joints)
                {
                    bones.push_back(map.transformOf(joint));
                }
                m_device.setBones(renderer, bones);

                if (group.skin->root)
                {
                    m_device.setRootBone(renderer, map.transformOf(*group.skin->root));
                }
            }
        }
        else
        {
            renderer = m_device.addStaticRenderer(transform, sharedMesh);
        }

        std::vector<MaterialHandle> sharedMaterials;
        sharedMaterials.reserve(mesh.submeshes.size());
        for (const auto& submesh : mesh.submeshes)
        {
            if (submesh.materialIndex >= materials.size())
            {
                throw cpptrace::out_of_range(fmt::format("submesh of '{}' references material {} ({} materials)",
                                                         group.name, submesh.materialIndex, materials.size()));
            }
            sharedMaterials.push_back(materials[submesh.materialIndex]);
        }
        m_device.setSharedMaterials(renderer, sharedMaterials);

        return renderer;
    }

} // namespace vrmi::scene
