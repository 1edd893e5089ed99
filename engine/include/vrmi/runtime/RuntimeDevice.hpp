#pragma once

#include "runtime_types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vrmi::runtime
{
    /**
     * @brief Scene API of the host engine, as seen by the importer
     *
     * Every builder drives the engine exclusively through this interface.
     * Objects are addressed by typed handles; the device owns the objects.
     * Calls with handles the device does not know throw cpptrace::out_of_range.
     */
    class RuntimeDevice
    {
    public:
        virtual ~RuntimeDevice() = default;

        [[nodiscard]] virtual RuntimeBackend backend() const = 0;

        // Textures
        virtual TextureHandle createTexture(const TextureDescriptor& desc) = 0;
        virtual void setTextureSampler(TextureHandle texture, const SamplerState& sampler) = 0;
        virtual void destroyTexture(TextureHandle texture) = 0;
        [[nodiscard]] virtual bool isTextureAlive(TextureHandle texture) const = 0;
        [[nodiscard]] virtual const TextureData& textureData(TextureHandle texture) const = 0;
        [[nodiscard]] virtual const std::string& textureName(TextureHandle texture) const = 0;

        // Materials and meshes
        virtual MaterialHandle createMaterial(const MaterialDescriptor& desc) = 0;
        virtual MeshHandle createMesh(const MeshDescriptor& desc) = 0;

        // Transforms
        virtual TransformHandle createTransform(std::string_view name) = 0;
        virtual void setName(TransformHandle transform, std::string_view name) = 0;
        [[nodiscard]] virtual const std::string& name(TransformHandle transform) const = 0;
        virtual void setLocalPose(TransformHandle transform, const glm::vec3& translation,
                                  const glm::quat& rotation) = 0;
        // An invalid parent detaches the transform. With worldPositionStays the
        // local pose is recomputed so the world matrix is unchanged.
        virtual void setParent(TransformHandle child, TransformHandle parent,
                               bool worldPositionStays) = 0;
        [[nodiscard]] virtual TransformHandle parent(TransformHandle transform) const = 0;
        [[nodiscard]] virtual std::vector<TransformHandle> children(TransformHandle transform) const = 0;
        [[nodiscard]] virtual glm::mat4 worldMatrix(TransformHandle transform) const = 0;

        // Renderers
        virtual RendererHandle addStaticRenderer(TransformHandle transform, MeshHandle mesh) = 0;
        virtual RendererHandle addSkinnedRenderer(TransformHandle transform, MeshHandle mesh) = 0;
        virtual void setSharedMaterials(RendererHandle renderer, std::span<const MaterialHandle> materials) = 0;
        virtual void setBones(RendererHandle renderer, std::span<const TransformHandle> bones) = 0;
        virtual void setRootBone(RendererHandle renderer, TransformHandle rootBone) = 0;

        // Avatar. Creation may reject the bone table; the error propagates.
        virtual AvatarHandle createHumanoidAvatar(TransformHandle root,
                                                  std::span<const HumanBoneBinding> bindings,
                                                  std::string_view name) = 0;
        virtual void addAnimator(TransformHandle transform, AvatarHandle avatar) = 0;
        virtual void addControllerMarker(TransformHandle transform, std::string_view name) = 0;
    };

} // namespace vrmi::runtime
