#pragma once

#include "vrmi/runtime/RuntimeDevice.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vrmi::runtime {

// In-memory scene device. Keeps every created object so callers can inspect
// what an import produced. Used by the tests and the console sample.
class NullRuntimeDevice : public RuntimeDevice {
public:
  struct TextureRecord {
    std::string name;
    TextureData data;
    std::optional<SamplerState> sampler;
    bool alive = true;
    uint32_t destroyCount = 0;
  };

  struct TransformRecord {
    std::string name;
    glm::vec3 translation{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    TransformHandle parent;
    std::vector<TransformHandle> children;
    std::vector<std::string> markers;
    AvatarHandle animatorAvatar;
    bool hasAnimator = false;
  };

  struct RendererRecord {
    RendererKind kind = RendererKind::Static;
    TransformHandle transform;
    MeshHandle mesh;
    std::vector<MaterialHandle> sharedMaterials;
    std::vector<TransformHandle> bones;
    TransformHandle rootBone;
  };

  struct AvatarRecord {
    std::string name;
    TransformHandle root;
    std::vector<HumanBoneBinding> bindings;
  };

  NullRuntimeDevice();
  ~NullRuntimeDevice() override;

  RuntimeBackend backend() const override { return RuntimeBackend::Null; }

  TextureHandle createTexture(const TextureDescriptor &desc) override;
  void setTextureSampler(TextureHandle texture,
                         const SamplerState &sampler) override;
  void destroyTexture(TextureHandle texture) override;
  bool isTextureAlive(TextureHandle texture) const override;
  const TextureData &textureData(TextureHandle texture) const override;
  const std::string &textureName(TextureHandle texture) const override;

  MaterialHandle createMaterial(const MaterialDescriptor &desc) override;
  MeshHandle createMesh(const MeshDescriptor &desc) override;

  TransformHandle createTransform(std::string_view name) override;
  void setName(TransformHandle transform, std::string_view name) override;
  const std::string &name(TransformHandle transform) const override;
  void setLocalPose(TransformHandle transform, const glm::vec3 &translation,
                    const glm::quat &rotation) override;
  void setParent(TransformHandle child, TransformHandle parent,
                 bool worldPositionStays) override;
  TransformHandle parent(TransformHandle transform) const override;
  std::vector<TransformHandle> children(TransformHandle transform) const override;
  glm::mat4 worldMatrix(TransformHandle transform) const override;

  RendererHandle addStaticRenderer(TransformHandle transform,
                                   MeshHandle mesh) override;
  RendererHandle addSkinnedRenderer(TransformHandle transform,
                                    MeshHandle mesh) override;
  void setSharedMaterials(RendererHandle renderer,
                          std::span<const MaterialHandle> materials) override;
  void setBones(RendererHandle renderer,
                std::span<const TransformHandle> bones) override;
  void setRootBone(RendererHandle renderer, TransformHandle rootBone) override;

  AvatarHandle createHumanoidAvatar(TransformHandle root,
                                    std::span<const HumanBoneBinding> bindings,
                                    std::string_view name) override;
  void addAnimator(TransformHandle transform, AvatarHandle avatar) override;
  void addControllerMarker(TransformHandle transform,
                           std::string_view name) override;

  // Introspection
  const TextureRecord &texture(TextureHandle texture) const;
  const TransformRecord &transform(TransformHandle transform) const;
  const RendererRecord &renderer(RendererHandle renderer) const;
  const MaterialDescriptor &material(MaterialHandle material) const;
  const MeshDescriptor &mesh(MeshHandle mesh) const;
  const AvatarRecord &avatar(AvatarHandle avatar) const;

  size_t textureCount() const { return m_textures.size(); }
  size_t liveTextureCount() const;
  uint32_t textureDestroyCount() const { return m_textureDestroyCount; }
  size_t transformCount() const { return m_transforms.size(); }
  size_t rendererCount() const { return m_renderers.size(); }
  size_t materialCount() const { return m_materials.size(); }
  size_t meshCount() const { return m_meshes.size(); }
  size_t avatarCount() const { return m_avatars.size(); }

  // Makes createHumanoidAvatar throw, as a host avatar builder rejecting an
  // incomplete skeleton would.
  void setFailAvatarCreation(bool fail) { m_failAvatarCreation = fail; }

private:
  TextureRecord &textureRecord(TextureHandle texture);
  TransformRecord &transformRecord(TransformHandle transform);
  RendererRecord &rendererRecord(RendererHandle renderer);
  glm::mat4 localMatrix(const TransformRecord &record) const;
  bool isAncestor(TransformHandle ancestor, TransformHandle transform) const;

  std::vector<TextureRecord> m_textures;
  std::vector<TransformRecord> m_transforms;
  std::vector<RendererRecord> m_renderers;
  std::vector<MaterialDescriptor> m_materials;
  std::vector<MeshDescriptor> m_meshes;
  std::vector<AvatarRecord> m_avatars;

  uint32_t m_textureDestroyCount = 0;
  bool m_failAvatarCreation = false;
};

} // namespace vrmi::runtime
