#include "vrmi/runtime/null/NullRuntimeDevice.hpp"

#include "vrmi/core/logger.hpp"

#include <algorithm>
#include <cpptrace/cpptrace.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace vrmi::runtime {

namespace {

template <typename Container, typename Tag>
auto &lookup(Container &container, core::Handle<Tag> handle,
             const char *what) {
  if (!handle.isValid() || handle.id >= container.size()) {
    throw cpptrace::out_of_range(
        fmt::format("NullRuntimeDevice: unknown {} handle {}", what, handle.id));
  }
  return container[handle.id];
}

} // namespace

NullRuntimeDevice::NullRuntimeDevice() {
  core::Logger::Runtime.trace("NullRuntimeDevice created");
}

NullRuntimeDevice::~NullRuntimeDevice() {
  core::Logger::Runtime.trace(
      "NullRuntimeDevice destroyed ({} textures, {} still alive)",
      m_textures.size(), liveTextureCount());
}

TextureHandle NullRuntimeDevice::createTexture(const TextureDescriptor &desc) {
  TextureHandle handle{static_cast<uint32_t>(m_textures.size())};
  m_textures.push_back(TextureRecord{desc.name, desc.data, std::nullopt});
  core::Logger::Runtime.trace("createTexture: {} ({}x{}) -> {}", desc.name,
                              desc.data.width, desc.data.height, handle.id);
  return handle;
}

void NullRuntimeDevice::setTextureSampler(TextureHandle texture,
                                          const SamplerState &sampler) {
  textureRecord(texture).sampler = sampler;
}

void NullRuntimeDevice::destroyTexture(TextureHandle texture) {
  auto &record = textureRecord(texture);
  ++record.destroyCount;
  ++m_textureDestroyCount;
  if (!record.alive) {
    core::Logger::Runtime.error("destroyTexture: '{}' destroyed twice",
                                record.name);
    return;
  }
  record.alive = false;
  core::Logger::Runtime.trace("destroyTexture: {}", record.name);
}

bool NullRuntimeDevice::isTextureAlive(TextureHandle texture) const {
  return texture.isValid() && texture.id < m_textures.size() &&
         m_textures[texture.id].alive;
}

const TextureData &NullRuntimeDevice::textureData(TextureHandle texture) const {
  return lookup(m_textures, texture, "texture").data;
}

const std::string &NullRuntimeDevice::textureName(TextureHandle texture) const {
  return lookup(m_textures, texture, "texture").name;
}

size_t NullRuntimeDevice::liveTextureCount() const {
  return static_cast<size_t>(std::ranges::count_if(
      m_textures, [](const TextureRecord &t) { return t.alive; }));
}

MaterialHandle
NullRuntimeDevice::createMaterial(const MaterialDescriptor &desc) {
  MaterialHandle handle{static_cast<uint32_t>(m_materials.size())};
  m_materials.push_back(desc);
  core::Logger::Runtime.trace("createMaterial: {} -> {}", desc.name, handle.id);
  return handle;
}

MeshHandle NullRuntimeDevice::createMesh(const MeshDescriptor &desc) {
  MeshHandle handle{static_cast<uint32_t>(m_meshes.size())};
  m_meshes.push_back(desc);
  core::Logger::Runtime.trace("createMesh: {} ({} vertices, {} submeshes)",
                              desc.name, desc.positions.size(),
                              desc.submeshes.size());
  return handle;
}

TransformHandle NullRuntimeDevice::createTransform(std::string_view name) {
  TransformHandle handle{static_cast<uint32_t>(m_transforms.size())};
  TransformRecord record;
  record.name = std::string(name);
  m_transforms.push_back(std::move(record));
  return handle;
}

void NullRuntimeDevice::setName(TransformHandle transform,
                                std::string_view name) {
  transformRecord(transform).name = std::string(name);
}

const std::string &NullRuntimeDevice::name(TransformHandle transform) const {
  return lookup(m_transforms, transform, "transform").name;
}

void NullRuntimeDevice::setLocalPose(TransformHandle transform,
                                     const glm::vec3 &translation,
                                     const glm::quat &rotation) {
  auto &record = transformRecord(transform);
  record.translation = translation;
  record.rotation = rotation;
}

void NullRuntimeDevice::setParent(TransformHandle child, TransformHandle parent,
                                  bool worldPositionStays) {
  auto &childRecord = transformRecord(child);
  if (parent.isValid()) {
    lookup(m_transforms, parent, "transform");
    if (parent == child || isAncestor(child, parent)) {
      throw cpptrace::logic_error(
          fmt::format("setParent: '{}' cannot be parented under its own "
                      "descendant",
                      childRecord.name));
    }
  }

  const glm::mat4 world = worldMatrix(child);

  if (childRecord.parent.isValid()) {
    auto &siblings = m_transforms[childRecord.parent.id].children;
    std::erase(siblings, child);
  }
  childRecord.parent = parent;
  if (parent.isValid()) {
    m_transforms[parent.id].children.push_back(child);
  }

  if (!worldPositionStays) {
    return;
  }

  const glm::mat4 parentWorld =
      parent.isValid() ? worldMatrix(parent) : glm::mat4(1.0f);
  const glm::mat4 local = glm::inverse(parentWorld) * world;

  // Poses carry no scale, so the basis only needs renormalizing.
  const glm::mat3 basis(glm::normalize(glm::vec3(local[0])),
                        glm::normalize(glm::vec3(local[1])),
                        glm::normalize(glm::vec3(local[2])));
  childRecord.translation = glm::vec3(local[3]);
  childRecord.rotation = glm::normalize(glm::quat_cast(basis));
}

TransformHandle NullRuntimeDevice::parent(TransformHandle transform) const {
  return lookup(m_transforms, transform, "transform").parent;
}

std::vector<TransformHandle>
NullRuntimeDevice::children(TransformHandle transform) const {
  return lookup(m_transforms, transform, "transform").children;
}

glm::mat4 NullRuntimeDevice::worldMatrix(TransformHandle transform) const {
  const auto &record = lookup(m_transforms, transform, "transform");
  glm::mat4 world = localMatrix(record);
  for (TransformHandle p = record.parent; p.isValid();
       p = m_transforms[p.id].parent) {
    world = localMatrix(m_transforms[p.id]) * world;
  }
  return world;
}

RendererHandle NullRuntimeDevice::addStaticRenderer(TransformHandle transform,
                                                    MeshHandle mesh) {
  transformRecord(transform);
  lookup(m_meshes, mesh, "mesh");
  RendererHandle handle{static_cast<uint32_t>(m_renderers.size())};
  m_renderers.push_back(
      RendererRecord{RendererKind::Static, transform, mesh, {}, {}, {}});
  return handle;
}

RendererHandle NullRuntimeDevice::addSkinnedRenderer(TransformHandle transform,
                                                     MeshHandle mesh) {
  transformRecord(transform);
  lookup(m_meshes, mesh, "mesh");
  RendererHandle handle{static_cast<uint32_t>(m_renderers.size())};
  m_renderers.push_back(
      RendererRecord{RendererKind::Skinned, transform, mesh, {}, {}, {}});
  return handle;
}

void NullRuntimeDevice::setSharedMaterials(
    RendererHandle renderer, std::span<const MaterialHandle> materials) {
  rendererRecord(renderer).sharedMaterials.assign(materials.begin(),
                                                  materials.end());
}

void NullRuntimeDevice::setBones(RendererHandle renderer,
                                 std::span<const TransformHandle> bones) {
  auto &record = rendererRecord(renderer);
  if (record.kind != RendererKind::Skinned) {
    throw cpptrace::logic_error("setBones: renderer is not skinned");
  }
  record.bones.assign(bones.begin(), bones.end());
}

void NullRuntimeDevice::setRootBone(RendererHandle renderer,
                                    TransformHandle rootBone) {
  auto &record = rendererRecord(renderer);
  if (record.kind != RendererKind::Skinned) {
    throw cpptrace::logic_error("setRootBone: renderer is not skinned");
  }
  record.rootBone = rootBone;
}

AvatarHandle NullRuntimeDevice::createHumanoidAvatar(
    TransformHandle root, std::span<const HumanBoneBinding> bindings,
    std::string_view name) {
  transformRecord(root);
  if (m_failAvatarCreation) {
    throw cpptrace::runtime_error(
        fmt::format("createHumanoidAvatar: avatar '{}' rejected", name));
  }
  AvatarHandle handle{static_cast<uint32_t>(m_avatars.size())};
  m_avatars.push_back(AvatarRecord{
      std::string(name), root,
      std::vector<HumanBoneBinding>(bindings.begin(), bindings.end())});
  core::Logger::Runtime.trace("createHumanoidAvatar: {} ({} bindings)", name,
                              bindings.size());
  return handle;
}

void NullRuntimeDevice::addAnimator(TransformHandle transform,
                                    AvatarHandle avatar) {
  auto &record = transformRecord(transform);
  lookup(m_avatars, avatar, "avatar");
  record.hasAnimator = true;
  record.animatorAvatar = avatar;
}

void NullRuntimeDevice::addControllerMarker(TransformHandle transform,
                                            std::string_view name) {
  transformRecord(transform).markers.emplace_back(name);
}

const NullRuntimeDevice::TextureRecord &
NullRuntimeDevice::texture(TextureHandle texture) const {
  return lookup(m_textures, texture, "texture");
}

const NullRuntimeDevice::TransformRecord &
NullRuntimeDevice::transform(TransformHandle transform) const {
  return lookup(m_transforms, transform, "transform");
}

const NullRuntimeDevice::RendererRecord &
NullRuntimeDevice::renderer(RendererHandle renderer) const {
  return lookup(m_renderers, renderer, "renderer");
}

const MaterialDescriptor &
NullRuntimeDevice::material(MaterialHandle material) const {
  return lookup(m_materials, material, "material");
}

const MeshDescriptor &NullRuntimeDevice::mesh(MeshHandle mesh) const {
  return lookup(m_meshes, mesh, "mesh");
}

const NullRuntimeDevice::AvatarRecord &
NullRuntimeDevice::avatar(AvatarHandle avatar) const {
  return lookup(m_avatars, avatar, "avatar");
}

NullRuntimeDevice::TextureRecord &
NullRuntimeDevice::textureRecord(TextureHandle texture) {
  return lookup(m_textures, texture, "texture");
}

NullRuntimeDevice::TransformRecord &
NullRuntimeDevice::transformRecord(TransformHandle transform) {
  return lookup(m_transforms, transform, "transform");
}

NullRuntimeDevice::RendererRecord &
NullRuntimeDevice::rendererRecord(RendererHandle renderer) {
  return lookup(m_renderers, renderer, "renderer");
}

glm::mat4 NullRuntimeDevice::localMatrix(const TransformRecord &record) const {
  return glm::translate(glm::mat4(1.0f), record.translation) *
         glm::mat4_cast(record.rotation);
}

bool NullRuntimeDevice::isAncestor(TransformHandle ancestor,
                                   TransformHandle transform) const {
  for (TransformHandle p = m_transforms[transform.id].parent; p.isValid();
       p = m_transforms[p.id].parent) {
    if (p == ancestor) {
      return true;
    }
  }
  return false;
}

} // namespace vrmi::runtime
