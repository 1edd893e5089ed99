#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace vrmi::core {

template <typename Tag>
struct Handle {
    uint32_t id = std::numeric_limits<uint32_t>::max();

    constexpr bool isValid() const { return id != std::numeric_limits<uint32_t>::max(); }
    constexpr void invalidate() { id = std::numeric_limits<uint32_t>::max(); }

    auto operator<=>(const Handle&) const = default;
    explicit operator bool() const { return isValid(); }
};

struct TextureTag {};
struct MaterialTag {};
struct MeshTag {};
struct TransformTag {};
struct RendererTag {};
struct AvatarTag {};

} // namespace vrmi::core

template <typename Tag>
struct std::hash<vrmi::core::Handle<Tag>> {
    size_t operator()(const vrmi::core::Handle<Tag>& h) const noexcept {
        return std::hash<uint32_t>{}(h.id);
    }
};

namespace vrmi {

using TextureHandle = core::Handle<core::TextureTag>;
using MaterialHandle = core::Handle<core::MaterialTag>;
using MeshHandle = core::Handle<core::MeshTag>;
using TransformHandle = core::Handle<core::TransformTag>;
using RendererHandle = core::Handle<core::RendererTag>;
using AvatarHandle = core::Handle<core::AvatarTag>;

inline constexpr TransformHandle INVALID_TRANSFORM_HANDLE{};

} // namespace vrmi
