#pragma once

#include "vrmi/core/Handle.h"
#include "vrmi/scene/HumanoidBones.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace vrmi::runtime
{
    // Backend selection
    enum class RuntimeBackend
    {
        Null
    };

    // How texel values of a texture are interpreted when sampled
    enum class ColorSpace
    {
        sRGB,
        Linear
    };

    enum class WrapMode
    {
        Repeat,
        Clamp,
        Mirror
    };

    enum class FilterMode
    {
        Point,
        Bilinear,
        Trilinear
    };

    // Axis a wrap entry applies to. All is exclusive with U/V/W.
    enum class SamplerWrapType : uint8_t
    {
        All,
        U,
        V,
        W
    };

    struct SamplerState
    {
        FilterMode filter = FilterMode::Bilinear;
        WrapMode wrapU = WrapMode::Repeat;
        WrapMode wrapV = WrapMode::Repeat;
        WrapMode wrapW = WrapMode::Repeat;

        bool operator==(const SamplerState&) const = default;
    };

    // Tightly packed RGBA8 texels, row 0 first.
    struct TextureData
    {
        uint32_t width = 0;
        uint32_t height = 0;
        ColorSpace colorSpace = ColorSpace::sRGB;
        std::vector<uint8_t> rgba;

        [[nodiscard]] glm::u8vec4 texel(uint32_t x, uint32_t y) const
        {
            const size_t offset = (static_cast<size_t>(y) * width + x) * 4;
            return {rgba[offset], rgba[offset + 1], rgba[offset + 2], rgba[offset + 3]};
        }
    };

    struct TextureDescriptor
    {
        std::string name;
        TextureData data;
    };

    enum class AlphaMode
    {
        Opaque,
        Mask,
        Blend
    };

    struct MaterialDescriptor
    {
        std::string name;

        TextureHandle baseColorTexture;
        TextureHandle normalTexture;
        TextureHandle standardTexture; // metallic / occlusion / smoothness pack
        TextureHandle emissiveTexture;

        glm::vec4 baseColorFactor{1.0f};
        float metallicFactor = 1.0f;
        float roughnessFactor = 1.0f;
        float normalScale = 1.0f;
        float occlusionStrength = 1.0f;
        glm::vec3 emissiveFactor{0.0f};

        AlphaMode alphaMode = AlphaMode::Opaque;
        float alphaCutoff = 0.5f;
        bool doubleSided = false;
    };

    struct SubmeshRange
    {
        uint32_t firstIndex = 0;
        uint32_t indexCount = 0;
    };

    struct BlendShapeDescriptor
    {
        std::string name;
        std::vector<glm::vec3> positionDeltas;
        std::vector<glm::vec3> normalDeltas;
    };

    struct MeshDescriptor
    {
        std::string name;

        std::vector<glm::vec3> positions;
        std::vector<glm::vec3> normals;
        std::vector<glm::vec2> uv0;
        std::vector<glm::u16vec4> joints;
        std::vector<glm::vec4> weights;
        std::vector<uint32_t> indices;

        std::vector<SubmeshRange> submeshes;
        std::vector<BlendShapeDescriptor> blendShapes;
    };

    // One entry of the role -> transform table handed to avatar creation
    struct HumanBoneBinding
    {
        scene::HumanoidBone bone = scene::HumanoidBone::Unknown;
        TransformHandle transform;
    };

    enum class RendererKind
    {
        Static,
        Skinned
    };

} // namespace vrmi::runtime
