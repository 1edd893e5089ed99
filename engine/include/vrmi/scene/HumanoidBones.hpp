#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vrmi::scene
{
    // Standard humanoid skeleton roles. Unknown is the "no role" sentinel
    // carried by nodes nobody declared and by avatar bindings of such nodes.
    enum class HumanoidBone : uint8_t
    {
        Unknown = 0,
        Hips,
        LeftUpperLeg, RightUpperLeg,
        LeftLowerLeg, RightLowerLeg,
        LeftFoot, RightFoot,
        Spine,
        Chest,
        Neck,
        Head,
        LeftShoulder, RightShoulder,
        LeftUpperArm, RightUpperArm,
        LeftLowerArm, RightLowerArm,
        LeftHand, RightHand,
        LeftToes, RightToes,
        LeftEye, RightEye,
        Jaw,
        LeftThumbProximal, LeftThumbIntermediate, LeftThumbDistal,
        LeftIndexProximal, LeftIndexIntermediate, LeftIndexDistal,
        LeftMiddleProximal, LeftMiddleIntermediate, LeftMiddleDistal,
        LeftRingProximal, LeftRingIntermediate, LeftRingDistal,
        LeftLittleProximal, LeftLittleIntermediate, LeftLittleDistal,
        RightThumbProximal, RightThumbIntermediate, RightThumbDistal,
        RightIndexProximal, RightIndexIntermediate, RightIndexDistal,
        RightMiddleProximal, RightMiddleIntermediate, RightMiddleDistal,
        RightRingProximal, RightRingIntermediate, RightRingDistal,
        RightLittleProximal, RightLittleIntermediate, RightLittleDistal,
        UpperChest,
        Count
    };

    inline constexpr size_t kHumanoidBoneCount = static_cast<size_t>(HumanoidBone::Count) - 1;

    struct HumanoidBoneInfo
    {
        HumanoidBone bone;
        std::string_view name; // key inside VRMC_vrm.humanoid.humanBones
    };

    // Every assignable role, in the order the importer assigns them.
    extern const std::array<HumanoidBoneInfo, kHumanoidBoneCount> kHumanoidBones;

    std::string_view toString(HumanoidBone bone);
    std::optional<HumanoidBone> humanoidBoneFromName(std::string_view name);

} // namespace vrmi::scene
