#include "vrmi/scene/HumanoidBones.hpp"

#include <algorithm>

namespace vrmi::scene
{
    const std::array<HumanoidBoneInfo, kHumanoidBoneCount> kHumanoidBones = {{
        {HumanoidBone::Hips, "hips"},
        {HumanoidBone::LeftUpperLeg, "leftUpperLeg"},
        {HumanoidBone::RightUpperLeg, "rightUpperLeg"},
        {HumanoidBone::LeftLowerLeg, "leftLowerLeg"},
        {HumanoidBone::RightLowerLeg, "rightLowerLeg"},
        {HumanoidBone::LeftFoot, "leftFoot"},
        {HumanoidBone::RightFoot, "rightFoot"},
        {HumanoidBone::Spine, "spine"},
        {HumanoidBone::Chest, "chest"},
        {HumanoidBone::Neck, "neck"},
        {HumanoidBone::Head, "head"},
        {HumanoidBone::LeftShoulder, "leftShoulder"},
        {HumanoidBone::RightShoulder, "rightShoulder"},
        {HumanoidBone::LeftUpperArm, "leftUpperArm"},
        {HumanoidBone::RightUpperArm, "rightUpperArm"},
        {HumanoidBone::LeftLowerArm, "leftLowerArm"},
        {HumanoidBone::RightLowerArm, "rightLowerArm"},
        {HumanoidBone::LeftHand, "leftHand"},
        {HumanoidBone::RightHand, "rightHand"},
        {HumanoidBone::LeftToes, "leftToes"},
        {HumanoidBone::RightToes, "rightToes"},
        {HumanoidBone::LeftEye, "leftEye"},
        {HumanoidBone::RightEye, "rightEye"},
        {HumanoidBone::Jaw, "jaw"},
        {HumanoidBone::LeftThumbProximal, "leftThumbProximal"},
        {HumanoidBone::LeftThumbIntermediate, "leftThumbIntermediate"},
        {HumanoidBone::LeftThumbDistal, "leftThumbDistal"},
        {HumanoidBone::LeftIndexProximal, "leftIndexProximal"},
        {HumanoidBone::LeftIndexIntermediate, "leftIndexIntermediate"},
        {HumanoidBone::LeftIndexDistal, "leftIndexDistal"},
        {HumanoidBone::LeftMiddleProximal, "leftMiddleProximal"},
        {HumanoidBone::LeftMiddleIntermediate, "leftMiddleIntermediate"},
        {HumanoidBone::LeftMiddleDistal, "leftMiddleDistal"},
        {HumanoidBone::LeftRingProximal, "leftRingProximal"},
        {HumanoidBone::LeftRingIntermediate, "leftRingIntermediate"},
        {HumanoidBone::LeftRingDistal, "leftRingDistal"},
        {HumanoidBone::LeftLittleProximal, "leftLittleProximal"},
        {HumanoidBone::LeftLittleIntermediate, "leftLittleIntermediate"},
        {HumanoidBone::LeftLittleDistal, "leftLittleDistal"},
        {HumanoidBone::RightThumbProximal, "rightThumbProximal"},
        {HumanoidBone::RightThumbIntermediate, "rightThumbIntermediate"},
        {HumanoidBone::RightThumbDistal, "rightThumbDistal"},
        {HumanoidBone::RightIndexProximal, "rightIndexProximal"},
        {HumanoidBone::RightIndexIntermediate, "rightIndexIntermediate"},
        {HumanoidBone::RightIndexDistal, "rightIndexDistal"},
        {HumanoidBone::RightMiddleProximal, "rightMiddleProximal"},
        {HumanoidBone::RightMiddleIntermediate, "rightMiddleIntermediate"},
        {HumanoidBone::RightMiddleDistal, "rightMiddleDistal"},
        {HumanoidBone::RightRingProximal, "rightRingProximal"},
        {HumanoidBone::RightRingIntermediate, "rightRingIntermediate"},
        {HumanoidBone::RightRingDistal, "rightRingDistal"},
        {HumanoidBone::RightLittleProximal, "rightLittleProximal"},
        {HumanoidBone::RightLittleIntermediate, "rightLittleIntermediate"},
        {HumanoidBone::RightLittleDistal, "rightLittleDistal"},
        {HumanoidBone::UpperChest, "upperChest"},
    }};

    std::string_view toString(HumanoidBone bone)
    {
        auto it = std::ranges::find(kHumanoidBones, bone, &HumanoidBoneInfo::bone);
        return it != kHumanoidBones.end() ? it->name : std::string_view("unknown");
    }

    std::optional<HumanoidBone> humanoidBoneFromName(std::string_view name)
    {
        auto it = std::ranges::find(kHumanoidBones, name, &HumanoidBoneInfo::name);
        if (it == kHumanoidBones.end())
        {
            return std::nullopt;
        }
        return it->bone;
    }

} // namespace vrmi::scene
