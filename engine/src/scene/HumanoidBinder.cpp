#include "vrmi/scene/HumanoidBinder.hpp"

#include "vrmi/core/logger.hpp"

namespace vrmi::scene
{
    size_t HumanoidBinder::assign(Model& model, const VrmExtension& vrm)
    {
        size_t assigned = 0;
        for (const auto& info : kHumanoidBones)
        {
            auto it = vrm.humanBones.find(info.bone);
            if (it == vrm.humanBones.end())
            {
                continue;
            }
            if (!model.isSourceNode(it->second))
            {
                core::Logger::Scene.debug("humanoid '{}' points at node {} which does not exist, skipped",
                                          info.name, it->second);
                continue;
            }
            model.nodes[static_cast<size_t>(it->second)].humanoidBone = info.bone;
            ++assigned;
        }
        core::Logger::Scene.debug("Assigned {} of {} humanoid roles", assigned, kHumanoidBoneCount);
        return assigned;
    }

    std::vector<runtime::HumanBoneBinding> HumanoidBinder::buildBindings(const Model& model, const ModelMap& map)
    {
        std::vector<runtime::HumanBoneBinding> bindings;
        bindings.reserve(map.nodes().size());
        for (const auto& [node, transform] : map.nodes())
        {
            bindings.push_back({model.node(node).humanoidBone, transform});
        }
        return bindings;
    }

} // namespace vrmi::scene
