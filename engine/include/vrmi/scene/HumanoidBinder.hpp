#pragma once

#include "vrmi/runtime/RuntimeDevice.hpp"
#include "vrmi/scene/Model.hpp"
#include "vrmi/scene/ModelAsset.hpp"

#include <vector>

namespace vrmi::scene
{
    class HumanoidBinder
    {
    public:
        // Writes every declared role onto its node. Declarations pointing
        // outside the node list are skipped. Returns the number of roles assigned.
        static size_t assign(Model& model, const VrmExtension& vrm);

        // Role (or Unknown) of every mapped node, in map order
        static std::vector<runtime::HumanBoneBinding> buildBindings(const Model& model, const ModelMap& map);
    };

} // namespace vrmi::scene
