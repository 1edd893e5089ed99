#include "vrmi/scene/Model.hpp"

#include <cpptrace/cpptrace.hpp>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace vrmi::scene
{
    const Node& Model::node(uint32_t index) const
    {
        if (index >= nodes.size())
        {
            throw cpptrace::out_of_range(fmt::format("node index {} out of range ({} nodes)", index, nodes.size()));
        }
        return nodes[index];
    }

    Node& Model::node(uint32_t index)
    {
        return const_cast<Node&>(std::as_const(*this).node(index));
    }

    const MeshGroup& Model::meshGroup(uint32_t index) const
    {
        if (index >= meshGroups.size())
        {
            throw cpptrace::out_of_range(
                fmt::format("mesh group index {} out of range ({} groups)", index, meshGroups.size()));
        }
        return meshGroups[index];
    }

    uint32_t Model::addNode(Node node)
    {
        nodes.push_back(std::move(node));
        return static_cast<uint32_t>(nodes.size() - 1);
    }

    void Model::addChild(uint32_t parent, uint32_t child)
    {
        this->node(child);
        this->node(parent).children.push_back(child);
    }

} // namespace vrmi::scene
