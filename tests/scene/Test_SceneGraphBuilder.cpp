#include <doctest/doctest.h>

#include "TestModels.hpp"
#include "vrmi/runtime/null/NullRuntimeDevice.hpp"
#include "vrmi/scene/SceneGraphBuilder.hpp"

#include <cpptrace/cpptrace.hpp>

using namespace vrmi;
using namespace vrmi::scene;

TEST_CASE("SceneGraphBuilder mirrors the node tree") {
    runtime::NullRuntimeDevice device;
    SceneGraphBuilder builder(device);
    const Model model = test::makeAvatarModel();
    ModelMap map;

    const TransformHandle root = builder.buildHierarchy(model, model.root, map);

    CHECK(device.transformCount() == model.nodes.size());
    CHECK(device.name(root) == "Root");
    CHECK_FALSE(device.parent(root).isValid());

    SUBCASE("Pre-order creation") {
        std::vector<uint32_t> order;
        for (const auto& [node, transform] : map.nodes()) {
            order.push_back(node);
        }
        CHECK((order == std::vector<uint32_t>{0, 1, 2, 3, 4, 5}));
    }

    SUBCASE("Parents and local poses") {
        const auto head = map.transformOf(4);
        CHECK(device.name(head) == "Head");
        CHECK(device.parent(head) == map.transformOf(3));
        CHECK(device.transform(head).translation.y == doctest::Approx(0.5f));

        // 1 + 0.2 + 0.5
        CHECK(device.worldMatrix(head)[3].y == doctest::Approx(1.7f));
    }

    SUBCASE("Lookups in both directions") {
        CHECK(map.nodeOf(map.transformOf(2)) == 2u);
        CHECK_FALSE(map.nodeOf(TransformHandle{999}).has_value());
        CHECK_THROWS_AS(map.transformOf(42), cpptrace::out_of_range);
    }
}

TEST_CASE("SceneGraphBuilder rejects a node reached twice") {
    runtime::NullRuntimeDevice device;
    SceneGraphBuilder builder(device);
    Model model = test::makeAvatarModel();
    // Head becomes a child of Root as well
    model.addChild(0, 4);

    ModelMap map;
    CHECK_THROWS_AS(builder.buildHierarchy(model, model.root, map), cpptrace::logic_error);
}

TEST_CASE("SceneGraphBuilder grafts onto a host root") {
    runtime::NullRuntimeDevice device;
    SceneGraphBuilder builder(device);
    const Model model = test::makeAvatarModel();
    ModelMap map;

    const TransformHandle host = device.createTransform("Host");
    device.setLocalPose(host, {5, 0, 0}, glm::quat(1, 0, 0, 0));

    const TransformHandle created = builder.buildHierarchy(model, model.root, map);
    const auto hips = map.transformOf(1);
    const glm::vec3 hipsWorld = glm::vec3(device.worldMatrix(hips)[3]);

    builder.substituteRoot(model.root, host, map);

    CHECK(map.transformOf(model.root) == host);
    CHECK(map.nodeOf(host) == model.root);
    CHECK_FALSE(map.nodeOf(created).has_value());
    CHECK(device.children(created).empty());
    CHECK(device.parent(hips) == host);

    // World pose survives the move
    const glm::vec3 moved = glm::vec3(device.worldMatrix(hips)[3]);
    CHECK(moved.x == doctest::Approx(hipsWorld.x));
    CHECK(moved.y == doctest::Approx(hipsWorld.y));
    CHECK(device.transform(hips).translation.x == doctest::Approx(-5.0f));

    // Map order keeps the root entry in place
    CHECK(map.nodes().front().second == host);
}

TEST_CASE("Root substitution keeps child order") {
    runtime::NullRuntimeDevice device;
    SceneGraphBuilder builder(device);

    Model model;
    const uint32_t root = model.addNode(Node{.name = "Root"});
    const uint32_t first = model.addNode(Node{.name = "First"});
    const uint32_t second = model.addNode(Node{.name = "Second"});
    model.addChild(root, first);
    model.addChild(root, second);
    model.root = root;

    ModelMap map;
    builder.buildHierarchy(model, root, map);
    const TransformHandle host = device.createTransform("Host");
    builder.substituteRoot(root, host, map);

    CHECK((device.children(host) == std::vector<TransformHandle>{map.transformOf(first), map.transformOf(second)}));
    CHECK(map.transformOf(root) == host);
}
