#include <catch2/catch.hpp>
#include "nodes/NodeRegistry.hpp"
#include "nodes/NodeBuilder.hpp"
#include "TestNodes.hpp"

using namespace flowgraph;
using namespace flowgraph::nodes;

TEST_CASE("NodeRegistry create by type name", "[NodeRegistry]") {
    NodeRegistry registry;
    NodeBuilder("adder", "math")
        .input("a", Type::Int)
        .output("r", Type::Int)
        .buildAndRegister(registry);

    auto node = registry.create("adder");
    REQUIRE(node != nullptr);
    REQUIRE(node->getTypeName() == "adder");
    REQUIRE(node->findInputPin("a") != nullptr);

    // Each instance gets its own ids
    auto other = registry.create("adder");
    REQUIRE(other->getId() != node->getId());
    REQUIRE(other->findInputPin("a")->getId() != node->findInputPin("a")->getId());

    REQUIRE(registry.create("unknown") == nullptr);
}

TEST_CASE("NodeRegistry accepts category prefixed names", "[NodeRegistry]") {
    NodeRegistry registry;
    NodeBuilder("adder", "math").buildAndRegister(registry);

    REQUIRE(registry.hasNode("math/adder"));
    REQUIRE(registry.getNode("math/adder") != nullptr);
    REQUIRE(registry.create("math/adder") != nullptr);
}

TEST_CASE("NodeRegistry factories", "[NodeRegistry]") {
    NodeRegistry registry;
    registry.registerFactory("plus_one", "test", [] {
        return std::make_unique<testnodes::PlusOneNode>();
    });

    REQUIRE(registry.hasNode("plus_one"));
    REQUIRE(registry.getNode("plus_one") == nullptr);
    auto node = registry.create("plus_one");
    REQUIRE(node != nullptr);
    REQUIRE(node->getTypeName() == "plus_one");
}

TEST_CASE("NodeRegistry enumeration", "[NodeRegistry]") {
    NodeRegistry registry;
    NodeBuilder("b", "cat1").buildAndRegister(registry);
    NodeBuilder("a", "cat1").buildAndRegister(registry);
    NodeBuilder("c", "cat2").buildAndRegister(registry);

    REQUIRE(registry.size() == 3);
    REQUIRE(registry.getNodeNames() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(registry.getNodeNamesInCategory("cat1") == std::vector<std::string>{"a", "b"});
    REQUIRE(registry.getCategories() == std::vector<std::string>{"cat1", "cat2"});

    registry.unregisterNode("b");
    REQUIRE_FALSE(registry.hasNode("b"));

    registry.clear();
    REQUIRE(registry.size() == 0);
}

TEST_CASE("NodeRegistry overwrites on re-registration", "[NodeRegistry]") {
    NodeRegistry registry;
    NodeBuilder("node", "first").buildAndRegister(registry);
    NodeBuilder("node", "second").buildAndRegister(registry);

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.getNode("node")->getCategory() == "second");
}
