#include <catch2/catch.hpp>
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/DefinedNode.hpp"

using namespace flowgraph;
using namespace flowgraph::nodes;

// =============================================================================
// NodeBuilder Basic Tests
// =============================================================================

TEST_CASE("NodeBuilder minimal node", "[NodeBuilder]") {
    auto def = NodeBuilder("test", "category")
        .output("out", Type::Int)
        .onExecute([](NodeContext& ctx) {
            ctx.setOutput("out", int64_t(42));
        })
        .build();

    REQUIRE(def->getName() == "test");
    REQUIRE(def->getCategory() == "category");
    REQUIRE(def->getInputs().empty());
    REQUIRE(def->getOutputs().size() == 1);
    REQUIRE(def->getOutputs()[0].flow == false);
}

TEST_CASE("NodeBuilder keeps pin declaration order", "[NodeBuilder]") {
    auto def = NodeBuilder("ordered", "test")
        .flowInput()
        .input("a", Type::Int, 1)
        .input("b", Type::Double)
        .flowOutput("then")
        .output("sum", Type::Double)
        .description("Adds things")
        .build();

    REQUIRE(def->getDescription() == "Adds things");
    REQUIRE(def->getInputs().size() == 3);
    REQUIRE(def->getInputs()[0].name == "in");
    REQUIRE(def->getInputs()[0].flow);
    REQUIRE(def->getInputs()[1].name == "a");
    REQUIRE(def->getInputs()[1].defaultValue == PinValue(1));
    REQUIRE(def->getInputs()[2].type == DataType::Double);
    REQUIRE(def->findOutput("sum") != nullptr);
    REQUIRE(def->findOutput("then")->flow);
    REQUIRE(def->findInput("missing") == nullptr);
}

TEST_CASE("NodeBuilder buildAndRegister", "[NodeBuilder]") {
    NodeRegistry registry;
    NodeBuilder("registered", "test")
        .output("out", Type::Int)
        .buildAndRegister(registry);

    REQUIRE(registry.hasNode("registered"));
    REQUIRE(registry.getNode("registered")->getCategory() == "test");
}

// =============================================================================
// DefinedNode
// =============================================================================

TEST_CASE("DefinedNode creates pins from the definition", "[NodeBuilder][DefinedNode]") {
    auto def = NodeBuilder("double_it", "math")
        .flowInput()
        .flowOutput()
        .input("x", Type::Int, 0)
        .output("y", Type::Int)
        .onExecute([](NodeContext& ctx) {
            ctx.setOutput("y", ctx.getInput("x").getInt() * 2);
        })
        .build();

    DefinedNode node(def);
    REQUIRE(node.getTypeName() == "double_it");
    REQUIRE(node.getInputPins().size() == 2);
    REQUIRE(node.getOutputPins().size() == 2);
    REQUIRE(node.flowInputCount() == 1);
    REQUIRE(node.dataOutputCount() == 1);
    REQUIRE(node.findInputPin("x")->getValue() == PinValue(0));

    node.findInputPin("x")->setValue(21);
    node.execute();

    REQUIRE(node.getState() == NodeState::Success);
    REQUIRE(node.findOutputPin("y")->getValue() == PinValue(42));
}

TEST_CASE("DefinedNode raises context errors", "[NodeBuilder][DefinedNode]") {
    auto def = NodeBuilder("fails", "test")
        .onExecute([](NodeContext& ctx) {
            ctx.setError("something went wrong");
        })
        .build();

    DefinedNode node(def);
    REQUIRE_THROWS_AS(node.execute(), std::runtime_error);
    REQUIRE(node.getState() == NodeState::Error);
    REQUIRE(node.getLastError() == "something went wrong");
}

TEST_CASE("DefinedNode without definition throws", "[NodeBuilder][DefinedNode]") {
    REQUIRE_THROWS_AS(DefinedNode(nullptr), std::invalid_argument);
}

TEST_CASE("Disabled node skips execution", "[NodeBuilder][DefinedNode]") {
    int calls = 0;
    auto def = NodeBuilder("counted", "test")
        .flowInput()
        .flowOutput("a")
        .flowOutput("b")
        .onExecute([&calls](NodeContext& ctx) {
            ++calls;
            ctx.fire("a");
        })
        .build();

    DefinedNode node(def);
    node.setEnabled(false);
    node.execute();
    REQUIRE(calls == 0);
    REQUIRE(node.getExercisedFlowOutputs().size() == 2);

    node.setEnabled(true);
    node.execute();
    REQUIRE(calls == 1);
    REQUIRE(node.getExercisedFlowOutputs().size() == 1);
    REQUIRE(node.getExercisedFlowOutputs()[0]->getName() == "a");
}
