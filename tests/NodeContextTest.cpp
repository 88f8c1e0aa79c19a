#include <catch2/catch.hpp>
#include "nodes/NodeContext.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/DefinedNode.hpp"

using namespace flowgraph;
using namespace flowgraph::nodes;

namespace {

NodeDefinitionPtr makeDefinition() {
    return NodeBuilder("ctx_test", "test")
        .flowInput()
        .flowOutput("yes")
        .flowOutput("no")
        .input("a", Type::Int, 5)
        .input("b", Type::Any)
        .output("result", Type::Int)
        .build();
}

} // anonymous namespace

// =============================================================================
// NodeContext Basic Tests
// =============================================================================

TEST_CASE("NodeContext default state", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    REQUIRE(ctx.hasError() == false);
    REQUIRE(ctx.getErrorMessage().empty());
    REQUIRE(ctx.getNodeId() == node.getId());
    REQUIRE(ctx.getNodeName() == "ctx_test");
}

TEST_CASE("NodeContext reads inputs", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    REQUIRE(ctx.getInput("a") == PinValue(5));
    REQUIRE(ctx.hasInput("a"));
    REQUIRE_FALSE(ctx.hasInput("b"));
    REQUIRE(ctx.getInput("nonexistent").isNull());
    // Flow pins are not readable as data
    REQUIRE(ctx.getInput("in").isNull());
    REQUIRE_FALSE(ctx.isInputConnected("a"));
}

TEST_CASE("NodeContext setOutput/getOutput", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    ctx.setOutput("result", int64_t(100));
    REQUIRE(ctx.getOutput("result") == PinValue(100));
    REQUIRE(node.findOutputPin("result")->getValue() == PinValue(100));
}

TEST_CASE("NodeContext setOutput on unknown pin throws", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    REQUIRE_THROWS_AS(ctx.setOutput("missing", 1), std::runtime_error);
    REQUIRE_THROWS_AS(ctx.setOutput("yes", 1), std::runtime_error);
}

TEST_CASE("NodeContext fire rejects unknown flow outputs", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    REQUIRE_NOTHROW(ctx.fire("yes"));
    REQUIRE_THROWS_AS(ctx.fire("result"), std::invalid_argument);
}

TEST_CASE("NodeContext error state", "[NodeContext]") {
    DefinedNode node(makeDefinition());
    NodeContext ctx(node);

    ctx.setError("bad input");
    REQUIRE(ctx.hasError());
    REQUIRE(ctx.getErrorMessage() == "bad input");
}

TEST_CASE("NodeContext halt fires nothing", "[NodeContext]") {
    auto def = NodeBuilder("halting", "test")
        .flowInput()
        .flowOutput()
        .onExecute([](NodeContext& ctx) { ctx.halt(); })
        .build();

    DefinedNode node(def);
    node.execute();
    REQUIRE(node.getExercisedFlowOutputs().empty());
}
