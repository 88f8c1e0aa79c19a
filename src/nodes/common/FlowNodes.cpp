#include "FlowNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"
#include "util/Logger.hpp"

namespace flowgraph {
namespace nodes {

void registerFlowNodes(NodeRegistry& registry) {
    NodeBuilder("start", "flow")
        .description("Entry point of a control-flow graph")
        .flowOutput("out")
        .buildAndRegister(registry);

    NodeBuilder("sequence", "flow")
        .description("Runs both outputs in order")
        .flowInput("in")
        .flowOutput("then_0")
        .flowOutput("then_1")
        .buildAndRegister(registry);

    NodeBuilder("branch", "flow")
        .flowInput("in")
        .input("condition", Type::Bool, false)
        .flowOutput("true")
        .flowOutput("false")
        .onExecute([](NodeContext& ctx) {
            auto condition = ctx.getInput("condition");
            if (condition.isNull()) {
                ctx.setError("Input 'condition' is not set");
                return;
            }
            ctx.fire(condition.getBool() ? "true" : "false");
        })
        .buildAndRegister(registry);

    NodeBuilder("merge", "flow")
        .flowInput("in_0")
        .flowInput("in_1")
        .flowOutput("out")
        .buildAndRegister(registry);

    NodeBuilder("counter", "flow")
        .flowInput("in")
        .flowOutput("out")
        .output("count", Type::Int, 0)
        .onExecute([](NodeContext& ctx) {
            auto count = ctx.getOutput("count");
            ctx.setOutput("count", (count.isNull() ? int64_t(0) : count.getInt()) + 1);
        })
        .buildAndRegister(registry);

    NodeBuilder("print", "flow")
        .flowInput("in")
        .flowOutput("out")
        .input("message", Type::Any)
        .onExecute([](NodeContext& ctx) {
            FLOWGRAPH_LOG_INFO("[" + ctx.getNodeName() + "] " + ctx.getInput("message").toString());
        })
        .buildAndRegister(registry);
}

} // namespace nodes
} // namespace flowgraph
