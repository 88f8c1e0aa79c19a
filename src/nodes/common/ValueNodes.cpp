#include "ValueNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"
#include "util/Logger.hpp"

namespace flowgraph {
namespace nodes {

void registerValueNodes(NodeRegistry& registry) {
    NodeBuilder("int_value", "value")
        .output("value", Type::Int, int64_t(0))
        .buildAndRegister(registry);

    NodeBuilder("double_value", "value")
        .output("value", Type::Double, 0.0)
        .buildAndRegister(registry);

    NodeBuilder("string_value", "value")
        .output("value", Type::String, std::string())
        .buildAndRegister(registry);

    NodeBuilder("bool_value", "value")
        .output("value", Type::Bool, false)
        .buildAndRegister(registry);
}

void registerOutputNode(NodeRegistry& registry) {
    NodeBuilder("output", "value")
        .description("Data-flow sink")
        .input("value", Type::Any)
        .onExecute([](NodeContext& ctx) {
            FLOWGRAPH_LOG_DEBUG("[" + ctx.getNodeName() + "] = " + ctx.getInput("value").toString());
        })
        .buildAndRegister(registry);
}

} // namespace nodes
} // namespace flowgraph
