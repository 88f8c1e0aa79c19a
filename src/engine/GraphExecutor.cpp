#include "engine/GraphExecutor.hpp"

namespace flowgraph {

ExecutionEngine GraphExecutor::makeEngine(GraphCategory category, ExecutionOptions options) {
    if (category == GraphCategory::DataFlow) {
        return DataFlowEngine(std::move(options));
    }
    return ControlFlowEngine(std::move(options));
}

ExecutionResult GraphExecutor::execute(const ExecutionEngine& engine, NodeGraph& graph,
                                       const CancellationToken& token) {
    return std::visit([&graph, &token](const auto& e) {
        return e.execute(graph, token);
    }, engine);
}

ExecutionResult GraphExecutor::execute(NodeGraph& graph, const CancellationToken& token,
                                       ExecutionOptions options) {
    return execute(makeEngine(graph.getCategory(), std::move(options)), graph, token);
}

std::future<ExecutionResult> GraphExecutor::executeAsync(NodeGraph& graph, CancellationToken token,
                                                         ExecutionOptions options) {
    ExecutionEngine engine = makeEngine(graph.getCategory(), std::move(options));
    return std::async(std::launch::async, [engine = std::move(engine), &graph, token]() {
        return execute(engine, graph, token);
    });
}

} // namespace flowgraph
