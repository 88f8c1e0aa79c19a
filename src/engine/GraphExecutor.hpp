#pragma once

#include "engine/ControlFlowEngine.hpp"
#include "engine/DataFlowEngine.hpp"
#include <future>
#include <variant>

namespace flowgraph {

/**
 * One of the two schedulers, chosen from the graph category
 */
using ExecutionEngine = std::variant<ControlFlowEngine, DataFlowEngine>;

/**
 * Runs a graph with the engine matching its category
 *
 * Example usage:
 *   CancellationSource cancel;
 *   auto future = GraphExecutor::executeAsync(graph, cancel.getToken());
 *   ExecutionResult result = future.get();
 */
class GraphExecutor {
public:
    static ExecutionEngine makeEngine(GraphCategory category, ExecutionOptions options = ExecutionOptions{});

    static ExecutionResult execute(const ExecutionEngine& engine, NodeGraph& graph,
                                   const CancellationToken& token = CancellationToken());

    static ExecutionResult execute(NodeGraph& graph,
                                   const CancellationToken& token = CancellationToken(),
                                   ExecutionOptions options = ExecutionOptions{});

    /**
     * Start a run on a worker thread
     * Precondition errors surface from future::get().
     */
    static std::future<ExecutionResult> executeAsync(NodeGraph& graph,
                                                     CancellationToken token = CancellationToken(),
                                                     ExecutionOptions options = ExecutionOptions{});
};

} // namespace flowgraph
