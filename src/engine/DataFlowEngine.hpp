#pragma once

#include "graph/NodeGraph.hpp"
#include "engine/Cancellation.hpp"
#include "engine/ExecutionErrors.hpp"
#include "engine/ExecutionOptions.hpp"
#include "engine/ExecutionResult.hpp"
#include <future>
#include <unordered_set>

namespace flowgraph {

/**
 * Executes a data-flow graph
 *
 * A node is ready once every data input is either unconnected or fed
 * by an already evaluated node. Ready nodes are evaluated one at a time
 * in graph insertion order and push their outputs downstream. Sink
 * nodes (no outgoing data connection) report their values in
 * ExecutionResult::sinkOutputs.
 *
 * A throwing node aborts the whole pass. Every run starts a fresh pass.
 */
class DataFlowEngine {
public:
    explicit DataFlowEngine(ExecutionOptions options = ExecutionOptions{});

    const ExecutionOptions& getOptions() const { return m_options; }

    /**
     * Run the graph on the calling thread
     * Throws GraphPreconditionError for a non data-flow graph or a
     * dangling main node, CyclicDependencyError when nodes block each other.
     */
    ExecutionResult execute(NodeGraph& graph, const CancellationToken& token = CancellationToken()) const;

    /**
     * Run the graph on a worker thread
     * The graph must outlive the returned future and must not be mutated meanwhile.
     */
    std::future<ExecutionResult> executeAsync(NodeGraph& graph, CancellationToken token = CancellationToken()) const;

private:
    static bool isReady(const NodeGraph& graph, const Node& node,
                        const std::unordered_set<const Node*>& evaluated);

    static bool hasOutgoingDataConnection(const NodeGraph& graph, const Node& node);

    static void collectSinkOutputs(const NodeGraph& graph,
                                   const std::unordered_set<const Node*>& evaluated,
                                   ExecutionResult& result);

    ExecutionOptions m_options;
};

} // namespace flowgraph
