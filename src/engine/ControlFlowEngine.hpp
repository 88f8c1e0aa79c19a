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
 * Executes a control-flow graph
 *
 * Starting at the main node, evaluates a node, then follows the flow
 * outputs it exercised (declaration order) and each of their
 * connections (registration order), depth-first. Nodes may be visited
 * again, so loops are bounded by ExecutionOptions::maxSteps and
 * maxVisitsPerNode.
 *
 * Before a flow node runs, its connected data inputs are pulled: pure
 * data nodes upstream are evaluated on demand, then each feeding
 * connection transfers its value.
 *
 * A throwing node aborts its own branch only; the failure is recorded
 * with the path from the main node and sibling branches continue.
 */
class ControlFlowEngine {
public:
    explicit ControlFlowEngine(ExecutionOptions options = ExecutionOptions{});

    const ExecutionOptions& getOptions() const { return m_options; }

    /**
     * Run the graph on the calling thread
     * Throws GraphPreconditionError for a non control-flow graph or a
     * missing/invalid main node.
     */
    ExecutionResult execute(NodeGraph& graph, const CancellationToken& token = CancellationToken()) const;

    /**
     * Run the graph on a worker thread
     * The graph must outlive the returned future and must not be mutated meanwhile.
     */
    std::future<ExecutionResult> executeAsync(NodeGraph& graph, CancellationToken token = CancellationToken()) const;

private:
    void checkPreconditions(const NodeGraph& graph) const;

    void pullDataInputs(const NodeGraph& graph, Node& node, ExecutionResult& result,
                        std::unordered_set<const Node*>& visiting) const;

    void evaluateDataNode(const NodeGraph& graph, Node& node, ExecutionResult& result,
                          std::unordered_set<const Node*>& visiting) const;

    ExecutionOptions m_options;
};

} // namespace flowgraph
