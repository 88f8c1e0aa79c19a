#pragma once

#include "graph/Node.hpp"
#include "engine/ExecutionOptions.hpp"
#include "engine/ExecutionResult.hpp"

namespace flowgraph {

/**
 * Run one evaluation step of a node on behalf of an engine
 *
 * Emits Started/Completed/Failed events, records the duration under the
 * node type in the Profiler and appends the node to
 * result.executedNodeIds. Exceptions from the node propagate after the
 * Failed event.
 */
void invokeNode(Node& node, const ExecutionOptions& options, ExecutionResult& result);

} // namespace flowgraph
