#pragma once

namespace flowgraph {
namespace nodes {

class NodeRegistry;

/**
 * Register control-flow nodes (category "flow"):
 * - start: entry point, flow output "out"
 * - sequence: fires "then_0" then "then_1"
 * - branch: fires "true" or "false" from the Bool input "condition"
 * - merge: joins flow inputs "in_0" / "in_1" into "out" (loop back-edges)
 * - counter: increments its Int output "count" on every step
 * - print: logs its "message" input
 */
void registerFlowNodes(NodeRegistry& registry);

} // namespace nodes
} // namespace flowgraph
