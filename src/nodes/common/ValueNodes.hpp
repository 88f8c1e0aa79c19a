#pragma once

namespace flowgraph {
namespace nodes {

class NodeRegistry;

/**
 * Register constant nodes (category "value"):
 * int_value, double_value, string_value, bool_value
 *
 * Each has a single output "value" holding the constant. The constant
 * is the pin value itself and is persisted with the graph.
 */
void registerValueNodes(NodeRegistry& registry);

/**
 * Register the data-flow sink "output": input "value", no outputs
 */
void registerOutputNode(NodeRegistry& registry);

} // namespace nodes
} // namespace flowgraph
