#pragma once

namespace flowgraph {
namespace nodes {

class NodeRegistry;

/**
 * Register every built-in node type
 */
void registerCommonNodes(NodeRegistry& registry);

} // namespace nodes
} // namespace flowgraph
