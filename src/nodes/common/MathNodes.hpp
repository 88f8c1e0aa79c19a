#pragma once

namespace flowgraph {
namespace nodes {

class NodeRegistry;

/**
 * Register math operation nodes:
 * - add, subtract, multiply, divide, less_than
 *
 * All share the same signature:
 *   Inputs:
 *     - a (Any, default 0): left operand
 *     - b (Any, default 0): right operand
 *   Outputs:
 *     - result: Int when both operands are Int (except divide), Double
 *       otherwise; Bool for less_than
 */
void registerMathNodes(NodeRegistry& registry);

} // namespace nodes
} // namespace flowgraph
