#include "register.hpp"
#include "FlowNodes.hpp"
#include "ValueNodes.hpp"
#include "MathNodes.hpp"

namespace flowgraph {
namespace nodes {

void registerCommonNodes(NodeRegistry& registry) {
    registerFlowNodes(registry);
    registerValueNodes(registry);
    registerOutputNode(registry);
    registerMathNodes(registry);
}

} // namespace nodes
} // namespace flowgraph
