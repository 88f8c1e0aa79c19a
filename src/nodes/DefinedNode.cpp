#include "nodes/DefinedNode.hpp"
#include <stdexcept>

namespace flowgraph {
namespace nodes {

DefinedNode::DefinedNode(NodeDefinitionPtr definition)
    : Node(definition ? definition->getName() : std::string())
    , m_definition(std::move(definition))
{
    if (!m_definition) {
        throw std::invalid_argument("DefinedNode requires a node definition");
    }

    for (const auto& def : m_definition->getInputs()) {
        if (def.flow) {
            addFlowInputPin(def.name);
        } else {
            addInputPin(def.name, def.type, def.defaultValue);
        }
    }
    for (const auto& def : m_definition->getOutputs()) {
        if (def.flow) {
            addFlowOutputPin(def.name);
        } else {
            addOutputPin(def.name, def.type, def.defaultValue);
        }
    }
}

void DefinedNode::onExecute() {
    NodeContext ctx(*this);
    m_definition->execute(ctx);
    if (ctx.hasError()) {
        throw std::runtime_error(ctx.getErrorMessage());
    }
}

} // namespace nodes
} // namespace flowgraph
