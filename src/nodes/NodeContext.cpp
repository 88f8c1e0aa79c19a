#include "nodes/NodeContext.hpp"
#include "nodes/DefinedNode.hpp"
#include <stdexcept>

namespace flowgraph {
namespace nodes {

NodeContext::NodeContext(DefinedNode& node)
    : m_node(node)
{}

PinValue NodeContext::getInput(const std::string& name) const {
    Pin* pin = m_node.findInputPin(name);
    if (!pin || pin->isFlowPin()) {
        return PinValue();
    }
    return pin->getValue();
}

bool NodeContext::hasInput(const std::string& name) const {
    return !getInput(name).isNull();
}

bool NodeContext::isInputConnected(const std::string& name) const {
    Pin* pin = m_node.findInputPin(name);
    return pin && pin->getIncomingConnection() != nullptr;
}

void NodeContext::setOutput(const std::string& name, const PinValue& value) {
    Pin* pin = m_node.findOutputPin(name);
    if (!pin || pin->isFlowPin()) {
        throw std::runtime_error("Node '" + m_node.getTypeName() + "' has no data output: " + name);
    }
    pin->setValue(value);
}

PinValue NodeContext::getOutput(const std::string& name) const {
    Pin* pin = m_node.findOutputPin(name);
    if (!pin || pin->isFlowPin()) {
        return PinValue();
    }
    return pin->getValue();
}

void NodeContext::fire(const std::string& flowOutput) {
    m_node.fireFlow(flowOutput);
}

void NodeContext::halt() {
    m_node.haltFlow();
}

void NodeContext::setError(const std::string& message) {
    m_hasError = true;
    m_errorMessage = message;
}

const std::string& NodeContext::getNodeId() const {
    return m_node.getId();
}

const std::string& NodeContext::getNodeName() const {
    return m_node.getName();
}

} // namespace nodes
} // namespace flowgraph
