#include "graph/Node.hpp"
#include "graph/NodeGroup.hpp"
#include <stdexcept>

namespace flowgraph {

namespace {

size_t countPins(const std::vector<std::unique_ptr<Pin>>& pins, bool flow) {
    size_t count = 0;
    for (const auto& pin : pins) {
        if (pin->isFlowPin() == flow) {
            ++count;
        }
    }
    return count;
}

Pin* findByName(const std::vector<std::unique_ptr<Pin>>& pins, const std::string& name) {
    for (const auto& pin : pins) {
        if (pin->getName() == name) {
            return pin.get();
        }
    }
    return nullptr;
}

} // anonymous namespace

Node::Node(std::string typeName)
    : m_id(generateId())
    , m_typeName(std::move(typeName))
    , m_name(m_typeName)
{}

Node::~Node() {
    if (m_group) {
        m_group->removeNode(*this);
    }
}

Pin* Node::findInputPin(const std::string& name) const {
    return findByName(m_inputs, name);
}

Pin* Node::findOutputPin(const std::string& name) const {
    return findByName(m_outputs, name);
}

Pin* Node::findPin(const std::string& id) const {
    for (const auto& pin : m_inputs) {
        if (pin->getId() == id) return pin.get();
    }
    for (const auto& pin : m_outputs) {
        if (pin->getId() == id) return pin.get();
    }
    return nullptr;
}

size_t Node::flowInputCount() const {
    return countPins(m_inputs, true);
}

size_t Node::flowOutputCount() const {
    return countPins(m_outputs, true);
}

size_t Node::dataInputCount() const {
    return countPins(m_inputs, false);
}

size_t Node::dataOutputCount() const {
    return countPins(m_outputs, false);
}

void Node::execute() {
    m_flowSelected = false;
    m_firedOutputs.clear();
    m_lastError.clear();

    if (!m_enabled) {
        return;
    }

    m_state = NodeState::Executing;
    try {
        onExecute();
    } catch (const std::exception& e) {
        m_state = NodeState::Error;
        m_lastError = e.what();
        throw;
    } catch (...) {
        m_state = NodeState::Error;
        m_lastError = "Unknown error";
        throw;
    }
    m_state = NodeState::Success;
}

std::vector<Pin*> Node::getExercisedFlowOutputs() const {
    std::vector<Pin*> result;
    for (const auto& pin : m_outputs) {
        if (!pin->isFlowPin()) continue;
        if (!m_flowSelected || m_firedOutputs.count(pin->getName()) > 0) {
            result.push_back(pin.get());
        }
    }
    return result;
}

void Node::onDeserialized() {
    for (auto& pin : m_inputs) {
        pin->setParentNode(this);
    }
    for (auto& pin : m_outputs) {
        pin->setParentNode(this);
    }
}

Pin& Node::addInputPin(const std::string& name, DataType type, PinValue defaultValue) {
    m_inputs.push_back(std::make_unique<Pin>(this, name, PinDirection::Input, type, false, std::move(defaultValue)));
    return *m_inputs.back();
}

Pin& Node::addOutputPin(const std::string& name, DataType type, PinValue defaultValue) {
    m_outputs.push_back(std::make_unique<Pin>(this, name, PinDirection::Output, type, false, std::move(defaultValue)));
    return *m_outputs.back();
}

Pin& Node::addFlowInputPin(const std::string& name) {
    m_inputs.push_back(std::make_unique<Pin>(this, name, PinDirection::Input, DataType::Any, true));
    return *m_inputs.back();
}

Pin& Node::addFlowOutputPin(const std::string& name) {
    m_outputs.push_back(std::make_unique<Pin>(this, name, PinDirection::Output, DataType::Any, true));
    return *m_outputs.back();
}

void Node::fireFlow(const std::string& pinName) {
    Pin* pin = findOutputPin(pinName);
    if (!pin || !pin->isFlowPin()) {
        throw std::invalid_argument("Node '" + m_typeName + "' has no flow output: " + pinName);
    }
    m_flowSelected = true;
    m_firedOutputs.insert(pinName);
}

void Node::haltFlow() {
    m_flowSelected = true;
    m_firedOutputs.clear();
}

void Node::setGroup(NodeGroup* group) {
    m_group = group;
    m_groupId = group ? std::optional<std::string>(group->getId()) : std::nullopt;
}

} // namespace flowgraph
