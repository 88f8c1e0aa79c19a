#include "graph/Connection.hpp"
#include "graph/Pin.hpp"
#include "graph/Node.hpp"

namespace flowgraph {

Connection::Connection(Pin& source, Pin& target)
    : m_id(generateId())
    , m_sourcePinId(source.getId())
    , m_targetPinId(target.getId())
{
    setSourcePin(&source);
    setTargetPin(&target);
    transfer();
}

Connection::Connection(std::string id, std::string sourcePinId, std::string targetPinId)
    : m_id(std::move(id))
    , m_sourcePinId(std::move(sourcePinId))
    , m_targetPinId(std::move(targetPinId))
{}

Connection::~Connection() {
    if (m_source) {
        m_source->detach(this);
    }
    if (m_target) {
        m_target->detach(this);
    }
}

Node* Connection::getSourceNode() const {
    return m_source ? m_source->getParentNode() : nullptr;
}

Node* Connection::getTargetNode() const {
    return m_target ? m_target->getParentNode() : nullptr;
}

void Connection::setSourcePin(Pin* pin) {
    if (m_source == pin) {
        return;
    }
    if (m_source) {
        m_source->detach(this);
    }
    m_source = pin;
    if (m_source) {
        m_sourcePinId = m_source->getId();
        m_source->attach(this);
    }
}

void Connection::setTargetPin(Pin* pin) {
    if (m_target == pin) {
        return;
    }
    if (m_target) {
        m_target->detach(this);
    }
    m_target = pin;
    if (m_target) {
        m_targetPinId = m_target->getId();
        m_target->attach(this);
    }
}

bool Connection::isValid() const {
    if (!isResolved()) {
        return false;
    }
    if (m_source->getParentNode() == nullptr || m_target->getParentNode() == nullptr) {
        return false;
    }
    if (!m_source->isOutput() || !m_target->isInput()) {
        return false;
    }
    if (m_source->isFlowPin() != m_target->isFlowPin()) {
        return false;
    }
    return m_source->isFlowPin() || m_source->isDataTypeCompatible(m_target->getDataType());
}

bool Connection::involves(const Node& node) const {
    return getSourceNode() == &node || getTargetNode() == &node;
}

bool Connection::isFlowConnection() const {
    if (m_source) {
        return m_source->isFlowPin();
    }
    return m_target != nullptr && m_target->isFlowPin();
}

void Connection::transfer() {
    if (!isResolved() || m_source->isFlowPin()) {
        return;
    }
    m_target->setValue(m_source->getValue());
}

void Connection::disconnect() {
    if (m_target) {
        bool feedsTarget = m_target->getIncomingConnection() == this;
        m_target->detach(this);
        if (feedsTarget) {
            m_target->resetValue();
        }
        m_target = nullptr;
    }
    if (m_source) {
        m_source->detach(this);
        m_source = nullptr;
    }
}

void Connection::forgetPin(Pin* pin) {
    if (m_source == pin) {
        m_source = nullptr;
    }
    if (m_target == pin) {
        m_target = nullptr;
    }
}

} // namespace flowgraph
