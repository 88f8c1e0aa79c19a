#include "graph/Pin.hpp"
#include "graph/Connection.hpp"
#include <algorithm>

namespace flowgraph {

Pin::Pin(Node* parent, std::string name, PinDirection direction,
         DataType dataType, bool isFlowPin, PinValue defaultValue)
    : m_id(generateId())
    , m_name(std::move(name))
    , m_direction(direction)
    , m_dataType(dataType)
    , m_isFlowPin(isFlowPin)
    , m_value(isFlowPin ? PinValue() : defaultValue)
    , m_defaultValue(isFlowPin ? PinValue() : std::move(defaultValue))
    , m_parent(parent)
{}

Pin::~Pin() {
    // Connections outliving the pin must not keep a dangling pointer
    if (m_incoming) {
        m_incoming->forgetPin(this);
    }
    for (auto* connection : m_outgoing) {
        connection->forgetPin(this);
    }
}

void Pin::setValue(const PinValue& value) {
    if (m_isFlowPin) {
        return;
    }
    m_value = value;
}

void Pin::resetValue() {
    m_value = m_defaultValue;
}

bool Pin::isDataTypeCompatible(DataType other) const {
    return flowgraph::isDataTypeCompatible(m_dataType, other);
}

bool Pin::canConnectTo(const Pin& other, bool replaceExisting) const {
    if (&other == this) {
        return false;
    }
    if (m_parent == nullptr || other.m_parent == nullptr) {
        return false;
    }
    if (m_parent == other.m_parent) {
        return false;
    }
    if (m_direction == other.m_direction) {
        return false;
    }

    // The input side accepts a single connection
    const Pin& input = isInput() ? *this : other;
    if (input.m_incoming != nullptr && !replaceExisting) {
        return false;
    }

    if (m_isFlowPin != other.m_isFlowPin) {
        return false;
    }
    if (m_isFlowPin) {
        return true;
    }
    return isDataTypeCompatible(other.m_dataType);
}

void Pin::attach(Connection* connection) {
    if (isInput()) {
        m_incoming = connection;
    } else if (std::find(m_outgoing.begin(), m_outgoing.end(), connection) == m_outgoing.end()) {
        m_outgoing.push_back(connection);
    }
}

void Pin::detach(Connection* connection) {
    if (isInput()) {
        if (m_incoming == connection) {
            m_incoming = nullptr;
        }
    } else {
        m_outgoing.erase(std::remove(m_outgoing.begin(), m_outgoing.end(), connection),
                         m_outgoing.end());
    }
}

} // namespace flowgraph
