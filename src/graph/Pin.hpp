#pragma once

#include "graph/Types.hpp"
#include <string>
#include <vector>

namespace flowgraph {

class Node;
class Connection;

/**
 * Typed, directional connection point owned by exactly one node
 *
 * Flow pins sequence control-flow execution and carry no value.
 * Data pins hold a PinValue; an input pin falls back to its default
 * value when its connection is removed.
 *
 * The parent node and connection pointers are navigation-only
 * back-references: the node owns the pin, the graph owns connections.
 */
class Pin {
public:
    Pin(Node* parent, std::string name, PinDirection direction,
        DataType dataType, bool isFlowPin, PinValue defaultValue = PinValue());
    ~Pin();

    // Non-copyable (connections and nodes point at pins)
    Pin(const Pin&) = delete;
    Pin& operator=(const Pin&) = delete;

    // === Identity ===

    const std::string& getId() const { return m_id; }

    /**
     * Replace the identifier (used when restoring a persisted graph)
     */
    void setId(std::string id) { m_id = std::move(id); }

    const std::string& getName() const { return m_name; }
    PinDirection getDirection() const { return m_direction; }
    bool isInput() const { return m_direction == PinDirection::Input; }
    bool isOutput() const { return m_direction == PinDirection::Output; }
    DataType getDataType() const { return m_dataType; }
    bool isFlowPin() const { return m_isFlowPin; }
    bool isDataPin() const { return !m_isFlowPin; }

    // === Value ===

    const PinValue& getValue() const { return m_value; }

    /**
     * Set the current value. Ignored for flow pins.
     */
    void setValue(const PinValue& value);

    const PinValue& getDefaultValue() const { return m_defaultValue; }
    void setDefaultValue(const PinValue& value) { m_defaultValue = value; }

    /**
     * Restore the default value
     */
    void resetValue();

    // === Relationships ===

    Node* getParentNode() const { return m_parent; }
    void setParentNode(Node* node) { m_parent = node; }

    /**
     * Connection feeding this input pin (nullptr for outputs or when unconnected)
     */
    Connection* getIncomingConnection() const { return m_incoming; }

    /**
     * Connections leaving this output pin, in registration order
     */
    const std::vector<Connection*>& getOutgoingConnections() const { return m_outgoing; }

    bool isConnected() const { return m_incoming != nullptr || !m_outgoing.empty(); }

    // === Compatibility ===

    /**
     * Check whether this pin may be connected to another pin
     *
     * Rejects: same pin, pins of the same node, equal directions,
     * flow/data mismatch, incompatible data types, and an input side
     * that already has a connection unless `replaceExisting` is set.
     */
    bool canConnectTo(const Pin& other, bool replaceExisting = false) const;

    bool isDataTypeCompatible(DataType other) const;

private:
    friend class Connection;

    void attach(Connection* connection);
    void detach(Connection* connection);

    std::string m_id;
    std::string m_name;
    PinDirection m_direction;
    DataType m_dataType;
    bool m_isFlowPin;
    PinValue m_value;
    PinValue m_defaultValue;

    Node* m_parent = nullptr;
    Connection* m_incoming = nullptr;
    std::vector<Connection*> m_outgoing;
};

} // namespace flowgraph
