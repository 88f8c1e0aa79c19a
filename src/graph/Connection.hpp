#pragma once

#include <string>

namespace flowgraph {

class Pin;
class Node;

/**
 * Directed edge from an output pin to an input pin
 *
 * A connection keeps the persisted pin ids alongside the resolved
 * pin pointers. A freshly loaded connection is unresolved until the
 * owning graph relinks it.
 */
class Connection {
public:
    /**
     * Create a resolved connection and push the source value into the target
     */
    Connection(Pin& source, Pin& target);

    /**
     * Create an unresolved connection record from persisted ids
     */
    Connection(std::string id, std::string sourcePinId, std::string targetPinId);

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& getId() const { return m_id; }
    const std::string& getSourcePinId() const { return m_sourcePinId; }
    const std::string& getTargetPinId() const { return m_targetPinId; }

    Pin* getSourcePin() const { return m_source; }
    Pin* getTargetPin() const { return m_target; }

    Node* getSourceNode() const;
    Node* getTargetNode() const;

    // === Relinking ===

    void setSourcePin(Pin* pin);
    void setTargetPin(Pin* pin);

    bool isResolved() const { return m_source != nullptr && m_target != nullptr; }

    /**
     * True when both endpoints resolve and are direction, flow-kind
     * and data-type compatible
     */
    bool isValid() const;

    bool involves(const Node& node) const;
    bool isFlowConnection() const;

    // === Value propagation ===

    /**
     * Copy the source value into the target (data connections only)
     */
    void transfer();

    /**
     * Detach from both pins and reset the target to its default value
     */
    void disconnect();

private:
    friend class Pin;

    // Called by a pin being destroyed
    void forgetPin(Pin* pin);

    std::string m_id;
    std::string m_sourcePinId;
    std::string m_targetPinId;
    Pin* m_source = nullptr;
    Pin* m_target = nullptr;
};

} // namespace flowgraph
