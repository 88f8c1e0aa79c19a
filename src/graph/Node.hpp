#pragma once

#include "graph/Types.hpp"
#include "graph/Geometry.hpp"
#include "graph/Pin.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace flowgraph {

class NodeGroup;

/**
 * Executable unit owning ordered input and output pins
 *
 * Subclasses declare their pins in the constructor and implement
 * onExecute(). Engines call execute(), which tracks the node state and
 * the set of flow outputs the step chose to fire.
 */
class Node {
public:
    explicit Node(std::string typeName);
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // === Identity ===

    const std::string& getId() const { return m_id; }
    void setId(std::string id) { m_id = std::move(id); }
    const std::string& getTypeName() const { return m_typeName; }
    const std::string& getName() const { return m_name; }
    void setName(std::string name) { m_name = std::move(name); }

    Point getPosition() const { return m_position; }
    void setPosition(Point position) { m_position = position; }

    bool isEnabled() const { return m_enabled; }
    void setEnabled(bool enabled) { m_enabled = enabled; }

    NodeState getState() const { return m_state; }
    void setState(NodeState state) { m_state = state; }
    const std::string& getLastError() const { return m_lastError; }

    // === Pins ===

    const std::vector<std::unique_ptr<Pin>>& getInputPins() const { return m_inputs; }
    const std::vector<std::unique_ptr<Pin>>& getOutputPins() const { return m_outputs; }

    /**
     * Find a pin by name on one side
     * Returns nullptr if not found
     */
    Pin* findInputPin(const std::string& name) const;
    Pin* findOutputPin(const std::string& name) const;

    /**
     * Find a pin by id on either side
     */
    Pin* findPin(const std::string& id) const;

    size_t flowInputCount() const;
    size_t flowOutputCount() const;
    size_t dataInputCount() const;
    size_t dataOutputCount() const;

    bool hasFlowPins() const { return flowInputCount() > 0 || flowOutputCount() > 0; }

    // === Group membership ===

    NodeGroup* getGroup() const { return m_group; }

    /**
     * Group id kept across serialization, resolved by NodeGraph::onDeserialized
     */
    const std::optional<std::string>& getGroupId() const { return m_groupId; }
    void setGroupId(std::optional<std::string> groupId) { m_groupId = std::move(groupId); }

    // === Execution ===

    /**
     * Run one evaluation step
     *
     * A disabled node does nothing and lets every flow output pass.
     * Exceptions thrown by onExecute() leave the node in the Error
     * state and propagate to the caller.
     */
    void execute();

    /**
     * Flow outputs exercised by the last step, in declaration order
     *
     * Every flow output unless the step explicitly fired a subset.
     */
    std::vector<Pin*> getExercisedFlowOutputs() const;

    /**
     * Point every pin back at this node after a load
     */
    void onDeserialized();

protected:
    virtual void onExecute() = 0;

    Pin& addInputPin(const std::string& name, DataType type, PinValue defaultValue = PinValue());
    Pin& addOutputPin(const std::string& name, DataType type, PinValue defaultValue = PinValue());
    Pin& addFlowInputPin(const std::string& name = "in");
    Pin& addFlowOutputPin(const std::string& name = "out");

    /**
     * Select a flow output to fire (call once per output)
     * Throws std::invalid_argument for an unknown flow output
     */
    void fireFlow(const std::string& pinName);

    /**
     * Stop control flow at this node for the current step
     */
    void haltFlow();

private:
    friend class NodeGroup;

    void setGroup(NodeGroup* group);

    std::string m_id;
    std::string m_typeName;
    std::string m_name;
    Point m_position;
    bool m_enabled = true;
    NodeState m_state = NodeState::Normal;
    std::string m_lastError;

    std::vector<std::unique_ptr<Pin>> m_inputs;
    std::vector<std::unique_ptr<Pin>> m_outputs;

    NodeGroup* m_group = nullptr;
    std::optional<std::string> m_groupId;

    bool m_flowSelected = false;
    std::set<std::string> m_firedOutputs;
};

} // namespace flowgraph
