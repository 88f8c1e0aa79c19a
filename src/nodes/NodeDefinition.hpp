#pragma once

#include "graph/Types.hpp"
#include "nodes/NodeContext.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>

namespace flowgraph {
namespace nodes {

/**
 * Execute function signature
 * Called once per evaluation step of a node instance
 */
using ExecuteFunction = std::function<void(NodeContext&)>;

/**
 * Definition of a pin on a node type
 */
struct PinDef {
    std::string name;
    DataType type;
    bool flow = false;
    PinValue defaultValue;

    PinDef(std::string n, DataType t, bool isFlow = false, PinValue def = PinValue())
        : name(std::move(n)), type(t), flow(isFlow), defaultValue(std::move(def)) {}
};

/**
 * Complete node type definition - immutable after creation
 *
 * Describes a node type: its name, category, pins in declaration order,
 * and the execute function that implements its logic.
 */
class NodeDefinition {
public:
    NodeDefinition(
        std::string name,
        std::string category,
        std::string description,
        std::vector<PinDef> inputs,
        std::vector<PinDef> outputs,
        ExecuteFunction executeFunc
    );

    // Getters
    const std::string& getName() const { return m_name; }
    const std::string& getCategory() const { return m_category; }
    const std::string& getDescription() const { return m_description; }
    const std::vector<PinDef>& getInputs() const { return m_inputs; }
    const std::vector<PinDef>& getOutputs() const { return m_outputs; }

    /**
     * Find an input definition by name
     * Returns nullptr if not found
     */
    const PinDef* findInput(const std::string& name) const;

    /**
     * Find an output definition by name
     * Returns nullptr if not found
     */
    const PinDef* findOutput(const std::string& name) const;

    /**
     * Run the execute function (no-op when none was given)
     */
    void execute(NodeContext& ctx) const;

private:
    std::string m_name;
    std::string m_category;
    std::string m_description;
    std::vector<PinDef> m_inputs;
    std::vector<PinDef> m_outputs;
    ExecuteFunction m_executeFunc;
};

using NodeDefinitionPtr = std::shared_ptr<const NodeDefinition>;

} // namespace nodes
} // namespace flowgraph
