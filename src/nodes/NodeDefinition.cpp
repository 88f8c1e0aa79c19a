#include "nodes/NodeDefinition.hpp"

namespace flowgraph {
namespace nodes {

NodeDefinition::NodeDefinition(
    std::string name,
    std::string category,
    std::string description,
    std::vector<PinDef> inputs,
    std::vector<PinDef> outputs,
    ExecuteFunction executeFunc
)
    : m_name(std::move(name))
    , m_category(std::move(category))
    , m_description(std::move(description))
    , m_inputs(std::move(inputs))
    , m_outputs(std::move(outputs))
    , m_executeFunc(std::move(executeFunc))
{}

const PinDef* NodeDefinition::findInput(const std::string& name) const {
    for (const auto& input : m_inputs) {
        if (input.name == name) {
            return &input;
        }
    }
    return nullptr;
}

const PinDef* NodeDefinition::findOutput(const std::string& name) const {
    for (const auto& output : m_outputs) {
        if (output.name == name) {
            return &output;
        }
    }
    return nullptr;
}

void NodeDefinition::execute(NodeContext& ctx) const {
    if (m_executeFunc) {
        m_executeFunc(ctx);
    }
}

} // namespace nodes
} // namespace flowgraph
