#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"

namespace flowgraph {
namespace nodes {

NodeBuilder::NodeBuilder(const std::string& name, const std::string& category)
    : m_name(name)
    , m_category(category)
{}

NodeBuilder& NodeBuilder::input(const std::string& name, DataType type, PinValue defaultValue) {
    m_inputs.emplace_back(name, type, false, std::move(defaultValue));
    return *this;
}

NodeBuilder& NodeBuilder::output(const std::string& name, DataType type, PinValue initialValue) {
    m_outputs.emplace_back(name, type, false, std::move(initialValue));
    return *this;
}

NodeBuilder& NodeBuilder::flowInput(const std::string& name) {
    m_inputs.emplace_back(name, DataType::Any, true);
    return *this;
}

NodeBuilder& NodeBuilder::flowOutput(const std::string& name) {
    m_outputs.emplace_back(name, DataType::Any, true);
    return *this;
}

NodeBuilder& NodeBuilder::description(const std::string& text) {
    m_description = text;
    return *this;
}

NodeBuilder& NodeBuilder::onExecute(ExecuteFunction func) {
    m_executeFunc = std::move(func);
    return *this;
}

NodeDefinitionPtr NodeBuilder::build() {
    return std::make_shared<NodeDefinition>(
        m_name,
        m_category,
        std::move(m_description),
        std::move(m_inputs),
        std::move(m_outputs),
        std::move(m_executeFunc)
    );
}

NodeDefinitionPtr NodeBuilder::buildAndRegister() {
    return buildAndRegister(NodeRegistry::instance());
}

NodeDefinitionPtr NodeBuilder::buildAndRegister(NodeRegistry& registry) {
    auto def = build();
    registry.registerNode(def);
    return def;
}

} // namespace nodes
} // namespace flowgraph
