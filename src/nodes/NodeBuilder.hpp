#pragma once

#include "nodes/NodeDefinition.hpp"
#include <string>
#include <vector>

namespace flowgraph {
namespace nodes {

// Forward declaration
class NodeRegistry;

/**
 * Fluent API for building node definitions
 *
 * Example usage:
 *   NodeBuilder("add", "math")
 *       .input("a", Type::Int)
 *       .input("b", Type::Int)
 *       .output("result", Type::Int)
 *       .onExecute([](NodeContext& ctx) {
 *           int64_t a = ctx.getInput("a").getInt();
 *           int64_t b = ctx.getInput("b").getInt();
 *           ctx.setOutput("result", a + b);
 *       })
 *       .build();
 */
class NodeBuilder {
public:
    /**
     * Create a builder for a node with given name and category
     */
    NodeBuilder(const std::string& name, const std::string& category);

    // === Data pins ===

    /**
     * Add a data input with an optional default value
     */
    NodeBuilder& input(const std::string& name, DataType type, PinValue defaultValue = PinValue());

    /**
     * Add a data output with an optional initial value
     */
    NodeBuilder& output(const std::string& name, DataType type, PinValue initialValue = PinValue());

    // === Flow pins ===

    NodeBuilder& flowInput(const std::string& name = "in");
    NodeBuilder& flowOutput(const std::string& name = "out");

    // === Metadata ===

    NodeBuilder& description(const std::string& text);

    // === Execute Function ===

    /**
     * Set the execute function (node logic)
     */
    NodeBuilder& onExecute(ExecuteFunction func);

    // === Build ===

    /**
     * Build and return the node definition
     */
    NodeDefinitionPtr build();

    /**
     * Build and register in the global registry
     */
    NodeDefinitionPtr buildAndRegister();

    /**
     * Build and register in a specific registry
     */
    NodeDefinitionPtr buildAndRegister(NodeRegistry& registry);

private:
    std::string m_name;
    std::string m_category;
    std::string m_description;
    std::vector<PinDef> m_inputs;
    std::vector<PinDef> m_outputs;
    ExecuteFunction m_executeFunc;
};

// Convenience alias for cleaner API
using Type = DataType;

} // namespace nodes
} // namespace flowgraph
