#pragma once

#include "graph/Types.hpp"
#include <string>

namespace flowgraph {
namespace nodes {

class DefinedNode;

/**
 * Execution context passed to node execute functions.
 * Reads input pins and writes output pins of the node being evaluated.
 *
 * Usage in onExecute:
 *   [](NodeContext& ctx) {
 *       auto a = ctx.getInput("a");
 *       ctx.setOutput("result", a.getInt() * 2);
 *   }
 */
class NodeContext {
public:
    explicit NodeContext(DefinedNode& node);

    // === Input Access ===

    /**
     * Current value of a data input (null value if there is no such pin)
     */
    PinValue getInput(const std::string& name) const;

    /**
     * Check if the input exists and is not null
     */
    bool hasInput(const std::string& name) const;

    /**
     * Check if the input pin is fed by a connection
     */
    bool isInputConnected(const std::string& name) const;

    // === Output Access ===

    /**
     * Set a data output (throws std::runtime_error for an unknown output)
     */
    void setOutput(const std::string& name, const PinValue& value);

    /**
     * Current value of a data output
     */
    PinValue getOutput(const std::string& name) const;

    // === Control flow ===

    /**
     * Fire one flow output. Without any call, every flow output fires.
     */
    void fire(const std::string& flowOutput);

    /**
     * Fire no flow output at all
     */
    void halt();

    // === Error Handling ===

    /**
     * Fail the step; the node raises the message once the function returns
     */
    void setError(const std::string& message);
    bool hasError() const { return m_hasError; }
    const std::string& getErrorMessage() const { return m_errorMessage; }

    const std::string& getNodeId() const;
    const std::string& getNodeName() const;

private:
    DefinedNode& m_node;
    bool m_hasError = false;
    std::string m_errorMessage;
};

} // namespace nodes
} // namespace flowgraph
