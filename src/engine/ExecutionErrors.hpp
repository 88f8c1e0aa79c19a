#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace flowgraph {

/** Failure message for nodes that throw something other than std::exception */
inline constexpr const char* UnknownError = "Unknown error";

/**
 * The graph cannot be run by the chosen engine (wrong category,
 * missing or invalid main node). Raised before any node executes.
 */
class GraphPreconditionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Data dependencies form a cycle; no remaining node can become ready
 */
class CyclicDependencyError : public std::runtime_error {
public:
    explicit CyclicDependencyError(std::vector<std::string> blockedNodeIds);

    const std::vector<std::string>& getBlockedNodeIds() const { return m_blockedNodeIds; }

private:
    static std::string buildMessage(const std::vector<std::string>& ids);

    std::vector<std::string> m_blockedNodeIds;
};

/**
 * A data node pulled on demand by a flow node failed.
 * The chain lists the pulled nodes from the one the flow node reads
 * down to the one that raised the error.
 */
class DataNodeError : public std::runtime_error {
public:
    DataNodeError(const std::string& nodeId, const std::string& message);

    const std::string& getNodeId() const { return m_chain.back(); }
    const std::vector<std::string>& getChain() const { return m_chain; }

    void prependNode(const std::string& nodeId);

private:
    std::vector<std::string> m_chain;
};

} // namespace flowgraph
