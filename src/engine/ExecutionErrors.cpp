#include "engine/ExecutionErrors.hpp"

namespace flowgraph {

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> blockedNodeIds)
    : std::runtime_error(buildMessage(blockedNodeIds))
    , m_blockedNodeIds(std::move(blockedNodeIds))
{}

std::string CyclicDependencyError::buildMessage(const std::vector<std::string>& ids) {
    std::string message = "Cyclic dependency detected, blocked nodes:";
    for (const auto& id : ids) {
        message += " " + id;
    }
    return message;
}

DataNodeError::DataNodeError(const std::string& nodeId, const std::string& message)
    : std::runtime_error(message)
    , m_chain{nodeId}
{}

void DataNodeError::prependNode(const std::string& nodeId) {
    m_chain.insert(m_chain.begin(), nodeId);
}

} // namespace flowgraph
