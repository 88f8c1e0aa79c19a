#include "engine/ExecutionResult.hpp"
#include "engine/ExecutionEvent.hpp"
#include "nodes/NodeGraphSerializer.hpp"

namespace flowgraph {

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
    }
    return "unknown";
}

std::string executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Started:   return "started";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed:    return "failed";
    }
    return "unknown";
}

nlohmann::json ExecutionEvent::toJson() const {
    nlohmann::json j = {
        {"node_id", nodeId},
        {"node_type", nodeType},
        {"status", executionStatusToString(status)}
    };
    if (status != ExecutionStatus::Started) {
        j["duration_ms"] = durationMs;
    }
    if (status == ExecutionStatus::Failed) {
        j["error_message"] = errorMessage;
    }
    return j;
}

std::vector<std::string> ExecutionResult::getErrors() const {
    std::vector<std::string> errors;
    errors.reserve(failures.size());
    for (const auto& failure : failures) {
        errors.push_back(failure.nodeId + ": " + failure.message);
    }
    return errors;
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j;
    j["category"] = graphCategoryToString(category);
    j["status"] = runStatusToString(status);
    j["executed_node_ids"] = executedNodeIds;
    j["step_count"] = stepCount;
    j["step_limit_reached"] = stepLimitReached;

    nlohmann::json failuresJson = nlohmann::json::array();
    for (const auto& failure : failures) {
        failuresJson.push_back({
            {"node_id", failure.nodeId},
            {"path", failure.path},
            {"message", failure.message}
        });
    }
    j["failures"] = failuresJson;

    nlohmann::json sinks = nlohmann::json::object();
    for (const auto& [nodeId, pins] : sinkOutputs) {
        nlohmann::json pinsJson = nlohmann::json::object();
        for (const auto& [pinName, value] : pins) {
            pinsJson[pinName] = nodes::NodeGraphSerializer::valueToJson(value);
        }
        sinks[nodeId] = pinsJson;
    }
    j["sink_outputs"] = sinks;

    return j;
}

} // namespace flowgraph
