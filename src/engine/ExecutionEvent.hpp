#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace flowgraph {

enum class ExecutionStatus {
    Started,
    Completed,
    Failed
};

std::string executionStatusToString(ExecutionStatus status);

/**
 * Progress notification for one node evaluation
 *
 * durationMs is set for Completed and Failed, errorMessage for Failed.
 */
struct ExecutionEvent {
    std::string nodeId;
    std::string nodeType;
    ExecutionStatus status = ExecutionStatus::Started;
    double durationMs = 0.0;
    std::string errorMessage;

    nlohmann::json toJson() const;
};

/**
 * Invoked synchronously on the thread running the engine
 */
using ExecutionCallback = std::function<void(const ExecutionEvent&)>;

} // namespace flowgraph
