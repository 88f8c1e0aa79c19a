#pragma once

#include "graph/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowgraph {

enum class RunStatus {
    Completed,
    Cancelled,
    Failed
};

std::string runStatusToString(RunStatus status);

/**
 * A node evaluation that raised an error
 */
struct NodeFailure {
    std::string nodeId;
    std::vector<std::string> path;   // Node ids from the entry node to the failing node
    std::string message;
};

/**
 * Pin name -> value of one sink node
 */
using PinValueMap = std::unordered_map<std::string, PinValue>;

/**
 * Outcome of one engine run
 */
struct ExecutionResult {
    GraphCategory category = GraphCategory::ControlFlow;
    RunStatus status = RunStatus::Completed;
    std::vector<std::string> executedNodeIds;    // Evaluation order, repeats included
    size_t stepCount = 0;
    bool stepLimitReached = false;
    std::vector<NodeFailure> failures;
    std::unordered_map<std::string, PinValueMap> sinkOutputs;   // DataFlow only

    bool succeeded() const { return status == RunStatus::Completed; }
    bool hasErrors() const { return !failures.empty(); }

    /**
     * "<nodeId>: <message>" per failure
     */
    std::vector<std::string> getErrors() const;

    nlohmann::json toJson() const;
};

} // namespace flowgraph
