#pragma once

#include "engine/ExecutionEvent.hpp"
#include <cstddef>

namespace flowgraph {

namespace util { class Config; }

/**
 * Bounds and hooks of a single run
 */
struct ExecutionOptions {
    // Flow-node evaluations per control-flow run (0 = unlimited)
    size_t maxSteps = 10000;

    // Evaluations of one node per control-flow run (0 = unlimited)
    size_t maxVisitsPerNode = 1000;

    // Report a reached bound as a failure instead of a normal stop
    bool failOnStepLimit = false;

    // Optional per-node event sink
    ExecutionCallback callback;

    /**
     * Read max_steps, max_visits_per_node and fail_on_step_limit
     */
    static ExecutionOptions fromConfig(const util::Config& config);
};

} // namespace flowgraph
