#include "engine/ExecutionOptions.hpp"
#include "util/Config.hpp"
#include <stdexcept>

namespace flowgraph {

namespace {

size_t readCount(const util::Config& config, const std::string& key, size_t fallback) {
    int64_t value = config.getInt(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        throw std::runtime_error("Config key '" + key + "' must not be negative");
    }
    return static_cast<size_t>(value);
}

} // anonymous namespace

ExecutionOptions ExecutionOptions::fromConfig(const util::Config& config) {
    ExecutionOptions options;
    options.maxSteps = readCount(config, "max_steps", options.maxSteps);
    options.maxVisitsPerNode = readCount(config, "max_visits_per_node", options.maxVisitsPerNode);
    options.failOnStepLimit = config.getBool("fail_on_step_limit", options.failOnStepLimit);
    return options;
}

} // namespace flowgraph
