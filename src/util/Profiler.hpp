#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace flowgraph {
namespace util {

/**
 * Accumulated evaluation times of one node type
 */
struct NodeTiming {
    size_t evaluations = 0;
    size_t failures = 0;
    double totalMs = 0.0;
    double minMs = 0.0;
    double maxMs = 0.0;

    double averageMs() const { return evaluations > 0 ? totalMs / evaluations : 0.0; }
};

/**
 * Profiler singleton - node evaluation times grouped by node type
 *
 * Engines report every evaluation through invokeNode(); the CLI prints
 * the table after a run.
 */
class Profiler {
public:
    static Profiler& instance();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /**
     * Add one evaluation (ignored while disabled)
     */
    void record(const std::string& nodeType, double durationMs, bool failed = false);

    std::optional<NodeTiming> getTiming(const std::string& nodeType) const;
    std::map<std::string, NodeTiming> snapshot() const;
    size_t totalEvaluations() const;

    void reset();

    nlohmann::json toJson() const;

    // Table sorted by total time, slowest type first
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    bool m_enabled = true;
    mutable std::mutex m_mutex;
    std::map<std::string, NodeTiming> m_timings;
};

} // namespace util
} // namespace flowgraph
