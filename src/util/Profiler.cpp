#include "util/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace flowgraph {
namespace util {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& nodeType, double durationMs, bool failed) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    NodeTiming& timing = m_timings[nodeType];
    if (timing.evaluations == 0 || durationMs < timing.minMs) {
        timing.minMs = durationMs;
    }
    timing.maxMs = std::max(timing.maxMs, durationMs);
    timing.totalMs += durationMs;
    ++timing.evaluations;
    if (failed) {
        ++timing.failures;
    }
}

std::optional<NodeTiming> Profiler::getTiming(const std::string& nodeType) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timings.find(nodeType);
    if (it == m_timings.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, NodeTiming> Profiler::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timings;
}

size_t Profiler::totalEvaluations() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t total = 0;
    for (const auto& [type, timing] : m_timings) {
        total += timing.evaluations;
    }
    return total;
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timings.clear();
}

nlohmann::json Profiler::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [type, timing] : m_timings) {
        j[type] = {
            {"evaluations", timing.evaluations},
            {"failures", timing.failures},
            {"total_ms", timing.totalMs},
            {"avg_ms", timing.averageMs()},
            {"min_ms", timing.minMs},
            {"max_ms", timing.maxMs}
        };
    }
    return j;
}

std::string Profiler::formatStats() const {
    std::vector<std::pair<std::string, NodeTiming>> rows;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        rows.assign(m_timings.begin(), m_timings.end());
    }

    if (rows.empty()) {
        return "No node evaluations recorded.";
    }

    std::stable_sort(rows.begin(), rows.end(),
        [](const auto& a, const auto& b) { return a.second.totalMs > b.second.totalMs; });

    std::ostringstream oss;
    oss << std::left << std::setw(24) << "node type"
        << std::right << std::setw(8) << "evals"
        << std::setw(8) << "failed"
        << std::setw(12) << "total ms"
        << std::setw(10) << "avg ms"
        << std::setw(10) << "max ms" << "\n";

    oss << std::fixed << std::setprecision(3);
    for (const auto& [type, timing] : rows) {
        oss << std::left << std::setw(24) << type
            << std::right << std::setw(8) << timing.evaluations
            << std::setw(8) << timing.failures
            << std::setw(12) << timing.totalMs
            << std::setw(10) << timing.averageMs()
            << std::setw(10) << timing.maxMs << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace flowgraph
