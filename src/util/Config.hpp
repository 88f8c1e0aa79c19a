#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <optional>

namespace flowgraph {
namespace util {

/**
 * Key/value application parameters
 *
 * File format: one `key = value` per line, `#` comments and blank
 * lines ignored. A leading '@' on the path is accepted and stripped.
 *
 * Usage:
 *   Config cfg = Config::load("@flowgraph.conf");
 *   int maxSteps = cfg.getInt("max_steps", 10000);
 */
class Config {
public:
    Config() = default;

    /**
     * Load a config file (throws std::runtime_error if it cannot be opened)
     */
    static Config load(const std::string& path);

    /**
     * Parse config text already in memory
     */
    static Config parse(const std::string& text);

    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& fallback = "") const;

    // Typed getters throw std::runtime_error on a malformed value
    int64_t getInt(const std::string& key, int64_t fallback) const;
    double getDouble(const std::string& key, double fallback) const;

    /**
     * Accepts true/false, yes/no, on/off and 1/0
     */
    bool getBool(const std::string& key, bool fallback) const;

    void set(const std::string& key, const std::string& value);

    const std::map<std::string, std::string>& values() const { return m_values; }
    size_t size() const { return m_values.size(); }

private:
    std::map<std::string, std::string> m_values;
};

} // namespace util
} // namespace flowgraph
