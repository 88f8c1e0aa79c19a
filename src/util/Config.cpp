#include "util/Config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace flowgraph {
namespace util {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

Config Config::load(const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Config Config::parse(const std::string& text) {
    Config config;
    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        config.m_values[key] = trim(line.substr(eq + 1));
    }
    return config;
}

bool Config::has(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Config::getString(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value ? *value : fallback;
}

int64_t Config::getInt(const std::string& key, int64_t fallback) const {
    auto value = get(key);
    if (!value) return fallback;
    try {
        size_t pos = 0;
        int64_t result = std::stoll(*value, &pos);
        if (pos != value->size()) {
            throw std::invalid_argument(*value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Config key '" + key + "' is not an integer: " + *value);
    }
}

double Config::getDouble(const std::string& key, double fallback) const {
    auto value = get(key);
    if (!value) return fallback;
    try {
        size_t pos = 0;
        double result = std::stod(*value, &pos);
        if (pos != value->size()) {
            throw std::invalid_argument(*value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Config key '" + key + "' is not a number: " + *value);
    }
}

bool Config::getBool(const std::string& key, bool fallback) const {
    auto value = get(key);
    if (!value) return fallback;
    std::string v = toLower(*value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw std::runtime_error("Config key '" + key + "' is not a boolean: " + *value);
}

void Config::set(const std::string& key, const std::string& value) {
    m_values[key] = value;
}

} // namespace util
} // namespace flowgraph
