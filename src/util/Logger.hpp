#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>

namespace flowgraph {
namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - process-wide timestamped log output
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Helpers
    static std::string levelToString(LogLevel level);

    /**
     * Parse "debug", "info", "warn" or "error" (throws std::invalid_argument)
     */
    static LogLevel stringToLevel(const std::string& str);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    LogLevel m_level = LogLevel::INFO;
    std::ostream* m_output = &std::clog;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
};

// Convenience macros
#define FLOWGRAPH_LOG_DEBUG(msg) flowgraph::util::Logger::instance().debug(msg)
#define FLOWGRAPH_LOG_INFO(msg) flowgraph::util::Logger::instance().info(msg)
#define FLOWGRAPH_LOG_WARN(msg) flowgraph::util::Logger::instance().warn(msg)
#define FLOWGRAPH_LOG_ERROR(msg) flowgraph::util::Logger::instance().error(msg)

} // namespace util
} // namespace flowgraph
