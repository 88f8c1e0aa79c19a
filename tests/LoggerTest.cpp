#include <catch2/catch.hpp>
#include "util/Logger.hpp"
#include <sstream>

using flowgraph::util::Logger;
using flowgraph::util::LogLevel;

namespace {

/**
 * Redirects the logger for one test and restores the defaults afterwards
 */
class CapturedLog {
public:
    CapturedLog() {
        Logger::instance().setOutputStream(&stream);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::ostringstream stream;
};

} // anonymous namespace

TEST_CASE("Logger writes level-tagged lines", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::DEBUG);

    FLOWGRAPH_LOG_INFO("graph loaded");
    FLOWGRAPH_LOG_ERROR("node failed");

    std::string text = log.stream.str();
    REQUIRE(text.find("[INFO ] graph loaded") != std::string::npos);
    REQUIRE(text.find("[ERROR] node failed") != std::string::npos);
}

TEST_CASE("Logger drops messages below the level", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::WARN);

    FLOWGRAPH_LOG_DEBUG("hidden debug");
    FLOWGRAPH_LOG_INFO("hidden info");
    FLOWGRAPH_LOG_WARN("visible");

    std::string text = log.stream.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[WARN ] visible") != std::string::npos);
}

TEST_CASE("Logger level names", "[Logger]") {
    REQUIRE(Logger::stringToLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::stringToLevel("warn") == LogLevel::WARN);
    REQUIRE(Logger::levelToString(LogLevel::ERROR) == "ERROR");
    REQUIRE_THROWS_AS(Logger::stringToLevel("verbose"), std::invalid_argument);
}
