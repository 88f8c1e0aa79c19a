#include "engine/GraphExecutor.hpp"
#include "nodes/NodeGraphSerializer.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/common/register.hpp"
#include "storage/GraphStorage.hpp"
#include "util/Config.hpp"
#include "util/Logger.hpp"
#include "util/Profiler.hpp"
#include <iostream>
#include <optional>
#include <string>

using namespace flowgraph;
using flowgraph::util::Config;
using flowgraph::util::Logger;
using flowgraph::util::Profiler;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> [args] [options]\n"
              << "Commands:\n"
              << "  run <graph.json>          Execute a graph and print the result as JSON\n"
              << "  candidates <graph.json>   List nodes eligible as main node\n"
              << "  validate <graph.json>     Check that every connection is resolved\n"
              << "  save <graph.json>         Store a new version (needs --db and --slug)\n"
              << "  load                      Print the latest stored version (needs --db and --slug)\n"
              << "Options:\n"
              << "  --config FILE        Parameters file (key=value lines, @file syntax)\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
              << "  --max-steps N        Flow steps per control-flow run (0 = unlimited)\n"
              << "  --no-profiler        Disable profiler\n"
              << "  --db PATH            Path to graphs SQLite database\n"
              << "  --slug SLUG          Graph slug in the database\n"
              << "  --version NAME       Version name for save\n"
              << "  -h, --help           Show this help\n";
}

struct CliOptions {
    std::string command;
    std::string graphPath;
    std::string configFile;
    std::optional<std::string> logLevel;
    std::optional<long long> maxSteps;
    bool noProfiler = false;
    std::string dbPath;
    std::string slug;
    std::optional<std::string> versionName;
};

int runCommand(const CliOptions& cli, const Config& config) {
    NodeGraph graph = nodes::NodeGraphSerializer::loadFromFile(cli.graphPath);
    graph.setOptions(GraphOptions::fromConfig(config));

    ExecutionOptions options = ExecutionOptions::fromConfig(config);
    if (cli.maxSteps) {
        if (*cli.maxSteps < 0) {
            throw std::runtime_error("--max-steps must not be negative");
        }
        options.maxSteps = static_cast<size_t>(*cli.maxSteps);
    }

    ExecutionResult result = GraphExecutor::execute(graph, CancellationToken(), std::move(options));
    std::cout << result.toJson().dump(2) << std::endl;

    if (Profiler::instance().isEnabled()) {
        std::cout << Profiler::instance().formatStats() << std::endl;
    }
    return result.succeeded() ? 0 : 1;
}

int candidatesCommand(const CliOptions& cli) {
    NodeGraph graph = nodes::NodeGraphSerializer::loadFromFile(cli.graphPath);
    for (Node* node : graph.getCandidateMainNodes()) {
        std::cout << node->getId() << "  " << node->getTypeName() << "  " << node->getName() << "\n";
    }
    return 0;
}

int validateCommand(const CliOptions& cli) {
    NodeGraph graph = nodes::NodeGraphSerializer::loadFromFile(cli.graphPath);
    if (!graph.validate()) {
        std::cout << "Graph '" << graph.getName() << "' has dangling connections" << std::endl;
        return 1;
    }
    std::cout << "Graph '" << graph.getName() << "' is valid: " << graph.nodeCount() << " node(s), "
              << graph.getConnections().size() << " connection(s)" << std::endl;
    return 0;
}

int saveCommand(const CliOptions& cli, const Config& config) {
    NodeGraph graph = nodes::NodeGraphSerializer::loadFromFile(cli.graphPath);
    storage::GraphStorage db(cli.dbPath);

    if (!db.graphExists(cli.slug)) {
        db.createGraph({.slug = cli.slug, .name = graph.getName(), .category = graph.getCategory()});
    }
    int64_t versionId = db.saveVersion(cli.slug, graph, cli.versionName);
    std::cout << "Saved '" << cli.slug << "' as version " << versionId << std::endl;

    int64_t keep = config.getInt("max_versions_per_graph", 0);
    if (keep < 0) {
        throw std::runtime_error("max_versions_per_graph must not be negative");
    }
    if (keep > 0) {
        db.pruneVersions(cli.slug, static_cast<size_t>(keep));
    }
    return 0;
}

int loadCommand(const CliOptions& cli) {
    storage::GraphStorage db(cli.dbPath);
    NodeGraph graph = db.loadGraph(cli.slug);
    std::cout << nodes::NodeGraphSerializer::toString(graph) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions cli;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                cli.configFile = argv[++i];
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                cli.logLevel = argv[++i];
            } else if (arg == "--max-steps" && i + 1 < argc) {
                cli.maxSteps = std::stoll(argv[++i]);
            } else if (arg == "--no-profiler") {
                cli.noProfiler = true;
            } else if (arg == "--db" && i + 1 < argc) {
                cli.dbPath = argv[++i];
            } else if (arg == "--slug" && i + 1 < argc) {
                cli.slug = argv[++i];
            } else if (arg == "--version" && i + 1 < argc) {
                cli.versionName = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (cli.command.empty()) {
                cli.command = arg;
            } else if (cli.graphPath.empty()) {
                cli.graphPath = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << std::endl;
                return 1;
            }
        }

        if (cli.command.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        Config config;
        if (!cli.configFile.empty()) {
            config = Config::load(cli.configFile);
        }

        // Configure Logger (flags override the file)
        Logger& logger = Logger::instance();
        logger.setLevel(Logger::stringToLevel(cli.logLevel.value_or(config.getString("log_level", "info"))));
        if (config.has("log_file")) {
            logger.enableFileLogging(config.getString("log_file"));
        }

        // Configure Profiler
        bool profile = config.getBool("enable_performance_monitoring", true) && !cli.noProfiler;
        Profiler::instance().setEnabled(profile);

        nodes::registerCommonNodes(nodes::NodeRegistry::instance());
        FLOWGRAPH_LOG_DEBUG("Registered " + std::to_string(nodes::NodeRegistry::instance().size()) + " node types");

        bool needsGraphFile = cli.command != "load";
        if (needsGraphFile && cli.graphPath.empty()) {
            std::cerr << "Error: '" << cli.command << "' needs a graph file" << std::endl;
            return 1;
        }
        bool needsDb = cli.command == "save" || cli.command == "load";
        if (needsDb && (cli.dbPath.empty() || cli.slug.empty())) {
            std::cerr << "Error: '" << cli.command << "' needs --db and --slug" << std::endl;
            return 1;
        }

        if (cli.command == "run") return runCommand(cli, config);
        if (cli.command == "candidates") return candidatesCommand(cli);
        if (cli.command == "validate") return validateCommand(cli);
        if (cli.command == "save") return saveCommand(cli, config);
        if (cli.command == "load") return loadCommand(cli);

        std::cerr << "Error: Unknown command: " << cli.command << std::endl;
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
