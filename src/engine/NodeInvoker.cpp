#include "engine/NodeInvoker.hpp"
#include "engine/ExecutionErrors.hpp"
#include "util/Logger.hpp"
#include "util/Profiler.hpp"
#include <chrono>

namespace flowgraph {

namespace {

ExecutionEvent makeEvent(const Node& node, ExecutionStatus status) {
    ExecutionEvent evt;
    evt.nodeId = node.getId();
    evt.nodeType = node.getTypeName();
    evt.status = status;
    return evt;
}

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

void invokeNode(Node& node, const ExecutionOptions& options, ExecutionResult& result) {
    if (options.callback) {
        options.callback(makeEvent(node, ExecutionStatus::Started));
    }

    FLOWGRAPH_LOG_DEBUG("Evaluating " + node.getTypeName() + " [" + node.getId() + "]");
    result.executedNodeIds.push_back(node.getId());

    auto startTime = std::chrono::steady_clock::now();
    auto reportFailure = [&](const std::string& message) {
        double duration = elapsedMs(startTime);
        util::Profiler::instance().record(node.getTypeName(), duration, true);
        if (options.callback) {
            ExecutionEvent evt = makeEvent(node, ExecutionStatus::Failed);
            evt.durationMs = duration;
            evt.errorMessage = message;
            options.callback(evt);
        }
    };

    try {
        node.execute();
    } catch (const std::exception& e) {
        reportFailure(e.what());
        throw;
    } catch (...) {
        reportFailure(UnknownError);
        throw;
    }

    double duration = elapsedMs(startTime);
    util::Profiler::instance().record(node.getTypeName(), duration);
    if (options.callback) {
        ExecutionEvent evt = makeEvent(node, ExecutionStatus::Completed);
        evt.durationMs = duration;
        options.callback(evt);
    }
}

} // namespace flowgraph
