#include "engine/DataFlowEngine.hpp"
#include "engine/NodeInvoker.hpp"
#include "util/Logger.hpp"

namespace flowgraph {

DataFlowEngine::DataFlowEngine(ExecutionOptions options)
    : m_options(std::move(options))
{}

ExecutionResult DataFlowEngine::execute(NodeGraph& graph, const CancellationToken& token) const {
    if (graph.getCategory() != GraphCategory::DataFlow) {
        throw GraphPreconditionError("Graph '" + graph.getName() + "' is not a data-flow graph");
    }
    if (graph.getMainNodeId() && !graph.getMainNode()) {
        throw GraphPreconditionError("Main node " + *graph.getMainNodeId() + " is not part of graph '" +
                                     graph.getName() + "'");
    }

    ExecutionResult result;
    result.category = GraphCategory::DataFlow;

    FLOWGRAPH_LOG_INFO("Data-flow run started: '" + graph.getName() + "'");

    std::unordered_set<const Node*> evaluated;
    const auto& nodes = graph.getNodes();
    bool cancelled = false;
    bool failed = false;

    while (evaluated.size() < nodes.size()) {
        if (token.isCancellationRequested()) {
            cancelled = true;
            break;
        }

        // First ready node in insertion order
        Node* ready = nullptr;
        for (const auto& node : nodes) {
            if (evaluated.count(node.get()) == 0 && isReady(graph, *node, evaluated)) {
                ready = node.get();
                break;
            }
        }

        if (!ready) {
            std::vector<std::string> blocked;
            for (const auto& node : nodes) {
                if (evaluated.count(node.get()) == 0) {
                    blocked.push_back(node->getId());
                }
            }
            FLOWGRAPH_LOG_ERROR("Data-flow run blocked: " + std::to_string(blocked.size()) + " node(s) in a cycle");
            throw CyclicDependencyError(blocked);
        }

        for (const auto& pin : ready->getInputPins()) {
            if (Connection* connection = pin->getIncomingConnection()) {
                connection->transfer();
            }
        }

        ++result.stepCount;
        try {
            invokeNode(*ready, m_options, result);
        } catch (const std::exception& e) {
            FLOWGRAPH_LOG_ERROR("Node " + ready->getTypeName() + " [" + ready->getId() + "] failed: " + e.what());
            result.failures.push_back(NodeFailure{ready->getId(), {ready->getId()}, e.what()});
            failed = true;
            break;
        } catch (...) {
            FLOWGRAPH_LOG_ERROR("Node " + ready->getTypeName() + " [" + ready->getId() + "] failed: " + UnknownError);
            result.failures.push_back(NodeFailure{ready->getId(), {ready->getId()}, UnknownError});
            failed = true;
            break;
        }
        evaluated.insert(ready);

        for (const auto& pin : ready->getOutputPins()) {
            if (pin->isFlowPin()) continue;
            for (Connection* connection : pin->getOutgoingConnections()) {
                connection->transfer();
            }
        }
    }

    collectSinkOutputs(graph, evaluated, result);

    if (cancelled) {
        result.status = RunStatus::Cancelled;
    } else if (failed) {
        result.status = RunStatus::Failed;
    } else {
        result.status = RunStatus::Completed;
    }

    FLOWGRAPH_LOG_INFO("Data-flow run " + runStatusToString(result.status) + ": '" + graph.getName() +
                       "', " + std::to_string(result.stepCount) + " node(s) evaluated");
    return result;
}

std::future<ExecutionResult> DataFlowEngine::executeAsync(NodeGraph& graph, CancellationToken token) const {
    DataFlowEngine engine = *this;
    return std::async(std::launch::async, [engine, &graph, token]() {
        return engine.execute(graph, token);
    });
}

bool DataFlowEngine::isReady(const NodeGraph& graph, const Node& node,
                             const std::unordered_set<const Node*>& evaluated) {
    for (const auto& pin : node.getInputPins()) {
        if (pin->isFlowPin()) continue;

        Connection* connection = pin->getIncomingConnection();
        if (!connection || !connection->isResolved()) continue;

        Node* source = connection->getSourceNode();
        if (!source || !graph.containsNode(*source)) continue;

        if (evaluated.count(source) == 0) {
            return false;
        }
    }
    return true;
}

bool DataFlowEngine::hasOutgoingDataConnection(const NodeGraph& graph, const Node& node) {
    for (const auto& pin : node.getOutputPins()) {
        if (pin->isFlowPin()) continue;
        for (Connection* connection : pin->getOutgoingConnections()) {
            Node* target = connection->getTargetNode();
            if (target && graph.containsNode(*target)) {
                return true;
            }
        }
    }
    return false;
}

void DataFlowEngine::collectSinkOutputs(const NodeGraph& graph,
                                        const std::unordered_set<const Node*>& evaluated,
                                        ExecutionResult& result) {
    for (const auto& node : graph.getNodes()) {
        if (evaluated.count(node.get()) == 0 || hasOutgoingDataConnection(graph, *node)) {
            continue;
        }

        // Data outputs when there are any, the data inputs otherwise
        const auto& pins = node->dataOutputCount() > 0 ? node->getOutputPins() : node->getInputPins();
        PinValueMap values;
        for (const auto& pin : pins) {
            if (pin->isDataPin()) {
                values[pin->getName()] = pin->getValue();
            }
        }
        if (!values.empty()) {
            result.sinkOutputs[node->getId()] = std::move(values);
        }
    }
}

} // namespace flowgraph
