#include "engine/ControlFlowEngine.hpp"
#include "engine/NodeInvoker.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <unordered_map>

namespace flowgraph {

namespace {

constexpr size_t NoParent = static_cast<size_t>(-1);

/**
 * One evaluation in the traversal, linked to the step that reached it
 */
struct Step {
    Node* node;
    size_t parent;
};

std::vector<std::string> buildPath(const std::vector<Step>& trail, size_t index) {
    std::vector<std::string> path;
    for (size_t i = index; i != NoParent; i = trail[i].parent) {
        path.push_back(trail[i].node->getId());
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // anonymous namespace

ControlFlowEngine::ControlFlowEngine(ExecutionOptions options)
    : m_options(std::move(options))
{}

void ControlFlowEngine::checkPreconditions(const NodeGraph& graph) const {
    if (graph.getCategory() != GraphCategory::ControlFlow) {
        throw GraphPreconditionError("Graph '" + graph.getName() + "' is not a control-flow graph");
    }
    if (!graph.getMainNodeId()) {
        throw GraphPreconditionError("Graph '" + graph.getName() + "' has no main node");
    }
    Node* main = graph.getMainNode();
    if (!main) {
        throw GraphPreconditionError("Main node " + *graph.getMainNodeId() + " is not part of graph '" +
                                     graph.getName() + "'");
    }
    if (!graph.isCandidateMainNode(*main)) {
        throw GraphPreconditionError("Main node " + main->getId() +
                                     " must have no flow inputs and at least one flow output");
    }
}

ExecutionResult ControlFlowEngine::execute(NodeGraph& graph, const CancellationToken& token) const {
    checkPreconditions(graph);

    ExecutionResult result;
    result.category = GraphCategory::ControlFlow;

    FLOWGRAPH_LOG_INFO("Control-flow run started: '" + graph.getName() + "'");

    std::vector<Step> trail;
    std::vector<std::pair<Node*, size_t>> pending;
    std::unordered_map<const Node*, size_t> visits;
    bool cancelled = false;

    pending.emplace_back(graph.getMainNode(), NoParent);

    while (!pending.empty()) {
        if (token.isCancellationRequested()) {
            cancelled = true;
            break;
        }

        auto [node, parent] = pending.back();

        if (m_options.maxSteps > 0 && result.stepCount >= m_options.maxSteps) {
            result.stepLimitReached = true;
            FLOWGRAPH_LOG_WARN("Step limit of " + std::to_string(m_options.maxSteps) + " reached");
            break;
        }
        if (m_options.maxVisitsPerNode > 0 && visits[node] >= m_options.maxVisitsPerNode) {
            result.stepLimitReached = true;
            FLOWGRAPH_LOG_WARN("Visit limit of " + std::to_string(m_options.maxVisitsPerNode) +
                               " reached on node " + node->getId());
            break;
        }

        pending.pop_back();
        trail.push_back(Step{node, parent});
        size_t index = trail.size() - 1;
        ++visits[node];
        ++result.stepCount;

        try {
            std::unordered_set<const Node*> visiting;
            pullDataInputs(graph, *node, result, visiting);
            invokeNode(*node, m_options, result);
        } catch (const DataNodeError& e) {
            std::vector<std::string> path = buildPath(trail, index);
            path.insert(path.end(), e.getChain().begin(), e.getChain().end());
            FLOWGRAPH_LOG_ERROR("Data node [" + e.getNodeId() + "] pulled by " + node->getTypeName() + " [" +
                                node->getId() + "] failed: " + e.what());
            result.failures.push_back(NodeFailure{e.getNodeId(), std::move(path), e.what()});
            continue;
        } catch (const std::exception& e) {
            FLOWGRAPH_LOG_ERROR("Node " + node->getTypeName() + " [" + node->getId() + "] failed: " + e.what());
            result.failures.push_back(NodeFailure{node->getId(), buildPath(trail, index), e.what()});
            continue;
        } catch (...) {
            FLOWGRAPH_LOG_ERROR("Node " + node->getTypeName() + " [" + node->getId() + "] failed: " + UnknownError);
            result.failures.push_back(NodeFailure{node->getId(), buildPath(trail, index), UnknownError});
            continue;
        }

        // Successors in pin declaration order, then connection registration order
        std::vector<Node*> next;
        for (Pin* pin : node->getExercisedFlowOutputs()) {
            for (Connection* connection : pin->getOutgoingConnections()) {
                Node* target = connection->getTargetNode();
                if (target && graph.containsNode(*target)) {
                    next.push_back(target);
                }
            }
        }
        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            pending.emplace_back(*it, index);
        }
    }

    if (result.stepLimitReached && m_options.failOnStepLimit && !pending.empty()) {
        Node* blocked = pending.back().first;
        std::vector<std::string> path = pending.back().second != NoParent
            ? buildPath(trail, pending.back().second)
            : std::vector<std::string>{};
        path.push_back(blocked->getId());
        result.failures.push_back(NodeFailure{blocked->getId(), path, "Step limit reached"});
    }

    if (cancelled) {
        result.status = RunStatus::Cancelled;
    } else if (!result.failures.empty()) {
        result.status = RunStatus::Failed;
    } else {
        result.status = RunStatus::Completed;
    }

    FLOWGRAPH_LOG_INFO("Control-flow run " + runStatusToString(result.status) + ": '" + graph.getName() +
                       "', " + std::to_string(result.stepCount) + " step(s)");
    return result;
}

std::future<ExecutionResult> ControlFlowEngine::executeAsync(NodeGraph& graph, CancellationToken token) const {
    ControlFlowEngine engine = *this;
    return std::async(std::launch::async, [engine, &graph, token]() {
        return engine.execute(graph, token);
    });
}

void ControlFlowEngine::pullDataInputs(const NodeGraph& graph, Node& node, ExecutionResult& result,
                                       std::unordered_set<const Node*>& visiting) const {
    for (const auto& pin : node.getInputPins()) {
        if (pin->isFlowPin()) continue;

        Connection* connection = pin->getIncomingConnection();
        if (!connection || !connection->isResolved()) continue;

        Node* source = connection->getSourceNode();
        if (source && !source->hasFlowPins() && graph.containsNode(*source)) {
            evaluateDataNode(graph, *source, result, visiting);
        }
        connection->transfer();
    }
}

void ControlFlowEngine::evaluateDataNode(const NodeGraph& graph, Node& node, ExecutionResult& result,
                                         std::unordered_set<const Node*>& visiting) const {
    if (visiting.count(&node) > 0) {
        std::vector<std::string> blocked;
        for (const auto* n : visiting) {
            blocked.push_back(n->getId());
        }
        std::sort(blocked.begin(), blocked.end());
        throw CyclicDependencyError(blocked);
    }

    visiting.insert(&node);
    try {
        pullDataInputs(graph, node, result, visiting);
    } catch (DataNodeError& e) {
        e.prependNode(node.getId());
        throw;
    }

    try {
        invokeNode(node, m_options, result);
    } catch (const std::exception& e) {
        throw DataNodeError(node.getId(), e.what());
    } catch (...) {
        throw DataNodeError(node.getId(), UnknownError);
    }
    visiting.erase(&node);
}

} // namespace flowgraph
