#include <catch2/catch.hpp>
#include "engine/ControlFlowEngine.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/common/register.hpp"
#include "TestNodes.hpp"

using namespace flowgraph;
using namespace testnodes;

namespace {

class ControlFlowFixture {
public:
    ControlFlowFixture() : graph("control", GraphCategory::ControlFlow) {
        nodes::registerCommonNodes(registry);
    }

    Node* create(const std::string& type) {
        Node* node = graph.addNode(registry.create(type));
        REQUIRE(node != nullptr);
        return node;
    }

    nodes::NodeRegistry registry;
    NodeGraph graph;
};

} // anonymous namespace

// =============================================================================
// Preconditions
// =============================================================================

TEST_CASE("Control flow preconditions", "[ControlFlowEngine]") {
    ControlFlowEngine engine;

    SECTION("Data-flow graphs are rejected") {
        NodeGraph graph("data", GraphCategory::DataFlow);
        graph.setMainNode(graph.emplaceNode<EntryNode>()->getId());
        REQUIRE_THROWS_AS(engine.execute(graph), GraphPreconditionError);
    }

    SECTION("A main node is required") {
        NodeGraph graph("no main");
        graph.emplaceNode<EntryNode>();
        REQUIRE_THROWS_AS(engine.execute(graph), GraphPreconditionError);
    }

    SECTION("The main node must exist") {
        NodeGraph graph("dangling");
        graph.restoreMainNodeId(std::string("missing"));
        REQUIRE_THROWS_AS(engine.execute(graph), GraphPreconditionError);
    }

    SECTION("The main node must be an entry node") {
        NodeGraph graph("flow main");
        auto* flow = graph.emplaceNode<FlowNode>();
        graph.restoreMainNodeId(flow->getId());
        REQUIRE_THROWS_AS(engine.execute(graph), GraphPreconditionError);
        REQUIRE(flow->executions == 0);
    }
}

// =============================================================================
// Traversal
// =============================================================================

TEST_CASE("Linear chain runs in order", "[ControlFlowEngine]") {
    NodeGraph graph("chain");
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* a = graph.emplaceNode<FlowNode>();
    auto* b = graph.emplaceNode<FlowNode>();
    graph.connect(*entry, "out", *a, "in");
    graph.connect(*a, "out", *b, "in");
    graph.setMainNode(entry->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.status == RunStatus::Completed);
    REQUIRE(result.category == GraphCategory::ControlFlow);
    REQUIRE(result.stepCount == 3);
    REQUIRE(result.executedNodeIds == std::vector<std::string>{entry->getId(), a->getId(), b->getId()});
    REQUIRE(a->executions == 1);
    REQUIRE(b->executions == 1);
}

TEST_CASE("Fan-out follows connection order depth-first", "[ControlFlowEngine]") {
    NodeGraph graph("fan out");
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* a = graph.emplaceNode<FlowNode>();
    auto* a2 = graph.emplaceNode<FlowNode>();
    auto* b = graph.emplaceNode<FlowNode>();
    graph.connect(*entry, "out", *a, "in");
    graph.connect(*entry, "out", *b, "in");
    graph.connect(*a, "out", *a2, "in");
    graph.setMainNode(entry->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.executedNodeIds ==
            std::vector<std::string>{entry->getId(), a->getId(), a2->getId(), b->getId()});
}

TEST_CASE_METHOD(ControlFlowFixture, "Counting loop through branch and merge", "[ControlFlowEngine]") {
    Node* start = create("start");
    Node* merge = create("merge");
    Node* counter = create("counter");
    Node* branch = create("branch");
    Node* lessThan = create("less_than");

    REQUIRE(graph.connect(*start, "out", *merge, "in_0"));
    REQUIRE(graph.connect(*merge, "out", *counter, "in"));
    REQUIRE(graph.connect(*counter, "out", *branch, "in"));
    REQUIRE(graph.connect(*counter, "count", *lessThan, "a"));
    REQUIRE(graph.connect(*lessThan, "result", *branch, "condition"));
    REQUIRE(graph.connect(*branch, "true", *merge, "in_1"));
    lessThan->findInputPin("b")->setValue(3);
    graph.setMainNode(start->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.status == RunStatus::Completed);
    REQUIRE(counter->findOutputPin("count")->getValue() == PinValue(3));
    // start + 3 x (merge, counter, branch)
    REQUIRE(result.stepCount == 10);
    // less_than is pulled once per branch step
    REQUIRE(result.executedNodeIds.size() == 13);
    REQUIRE_FALSE(result.stepLimitReached);
}

TEST_CASE_METHOD(ControlFlowFixture, "Endless loops stop at the step limit", "[ControlFlowEngine]") {
    Node* start = create("start");
    Node* merge = create("merge");
    auto* body = graph.emplaceNode<FlowNode>();
    graph.connect(*start, "out", *merge, "in_0");
    graph.connect(*merge, "out", *body, "in");
    graph.connect(*body, "out", *merge, "in_1");
    graph.setMainNode(start->getId());

    SECTION("maxSteps") {
        ExecutionOptions options;
        options.maxSteps = 7;
        ExecutionResult result = ControlFlowEngine(options).execute(graph);
        REQUIRE(result.status == RunStatus::Completed);
        REQUIRE(result.stepLimitReached);
        REQUIRE(result.stepCount == 7);
        REQUIRE(body->executions == 3);
    }

    SECTION("maxVisitsPerNode") {
        ExecutionOptions options;
        options.maxSteps = 0;
        options.maxVisitsPerNode = 3;
        ExecutionResult result = ControlFlowEngine(options).execute(graph);
        REQUIRE(result.stepLimitReached);
        REQUIRE(body->executions == 3);
        REQUIRE(result.stepCount == 7);
    }

    SECTION("failOnStepLimit reports the blocked node") {
        ExecutionOptions options;
        options.maxSteps = 4;
        options.failOnStepLimit = true;
        ExecutionResult result = ControlFlowEngine(options).execute(graph);
        REQUIRE(result.status == RunStatus::Failed);
        REQUIRE(result.failures.size() == 1);
        REQUIRE(result.failures[0].message == "Step limit reached");
        // start, merge, body, merge ran; body is next
        REQUIRE(result.failures[0].nodeId == body->getId());
    }
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE_METHOD(ControlFlowFixture, "A failing node aborts only its own branch", "[ControlFlowEngine]") {
    Node* start = create("start");
    Node* sequence = create("sequence");
    auto* thrower = graph.emplaceNode<ThrowingFlowNode>();
    auto* afterThrow = graph.emplaceNode<FlowNode>();
    auto* sibling = graph.emplaceNode<FlowNode>();
    graph.connect(*start, "out", *sequence, "in");
    graph.connect(*sequence, "then_0", *thrower, "in");
    graph.connect(*thrower, "out", *afterThrow, "in");
    graph.connect(*sequence, "then_1", *sibling, "in");
    graph.setMainNode(start->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.status == RunStatus::Failed);
    REQUIRE(result.failures.size() == 1);
    const NodeFailure& failure = result.failures[0];
    REQUIRE(failure.nodeId == thrower->getId());
    REQUIRE(failure.message == "boom");
    REQUIRE(failure.path == std::vector<std::string>{start->getId(), sequence->getId(), thrower->getId()});
    REQUIRE(afterThrow->executions == 0);
    REQUIRE(sibling->executions == 1);
    REQUIRE(result.getErrors() == std::vector<std::string>{thrower->getId() + ": boom"});
}

TEST_CASE_METHOD(ControlFlowFixture, "Data inputs are pulled before a flow node runs", "[ControlFlowEngine]") {
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* source = graph.emplaceNode<SourceNode>(41);
    auto* plusOne = graph.emplaceNode<PlusOneNode>();
    Node* print = create("print");
    graph.connect(*entry, "out", *print, "in");
    graph.connect(*source, "y", *plusOne, "x");
    graph.connect(*plusOne, "y", *print, "message");
    graph.setMainNode(entry->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.succeeded());
    REQUIRE(print->findInputPin("message")->getValue() == PinValue(42));
    REQUIRE(result.executedNodeIds ==
            std::vector<std::string>{entry->getId(), source->getId(), plusOne->getId(), print->getId()});
    REQUIRE(result.stepCount == 2);
}

TEST_CASE_METHOD(ControlFlowFixture, "Cyclic data inputs fail the pulling node", "[ControlFlowEngine]") {
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* p1 = graph.emplaceNode<PlusOneNode>();
    auto* p2 = graph.emplaceNode<PlusOneNode>();
    Node* print = create("print");
    graph.connect(*entry, "out", *print, "in");
    graph.connect(*p1, "y", *p2, "x");
    graph.connect(*p2, "y", *p1, "x");
    graph.connect(*p1, "y", *print, "message");
    graph.setMainNode(entry->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.status == RunStatus::Failed);
    REQUIRE(result.failures.size() == 1);
    REQUIRE(result.failures[0].nodeId == print->getId());
    REQUIRE(result.failures[0].message.find("Cyclic dependency") != std::string::npos);
}

TEST_CASE_METHOD(ControlFlowFixture, "A failing pulled data node is reported as the faulting node", "[ControlFlowEngine]") {
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* failing = graph.emplaceNode<FailingDataNode>();
    auto* plusOne = graph.emplaceNode<PlusOneNode>();
    Node* print = create("print");
    auto* after = graph.emplaceNode<FlowNode>();
    graph.connect(*entry, "out", *print, "in");
    graph.connect(*print, "out", *after, "in");
    graph.connect(*failing, "y", *plusOne, "x");
    graph.connect(*plusOne, "y", *print, "message");
    graph.setMainNode(entry->getId());

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.status == RunStatus::Failed);
    REQUIRE(result.failures.size() == 1);
    const NodeFailure& failure = result.failures[0];
    REQUIRE(failure.nodeId == failing->getId());
    REQUIRE(failure.message == "cannot compute");
    REQUIRE(failure.path ==
            std::vector<std::string>{entry->getId(), print->getId(), plusOne->getId(), failing->getId()});
    REQUIRE(result.executedNodeIds == std::vector<std::string>{entry->getId(), failing->getId()});
    REQUIRE(failing->getState() == NodeState::Error);
    REQUIRE(after->executions == 0);
}

TEST_CASE("Non-standard exceptions fail only their own branch", "[ControlFlowEngine]") {
    NodeGraph graph("opaque");
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* opaque = graph.emplaceNode<OpaqueThrowingNode>(true);
    auto* sibling = graph.emplaceNode<FlowNode>();
    graph.connect(*entry, "out", *opaque, "in");
    graph.connect(*entry, "out", *sibling, "in");
    graph.setMainNode(entry->getId());

    std::vector<ExecutionEvent> events;
    ExecutionOptions options;
    options.callback = [&events](const ExecutionEvent& evt) { events.push_back(evt); };

    ExecutionResult result = ControlFlowEngine(options).execute(graph);

    REQUIRE(result.status == RunStatus::Failed);
    REQUIRE(result.failures.size() == 1);
    REQUIRE(result.failures[0].nodeId == opaque->getId());
    REQUIRE(result.failures[0].message == "Unknown error");
    REQUIRE(opaque->getState() == NodeState::Error);
    REQUIRE(sibling->executions == 1);
    REQUIRE(events[3].status == ExecutionStatus::Failed);
    REQUIRE(events[3].errorMessage == "Unknown error");
}

TEST_CASE("Disabled flow nodes pass the flow through", "[ControlFlowEngine]") {
    NodeGraph graph("disabled");
    auto* entry = graph.emplaceNode<EntryNode>();
    auto* a = graph.emplaceNode<FlowNode>();
    auto* b = graph.emplaceNode<FlowNode>();
    graph.connect(*entry, "out", *a, "in");
    graph.connect(*a, "out", *b, "in");
    graph.setMainNode(entry->getId());
    a->setEnabled(false);

    ExecutionResult result = ControlFlowEngine().execute(graph);

    REQUIRE(result.succeeded());
    REQUIRE(a->executions == 0);
    REQUIRE(b->executions == 1);
}

TEST_CASE("Cancelled runs evaluate nothing", "[ControlFlowEngine]") {
    NodeGraph graph("cancelled");
    auto* entry = graph.emplaceNode<EntryNode>();
    graph.setMainNode(entry->getId());

    CancellationSource cancel;
    cancel.cancel();
    ExecutionResult result = ControlFlowEngine().execute(graph, cancel.getToken());

    REQUIRE(result.status == RunStatus::Cancelled);
    REQUIRE(result.executedNodeIds.empty());
    REQUIRE(result.stepCount == 0);
}
