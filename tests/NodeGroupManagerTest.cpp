#include <catch2/catch.hpp>
#include "graph/NodeGroupManager.hpp"
#include "util/Config.hpp"
#include "TestNodes.hpp"

using namespace flowgraph;
using namespace testnodes;

namespace {

Node* makeNode(NodeGraph& graph, double x, double y) {
    auto* node = graph.emplaceNode<FlowNode>();
    node->setPosition(Point{x, y});
    return node;
}

} // anonymous namespace

TEST_CASE("createGroupFromNodes fits the bounds with padding", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.setMeasureFunction([](const Node&) { return Size{50, 30}; });

    Node* n1 = makeNode(graph, 10, 10);
    Node* n2 = makeNode(graph, 100, 40);

    NodeGroup* g = mgr.createGroupFromNodes("G", {n1, n2}, 10);

    // n1 spans (10,10)-(60,40), n2 spans (100,40)-(150,70)
    REQUIRE(g != nullptr);
    REQUIRE(g->getBounds() == Rect{0, 0, 160, 80});
    REQUIRE(n1->getGroup() == g);
    REQUIRE(n2->getGroup() == g);
    REQUIRE(g->containsNode(*n1));
    REQUIRE(g->containsNode(*n2));
}

TEST_CASE("addNodeToGroup expands the bounds", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.setMeasureFunction([](const Node&) { return Size{100, 50}; });

    NodeGroup* g = mgr.createGroup("G", Rect{0, 0, 100, 100});
    Node* n = makeNode(graph, 120, 80);

    REQUIRE(mgr.addNodeToGroup(*n, *g, true));
    REQUIRE(n->getGroup() == g);
    REQUIRE(g->getBounds().width == 228);
    REQUIRE(g->getBounds().height == 138);
}

TEST_CASE("addNodeToGroup without adjusting keeps the bounds", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    NodeGroup* g = mgr.createGroup("G", Rect{0, 0, 100, 100});
    Node* n = makeNode(graph, 500, 500);

    REQUIRE(mgr.addNodeToGroup(*n, *g, false));
    REQUIRE(g->getBounds() == Rect{0, 0, 100, 100});
    REQUIRE_FALSE(mgr.validateNodeInsideBounds(*g, *n));
}

TEST_CASE("moveGroup cascades to nodes and children", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    NodeGroup* parent = mgr.createGroup("P", Rect{0, 0, 200, 200});
    NodeGroup* child = mgr.createGroup("C", Rect{10, 10, 50, 50}, parent);

    Node* n1 = makeNode(graph, 20, 30);
    Node* n2 = makeNode(graph, 25, 35);
    mgr.addNodeToGroup(*n1, *parent, false);
    mgr.addNodeToGroup(*n2, *child, false);

    mgr.moveGroup(*parent, 5, 7, true, true);

    REQUIRE(parent->getBounds().x == 5);
    REQUIRE(parent->getBounds().y == 7);
    REQUIRE(child->getBounds().x == 15);
    REQUIRE(child->getBounds().y == 17);
    REQUIRE(n1->getPosition() == Point{25, 37});
    REQUIRE(n2->getPosition() == Point{30, 42});
}

TEST_CASE("moveGroup without cascading moves only the group", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    NodeGroup* parent = mgr.createGroup("P", Rect{0, 0, 200, 200});
    NodeGroup* child = mgr.createGroup("C", Rect{10, 10, 50, 50}, parent);
    Node* n = makeNode(graph, 20, 30);
    mgr.addNodeToGroup(*n, *parent, false);

    mgr.moveGroup(*parent, 5, 5, false, false);

    REQUIRE(parent->getBounds().x == 5);
    REQUIRE(child->getBounds().x == 10);
    REQUIRE(n->getPosition() == Point{20, 30});
}

TEST_CASE("constrainOrExpandNodePosition clamps or expands", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.setMeasureFunction([](const Node&) { return Size{50, 30}; });
    NodeGroup* g = mgr.createGroup("G", Rect{0, 0, 100, 100});
    Node* n = makeNode(graph, 0, 0);
    mgr.addNodeToGroup(*n, *g, false);

    Point clamped = mgr.constrainOrExpandNodePosition(*n, *g, Point{90, 90}, false);
    REQUIRE(clamped == Point{50, 70});
    REQUIRE(g->getBounds() == Rect{0, 0, 100, 100});

    Point desired{120, 120};
    Point expanded = mgr.constrainOrExpandNodePosition(*n, *g, desired, true, 10);
    REQUIRE(expanded == desired);
    REQUIRE(g->getBounds().width >= 180);
    REQUIRE(g->getBounds().height >= 160);

    // Already inside: unchanged
    REQUIRE(mgr.constrainOrExpandNodePosition(*n, *g, Point{10, 10}, false) == Point{10, 10});
}

TEST_CASE("updateGroupBoundsToFit includes nested groups", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.setDefaultNodeSize(Size{10, 10});
    NodeGroup* parent = mgr.createGroup("P", Rect{0, 0, 10, 10});
    NodeGroup* child = mgr.createGroup("C", Rect{}, parent);
    Node* n = makeNode(graph, 100, 200);
    mgr.addNodeToGroup(*n, *child, false);

    mgr.updateGroupBoundsToFit(*parent, 5);
    REQUIRE(parent->getBounds() == Rect{95, 195, 20, 20});

    NodeGroup* empty = mgr.createGroup("E", Rect{1, 2, 3, 4});
    mgr.updateGroupBoundsToFit(*empty);
    REQUIRE(empty->getBounds() == Rect{1, 2, 3, 4});
}

TEST_CASE("validateNodeInsideBounds honours the tolerance", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.setDefaultNodeSize(Size{20, 20});
    NodeGroup* g = mgr.createGroup("G", Rect{0, 0, 100, 100});

    Node* inside = makeNode(graph, 10, 10);
    Node* edge = makeNode(graph, 85, 10);

    REQUIRE(mgr.validateNodeInsideBounds(*g, *inside));
    REQUIRE_FALSE(mgr.validateNodeInsideBounds(*g, *edge));
    REQUIRE(mgr.validateNodeInsideBounds(*g, *edge, 5));
}

TEST_CASE("createGroup under a foreign parent fails", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    NodeGroup foreign;
    REQUIRE(mgr.createGroup("G", Rect{}, &foreign) == nullptr);
}

TEST_CASE("removeNodeFromGroup and deleteGroup", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    NodeGroup* a = mgr.createGroup("A", Rect{});
    NodeGroup* b = mgr.createGroup("B", Rect{});
    Node* n = makeNode(graph, 0, 0);
    mgr.addNodeToGroup(*n, *a);

    REQUIRE_FALSE(mgr.removeNodeFromGroup(*n, *b));
    REQUIRE(mgr.removeNodeFromGroup(*n, *a));
    REQUIRE(n->getGroup() == nullptr);

    mgr.addNodeToGroup(*n, *b);
    REQUIRE(mgr.deleteGroup(*b));
    REQUIRE(n->getGroup() == nullptr);
    REQUIRE(graph.getRootGroups().size() == 1);
}

TEST_CASE("NodeGroupManager reads node size from config", "[NodeGroupManager]") {
    NodeGraph graph;
    NodeGroupManager mgr(graph);
    mgr.configure(util::Config::parse("default_node_width = 200\ndefault_node_height = 90\n"));

    REQUIRE(mgr.getDefaultNodeSize().width == 200);
    REQUIRE(mgr.getDefaultNodeSize().height == 90);

    Node* n = makeNode(graph, 5, 5);
    REQUIRE(mgr.getNodeRect(*n) == Rect{5, 5, 200, 90});
}
