#include "graph/NodeGroupManager.hpp"
#include "util/Config.hpp"
#include <algorithm>

namespace flowgraph {

NodeGroupManager::NodeGroupManager(NodeGraph& graph)
    : m_graph(graph)
{}

void NodeGroupManager::configure(const util::Config& config) {
    m_defaultNodeSize.width = config.getDouble("default_node_width", m_defaultNodeSize.width);
    m_defaultNodeSize.height = config.getDouble("default_node_height", m_defaultNodeSize.height);
}

// === Creation / deletion ===

NodeGroup* NodeGroupManager::createGroup(const std::string& name, const Rect& bounds, NodeGroup* parent) {
    auto group = std::make_unique<NodeGroup>(name, bounds);
    if (parent) {
        if (!m_graph.ownsGroup(*parent)) {
            return nullptr;
        }
        return parent->addChild(std::move(group));
    }
    return m_graph.addGroup(std::move(group));
}

NodeGroup* NodeGroupManager::createGroupFromNodes(const std::string& name, const std::vector<Node*>& nodes,
                                                  double padding, NodeGroup* parent) {
    std::vector<Node*> members;
    for (auto* node : nodes) {
        if (node && std::find(members.begin(), members.end(), node) == members.end()) {
            members.push_back(node);
        }
    }

    NodeGroup* group = createGroup(name, calculateBoundsForNodes(members, padding), parent);
    if (!group) {
        return nullptr;
    }

    for (auto* node : members) {
        addNodeToGroup(*node, *group, false);
    }
    updateGroupBoundsToFit(*group, padding);
    return group;
}

bool NodeGroupManager::deleteGroup(NodeGroup& group) {
    return m_graph.removeGroup(group);
}

// === Membership ===

bool NodeGroupManager::addNodeToGroup(Node& node, NodeGroup& group, bool adjustBounds, double padding) {
    if (!m_graph.moveNodeToGroup(node, &group)) {
        return false;
    }
    if (adjustBounds) {
        expandBoundsToIncludeNode(group, node, padding);
    }
    return true;
}

bool NodeGroupManager::removeNodeFromGroup(Node& node, NodeGroup& group) {
    if (node.getGroup() != &group) {
        return false;
    }
    return m_graph.moveNodeToGroup(node, nullptr);
}

// === Layout ===

void NodeGroupManager::moveGroup(NodeGroup& group, double dx, double dy,
                                 bool cascadeNodes, bool cascadeChildren) {
    group.setBounds(translate(group.getBounds(), dx, dy));

    if (cascadeNodes) {
        for (auto* node : group.getNodes()) {
            Point p = node->getPosition();
            node->setPosition(Point{p.x + dx, p.y + dy});
        }
    }

    if (cascadeChildren) {
        for (const auto& child : group.getChildren()) {
            moveGroup(*child, dx, dy, cascadeNodes, true);
        }
    }
}

void NodeGroupManager::updateGroupBoundsToFit(NodeGroup& group, double padding) {
    auto nodes = group.getAllNodesRecursive();
    if (nodes.empty()) {
        return;
    }
    group.setBounds(calculateBoundsForNodes(nodes, padding));
}

bool NodeGroupManager::validateNodeInsideBounds(const NodeGroup& group, const Node& node, double tolerance) const {
    Rect expanded = inflate(group.getBounds(), tolerance);
    Rect nodeRect = getNodeRect(node);
    return intersects(expanded, nodeRect) && contains(expanded, nodeRect);
}

void NodeGroupManager::expandBoundsToIncludeNode(NodeGroup& group, const Node& node, double padding) {
    group.setBounds(expandToInclude(group.getBounds(), getNodeRect(node), padding));
}

Rect NodeGroupManager::calculateBoundsForNodes(const std::vector<Node*>& nodes, double padding) const {
    std::vector<Rect> rects;
    rects.reserve(nodes.size());
    for (const auto* node : nodes) {
        if (node) {
            rects.push_back(getNodeRect(*node));
        }
    }
    return boundingRect(rects, padding);
}

Point NodeGroupManager::constrainOrExpandNodePosition(const Node& node, NodeGroup& group, Point desired,
                                                      bool dynamicExpand, double padding) {
    Size size = measure(node);
    Rect desiredRect{desired.x, desired.y, size.width, size.height};

    if (contains(group.getBounds(), desiredRect)) {
        return desired;
    }

    if (dynamicExpand) {
        group.setBounds(expandToInclude(group.getBounds(), desiredRect, padding));
        return desired;
    }
    return clampInside(group.getBounds(), desiredRect);
}

Rect NodeGroupManager::getNodeRect(const Node& node) const {
    Size size = measure(node);
    Point p = node.getPosition();
    return Rect{p.x, p.y, size.width, size.height};
}

Size NodeGroupManager::measure(const Node& node) const {
    return m_measure ? m_measure(node) : m_defaultNodeSize;
}

} // namespace flowgraph
