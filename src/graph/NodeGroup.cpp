#include "graph/NodeGroup.hpp"
#include "graph/Node.hpp"
#include <algorithm>
#include <stdexcept>

namespace flowgraph {

NodeGroup::NodeGroup(std::string name, Rect bounds)
    : m_id(generateId())
    , m_name(std::move(name))
    , m_bounds(bounds)
{}

NodeGroup::~NodeGroup() {
    clearNodes();
}

void NodeGroup::addNode(Node& node) {
    if (node.getGroup() == this) {
        return;
    }
    if (node.getGroup()) {
        node.getGroup()->removeNode(node);
    }
    m_nodes.push_back(&node);
    node.setGroup(this);
}

bool NodeGroup::removeNode(Node& node) {
    auto it = std::find(m_nodes.begin(), m_nodes.end(), &node);
    if (it == m_nodes.end()) {
        return false;
    }
    m_nodes.erase(it);
    if (node.getGroup() == this) {
        node.setGroup(nullptr);
    }
    return true;
}

void NodeGroup::clearNodes() {
    for (auto* node : m_nodes) {
        if (node->getGroup() == this) {
            node->setGroup(nullptr);
        }
    }
    m_nodes.clear();
}

bool NodeGroup::containsNode(const Node& node) const {
    return std::find(m_nodes.begin(), m_nodes.end(), &node) != m_nodes.end();
}

bool NodeGroup::containsNodeRecursive(const Node& node) const {
    if (containsNode(node)) {
        return true;
    }
    for (const auto& child : m_children) {
        if (child->containsNodeRecursive(node)) {
            return true;
        }
    }
    return false;
}

std::vector<Node*> NodeGroup::getAllNodesRecursive() const {
    std::vector<Node*> result(m_nodes.begin(), m_nodes.end());
    for (const auto& child : m_children) {
        auto nested = child->getAllNodesRecursive();
        result.insert(result.end(), nested.begin(), nested.end());
    }
    return result;
}

NodeGroup* NodeGroup::addChild(std::unique_ptr<NodeGroup> child) {
    if (!child) {
        throw std::invalid_argument("Cannot add a null child group");
    }
    if (child.get() == this || isDescendantOf(*child)) {
        throw std::invalid_argument("Group '" + child->getName() + "' cannot become a child of itself or its descendant");
    }
    child->m_parent = this;
    m_children.push_back(std::move(child));
    return m_children.back().get();
}

std::unique_ptr<NodeGroup> NodeGroup::detachChild(NodeGroup& child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [&child](const std::unique_ptr<NodeGroup>& g) { return g.get() == &child; });
    if (it == m_children.end()) {
        return nullptr;
    }
    std::unique_ptr<NodeGroup> detached = std::move(*it);
    m_children.erase(it);
    detached->m_parent = nullptr;
    return detached;
}

bool NodeGroup::isDescendantOf(const NodeGroup& ancestor) const {
    for (const NodeGroup* g = m_parent; g != nullptr; g = g->m_parent) {
        if (g == &ancestor) {
            return true;
        }
    }
    return false;
}

void NodeGroup::collectPreOrder(std::vector<NodeGroup*>& out) {
    out.push_back(this);
    for (auto& child : m_children) {
        child->collectPreOrder(out);
    }
}

NodeGroup* NodeGroup::findGroup(const std::string& id) {
    if (m_id == id) {
        return this;
    }
    for (auto& child : m_children) {
        if (NodeGroup* found = child->findGroup(id)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace flowgraph
