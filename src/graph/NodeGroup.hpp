#pragma once

#include "graph/Geometry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace flowgraph {

class Node;

/**
 * Hierarchical cluster of nodes with a bounding region
 *
 * A group owns its child groups but never its member nodes. A node
 * belongs to at most one group: adding it here removes it from its
 * previous group.
 */
class NodeGroup {
public:
    explicit NodeGroup(std::string name = "Group", Rect bounds = Rect{});
    ~NodeGroup();

    NodeGroup(const NodeGroup&) = delete;
    NodeGroup& operator=(const NodeGroup&) = delete;

    const std::string& getId() const { return m_id; }
    void setId(std::string id) { m_id = std::move(id); }
    const std::string& getName() const { return m_name; }
    void setName(std::string name) { m_name = std::move(name); }

    const Rect& getBounds() const { return m_bounds; }
    void setBounds(const Rect& bounds) { m_bounds = bounds; }

    // === Members ===

    const std::vector<Node*>& getNodes() const { return m_nodes; }

    /**
     * Add a member node, moving it out of any other group
     */
    void addNode(Node& node);

    bool removeNode(Node& node);

    /**
     * Detach every direct member node
     */
    void clearNodes();

    bool containsNode(const Node& node) const;
    bool containsNodeRecursive(const Node& node) const;

    /**
     * Members of this group and all descendants, pre-order
     */
    std::vector<Node*> getAllNodesRecursive() const;

    // === Hierarchy ===

    NodeGroup* getParent() const { return m_parent; }
    const std::vector<std::unique_ptr<NodeGroup>>& getChildren() const { return m_children; }

    /**
     * Take ownership of a child group
     * Throws std::invalid_argument if the child is this group or one of its ancestors
     */
    NodeGroup* addChild(std::unique_ptr<NodeGroup> child);

    /**
     * Release ownership of a direct child (nullptr if not a child)
     */
    std::unique_ptr<NodeGroup> detachChild(NodeGroup& child);

    /**
     * True when `ancestor` is a strict ancestor of this group
     */
    bool isDescendantOf(const NodeGroup& ancestor) const;

    /**
     * Append this group and all descendants, parents first
     */
    void collectPreOrder(std::vector<NodeGroup*>& out);

    NodeGroup* findGroup(const std::string& id);

private:
    std::string m_id;
    std::string m_name;
    Rect m_bounds;
    NodeGroup* m_parent = nullptr;
    std::vector<std::unique_ptr<NodeGroup>> m_children;
    std::vector<Node*> m_nodes;
};

} // namespace flowgraph
