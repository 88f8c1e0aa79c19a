#pragma once

#include "graph/Geometry.hpp"
#include "graph/NodeGraph.hpp"
#include <functional>
#include <string>
#include <vector>

namespace flowgraph {

namespace util { class Config; }

/**
 * Group layout operations over the groups of one graph
 *
 * Creates and deletes groups, moves nodes in and out of them and keeps
 * group bounds consistent with member positions. Node sizes come from
 * the measure function when set, otherwise from the default size.
 */
class NodeGroupManager {
public:
    using MeasureFunction = std::function<Size(const Node&)>;

    explicit NodeGroupManager(NodeGraph& graph);

    void setMeasureFunction(MeasureFunction measure) { m_measure = std::move(measure); }
    void setDefaultNodeSize(Size size) { m_defaultNodeSize = size; }
    Size getDefaultNodeSize() const { return m_defaultNodeSize; }

    /**
     * Apply default_node_width / default_node_height
     */
    void configure(const util::Config& config);

    // === Creation / deletion ===

    /**
     * Create a root group, or a child of `parent` when given
     * Returns nullptr if `parent` does not belong to the graph.
     */
    NodeGroup* createGroup(const std::string& name, const Rect& bounds, NodeGroup* parent = nullptr);

    /**
     * Create a group fitted around the given nodes
     */
    NodeGroup* createGroupFromNodes(const std::string& name, const std::vector<Node*>& nodes,
                                    double padding = 16, NodeGroup* parent = nullptr);

    /**
     * Delete a group and its descendants; member nodes become ungrouped
     */
    bool deleteGroup(NodeGroup& group);

    // === Membership ===

    bool addNodeToGroup(Node& node, NodeGroup& group, bool adjustBounds = true, double padding = 8);
    bool removeNodeFromGroup(Node& node, NodeGroup& group);

    // === Layout ===

    /**
     * Translate a group, optionally with its member node positions and child groups
     */
    void moveGroup(NodeGroup& group, double dx, double dy,
                   bool cascadeNodes = false, bool cascadeChildren = true);

    /**
     * Fit the bounds tightly around all nested member nodes plus padding
     * Leaves the bounds unchanged when the group has no nodes.
     */
    void updateGroupBoundsToFit(NodeGroup& group, double padding = 16);

    bool validateNodeInsideBounds(const NodeGroup& group, const Node& node, double tolerance = 0) const;

    void expandBoundsToIncludeNode(NodeGroup& group, const Node& node, double padding = 8);

    Rect calculateBoundsForNodes(const std::vector<Node*>& nodes, double padding = 16) const;

    /**
     * Resolve a desired node position against a group
     *
     * Positions already inside are returned unchanged. Otherwise the
     * group grows to include the node (dynamicExpand) or the position is
     * clamped inside the bounds.
     */
    Point constrainOrExpandNodePosition(const Node& node, NodeGroup& group, Point desired,
                                        bool dynamicExpand = true, double padding = 8);

    Rect getNodeRect(const Node& node) const;

private:
    Size measure(const Node& node) const;

    NodeGraph& m_graph;
    MeasureFunction m_measure;
    Size m_defaultNodeSize{120.0, 60.0};
};

} // namespace flowgraph
