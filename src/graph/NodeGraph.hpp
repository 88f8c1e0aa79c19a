#pragma once

#include "graph/Types.hpp"
#include "graph/Pin.hpp"
#include "graph/Connection.hpp"
#include "graph/Node.hpp"
#include "graph/NodeGroup.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowgraph {

namespace util { class Config; }

/**
 * Mutation policies of a graph
 */
struct GraphOptions {
    // A new connection on an already connected input replaces the old one
    bool replaceInputConnectionOnNew = true;

    static GraphOptions fromConfig(const util::Config& config);
};

/**
 * Aggregate root owning nodes, connections and root groups
 *
 * Structural operations never throw: connect() returns nullptr and
 * removals return false when the request does not apply.
 *
 * Example usage:
 *   NodeGraph graph("demo", GraphCategory::ControlFlow);
 *   Node* start = graph.addNode(registry.create("start"));
 *   Node* print = graph.addNode(registry.create("print"));
 *   graph.connect(*start->findOutputPin("out"), *print->findInputPin("in"));
 *   graph.setMainNode(start->getId());
 */
class NodeGraph {
public:
    explicit NodeGraph(std::string name = "Graph",
                       GraphCategory category = GraphCategory::ControlFlow,
                       GraphOptions options = GraphOptions{});
    ~NodeGraph();

    NodeGraph(const NodeGraph&) = delete;
    NodeGraph& operator=(const NodeGraph&) = delete;
    NodeGraph(NodeGraph&&) = default;
    NodeGraph& operator=(NodeGraph&&) = default;

    // === Identity ===

    const std::string& getId() const { return m_id; }
    void setId(std::string id) { m_id = std::move(id); }
    const std::string& getName() const { return m_name; }
    void setName(std::string name) { m_name = std::move(name); }
    GraphCategory getCategory() const { return m_category; }
    void setCategory(GraphCategory category) { m_category = category; }
    const GraphOptions& getOptions() const { return m_options; }
    void setOptions(const GraphOptions& options) { m_options = options; }

    // === Nodes ===

    /**
     * Insert a node. If a node with the same id is already present the
     * argument is discarded and the existing node is returned.
     */
    Node* addNode(std::unique_ptr<Node> node);

    /**
     * Construct a node in place
     */
    template <typename T, typename... Args>
    T* emplaceNode(Args&&... args) {
        auto node = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = node.get();
        addNode(std::move(node));
        return raw;
    }

    /**
     * Remove a node with its connections and group membership
     * Clears the main node when it pointed at the removed node.
     */
    bool removeNode(Node& node);
    bool removeNode(const std::string& id);

    Node* getNode(const std::string& id) const;
    bool containsNode(const Node& node) const;
    const std::vector<std::unique_ptr<Node>>& getNodes() const { return m_nodes; }
    size_t nodeCount() const { return m_nodes.size(); }

    // === Connections ===

    /**
     * Connect an output pin to an input pin
     *
     * Returns nullptr when either pin has no parent node, a parent is
     * not a member of this graph, the pins are not output/input, or the
     * pins are incompatible. With replaceInputConnectionOnNew the
     * previous connection of the target input is removed first.
     */
    Connection* connect(Pin& source, Pin& target);

    /**
     * Connect by pin name (nullptr if either pin does not exist)
     */
    Connection* connect(Node& source, const std::string& outputPin,
                        Node& target, const std::string& inputPin);

    /**
     * Register a connection as-is (used by loaders before onDeserialized)
     */
    Connection* addConnection(std::unique_ptr<Connection> connection);

    bool removeConnection(Connection& connection);
    bool removeConnection(const std::string& id);

    Connection* getConnection(const std::string& id) const;
    const std::vector<std::unique_ptr<Connection>>& getConnections() const { return m_connections; }
    std::vector<Connection*> getConnectionsFrom(const Pin& pin) const;
    Connection* getConnectionTo(const Pin& pin) const;
    std::vector<Connection*> getConnectionsOf(const Node& node) const;

    // === Groups ===

    /**
     * Register a root group
     */
    NodeGroup* addGroup(std::unique_ptr<NodeGroup> group);

    /**
     * Remove a group anywhere in the hierarchy together with its
     * descendants. Member nodes stay in the graph, ungrouped.
     */
    bool removeGroup(NodeGroup& group);

    /**
     * Move a node into a group owned by this graph (nullptr ungroups it)
     */
    bool moveNodeToGroup(Node& node, NodeGroup* group);

    /**
     * Register a group foreign to the graph as a root group, then move the node into it
     */
    NodeGroup* moveNodeToGroup(Node& node, std::unique_ptr<NodeGroup> group);

    /**
     * Move a group under a new parent (nullptr makes it a root group)
     * Rejects the group itself and its descendants as new parent.
     */
    bool reparentGroup(NodeGroup& group, NodeGroup* newParent);

    NodeGroup* findGroup(const std::string& id) const;
    bool ownsGroup(const NodeGroup& group) const;
    const std::vector<std::unique_ptr<NodeGroup>>& getRootGroups() const { return m_rootGroups; }

    /**
     * All groups, parents before children
     */
    std::vector<NodeGroup*> getAllGroupsRecursive() const;

    // === Main node ===

    const std::optional<std::string>& getMainNodeId() const { return m_mainNodeId; }
    Node* getMainNode() const;

    /**
     * Select the main node. Only current candidates are accepted;
     * std::nullopt clears the selection.
     */
    bool setMainNode(const std::optional<std::string>& nodeId);

    /**
     * Set the main node id without checks (used by loaders)
     */
    void restoreMainNodeId(std::optional<std::string> nodeId) { m_mainNodeId = std::move(nodeId); }

    bool isCandidateMainNode(const Node& node) const;

    /**
     * ControlFlow: nodes without flow inputs and with flow outputs.
     * DataFlow: nodes with data inputs and without data outputs.
     */
    std::vector<Node*> getCandidateMainNodes() const;

    // === Lookup & consistency ===

    Pin* findPin(const std::string& pinId) const;

    /**
     * Rebuild pin, group and connection references from stored ids
     * Unknown ids leave the reference unset.
     */
    void onDeserialized();

    /**
     * True when every connection resolves and is compatible
     */
    bool validate() const;

private:
    std::unique_ptr<NodeGroup> takeGroup(NodeGroup& group);
    void rebuildNodeIndex();

    std::string m_id;
    std::string m_name;
    GraphCategory m_category;
    GraphOptions m_options;
    std::optional<std::string> m_mainNodeId;

    // Destruction runs bottom-up: connections, then groups, then nodes
    std::vector<std::unique_ptr<Node>> m_nodes;
    std::unordered_map<std::string, Node*> m_nodeIndex;
    std::vector<std::unique_ptr<NodeGroup>> m_rootGroups;
    std::vector<std::unique_ptr<Connection>> m_connections;
};

} // namespace flowgraph
