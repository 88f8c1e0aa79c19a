#include "graph/NodeGraph.hpp"
#include "util/Config.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace flowgraph {

GraphOptions GraphOptions::fromConfig(const util::Config& config) {
    GraphOptions options;
    options.replaceInputConnectionOnNew = config.getBool("replace_input_connection_on_new",
                                                         options.replaceInputConnectionOnNew);
    return options;
}

NodeGraph::NodeGraph(std::string name, GraphCategory category, GraphOptions options)
    : m_id(generateId())
    , m_name(std::move(name))
    , m_category(category)
    , m_options(options)
{}

NodeGraph::~NodeGraph() {
    m_connections.clear();
    m_rootGroups.clear();
    m_nodes.clear();
}

// === Nodes ===

Node* NodeGraph::addNode(std::unique_ptr<Node> node) {
    if (!node) {
        return nullptr;
    }

    auto it = m_nodeIndex.find(node->getId());
    if (it != m_nodeIndex.end()) {
        return it->second;
    }

    Node* raw = node.get();
    m_nodes.push_back(std::move(node));
    m_nodeIndex[raw->getId()] = raw;
    return raw;
}

bool NodeGraph::removeNode(Node& node) {
    if (!containsNode(node)) {
        return false;
    }

    // Connections first, resolved or still referring to the node's pins by id
    auto touches = [&node](const std::unique_ptr<Connection>& c) {
        return c->involves(node) ||
               node.findPin(c->getSourcePinId()) != nullptr ||
               node.findPin(c->getTargetPinId()) != nullptr;
    };
    for (auto& c : m_connections) {
        if (touches(c)) {
            c->disconnect();
        }
    }
    m_connections.erase(std::remove_if(m_connections.begin(), m_connections.end(), touches),
                        m_connections.end());

    if (NodeGroup* group = node.getGroup()) {
        group->removeNode(node);
    }

    if (m_mainNodeId && *m_mainNodeId == node.getId()) {
        m_mainNodeId.reset();
    }

    m_nodeIndex.erase(node.getId());
    m_nodes.erase(std::remove_if(m_nodes.begin(), m_nodes.end(),
        [&node](const std::unique_ptr<Node>& n) { return n.get() == &node; }),
        m_nodes.end());
    return true;
}

bool NodeGraph::removeNode(const std::string& id) {
    Node* node = getNode(id);
    return node ? removeNode(*node) : false;
}

Node* NodeGraph::getNode(const std::string& id) const {
    auto it = m_nodeIndex.find(id);
    return it != m_nodeIndex.end() ? it->second : nullptr;
}

bool NodeGraph::containsNode(const Node& node) const {
    return getNode(node.getId()) == &node;
}

// === Connections ===

Connection* NodeGraph::connect(Pin& source, Pin& target) {
    Node* sourceNode = source.getParentNode();
    Node* targetNode = target.getParentNode();
    if (!sourceNode || !targetNode) {
        return nullptr;
    }
    if (!containsNode(*sourceNode) || !containsNode(*targetNode)) {
        return nullptr;
    }
    if (!source.isOutput() || !target.isInput()) {
        return nullptr;
    }

    bool replace = m_options.replaceInputConnectionOnNew;
    if (!source.canConnectTo(target, replace)) {
        FLOWGRAPH_LOG_DEBUG("Rejected connection " + sourceNode->getName() + "." + source.getName() +
                            " -> " + targetNode->getName() + "." + target.getName());
        return nullptr;
    }

    if (Connection* existing = target.getIncomingConnection()) {
        if (!removeConnection(*existing)) {
            existing->disconnect();
        }
    }

    m_connections.push_back(std::make_unique<Connection>(source, target));
    return m_connections.back().get();
}

Connection* NodeGraph::connect(Node& source, const std::string& outputPin,
                               Node& target, const std::string& inputPin) {
    Pin* out = source.findOutputPin(outputPin);
    Pin* in = target.findInputPin(inputPin);
    if (!out || !in) {
        return nullptr;
    }
    return connect(*out, *in);
}

Connection* NodeGraph::addConnection(std::unique_ptr<Connection> connection) {
    if (!connection) {
        return nullptr;
    }
    if (Connection* existing = getConnection(connection->getId())) {
        return existing;
    }
    m_connections.push_back(std::move(connection));
    return m_connections.back().get();
}

bool NodeGraph::removeConnection(Connection& connection) {
    auto it = std::find_if(m_connections.begin(), m_connections.end(),
        [&connection](const std::unique_ptr<Connection>& c) { return c.get() == &connection; });
    if (it == m_connections.end()) {
        return false;
    }
    (*it)->disconnect();
    m_connections.erase(it);
    return true;
}

bool NodeGraph::removeConnection(const std::string& id) {
    Connection* connection = getConnection(id);
    return connection ? removeConnection(*connection) : false;
}

Connection* NodeGraph::getConnection(const std::string& id) const {
    for (const auto& c : m_connections) {
        if (c->getId() == id) {
            return c.get();
        }
    }
    return nullptr;
}

std::vector<Connection*> NodeGraph::getConnectionsFrom(const Pin& pin) const {
    std::vector<Connection*> result;
    for (const auto& c : m_connections) {
        if (c->getSourcePin() == &pin) {
            result.push_back(c.get());
        }
    }
    return result;
}

Connection* NodeGraph::getConnectionTo(const Pin& pin) const {
    for (const auto& c : m_connections) {
        if (c->getTargetPin() == &pin) {
            return c.get();
        }
    }
    return nullptr;
}

std::vector<Connection*> NodeGraph::getConnectionsOf(const Node& node) const {
    std::vector<Connection*> result;
    for (const auto& c : m_connections) {
        if (c->involves(node)) {
            result.push_back(c.get());
        }
    }
    return result;
}

// === Groups ===

NodeGroup* NodeGraph::addGroup(std::unique_ptr<NodeGroup> group) {
    if (!group) {
        return nullptr;
    }
    m_rootGroups.push_back(std::move(group));
    return m_rootGroups.back().get();
}

bool NodeGraph::removeGroup(NodeGroup& group) {
    auto owned = takeGroup(group);
    if (!owned) {
        return false;
    }

    std::vector<NodeGroup*> subtree;
    owned->collectPreOrder(subtree);
    for (auto* g : subtree) {
        g->clearNodes();
    }
    return true;
}

bool NodeGraph::moveNodeToGroup(Node& node, NodeGroup* group) {
    if (!containsNode(node)) {
        return false;
    }
    if (!group) {
        if (NodeGroup* current = node.getGroup()) {
            current->removeNode(node);
        }
        node.setGroupId(std::nullopt);
        return true;
    }
    if (!ownsGroup(*group)) {
        return false;
    }
    group->addNode(node);
    return true;
}

NodeGroup* NodeGraph::moveNodeToGroup(Node& node, std::unique_ptr<NodeGroup> group) {
    NodeGroup* registered = addGroup(std::move(group));
    if (registered) {
        moveNodeToGroup(node, registered);
    }
    return registered;
}

bool NodeGraph::reparentGroup(NodeGroup& group, NodeGroup* newParent) {
    if (!ownsGroup(group)) {
        return false;
    }
    if (newParent) {
        if (!ownsGroup(*newParent)) {
            return false;
        }
        if (newParent == &group || newParent->isDescendantOf(group)) {
            return false;
        }
    }
    if (group.getParent() == newParent) {
        return true;
    }

    auto owned = takeGroup(group);
    if (newParent) {
        newParent->addChild(std::move(owned));
    } else {
        m_rootGroups.push_back(std::move(owned));
    }
    return true;
}

NodeGroup* NodeGraph::findGroup(const std::string& id) const {
    for (const auto& root : m_rootGroups) {
        if (NodeGroup* found = root->findGroup(id)) {
            return found;
        }
    }
    return nullptr;
}

bool NodeGraph::ownsGroup(const NodeGroup& group) const {
    const NodeGroup* root = &group;
    while (root->getParent()) {
        root = root->getParent();
    }
    return std::any_of(m_rootGroups.begin(), m_rootGroups.end(),
        [root](const std::unique_ptr<NodeGroup>& g) { return g.get() == root; });
}

std::vector<NodeGroup*> NodeGraph::getAllGroupsRecursive() const {
    std::vector<NodeGroup*> result;
    for (const auto& root : m_rootGroups) {
        root->collectPreOrder(result);
    }
    return result;
}

std::unique_ptr<NodeGroup> NodeGraph::takeGroup(NodeGroup& group) {
    if (!ownsGroup(group)) {
        return nullptr;
    }
    if (NodeGroup* parent = group.getParent()) {
        return parent->detachChild(group);
    }

    auto it = std::find_if(m_rootGroups.begin(), m_rootGroups.end(),
        [&group](const std::unique_ptr<NodeGroup>& g) { return g.get() == &group; });
    std::unique_ptr<NodeGroup> owned = std::move(*it);
    m_rootGroups.erase(it);
    return owned;
}

// === Main node ===

Node* NodeGraph::getMainNode() const {
    return m_mainNodeId ? getNode(*m_mainNodeId) : nullptr;
}

bool NodeGraph::setMainNode(const std::optional<std::string>& nodeId) {
    if (!nodeId) {
        m_mainNodeId.reset();
        return true;
    }

    Node* node = getNode(*nodeId);
    if (!node || !isCandidateMainNode(*node)) {
        return false;
    }
    m_mainNodeId = nodeId;
    return true;
}

bool NodeGraph::isCandidateMainNode(const Node& node) const {
    if (m_category == GraphCategory::ControlFlow) {
        return node.flowInputCount() == 0 && node.flowOutputCount() > 0;
    }
    return node.dataInputCount() > 0 && node.dataOutputCount() == 0;
}

std::vector<Node*> NodeGraph::getCandidateMainNodes() const {
    std::vector<Node*> result;
    for (const auto& node : m_nodes) {
        if (isCandidateMainNode(*node)) {
            result.push_back(node.get());
        }
    }
    return result;
}

// === Lookup & consistency ===

Pin* NodeGraph::findPin(const std::string& pinId) const {
    for (const auto& node : m_nodes) {
        if (Pin* pin = node->findPin(pinId)) {
            return pin;
        }
    }
    return nullptr;
}

void NodeGraph::rebuildNodeIndex() {
    m_nodeIndex.clear();
    for (const auto& node : m_nodes) {
        m_nodeIndex.emplace(node->getId(), node.get());
    }
}

void NodeGraph::onDeserialized() {
    rebuildNodeIndex();

    // Pin -> node
    for (auto& node : m_nodes) {
        node->onDeserialized();
    }

    // Node -> group, from the stored group ids
    std::unordered_map<std::string, NodeGroup*> groupIndex;
    for (auto* group : getAllGroupsRecursive()) {
        groupIndex.emplace(group->getId(), group);
    }

    std::vector<std::pair<Node*, std::optional<std::string>>> wanted;
    wanted.reserve(m_nodes.size());
    for (auto& node : m_nodes) {
        wanted.emplace_back(node.get(), node->getGroupId());
    }
    for (auto& [id, group] : groupIndex) {
        group->clearNodes();
    }
    for (auto& [node, groupId] : wanted) {
        if (NodeGroup* current = node->getGroup()) {
            current->removeNode(*node);
        }
        auto it = groupId ? groupIndex.find(*groupId) : groupIndex.end();
        if (it != groupIndex.end()) {
            it->second->addNode(*node);
        } else {
            node->setGroupId(std::nullopt);
        }
    }

    // Connection -> pins
    std::unordered_map<std::string, Pin*> pinIndex;
    for (auto& node : m_nodes) {
        for (auto& pin : node->getInputPins()) {
            pinIndex.emplace(pin->getId(), pin.get());
        }
        for (auto& pin : node->getOutputPins()) {
            pinIndex.emplace(pin->getId(), pin.get());
        }
    }

    size_t dangling = 0;
    for (auto& c : m_connections) {
        auto source = pinIndex.find(c->getSourcePinId());
        auto target = pinIndex.find(c->getTargetPinId());
        Pin* targetPin = target != pinIndex.end() ? target->second : nullptr;

        // An input is fed by one connection; later duplicates stay unresolved
        if (targetPin && targetPin->isInput() && targetPin->getIncomingConnection() &&
            targetPin->getIncomingConnection() != c.get()) {
            FLOWGRAPH_LOG_WARN("Graph '" + m_name + "': connection " + c->getId() + " targets input " +
                               targetPin->getId() + " which is already fed by " +
                               targetPin->getIncomingConnection()->getId());
            targetPin = nullptr;
        }

        c->setSourcePin(source != pinIndex.end() ? source->second : nullptr);
        c->setTargetPin(targetPin);
        if (c->isResolved()) {
            c->transfer();
        } else {
            ++dangling;
        }
    }
    if (dangling > 0) {
        FLOWGRAPH_LOG_WARN("Graph '" + m_name + "': " + std::to_string(dangling) +
                           " connection(s) reference unknown pins");
    }

    if (m_mainNodeId && !getNode(*m_mainNodeId)) {
        FLOWGRAPH_LOG_WARN("Graph '" + m_name + "': main node " + *m_mainNodeId + " not found");
        m_mainNodeId.reset();
    }
}

bool NodeGraph::validate() const {
    for (const auto& c : m_connections) {
        if (!c->isValid()) {
            return false;
        }
        if (!containsNode(*c->getSourceNode()) || !containsNode(*c->getTargetNode())) {
            return false;
        }
    }
    return true;
}

} // namespace flowgraph
