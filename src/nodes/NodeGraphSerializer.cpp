#include "nodes/NodeGraphSerializer.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace flowgraph {
namespace nodes {

namespace {

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> jsonToOptional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // anonymous namespace

// =============================================================================
// Serialization
// =============================================================================

json NodeGraphSerializer::toJson(const NodeGraph& graph) {
    json result;
    result["id"] = graph.getId();
    result["name"] = graph.getName();
    result["category"] = graphCategoryToString(graph.getCategory());
    result["main_node_id"] = optionalToJson(graph.getMainNodeId());

    json nodesArray = json::array();
    for (const auto& node : graph.getNodes()) {
        nodesArray.push_back(nodeToJson(*node));
    }
    result["nodes"] = nodesArray;

    json connectionsArray = json::array();
    for (const auto& conn : graph.getConnections()) {
        connectionsArray.push_back({
            {"id", conn->getId()},
            {"source_pin_id", conn->getSourcePinId()},
            {"target_pin_id", conn->getTargetPinId()}
        });
    }
    result["connections"] = connectionsArray;

    // Pre-order keeps every parent ahead of its children
    json groupsArray = json::array();
    for (const auto* group : graph.getAllGroupsRecursive()) {
        groupsArray.push_back(groupToJson(*group));
    }
    result["groups"] = groupsArray;

    return result;
}

std::string NodeGraphSerializer::toString(const NodeGraph& graph, int indent) {
    return toJson(graph).dump(indent);
}

void NodeGraphSerializer::saveToFile(const NodeGraph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << toString(graph) << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write graph to: " + path);
    }
}

json NodeGraphSerializer::nodeToJson(const Node& node) {
    json j;
    j["id"] = node.getId();
    j["type"] = node.getTypeName();
    j["name"] = node.getName();
    j["position"] = json::array({node.getPosition().x, node.getPosition().y});
    j["group_id"] = optionalToJson(node.getGroupId());
    j["enabled"] = node.isEnabled();

    json inputs = json::array();
    for (const auto& pin : node.getInputPins()) {
        inputs.push_back(pinToJson(*pin));
    }
    j["inputs"] = inputs;

    json outputs = json::array();
    for (const auto& pin : node.getOutputPins()) {
        outputs.push_back(pinToJson(*pin));
    }
    j["outputs"] = outputs;

    return j;
}

json NodeGraphSerializer::pinToJson(const Pin& pin) {
    json j;
    j["id"] = pin.getId();
    j["name"] = pin.getName();
    j["data_type"] = dataTypeToString(pin.getDataType());
    j["flow"] = pin.isFlowPin();
    if (pin.isDataPin()) {
        j["value"] = valueToJson(pin.getValue());
    }
    return j;
}

json NodeGraphSerializer::groupToJson(const NodeGroup& group) {
    json j;
    j["id"] = group.getId();
    j["name"] = group.getName();
    const Rect& b = group.getBounds();
    j["bounds"] = json::array({b.x, b.y, b.width, b.height});
    j["parent_id"] = group.getParent() ? json(group.getParent()->getId()) : json(nullptr);

    json nodeIds = json::array();
    for (const auto* node : group.getNodes()) {
        nodeIds.push_back(node->getId());
    }
    j["node_ids"] = nodeIds;
    return j;
}

// =============================================================================
// Deserialization
// =============================================================================

NodeGraph NodeGraphSerializer::fromJson(const json& j, const NodeRegistry& registry) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid graph: expected a JSON object");
    }

    try {
        NodeGraph graph(j.value("name", std::string("Graph")));
        if (j.contains("id") && j["id"].is_string()) {
            graph.setId(j["id"].get<std::string>());
        }
        if (j.contains("category")) {
            graph.setCategory(stringToGraphCategory(j["category"].get<std::string>()));
        }

        // Nodes
        if (j.contains("nodes") && j["nodes"].is_array()) {
            for (const auto& nodeJson : j["nodes"]) {
                if (!nodeJson.contains("id") || !nodeJson.contains("type")) {
                    throw std::runtime_error("Invalid node: missing 'id' or 'type'");
                }

                std::string id = nodeJson["id"].get<std::string>();
                std::string type = nodeJson["type"].get<std::string>();

                auto node = registry.create(type);
                if (!node) {
                    FLOWGRAPH_LOG_WARN("Skipping node " + id + ": unknown type '" + type + "'");
                    continue;
                }

                node->setId(id);
                node->setName(nodeJson.value("name", type));
                node->setEnabled(nodeJson.value("enabled", true));
                node->setGroupId(jsonToOptional(nodeJson, "group_id"));

                if (nodeJson.contains("position") && nodeJson["position"].is_array() &&
                    nodeJson["position"].size() >= 2) {
                    node->setPosition(Point{
                        nodeJson["position"][0].get<double>(),
                        nodeJson["position"][1].get<double>()
                    });
                }

                if (nodeJson.contains("inputs")) {
                    restorePins(nodeJson["inputs"], node->getInputPins());
                }
                if (nodeJson.contains("outputs")) {
                    restorePins(nodeJson["outputs"], node->getOutputPins());
                }

                graph.addNode(std::move(node));
            }
        }

        // Connections stay unresolved until onDeserialized()
        if (j.contains("connections") && j["connections"].is_array()) {
            for (const auto& connJson : j["connections"]) {
                if (!connJson.contains("source_pin_id") || !connJson.contains("target_pin_id")) {
                    throw std::runtime_error("Invalid connection: missing pin ids");
                }
                std::string id = connJson.contains("id") ? connJson["id"].get<std::string>() : generateId();
                graph.addConnection(std::make_unique<Connection>(
                    id,
                    connJson["source_pin_id"].get<std::string>(),
                    connJson["target_pin_id"].get<std::string>()));
            }
        }

        // Groups, parents first
        if (j.contains("groups") && j["groups"].is_array()) {
            std::unordered_map<std::string, NodeGroup*> created;
            for (const auto& groupJson : j["groups"]) {
                auto group = std::make_unique<NodeGroup>(groupJson.value("name", std::string("Group")));
                if (groupJson.contains("id")) {
                    group->setId(groupJson["id"].get<std::string>());
                }
                if (groupJson.contains("bounds") && groupJson["bounds"].is_array() &&
                    groupJson["bounds"].size() >= 4) {
                    const auto& b = groupJson["bounds"];
                    group->setBounds(Rect{b[0].get<double>(), b[1].get<double>(),
                                          b[2].get<double>(), b[3].get<double>()});
                }

                // Members listed on the group count for nodes without a group_id
                if (groupJson.contains("node_ids") && groupJson["node_ids"].is_array()) {
                    for (const auto& nodeId : groupJson["node_ids"]) {
                        Node* node = graph.getNode(nodeId.get<std::string>());
                        if (node && !node->getGroupId()) {
                            node->setGroupId(group->getId());
                        }
                    }
                }

                auto parentId = jsonToOptional(groupJson, "parent_id");
                auto parent = parentId ? created.find(*parentId) : created.end();
                NodeGroup* placed = nullptr;
                if (parent != created.end()) {
                    placed = parent->second->addChild(std::move(group));
                } else {
                    if (parentId) {
                        FLOWGRAPH_LOG_WARN("Group parent " + *parentId + " not found, keeping group as root");
                    }
                    placed = graph.addGroup(std::move(group));
                }
                created.emplace(placed->getId(), placed);
            }
        }

        graph.restoreMainNodeId(jsonToOptional(j, "main_node_id"));
        graph.onDeserialized();
        return graph;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed graph JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Malformed graph JSON: ") + e.what());
    }
}

NodeGraph NodeGraphSerializer::fromString(const std::string& str, const NodeRegistry& registry) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid graph JSON: ") + e.what());
    }
    return fromJson(j, registry);
}

NodeGraph NodeGraphSerializer::loadFromFile(const std::string& path, const NodeRegistry& registry) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str(), registry);
}

void NodeGraphSerializer::restorePins(const json& pinsJson, const std::vector<std::unique_ptr<Pin>>& pins) {
    if (!pinsJson.is_array()) {
        throw std::runtime_error("Invalid node: pin list must be an array");
    }

    size_t count = std::min(pinsJson.size(), pins.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& pinJson = pinsJson[i];
        Pin& pin = *pins[i];
        if (pinJson.contains("id")) {
            pin.setId(pinJson["id"].get<std::string>());
        }
        if (pin.isDataPin() && pinJson.contains("value")) {
            pin.setValue(jsonToValue(pinJson["value"]));
        }
    }
}

// =============================================================================
// Helpers - Value Serialization
// =============================================================================

json NodeGraphSerializer::valueToJson(const PinValue& value) {
    json result;
    if (value.isNull()) {
        result["type"] = "null";
        result["value"] = nullptr;
        return result;
    }

    result["type"] = dataTypeToString(value.getType());
    switch (value.getType()) {
        case DataType::Int:
            result["value"] = value.getInt();
            break;
        case DataType::Double:
            result["value"] = value.getDouble();
            break;
        case DataType::String:
            result["value"] = value.getString();
            break;
        case DataType::Bool:
            result["value"] = value.getBool();
            break;
        case DataType::Any:
            result["value"] = nullptr;
            break;
    }
    return result;
}

PinValue NodeGraphSerializer::jsonToValue(const json& j) {
    if (!j.is_object() || !j.contains("type")) {
        throw std::runtime_error("Invalid value: missing 'type'");
    }

    std::string typeStr = j["type"].get<std::string>();
    if (typeStr == "null" || !j.contains("value") || j["value"].is_null()) {
        return PinValue();
    }

    DataType type;
    try {
        type = stringToDataType(typeStr);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid value: ") + e.what());
    }

    const json& v = j["value"];
    switch (type) {
        case DataType::Int:
            return PinValue(v.get<int64_t>());
        case DataType::Double:
            return PinValue(v.get<double>());
        case DataType::String:
            return PinValue(v.get<std::string>());
        case DataType::Bool:
            return PinValue(v.get<bool>());
        case DataType::Any:
            // Infer from the JSON kind
            if (v.is_boolean()) return PinValue(v.get<bool>());
            if (v.is_number_integer()) return PinValue(v.get<int64_t>());
            if (v.is_number()) return PinValue(v.get<double>());
            if (v.is_string()) return PinValue(v.get<std::string>());
            break;
    }
    throw std::runtime_error("Invalid value for type '" + typeStr + "'");
}

} // namespace nodes
} // namespace flowgraph
