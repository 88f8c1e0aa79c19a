#pragma once

#include "graph/NodeGraph.hpp"
#include "nodes/NodeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace flowgraph {
namespace nodes {

using json = nlohmann::json;

/**
 * Serialization/Deserialization for NodeGraph
 *
 * JSON format:
 * {
 *   "id": "...", "name": "demo", "category": "control_flow", "main_node_id": "...",
 *   "nodes": [
 *     {"id": "...", "type": "add", "name": "add", "position": [10, 20],
 *      "group_id": null, "enabled": true,
 *      "inputs": [{"id": "...", "name": "a", "data_type": "any", "flow": false,
 *                  "value": {"type": "int", "value": 1}}],
 *      "outputs": [...]}
 *   ],
 *   "connections": [{"id": "...", "source_pin_id": "...", "target_pin_id": "..."}],
 *   "groups": [{"id": "...", "name": "G", "bounds": [0, 0, 200, 100],
 *               "parent_id": null, "node_ids": ["..."]}]
 * }
 *
 * Groups are written parents first. Pins are matched by position when
 * loading, so a node type must keep its pin order to stay loadable.
 */
class NodeGraphSerializer {
public:
    // === Serialization ===

    /**
     * Convert a NodeGraph to JSON
     */
    static json toJson(const NodeGraph& graph);

    /**
     * Convert a NodeGraph to JSON string
     */
    static std::string toString(const NodeGraph& graph, int indent = 2);

    /**
     * Write the JSON form to a file (throws std::runtime_error on I/O failure)
     */
    static void saveToFile(const NodeGraph& graph, const std::string& path);

    // === Deserialization ===

    /**
     * Create a NodeGraph from JSON, instantiating nodes through the registry
     *
     * Unknown node types are skipped with a warning. Malformed documents
     * throw std::runtime_error.
     */
    static NodeGraph fromJson(const json& j, const NodeRegistry& registry = NodeRegistry::instance());

    /**
     * Create a NodeGraph from JSON string
     */
    static NodeGraph fromString(const std::string& str, const NodeRegistry& registry = NodeRegistry::instance());

    static NodeGraph loadFromFile(const std::string& path, const NodeRegistry& registry = NodeRegistry::instance());

    // === Helpers (public for result serialization) ===

    static json valueToJson(const PinValue& value);
    static PinValue jsonToValue(const json& j);

private:
    static json nodeToJson(const Node& node);
    static json pinToJson(const Pin& pin);
    static json groupToJson(const NodeGroup& group);
    static void restorePins(const json& pinsJson, const std::vector<std::unique_ptr<Pin>>& pins);
};

} // namespace nodes
} // namespace flowgraph
