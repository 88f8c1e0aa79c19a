#pragma once

#include "graph/Node.hpp"
#include "nodes/NodeDefinition.hpp"
#include <functional>
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace flowgraph {
namespace nodes {

/**
 * Factory for node types implemented as Node subclasses
 */
using NodeFactory = std::function<std::unique_ptr<Node>()>;

/**
 * Central registry of constructible node types
 *
 * A type is either a NodeDefinition (instantiated as a DefinedNode) or
 * a factory for a custom Node subclass.
 *
 * Supports both singleton access (global registry) and custom instances
 * for testing or isolated environments.
 *
 * Usage:
 *   NodeRegistry::instance().registerNode(def);
 *   auto node = NodeRegistry::instance().create("add");
 *
 *   NodeRegistry myRegistry;
 *   myRegistry.registerFactory("timer", "flow", [] { return std::make_unique<TimerNode>(); });
 */
class NodeRegistry {
public:
    NodeRegistry() = default;

    // Non-copyable
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    // Movable
    NodeRegistry(NodeRegistry&&) = default;
    NodeRegistry& operator=(NodeRegistry&&) = default;

    /**
     * Get the global singleton instance
     */
    static NodeRegistry& instance();

    // === Registration ===

    /**
     * Register a node definition
     * Overwrites if a type with the same name already exists
     */
    void registerNode(NodeDefinitionPtr definition);

    /**
     * Register a factory for a Node subclass
     * Overwrites if a type with the same name already exists
     */
    void registerFactory(const std::string& name, const std::string& category, NodeFactory factory);

    /**
     * Unregister a node type by name
     */
    void unregisterNode(const std::string& name);

    // === Lookup ===

    /**
     * Get a node definition by name ("category/name" is accepted)
     * Returns nullptr if not found or if the type is factory-based
     */
    NodeDefinitionPtr getNode(const std::string& name) const;

    /**
     * Check if a node type exists
     */
    bool hasNode(const std::string& name) const;

    /**
     * Instantiate a node type
     * Returns nullptr for an unknown type name
     */
    std::unique_ptr<Node> create(const std::string& typeName) const;

    // === Enumeration ===

    /**
     * Get all registered node names (sorted)
     */
    std::vector<std::string> getNodeNames() const;

    /**
     * Get node names in a specific category
     */
    std::vector<std::string> getNodeNamesInCategory(const std::string& category) const;

    /**
     * Get all categories
     */
    std::vector<std::string> getCategories() const;

    /**
     * Get number of registered node types
     */
    size_t size() const { return m_entries.size(); }

    // === Clear ===

    /**
     * Remove all registered node types
     */
    void clear();

private:
    struct Entry {
        std::string category;
        NodeDefinitionPtr definition;
        NodeFactory factory;
    };

    const Entry* findEntry(const std::string& name) const;

    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace nodes
} // namespace flowgraph
