#pragma once

#include "storage/GraphMetadata.hpp"
#include "graph/NodeGraph.hpp"
#include "nodes/NodeRegistry.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace flowgraph {
namespace storage {

/**
 * Versioned graph store backed by SQLite
 *
 * A graph is a catalogue row keyed by slug plus any number of saved
 * versions, each holding the NodeGraphSerializer document. Loading goes
 * through a NodeRegistry, so node types must be registered first.
 *
 * Usage:
 *   GraphStorage db("./graphs.db");
 *   db.createGraph({.slug = "counter", .name = "Counter loop"});
 *   db.saveVersion("counter", graph, std::string("first draft"));
 *   NodeGraph loaded = db.loadGraph("counter");
 */
class GraphStorage {
public:
    /**
     * Open or create the database and bring its schema up to date
     * Throws std::runtime_error if the file cannot be opened or was
     * written by a newer schema.
     */
    explicit GraphStorage(const std::string& dbPath);
    ~GraphStorage();

    GraphStorage(const GraphStorage&) = delete;
    GraphStorage& operator=(const GraphStorage&) = delete;
    GraphStorage(GraphStorage&&) noexcept;
    GraphStorage& operator=(GraphStorage&&) noexcept;

    // === Graph CRUD ===

    /**
     * Create a new graph with metadata (timestamps are auto-set)
     * Throws if slug already exists
     */
    void createGraph(const GraphMetadata& metadata);

    /**
     * Update graph metadata (updates updated_at timestamp)
     * Throws if graph doesn't exist
     */
    void updateGraph(const GraphMetadata& metadata);

    /**
     * Delete a graph and all its versions
     */
    void deleteGraph(const std::string& slug);

    std::optional<GraphMetadata> getGraph(const std::string& slug);

    /**
     * List all graphs ordered by updated_at DESC
     */
    std::vector<GraphMetadata> listGraphs();

    bool graphExists(const std::string& slug);

    // === Version Management ===

    /**
     * Store a snapshot of the graph and bump the graph's updated_at
     * Returns the version id. Throws if the slug is unknown or the
     * graph category differs from the stored one.
     */
    int64_t saveVersion(const std::string& slug,
                        const NodeGraph& graph,
                        const std::optional<std::string>& versionName = std::nullopt);

    std::optional<GraphVersion> getVersion(int64_t versionId);

    /**
     * Most recently saved version of a graph
     */
    std::optional<GraphVersion> getLatestVersion(const std::string& slug);

    /**
     * List versions of a graph, newest first
     */
    std::vector<GraphVersion> listVersions(const std::string& slug);

    void deleteVersion(int64_t versionId);

    /**
     * Keep the newest `keep` versions of a graph, returns how many were deleted
     */
    size_t pruneVersions(const std::string& slug, size_t keep);

    /**
     * Load the latest version of a graph
     * Throws if the graph has no version.
     */
    NodeGraph loadGraph(const std::string& slug,
                        const nodes::NodeRegistry& registry = nodes::NodeRegistry::instance());

    /**
     * Load a specific version
     * Throws if the version doesn't exist.
     */
    NodeGraph loadVersion(int64_t versionId,
                          const nodes::NodeRegistry& registry = nodes::NodeRegistry::instance());

    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace flowgraph
