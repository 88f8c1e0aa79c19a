#pragma once

#include "graph/Types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace flowgraph {
namespace storage {

/**
 * Catalogue entry of a stored graph
 */
struct GraphMetadata {
    std::string slug;                    // Unique key, used on the command line
    std::string name;
    std::string description;
    GraphCategory category = GraphCategory::ControlFlow;
    std::string createdAt;               // ISO 8601 UTC, set by the storage
    std::string updatedAt;               // Bumped by updates and new versions
};

/**
 * One saved snapshot of a graph
 */
struct GraphVersion {
    int64_t id = 0;
    std::string graphSlug;
    std::optional<std::string> versionName;
    std::string graphJson;               // NodeGraphSerializer document
    size_t nodeCount = 0;
    size_t connectionCount = 0;
    std::string createdAt;
};

} // namespace storage
} // namespace flowgraph
