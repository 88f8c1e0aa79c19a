#include "storage/GraphStorage.hpp"
#include "nodes/NodeGraphSerializer.hpp"
#include "util/Logger.hpp"
#include <sqlite3.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace flowgraph {
namespace storage {

namespace {

constexpr int SchemaVersion = 1;

constexpr const char* VersionColumns =
    "id, graph_slug, version_name, graph_json, node_count, connection_count, created_at";

constexpr const char* GraphColumns =
    "slug, name, description, category, created_at, updated_at";

/**
 * UTC time as 2024-05-01T10:00:00.123Z
 */
std::string utcNow() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string lastError(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "out of memory";
}

/**
 * Prepared statement with positional binding
 *
 * Usage:
 *   Statement stmt(db, "SELECT name FROM graphs WHERE slug = ?");
 *   stmt.bind(slug);
 *   while (stmt.step()) { ... stmt.text(0) ... }
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Cannot prepare '" + sql + "': " + lastError(db));
        }
    }

    ~Statement() {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    template <typename... Args>
    Statement& bind(const Args&... args) {
        int index = 0;
        (bindOne(++index, args), ...);
        return *this;
    }

    /**
     * Advance one row; false once the statement is done
     */
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error("SQLite step failed: " + lastError(m_db));
    }

    /**
     * Run a statement that returns no rows, returning the changed row count
     */
    int run() {
        step();
        return sqlite3_changes(m_db);
    }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(m_stmt, col);
        return value ? reinterpret_cast<const char*>(value) : std::string();
    }

    std::optional<std::string> optionalText(int col) const {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return text(col);
    }

    int64_t integer(int col) const {
        return sqlite3_column_int64(m_stmt, col);
    }

private:
    void bindOne(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindOne(int index, const char* value) {
        sqlite3_bind_text(m_stmt, index, value, -1, SQLITE_TRANSIENT);
    }

    void bindOne(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindOne(int index, size_t value) {
        sqlite3_bind_int64(m_stmt, index, static_cast<int64_t>(value));
    }

    void bindOne(int index, const std::optional<std::string>& value) {
        if (value) {
            bindOne(index, *value);
        } else {
            sqlite3_bind_null(m_stmt, index);
        }
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

/**
 * BEGIN on construction, ROLLBACK unless commit() was called
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : m_db(db) {
        execute("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        execute("COMMIT");
        m_committed = true;
    }

private:
    void execute(const char* sql) {
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string(sql) + " failed: " + lastError(m_db));
        }
    }

    sqlite3* m_db;
    bool m_committed = false;
};

GraphMetadata readMetadata(const Statement& stmt) {
    return GraphMetadata{
        .slug = stmt.text(0),
        .name = stmt.text(1),
        .description = stmt.text(2),
        .category = stringToGraphCategory(stmt.text(3)),
        .createdAt = stmt.text(4),
        .updatedAt = stmt.text(5)
    };
}

GraphVersion readVersion(const Statement& stmt) {
    return GraphVersion{
        .id = stmt.integer(0),
        .graphSlug = stmt.text(1),
        .versionName = stmt.optionalText(2),
        .graphJson = stmt.text(3),
        .nodeCount = static_cast<size_t>(stmt.integer(4)),
        .connectionCount = static_cast<size_t>(stmt.integer(5)),
        .createdAt = stmt.text(6)
    };
}

} // anonymous namespace

// =============================================================================
// GraphStorage::Impl
// =============================================================================

class GraphStorage::Impl {
public:
    explicit Impl(std::string dbPath) : m_dbPath(std::move(dbPath)) {
        if (sqlite3_open(m_dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = lastError(m_db);
            sqlite3_close(m_db);
            throw std::runtime_error("Cannot open graph database " + m_dbPath + ": " + error);
        }

        try {
            execute("PRAGMA foreign_keys = ON");
            migrate();
        } catch (const std::exception&) {
            sqlite3_close(m_db);
            throw;
        }

        FLOWGRAPH_LOG_DEBUG("Graph database ready: " + m_dbPath);
    }

    ~Impl() {
        sqlite3_close(m_db);
    }

    // === Graphs ===

    void createGraph(const GraphMetadata& metadata) {
        if (graphExists(metadata.slug)) {
            throw std::runtime_error("Graph already exists: " + metadata.slug);
        }
        std::string now = utcNow();
        Statement(m_db, std::string("INSERT INTO graphs (") + GraphColumns + ") VALUES (?, ?, ?, ?, ?, ?)")
            .bind(metadata.slug, metadata.name, metadata.description,
                  graphCategoryToString(metadata.category), now, now)
            .run();
        FLOWGRAPH_LOG_INFO("Created graph '" + metadata.slug + "'");
    }

    void updateGraph(const GraphMetadata& metadata) {
        int changed = Statement(m_db,
                "UPDATE graphs SET name = ?, description = ?, category = ?, updated_at = ? WHERE slug = ?")
            .bind(metadata.name, metadata.description, graphCategoryToString(metadata.category),
                  utcNow(), metadata.slug)
            .run();
        if (changed == 0) {
            throw std::runtime_error("Graph not found: " + metadata.slug);
        }
    }

    void deleteGraph(const std::string& slug) {
        // graph_versions rows go with the graph (ON DELETE CASCADE)
        if (Statement(m_db, "DELETE FROM graphs WHERE slug = ?").bind(slug).run() > 0) {
            FLOWGRAPH_LOG_INFO("Deleted graph '" + slug + "'");
        }
    }

    std::optional<GraphMetadata> getGraph(const std::string& slug) {
        Statement stmt(m_db, std::string("SELECT ") + GraphColumns + " FROM graphs WHERE slug = ?");
        stmt.bind(slug);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readMetadata(stmt);
    }

    std::vector<GraphMetadata> listGraphs() {
        Statement stmt(m_db, std::string("SELECT ") + GraphColumns +
                             " FROM graphs ORDER BY updated_at DESC, slug");
        std::vector<GraphMetadata> graphs;
        while (stmt.step()) {
            graphs.push_back(readMetadata(stmt));
        }
        return graphs;
    }

    bool graphExists(const std::string& slug) {
        Statement stmt(m_db, "SELECT 1 FROM graphs WHERE slug = ?");
        stmt.bind(slug);
        return stmt.step();
    }

    // === Versions ===

    int64_t saveVersion(const std::string& slug, const NodeGraph& graph,
                        const std::optional<std::string>& versionName) {
        auto metadata = getGraph(slug);
        if (!metadata) {
            throw std::runtime_error("Graph not found: " + slug);
        }
        if (metadata->category != graph.getCategory()) {
            throw std::runtime_error("Graph '" + slug + "' is stored as " +
                                     graphCategoryToString(metadata->category) + ", cannot save a " +
                                     graphCategoryToString(graph.getCategory()) + " graph");
        }

        std::string document = nodes::NodeGraphSerializer::toString(graph, -1);
        std::string now = utcNow();

        Transaction tx(m_db);
        Statement(m_db,
                "INSERT INTO graph_versions "
                "(graph_slug, version_name, graph_json, node_count, connection_count, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?)")
            .bind(slug, versionName, document, graph.nodeCount(), graph.getConnections().size(), now)
            .run();
        int64_t versionId = sqlite3_last_insert_rowid(m_db);

        Statement(m_db, "UPDATE graphs SET updated_at = ? WHERE slug = ?").bind(now, slug).run();
        tx.commit();

        FLOWGRAPH_LOG_INFO("Saved '" + slug + "' version " + std::to_string(versionId) + " (" +
                           std::to_string(graph.nodeCount()) + " nodes)");
        return versionId;
    }

    std::optional<GraphVersion> getVersion(int64_t versionId) {
        Statement stmt(m_db, std::string("SELECT ") + VersionColumns + " FROM graph_versions WHERE id = ?");
        stmt.bind(versionId);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readVersion(stmt);
    }

    std::vector<GraphVersion> listVersions(const std::string& slug, std::optional<int64_t> limit = std::nullopt) {
        // Versions saved within the same millisecond are ordered by id
        std::string sql = std::string("SELECT ") + VersionColumns +
                          " FROM graph_versions WHERE graph_slug = ? ORDER BY created_at DESC, id DESC";
        if (limit) {
            sql += " LIMIT " + std::to_string(*limit);
        }

        Statement stmt(m_db, sql);
        stmt.bind(slug);
        std::vector<GraphVersion> versions;
        while (stmt.step()) {
            versions.push_back(readVersion(stmt));
        }
        return versions;
    }

    void deleteVersion(int64_t versionId) {
        Statement(m_db, "DELETE FROM graph_versions WHERE id = ?").bind(versionId).run();
    }

    size_t pruneVersions(const std::string& slug, size_t keep) {
        int removed = Statement(m_db,
                "DELETE FROM graph_versions WHERE graph_slug = ? AND id NOT IN ("
                "SELECT id FROM graph_versions WHERE graph_slug = ? "
                "ORDER BY created_at DESC, id DESC LIMIT ?)")
            .bind(slug, slug, keep)
            .run();
        if (removed > 0) {
            FLOWGRAPH_LOG_INFO("Pruned " + std::to_string(removed) + " old version(s) of '" + slug + "'");
        }
        return static_cast<size_t>(removed);
    }

    NodeGraph loadGraph(const std::string& slug, const nodes::NodeRegistry& registry) {
        if (!graphExists(slug)) {
            throw std::runtime_error("Graph not found: " + slug);
        }
        auto latest = listVersions(slug, 1);
        if (latest.empty()) {
            throw std::runtime_error("No version found for graph: " + slug);
        }
        return nodes::NodeGraphSerializer::fromString(latest.front().graphJson, registry);
    }

    NodeGraph loadVersion(int64_t versionId, const nodes::NodeRegistry& registry) {
        auto version = getVersion(versionId);
        if (!version) {
            throw std::runtime_error("Version not found: " + std::to_string(versionId));
        }
        return nodes::NodeGraphSerializer::fromString(version->graphJson, registry);
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    void execute(const std::string& sql) {
        char* message = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
            std::string error = message ? message : lastError(m_db);
            sqlite3_free(message);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    int userVersion() {
        Statement stmt(m_db, "PRAGMA user_version");
        return stmt.step() ? static_cast<int>(stmt.integer(0)) : 0;
    }

    void migrate() {
        int version = userVersion();
        if (version > SchemaVersion) {
            throw std::runtime_error("Graph database " + m_dbPath + " uses schema " + std::to_string(version) +
                                     ", this build supports up to " + std::to_string(SchemaVersion));
        }
        if (version == SchemaVersion) {
            return;
        }

        execute(R"(
            CREATE TABLE IF NOT EXISTS graphs (
                slug TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                category TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            )
        )");
        execute(R"(
            CREATE TABLE IF NOT EXISTS graph_versions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                graph_slug TEXT NOT NULL REFERENCES graphs(slug) ON DELETE CASCADE,
                version_name TEXT,
                graph_json TEXT NOT NULL,
                node_count INTEGER NOT NULL DEFAULT 0,
                connection_count INTEGER NOT NULL DEFAULT 0,
                created_at TEXT NOT NULL
            )
        )");
        execute("CREATE INDEX IF NOT EXISTS idx_graph_versions_slug_created "
                "ON graph_versions(graph_slug, created_at DESC)");
        execute("PRAGMA user_version = " + std::to_string(SchemaVersion));
    }

    std::string m_dbPath;
    sqlite3* m_db = nullptr;
};

// =============================================================================
// GraphStorage
// =============================================================================

GraphStorage::GraphStorage(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

GraphStorage::~GraphStorage() = default;

GraphStorage::GraphStorage(GraphStorage&&) noexcept = default;
GraphStorage& GraphStorage::operator=(GraphStorage&&) noexcept = default;

void GraphStorage::createGraph(const GraphMetadata& metadata) {
    m_impl->createGraph(metadata);
}

void GraphStorage::updateGraph(const GraphMetadata& metadata) {
    m_impl->updateGraph(metadata);
}

void GraphStorage::deleteGraph(const std::string& slug) {
    m_impl->deleteGraph(slug);
}

std::optional<GraphMetadata> GraphStorage::getGraph(const std::string& slug) {
    return m_impl->getGraph(slug);
}

std::vector<GraphMetadata> GraphStorage::listGraphs() {
    return m_impl->listGraphs();
}

bool GraphStorage::graphExists(const std::string& slug) {
    return m_impl->graphExists(slug);
}

int64_t GraphStorage::saveVersion(const std::string& slug, const NodeGraph& graph,
                                  const std::optional<std::string>& versionName) {
    return m_impl->saveVersion(slug, graph, versionName);
}

std::optional<GraphVersion> GraphStorage::getVersion(int64_t versionId) {
    return m_impl->getVersion(versionId);
}

std::optional<GraphVersion> GraphStorage::getLatestVersion(const std::string& slug) {
    auto versions = m_impl->listVersions(slug, 1);
    if (versions.empty()) {
        return std::nullopt;
    }
    return std::move(versions.front());
}

std::vector<GraphVersion> GraphStorage::listVersions(const std::string& slug) {
    return m_impl->listVersions(slug);
}

void GraphStorage::deleteVersion(int64_t versionId) {
    m_impl->deleteVersion(versionId);
}

size_t GraphStorage::pruneVersions(const std::string& slug, size_t keep) {
    return m_impl->pruneVersions(slug, keep);
}

NodeGraph GraphStorage::loadGraph(const std::string& slug, const nodes::NodeRegistry& registry) {
    return m_impl->loadGraph(slug, registry);
}

NodeGraph GraphStorage::loadVersion(int64_t versionId, const nodes::NodeRegistry& registry) {
    return m_impl->loadVersion(versionId, registry);
}

const std::string& GraphStorage::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
} // namespace flowgraph
