#pragma once
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct Config; // forward declaration

// A stored record; field names follow memory_json.hpp.
using Document = nlohmann::json;

// Equality conditions: {"field": value, ...}
using Filter = nlohmann::json;

// ── Session store ────────────────────────────────────────────

// Ephemeral, TTL-scoped conversation buffers
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Expired sessions are reported as absent.
    virtual std::optional<WorkingMemory> get(const std::string& session_id) = 0;

    // Store (or replace) a session; expires after ttl_seconds (0 = store default).
    virtual void save(const WorkingMemory& session, uint32_t ttl_seconds = 0) = 0;

    // Append in FIFO order. No-op returning false when the session is absent.
    virtual bool append_message(const std::string& session_id,
                                const ConversationMessage& message) = 0;

    virtual bool remove(const std::string& session_id) = 0;

    // Ids of the user's unexpired sessions
    virtual std::vector<std::string> list_active(const std::string& user_id) = 0;
};

// ── Vector index ─────────────────────────────────────────────

struct VectorRecord {
    std::string memory_id;
    Embedding embedding;
    nlohmann::json metadata = nlohmann::json::object();
};

class VectorStore {
public:
    virtual ~VectorStore() = default;

    virtual bool upsert(const std::string& memory_id,
                        const Embedding& embedding,
                        const nlohmann::json& metadata,
                        const std::string& collection) = 0;

    // Returns the number of records written
    virtual uint32_t batch_upsert(const std::vector<VectorRecord>& records,
                                  const std::string& collection) = 0;

    // Best matches first. Scores are similarities normalized to [0, 1];
    // hits below score_floor or failing an equality filter are dropped.
    virtual std::vector<VectorHit> search(const Embedding& query,
                                          uint32_t top_k,
                                          const std::string& collection,
                                          const Filter& filters = Filter::object(),
                                          double score_floor = 0.0) = 0;

    virtual bool remove(const std::string& memory_id, const std::string& collection) = 0;
};

// ── Document store ───────────────────────────────────────────

enum class SortOrder { Ascending, Descending };

struct FindOptions {
    std::string sort_by = "created_at";
    SortOrder sort_order = SortOrder::Descending;
    uint32_t skip = 0;
    uint32_t limit = 100;
};

// Collections: "episodic_memories", "semantic_memories". Any other
// collection name throws std::invalid_argument.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Returns the document id (generated when the document has none)
    virtual std::optional<std::string> insert(const std::string& collection,
                                              const Document& doc) = 0;

    virtual std::optional<Document> find_by_id(const std::string& collection,
                                               const std::string& id) = 0;

    virtual std::vector<Document> find(const std::string& collection,
                                       const Filter& query,
                                       const FindOptions& options = {}) = 0;

    // Apply a partial update; updated_at is stamped. False if nothing matched.
    virtual bool update(const std::string& collection,
                        const std::string& id,
                        const Document& partial) = 0;

    virtual bool remove(const std::string& collection, const std::string& id) = 0;

    virtual uint32_t count(const std::string& collection, const Filter& query) = 0;

    // Full-text match over the given fields, best matches first
    virtual std::vector<Document> full_text_search(const std::string& collection,
                                                   const std::string& text,
                                                   const std::vector<std::string>& fields,
                                                   uint32_t limit) = 0;
};

// ── Graph index ──────────────────────────────────────────────

class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Insert or replace by node id
    virtual bool add_node(const GraphNode& node) = 0;

    // Insert or replace by (source, target, relation)
    virtual bool add_edge(const GraphEdge& edge) = 0;

    virtual std::optional<GraphNode> get_node(const std::string& id) = 0;

    // Nodes reachable within max_depth hops, each reported once with the
    // edge that first reached it.
    virtual std::vector<Neighbor> get_neighbors(const std::string& id,
                                                const std::optional<std::string>& relation = std::nullopt,
                                                Direction direction = Direction::Both,
                                                uint32_t max_depth = 1) = 0;

    // Shortest path over outgoing edges, start and end included
    virtual std::optional<std::vector<std::string>> find_path(const std::string& start_id,
                                                              const std::string& end_id,
                                                              uint32_t max_depth = 5) = 0;

    virtual bool delete_node(const std::string& id, bool cascade = true) = 0;

    virtual bool delete_edge(const std::string& source_id,
                             const std::string& target_id,
                             const std::optional<std::string>& relation = std::nullopt) = 0;

    virtual Subgraph query_subgraph(const std::string& center_id,
                                    uint32_t max_depth = 2,
                                    const std::vector<std::string>& relation_filter = {}) = 0;
};

// ── Factory ──────────────────────────────────────────────────

struct StorageBundle {
    std::unique_ptr<SessionStore> sessions;
    std::unique_ptr<VectorStore> vectors;
    std::unique_ptr<DocumentStore> documents;
    std::unique_ptr<GraphStore> graph;
};

// "local": in-process session store + SQLite stores at config.sqlite_path().
// "production" is reserved and throws std::runtime_error; any other mode
// throws std::invalid_argument.
StorageBundle create_storage(const Config& config);

} // namespace engram
