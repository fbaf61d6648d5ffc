#pragma once
#include "../storage.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

// Adjacency-list graph in SQLite: graph_nodes + graph_edges tables
class SqliteGraphStore : public GraphStore {
public:
    explicit SqliteGraphStore(const std::string& path);
    ~SqliteGraphStore() override;

    // Non-copyable
    SqliteGraphStore(const SqliteGraphStore&) = delete;
    SqliteGraphStore& operator=(const SqliteGraphStore&) = delete;

    bool add_node(const GraphNode& node) override;
    bool add_edge(const GraphEdge& edge) override;
    std::optional<GraphNode> get_node(const std::string& id) override;
    std::vector<Neighbor> get_neighbors(const std::string& id,
                                        const std::optional<std::string>& relation = std::nullopt,
                                        Direction direction = Direction::Both,
                                        uint32_t max_depth = 1) override;
    std::optional<std::vector<std::string>> find_path(const std::string& start_id,
                                                      const std::string& end_id,
                                                      uint32_t max_depth = 5) override;
    bool delete_node(const std::string& id, bool cascade = true) override;
    bool delete_edge(const std::string& source_id,
                     const std::string& target_id,
                     const std::optional<std::string>& relation = std::nullopt) override;
    Subgraph query_subgraph(const std::string& center_id,
                            uint32_t max_depth = 2,
                            const std::vector<std::string>& relation_filter = {}) override;

private:
    void init_schema();

    // Caller holds mutex_
    std::optional<GraphNode> load_node(const std::string& id);
    std::vector<Neighbor> one_hop(const std::string& id,
                                  const std::optional<std::string>& relation,
                                  Direction direction);
    std::vector<GraphEdge> touching_edges(const std::string& id);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace engram
