#include "sqlite_graph_store.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <deque>
#include <iostream>
#include <set>
#include <tuple>
#include <unordered_set>

using json = nlohmann::json;

namespace engram {

static json parse_properties(const std::string& text) {
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    return j.is_object() ? j : json::object();
}

static std::string dump_properties(const json& props) {
    return props.is_object() ? props.dump() : "{}";
}

SqliteGraphStore::SqliteGraphStore(const std::string& path) : path_(path) {
    db_ = open_database(path_, "SqliteGraphStore");
    init_schema();
}

SqliteGraphStore::~SqliteGraphStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteGraphStore::init_schema() {
    const std::string owner = "SqliteGraphStore";
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS graph_nodes ("
        "  id         TEXT PRIMARY KEY,"
        "  label      TEXT NOT NULL,"
        "  properties TEXT NOT NULL DEFAULT '{}',"
        "  created_at INTEGER NOT NULL"
        ");", owner);
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS graph_edges ("
        "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  source_id  TEXT NOT NULL,"
        "  target_id  TEXT NOT NULL,"
        "  relation   TEXT NOT NULL,"
        "  weight     REAL NOT NULL DEFAULT 1.0,"
        "  properties TEXT NOT NULL DEFAULT '{}',"
        "  created_at INTEGER NOT NULL"
        ");", owner);
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_edges_source ON graph_edges(source_id);", owner);
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_edges_target ON graph_edges(target_id);", owner);
    exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_edges_relation ON graph_edges(relation);", owner);
    exec_sql(db_,
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_edges_unique"
        " ON graph_edges(source_id, target_id, relation);", owner);
}

bool SqliteGraphStore::add_node(const GraphNode& node) {
    if (node.id.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "INSERT INTO graph_nodes (id, label, properties, created_at) VALUES (?, ?, ?, ?)"
        " ON CONFLICT(id) DO UPDATE SET label = excluded.label,"
        " properties = excluded.properties;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Add node failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    bind_text(g.stmt, 1, node.id);
    bind_text(g.stmt, 2, node.label);
    bind_text(g.stmt, 3, dump_properties(node.properties));
    sqlite3_bind_int64(g.stmt, 4, static_cast<int64_t>(
        node.created_at ? node.created_at : epoch_seconds()));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Add node " << node.id << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

bool SqliteGraphStore::add_edge(const GraphEdge& edge) {
    if (edge.source_id.empty() || edge.target_id.empty() || edge.relation.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "INSERT INTO graph_edges (source_id, target_id, relation, weight, properties, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(source_id, target_id, relation) DO UPDATE SET"
        " weight = excluded.weight, properties = excluded.properties;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Add edge failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    bind_text(g.stmt, 1, edge.source_id);
    bind_text(g.stmt, 2, edge.target_id);
    bind_text(g.stmt, 3, edge.relation);
    sqlite3_bind_double(g.stmt, 4, edge.weight);
    bind_text(g.stmt, 5, dump_properties(edge.properties));
    sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(epoch_seconds()));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Add edge " << edge.source_id << " -> " << edge.target_id
                  << " failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

std::optional<GraphNode> SqliteGraphStore::load_node(const std::string& id) {
    StmtGuard g;
    const char* sql = "SELECT id, label, properties, created_at FROM graph_nodes WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    GraphNode node;
    node.id = column_text(g.stmt, 0);
    node.label = column_text(g.stmt, 1);
    node.properties = parse_properties(column_text(g.stmt, 2));
    node.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
    return node;
}

std::optional<GraphNode> SqliteGraphStore::get_node(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_node(id);
}

std::vector<Neighbor> SqliteGraphStore::one_hop(const std::string& id,
                                                const std::optional<std::string>& relation,
                                                Direction direction) {
    std::vector<Neighbor> results;

    auto run = [&](const char* join_col, const char* match_col, Direction dir) {
        std::string sql = std::string(
            "SELECT n.id, n.label, n.properties, n.created_at,"
            "       e.relation, e.weight, e.properties"
            " FROM graph_edges e JOIN graph_nodes n ON e.") + join_col + " = n.id"
            " WHERE e." + match_col + " = ?";
        if (relation) sql += " AND e.relation = ?";
        sql += " ORDER BY e.id;";

        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[storage] Neighbor query failed: " << sqlite3_errmsg(db_) << "\n";
            return;
        }
        bind_text(g.stmt, 1, id);
        if (relation) bind_text(g.stmt, 2, *relation);

        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            Neighbor nb;
            nb.node.id = column_text(g.stmt, 0);
            nb.node.label = column_text(g.stmt, 1);
            nb.node.properties = parse_properties(column_text(g.stmt, 2));
            nb.node.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 3));
            nb.relation = column_text(g.stmt, 4);
            nb.weight = sqlite3_column_double(g.stmt, 5);
            nb.edge_properties = parse_properties(column_text(g.stmt, 6));
            nb.direction = dir;
            nb.depth = 1;
            results.push_back(std::move(nb));
        }
    };

    if (direction == Direction::Outgoing || direction == Direction::Both) {
        run("target_id", "source_id", Direction::Outgoing);
    }
    if (direction == Direction::Incoming || direction == Direction::Both) {
        run("source_id", "target_id", Direction::Incoming);
    }
    return results;
}

std::vector<Neighbor> SqliteGraphStore::get_neighbors(const std::string& id,
                                                      const std::optional<std::string>& relation,
                                                      Direction direction,
                                                      uint32_t max_depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_depth <= 1) return one_hop(id, relation, direction);

    // BFS; each node is reported once, at the depth it was first reached
    std::unordered_set<std::string> visited{id};
    std::deque<std::pair<std::string, uint32_t>> queue{{id, 0}};
    std::vector<Neighbor> results;

    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (depth >= max_depth) continue;

        for (auto& nb : one_hop(current, relation, direction)) {
            if (!visited.insert(nb.node.id).second) continue;
            nb.depth = depth + 1;
            queue.emplace_back(nb.node.id, depth + 1);
            results.push_back(std::move(nb));
        }
    }
    return results;
}

std::optional<std::vector<std::string>> SqliteGraphStore::find_path(const std::string& start_id,
                                                                    const std::string& end_id,
                                                                    uint32_t max_depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<std::string> visited{start_id};
    std::deque<std::vector<std::string>> queue{{start_id}};

    while (!queue.empty()) {
        auto path = std::move(queue.front());
        queue.pop_front();
        if (path.back() == end_id) return path;
        if (path.size() > max_depth) continue;  // max_depth edges

        StmtGuard g;
        const char* sql = "SELECT target_id FROM graph_edges WHERE source_id = ? ORDER BY id;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
        bind_text(g.stmt, 1, path.back());
        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            std::string next = column_text(g.stmt, 0);
            if (!visited.insert(next).second) continue;
            auto extended = path;
            extended.push_back(next);
            queue.push_back(std::move(extended));
        }
    }
    return std::nullopt;
}

bool SqliteGraphStore::delete_node(const std::string& id, bool cascade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cascade) {
        StmtGuard g;
        const char* sql = "DELETE FROM graph_edges WHERE source_id = ? OR target_id = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
            bind_text(g.stmt, 1, id);
            bind_text(g.stmt, 2, id);
            if (sqlite3_step(g.stmt) != SQLITE_DONE) {
                std::cerr << "[storage] Edge cascade for " << id << " failed: "
                          << sqlite3_errmsg(db_) << "\n";
            }
        }
    }

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM graph_nodes WHERE id = ?;", -1,
                           &g.stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

bool SqliteGraphStore::delete_edge(const std::string& source_id,
                                   const std::string& target_id,
                                   const std::optional<std::string>& relation) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "DELETE FROM graph_edges WHERE source_id = ? AND target_id = ?";
    if (relation) sql += " AND relation = ?";
    sql += ";";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    bind_text(g.stmt, 1, source_id);
    bind_text(g.stmt, 2, target_id);
    if (relation) bind_text(g.stmt, 3, *relation);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

std::vector<GraphEdge> SqliteGraphStore::touching_edges(const std::string& id) {
    std::vector<GraphEdge> edges;
    StmtGuard g;
    const char* sql =
        "SELECT source_id, target_id, relation, weight, properties FROM graph_edges"
        " WHERE source_id = ? OR target_id = ? ORDER BY id;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return edges;
    bind_text(g.stmt, 1, id);
    bind_text(g.stmt, 2, id);
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        GraphEdge e;
        e.source_id = column_text(g.stmt, 0);
        e.target_id = column_text(g.stmt, 1);
        e.relation = column_text(g.stmt, 2);
        e.weight = sqlite3_column_double(g.stmt, 3);
        e.properties = parse_properties(column_text(g.stmt, 4));
        edges.push_back(std::move(e));
    }
    return edges;
}

Subgraph SqliteGraphStore::query_subgraph(const std::string& center_id,
                                          uint32_t max_depth,
                                          const std::vector<std::string>& relation_filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    Subgraph sub;
    if (auto center = load_node(center_id)) sub.nodes.push_back(std::move(*center));

    std::unordered_set<std::string> visited{center_id};
    std::set<std::tuple<std::string, std::string, std::string>> seen_edges;
    std::deque<std::pair<std::string, uint32_t>> queue{{center_id, 0}};

    while (!queue.empty()) {
        auto [current, depth] = queue.front();
        queue.pop_front();
        if (depth >= max_depth) continue;

        for (auto& edge : touching_edges(current)) {
            if (!relation_filter.empty() &&
                std::find(relation_filter.begin(), relation_filter.end(), edge.relation) ==
                    relation_filter.end()) {
                continue;
            }
            std::string other = edge.source_id == current ? edge.target_id : edge.source_id;
            if (seen_edges.emplace(edge.source_id, edge.target_id, edge.relation).second) {
                sub.edges.push_back(std::move(edge));
            }
            if (visited.insert(other).second) {
                if (auto node = load_node(other)) sub.nodes.push_back(std::move(*node));
                queue.emplace_back(other, depth + 1);
            }
        }
    }
    return sub;
}

} // namespace engram
