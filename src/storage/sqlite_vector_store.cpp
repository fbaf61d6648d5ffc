#include "sqlite_vector_store.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace engram {

double l2_score(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return 1.0 / (1.0 + std::sqrt(sum));
}

SqliteVectorStore::SqliteVectorStore(const std::string& path) : path_(path) {
    db_ = open_database(path_, "SqliteVectorStore");
    init_schema();
}

SqliteVectorStore::~SqliteVectorStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteVectorStore::init_schema() {
    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS vectors ("
        "  memory_id  TEXT NOT NULL,"
        "  collection TEXT NOT NULL,"
        "  embedding  BLOB NOT NULL,"
        "  dims       INTEGER NOT NULL,"
        "  metadata   TEXT NOT NULL DEFAULT '{}',"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY (memory_id, collection)"
        ");", "SqliteVectorStore");
    exec_sql(db_,
        "CREATE INDEX IF NOT EXISTS idx_vectors_collection ON vectors(collection);",
        "SqliteVectorStore");
}

bool SqliteVectorStore::upsert_locked(const std::string& memory_id,
                                      const Embedding& embedding,
                                      const json& metadata,
                                      const std::string& collection) {
    if (memory_id.empty() || embedding.empty()) return false;

    const char* sql =
        "INSERT OR REPLACE INTO vectors"
        " (memory_id, collection, embedding, dims, metadata, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?);";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Vector upsert failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    bind_text(g.stmt, 1, memory_id);
    bind_text(g.stmt, 2, collection);
    bind_blob(g.stmt, 3, embedding);
    sqlite3_bind_int(g.stmt, 4, static_cast<int>(embedding.size()));
    bind_text(g.stmt, 5, metadata.is_object() ? metadata.dump() : "{}");
    sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(epoch_seconds()));
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Vector upsert failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

bool SqliteVectorStore::upsert(const std::string& memory_id,
                               const Embedding& embedding,
                               const json& metadata,
                               const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_locked(memory_id, embedding, metadata, collection);
}

uint32_t SqliteVectorStore::batch_upsert(const std::vector<VectorRecord>& records,
                                         const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr);
    uint32_t written = 0;
    for (const auto& r : records) {
        if (upsert_locked(r.memory_id, r.embedding, r.metadata, collection)) ++written;
    }
    sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    return written;
}

static bool metadata_matches(const json& metadata, const Filter& filters) {
    if (!filters.is_object()) return true;
    for (const auto& [key, value] : filters.items()) {
        if (!metadata.contains(key) || metadata[key] != value) return false;
    }
    return true;
}

std::vector<VectorHit> SqliteVectorStore::search(const Embedding& query,
                                                 uint32_t top_k,
                                                 const std::string& collection,
                                                 const Filter& filters,
                                                 double score_floor) {
    if (query.empty() || top_k == 0) return {};

    std::vector<VectorHit> hits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const char* sql =
            "SELECT memory_id, embedding, metadata FROM vectors"
            " WHERE collection = ? AND dims = ?;";
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[storage] Vector search failed: " << sqlite3_errmsg(db_) << "\n";
            return {};
        }
        bind_text(g.stmt, 1, collection);
        sqlite3_bind_int(g.stmt, 2, static_cast<int>(query.size()));

        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            json metadata = json::parse(column_text(g.stmt, 2), nullptr, false);
            if (!metadata.is_object()) metadata = json::object();
            if (!metadata_matches(metadata, filters)) continue;

            double score = l2_score(query, column_blob(g.stmt, 1));
            if (score < score_floor) continue;

            VectorHit hit;
            hit.memory_id = column_text(g.stmt, 0);
            hit.score = score;
            hit.metadata = std::move(metadata);
            hits.push_back(std::move(hit));
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const VectorHit& a, const VectorHit& b) { return a.score > b.score; });
    if (hits.size() > top_k) hits.resize(top_k);
    return hits;
}

bool SqliteVectorStore::remove(const std::string& memory_id, const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "DELETE FROM vectors WHERE memory_id = ? AND collection = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    bind_text(g.stmt, 1, memory_id);
    bind_text(g.stmt, 2, collection);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteVectorStore::count(const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "SELECT COUNT(*) FROM vectors WHERE collection = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    bind_text(g.stmt, 1, collection);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

} // namespace engram
