#include "sqlite_document_store.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace engram {

namespace {

enum class Kind { Text, Integer, Real, Bool, List, NullableText, NullableInteger };

struct Column {
    const char* name;
    Kind kind;
};

struct Collection {
    const char* table;
    std::vector<Column> columns;           // columns[0] is the id
    std::vector<std::string> fts_fields;   // empty = LIKE search only
    const char* fts_table;
};

const Collection& episodic_schema() {
    static const Collection c{
        "episodic_memories",
        {
            {"id", Kind::Text},
            {"user_id", Kind::Text},
            {"agent_id", Kind::Text},
            {"lossless_restatement", Kind::Text},
            {"summary", Kind::Text},
            {"keywords", Kind::List},
            {"event_type", Kind::Text},
            {"participants", Kind::List},
            {"location", Kind::NullableText},
            {"importance", Kind::Real},
            {"confidence", Kind::Real},
            {"access_count", Kind::Integer},
            {"last_accessed_at", Kind::NullableInteger},
            {"is_archived", Kind::Bool},
            {"is_compressed", Kind::Bool},
            {"merged_from", Kind::List},
            {"source_session_id", Kind::Text},
            {"created_at", Kind::Integer},
            {"updated_at", Kind::Integer},
        },
        {"lossless_restatement", "summary", "keywords"},
        "episodic_memories_fts"
    };
    return c;
}

const Collection& semantic_schema() {
    static const Collection c{
        "semantic_memories",
        {
            {"id", Kind::Text},
            {"user_id", Kind::Text},
            {"agent_id", Kind::Text},
            {"subject", Kind::Text},
            {"predicate", Kind::Text},
            {"object", Kind::Text},
            {"category", Kind::Text},
            {"confidence", Kind::Real},
            {"source_session_id", Kind::Text},
            {"created_at", Kind::Integer},
            {"updated_at", Kind::Integer},
        },
        {},
        nullptr
    };
    return c;
}

const Collection& schema_for(const std::string& collection) {
    if (collection == kEpisodicCollection) return episodic_schema();
    if (collection == kSemanticCollection) return semantic_schema();
    throw std::invalid_argument("Unsupported collection: " + collection);
}

const Column* find_column(const Collection& c, const std::string& name) {
    for (const auto& col : c.columns) {
        if (name == col.name) return &col;
    }
    return nullptr;
}

bool is_textual(Kind kind) {
    return kind == Kind::Text || kind == Kind::List || kind == Kind::NullableText;
}

std::string column_list(const Collection& c, const std::string& prefix = "") {
    std::string out;
    for (const auto& col : c.columns) {
        if (!out.empty()) out += ", ";
        out += prefix + col.name;
    }
    return out;
}

void bind_value(sqlite3_stmt* stmt, int idx, Kind kind, const json& v) {
    switch (kind) {
        case Kind::Text:
            if (v.is_string()) bind_text(stmt, idx, v.get<std::string>());
            else bind_text(stmt, idx, v.is_null() ? "" : v.dump());
            break;
        case Kind::Integer:
            if (v.is_number()) sqlite3_bind_int64(stmt, idx, v.get<int64_t>());
            else if (v.is_boolean()) sqlite3_bind_int64(stmt, idx, v.get<bool>() ? 1 : 0);
            else sqlite3_bind_int64(stmt, idx, 0);
            break;
        case Kind::Real:
            sqlite3_bind_double(stmt, idx, v.is_number() ? v.get<double>() : 0.0);
            break;
        case Kind::Bool: {
            bool b = v.is_boolean() ? v.get<bool>()
                                    : (v.is_number() && v.get<double>() != 0.0);
            sqlite3_bind_int(stmt, idx, b ? 1 : 0);
            break;
        }
        case Kind::List:
            bind_text(stmt, idx, v.is_array() ? v.dump() : "[]");
            break;
        case Kind::NullableText:
            if (v.is_string()) bind_text(stmt, idx, v.get<std::string>());
            else sqlite3_bind_null(stmt, idx);
            break;
        case Kind::NullableInteger:
            if (v.is_number()) sqlite3_bind_int64(stmt, idx, v.get<int64_t>());
            else sqlite3_bind_null(stmt, idx);
            break;
    }
}

json integer_json(sqlite3_stmt* stmt, int col) {
    int64_t v = sqlite3_column_int64(stmt, col);
    if (v >= 0) return static_cast<uint64_t>(v);
    return v;
}

json read_value(sqlite3_stmt* stmt, int col, Kind kind) {
    bool is_null = sqlite3_column_type(stmt, col) == SQLITE_NULL;
    switch (kind) {
        case Kind::Text:    return column_text(stmt, col);
        case Kind::Integer: return integer_json(stmt, col);
        case Kind::Real:    return sqlite3_column_double(stmt, col);
        case Kind::Bool:    return sqlite3_column_int(stmt, col) != 0;
        case Kind::List: {
            json arr = json::parse(column_text(stmt, col), nullptr, /*allow_exceptions=*/false);
            return arr.is_array() ? arr : json::array();
        }
        case Kind::NullableText:
            return is_null ? json() : json(column_text(stmt, col));
        case Kind::NullableInteger:
            return is_null ? json() : integer_json(stmt, col);
    }
    return json();
}

json read_row(sqlite3_stmt* stmt, const Collection& c) {
    json doc = json::object();
    for (size_t i = 0; i < c.columns.size(); ++i) {
        doc[c.columns[i].name] = read_value(stmt, static_cast<int>(i), c.columns[i].kind);
    }
    return doc;
}

struct Where {
    std::string sql;
    std::vector<std::pair<Kind, json>> params;
};

Where build_where(const Collection& c, const Filter& query) {
    Where where;
    if (!query.is_object()) return where;
    for (const auto& [key, value] : query.items()) {
        const Column* col = find_column(c, key);
        if (!col) {
            throw std::invalid_argument("Unknown field '" + key + "' in " + c.table);
        }
        where.sql += where.sql.empty() ? " WHERE " : " AND ";
        if (value.is_null()) {
            where.sql += std::string(col->name) + " IS NULL";
        } else {
            where.sql += std::string(col->name) + " = ?";
            where.params.emplace_back(col->kind, value);
        }
    }
    return where;
}

int bind_where(sqlite3_stmt* stmt, const Where& where) {
    int idx = 1;
    for (const auto& [kind, value] : where.params) {
        bind_value(stmt, idx++, kind, value);
    }
    return idx;
}

std::vector<json> collect_rows(sqlite3_stmt* stmt, const Collection& c) {
    std::vector<json> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(read_row(stmt, c));
    }
    return rows;
}

} // namespace

SqliteDocumentStore::SqliteDocumentStore(const std::string& path) : path_(path) {
    db_ = open_database(path_, "SqliteDocumentStore");
    init_schema();
}

SqliteDocumentStore::~SqliteDocumentStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteDocumentStore::init_schema() {
    const std::string owner = "SqliteDocumentStore";

    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS episodic_memories ("
        "  id                   TEXT PRIMARY KEY,"
        "  user_id              TEXT NOT NULL,"
        "  agent_id             TEXT NOT NULL DEFAULT 'default',"
        "  lossless_restatement TEXT NOT NULL,"
        "  summary              TEXT NOT NULL DEFAULT '',"
        "  keywords             TEXT NOT NULL DEFAULT '[]',"
        "  event_type           TEXT NOT NULL DEFAULT 'general_conversation',"
        "  participants         TEXT NOT NULL DEFAULT '[]',"
        "  location             TEXT,"
        "  importance           REAL NOT NULL DEFAULT 0.5,"
        "  confidence           REAL NOT NULL DEFAULT 0.8,"
        "  access_count         INTEGER NOT NULL DEFAULT 0,"
        "  last_accessed_at     INTEGER,"
        "  is_archived          INTEGER NOT NULL DEFAULT 0,"
        "  is_compressed        INTEGER NOT NULL DEFAULT 0,"
        "  merged_from          TEXT NOT NULL DEFAULT '[]',"
        "  source_session_id    TEXT NOT NULL DEFAULT '',"
        "  created_at           INTEGER NOT NULL,"
        "  updated_at           INTEGER NOT NULL"
        ");", owner);
    exec_sql(db_,
        "CREATE INDEX IF NOT EXISTS idx_episodic_user "
        "ON episodic_memories(user_id, is_archived);", owner);

    // FTS5 virtual table (content table referencing episodic_memories)
    exec_sql(db_,
        "CREATE VIRTUAL TABLE IF NOT EXISTS episodic_memories_fts "
        "USING fts5(lossless_restatement, summary, keywords,"
        " content=episodic_memories, content_rowid=rowid);", owner);

    // Triggers to keep FTS in sync with the episodic table
    exec_sql(db_,
        "CREATE TRIGGER IF NOT EXISTS episodic_ai AFTER INSERT ON episodic_memories BEGIN"
        "  INSERT INTO episodic_memories_fts(rowid, lossless_restatement, summary, keywords)"
        "  VALUES (new.rowid, new.lossless_restatement, new.summary, new.keywords);"
        "END;", owner);
    exec_sql(db_,
        "CREATE TRIGGER IF NOT EXISTS episodic_ad AFTER DELETE ON episodic_memories BEGIN"
        "  INSERT INTO episodic_memories_fts(episodic_memories_fts, rowid,"
        "    lossless_restatement, summary, keywords)"
        "  VALUES ('delete', old.rowid, old.lossless_restatement, old.summary, old.keywords);"
        "END;", owner);
    exec_sql(db_,
        "CREATE TRIGGER IF NOT EXISTS episodic_au AFTER UPDATE ON episodic_memories BEGIN"
        "  INSERT INTO episodic_memories_fts(episodic_memories_fts, rowid,"
        "    lossless_restatement, summary, keywords)"
        "  VALUES ('delete', old.rowid, old.lossless_restatement, old.summary, old.keywords);"
        "  INSERT INTO episodic_memories_fts(rowid, lossless_restatement, summary, keywords)"
        "  VALUES (new.rowid, new.lossless_restatement, new.summary, new.keywords);"
        "END;", owner);

    exec_sql(db_,
        "CREATE TABLE IF NOT EXISTS semantic_memories ("
        "  id                TEXT PRIMARY KEY,"
        "  user_id           TEXT NOT NULL,"
        "  agent_id          TEXT NOT NULL DEFAULT 'default',"
        "  subject           TEXT NOT NULL,"
        "  predicate         TEXT NOT NULL,"
        "  object            TEXT NOT NULL,"
        "  category          TEXT NOT NULL DEFAULT 'fact',"
        "  confidence        REAL NOT NULL DEFAULT 0.8,"
        "  source_session_id TEXT NOT NULL DEFAULT '',"
        "  created_at        INTEGER NOT NULL,"
        "  updated_at        INTEGER NOT NULL"
        ");", owner);
    exec_sql(db_,
        "CREATE INDEX IF NOT EXISTS idx_semantic_user ON semantic_memories(user_id);", owner);
}

std::optional<std::string> SqliteDocumentStore::insert(const std::string& collection,
                                                       const Document& doc) {
    const auto& c = schema_for(collection);

    json row = doc.is_object() ? doc : json::object();
    std::string id = row.value("id", "");
    if (id.empty()) id = generate_id();
    row["id"] = id;
    uint64_t now = epoch_seconds();
    if (row.value("created_at", uint64_t{0}) == 0) row["created_at"] = now;
    row["updated_at"] = now;

    std::string placeholders;
    for (size_t i = 0; i < c.columns.size(); ++i) {
        placeholders += i == 0 ? "?" : ", ?";
    }
    std::string sql = std::string("INSERT INTO ") + c.table + " (" + column_list(c) +
                      ") VALUES (" + placeholders + ");";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Insert into " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return std::nullopt;
    }
    for (size_t i = 0; i < c.columns.size(); ++i) {
        const auto& col = c.columns[i];
        bind_value(g.stmt, static_cast<int>(i + 1), col.kind,
                   row.contains(col.name) ? row[col.name] : json());
    }
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Insert into " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return std::nullopt;
    }
    return id;
}

std::optional<Document> SqliteDocumentStore::find_by_id(const std::string& collection,
                                                        const std::string& id) {
    const auto& c = schema_for(collection);
    std::string sql = "SELECT " + column_list(c) + " FROM " + c.table + " WHERE id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return read_row(g.stmt, c);
}

std::vector<Document> SqliteDocumentStore::find(const std::string& collection,
                                                const Filter& query,
                                                const FindOptions& options) {
    const auto& c = schema_for(collection);
    if (!find_column(c, options.sort_by)) {
        throw std::invalid_argument("Invalid sort field '" + options.sort_by +
                                    "' for " + c.table);
    }
    Where where = build_where(c, query);

    std::string sql = "SELECT " + column_list(c) + " FROM " + c.table + where.sql +
                      " ORDER BY " + options.sort_by +
                      (options.sort_order == SortOrder::Ascending ? " ASC" : " DESC") +
                      ", rowid ASC LIMIT ? OFFSET ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Find in " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return {};
    }
    int idx = bind_where(g.stmt, where);
    sqlite3_bind_int64(g.stmt, idx++, static_cast<int64_t>(options.limit));
    sqlite3_bind_int64(g.stmt, idx, static_cast<int64_t>(options.skip));
    return collect_rows(g.stmt, c);
}

bool SqliteDocumentStore::update(const std::string& collection,
                                 const std::string& id,
                                 const Document& partial) {
    const auto& c = schema_for(collection);

    std::string assignments;
    std::vector<std::pair<Kind, json>> params;
    bool stamped = false;
    if (partial.is_object()) {
        for (const auto& [key, value] : partial.items()) {
            if (key == "id") continue;
            const Column* col = find_column(c, key);
            if (!col) {
                std::cerr << "[storage] Ignoring unknown field '" << key
                          << "' in update of " << c.table << "\n";
                continue;
            }
            if (key == "updated_at") stamped = true;
            if (!assignments.empty()) assignments += ", ";
            assignments += key + " = ?";
            params.emplace_back(col->kind, value);
        }
    }
    if (!stamped) {
        if (!assignments.empty()) assignments += ", ";
        assignments += "updated_at = ?";
        params.emplace_back(Kind::Integer, json(epoch_seconds()));
    }

    std::string sql = std::string("UPDATE ") + c.table + " SET " + assignments + " WHERE id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Update of " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    int idx = 1;
    for (const auto& [kind, value] : params) {
        bind_value(g.stmt, idx++, kind, value);
    }
    bind_text(g.stmt, idx, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[storage] Update of " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteDocumentStore::remove(const std::string& collection, const std::string& id) {
    const auto& c = schema_for(collection);
    std::string sql = std::string("DELETE FROM ") + c.table + " WHERE id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bind_text(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteDocumentStore::count(const std::string& collection, const Filter& query) {
    const auto& c = schema_for(collection);
    Where where = build_where(c, query);
    std::string sql = std::string("SELECT COUNT(*) FROM ") + c.table + where.sql + ";";

    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    bind_where(g.stmt, where);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

std::vector<Document> SqliteDocumentStore::full_text_search(const std::string& collection,
                                                            const std::string& text,
                                                            const std::vector<std::string>& fields,
                                                            uint32_t limit) {
    const auto& c = schema_for(collection);
    if (trim(text).empty() || limit == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<json> results;

    // FTS5 path, restricted to the requested indexed fields
    std::string fts_query = build_fts_query(text);
    if (c.fts_table && !fts_query.empty()) {
        std::vector<std::string> cols;
        for (const auto& f : fields) {
            if (std::find(c.fts_fields.begin(), c.fts_fields.end(), f) != c.fts_fields.end()) {
                cols.push_back(f);
            }
        }
        std::string match = fts_query;
        if (!cols.empty() && cols.size() < c.fts_fields.size()) {
            std::string column_set;
            for (const auto& col : cols) column_set += (column_set.empty() ? "" : " ") + col;
            match = "{" + column_set + "} : (" + fts_query + ")";
        }

        std::string sql = "SELECT " + column_list(c, "m.") + " FROM " + c.fts_table +
                          " JOIN " + c.table + " AS m ON " + c.fts_table + ".rowid = m.rowid"
                          " WHERE " + c.fts_table + " MATCH ?"
                          " ORDER BY bm25(" + c.fts_table + ") LIMIT ?;";
        StmtGuard g;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) == SQLITE_OK) {
            bind_text(g.stmt, 1, match);
            sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(limit));
            results = collect_rows(g.stmt, c);
        }
    }
    if (!results.empty()) return results;

    // LIKE fallback: any whitespace token in any requested text field
    std::vector<std::string> like_fields;
    for (const auto& f : fields) {
        const Column* col = find_column(c, f);
        if (col && is_textual(col->kind)) like_fields.push_back(f);
    }
    if (like_fields.empty()) {
        for (const auto& col : c.columns) {
            if (col.kind == Kind::Text && std::string(col.name) != "id" &&
                std::string(col.name).find("_id") == std::string::npos) {
                like_fields.push_back(col.name);
            }
        }
    }

    std::vector<std::string> tokens;
    for (const auto& t : split(text, ' ')) {
        std::string tok = trim(t);
        if (!tok.empty()) tokens.push_back(tok);
        if (tokens.size() >= 8) break;
    }
    if (tokens.empty()) return {};

    std::string cond;
    for (size_t t = 0; t < tokens.size(); ++t) {
        for (const auto& f : like_fields) {
            if (!cond.empty()) cond += " OR ";
            cond += f + " LIKE ?";
        }
    }
    std::string sql = "SELECT " + column_list(c) + " FROM " + c.table +
                      " WHERE (" + cond + ") ORDER BY created_at DESC LIMIT ?;";
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[storage] Text search in " << c.table << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return {};
    }
    int idx = 1;
    for (const auto& tok : tokens) {
        for (size_t f = 0; f < like_fields.size(); ++f) {
            bind_text(g.stmt, idx++, "%" + tok + "%");
        }
    }
    sqlite3_bind_int64(g.stmt, idx, static_cast<int64_t>(limit));
    return collect_rows(g.stmt, c);
}

} // namespace engram
