#pragma once
#include "../models.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace engram {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Open (creating parent directories) and apply the shared pragmas.
// Throws std::runtime_error naming `owner` on failure.
sqlite3* open_database(const std::string& path, const std::string& owner);

// Run schema DDL; logs and returns false on error.
bool exec_sql(sqlite3* db, const char* sql, const std::string& owner);

// Column text, "" for NULL
std::string column_text(sqlite3_stmt* stmt, int col);

// Bind helpers (1-based index like sqlite3_bind_*)
void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value);

void bind_blob(sqlite3_stmt* stmt, int idx, const Embedding& embedding);
Embedding column_blob(sqlite3_stmt* stmt, int col);

// Preprocess free text for FTS5: split on non-alphanumeric, skip
// single-char tokens, quote and OR-join the rest (FTS5 defaults to
// implicit AND).
std::string build_fts_query(const std::string& query);

} // namespace engram
