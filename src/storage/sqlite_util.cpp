#include "sqlite_util.hpp"
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace engram {

sqlite3* open_database(const std::string& path, const std::string& owner) {
    // Ensure parent directory exists
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) sqlite3_close(db);
        throw std::runtime_error(owner + ": failed to open database " + path + ": " + err);
    }

    // Three stores plus the extraction worker share one file
    sqlite3_busy_timeout(db, 5000);

    // Performance pragmas
    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    sqlite3_exec(db, "PRAGMA trusted_schema=ON;", nullptr, nullptr, nullptr);
    return db;
}

bool exec_sql(sqlite3* db, const char* sql, const std::string& owner) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[storage] " << owner << ": " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_blob(sqlite3_stmt* stmt, int idx, const Embedding& embedding) {
    sqlite3_bind_blob(stmt, idx, embedding.data(),
                      static_cast<int>(embedding.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
}

Embedding column_blob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || bytes <= 0) return {};
    Embedding emb(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(emb.data(), blob, emb.size() * sizeof(float));
    return emb;
}

std::string build_fts_query(const std::string& query) {
    std::string result;
    std::string token;
    for (char c : query) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else {
            if (token.size() >= 2) {
                if (!result.empty()) result += " OR ";
                result += '"' + token + '"';
            }
            token.clear();
        }
    }
    if (token.size() >= 2) {
        if (!result.empty()) result += " OR ";
        result += '"' + token + '"';
    }
    return result;
}

} // namespace engram
