#pragma once
#include "../storage.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

// Memory documents in typed SQLite tables, one per collection.
// List fields are stored as JSON text; episodic text fields are indexed by FTS5.
class SqliteDocumentStore : public DocumentStore {
public:
    explicit SqliteDocumentStore(const std::string& path);
    ~SqliteDocumentStore() override;

    // Non-copyable
    SqliteDocumentStore(const SqliteDocumentStore&) = delete;
    SqliteDocumentStore& operator=(const SqliteDocumentStore&) = delete;

    std::optional<std::string> insert(const std::string& collection,
                                      const Document& doc) override;
    std::optional<Document> find_by_id(const std::string& collection,
                                       const std::string& id) override;
    std::vector<Document> find(const std::string& collection,
                               const Filter& query,
                               const FindOptions& options = {}) override;
    bool update(const std::string& collection,
                const std::string& id,
                const Document& partial) override;
    bool remove(const std::string& collection, const std::string& id) override;
    uint32_t count(const std::string& collection, const Filter& query) override;
    std::vector<Document> full_text_search(const std::string& collection,
                                           const std::string& text,
                                           const std::vector<std::string>& fields,
                                           uint32_t limit) override;

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace engram
