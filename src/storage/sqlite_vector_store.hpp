#pragma once
#include "../storage.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

// Embeddings as float BLOBs with a JSON metadata bag, searched by brute force.
// Score = 1 / (1 + L2 distance).
class SqliteVectorStore : public VectorStore {
public:
    explicit SqliteVectorStore(const std::string& path);
    ~SqliteVectorStore() override;

    // Non-copyable
    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

    bool upsert(const std::string& memory_id,
                const Embedding& embedding,
                const nlohmann::json& metadata,
                const std::string& collection) override;
    uint32_t batch_upsert(const std::vector<VectorRecord>& records,
                          const std::string& collection) override;
    std::vector<VectorHit> search(const Embedding& query,
                                  uint32_t top_k,
                                  const std::string& collection,
                                  const Filter& filters = Filter::object(),
                                  double score_floor = 0.0) override;
    bool remove(const std::string& memory_id, const std::string& collection) override;

    uint32_t count(const std::string& collection);

private:
    void init_schema();
    // Caller holds mutex_
    bool upsert_locked(const std::string& memory_id,
                       const Embedding& embedding,
                       const nlohmann::json& metadata,
                       const std::string& collection);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

// Similarity in (0, 1] from Euclidean distance
double l2_score(const Embedding& a, const Embedding& b);

} // namespace engram
