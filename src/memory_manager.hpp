#pragma once
#include "storage.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

struct EpisodicFilter {
    std::optional<std::string> event_type;
    std::optional<double> min_importance;
    std::vector<std::string> keywords;  // any match, case-insensitive
};

struct MemoryPage {
    std::vector<Document> items;
    uint32_t total = 0;
    uint32_t page = 1;
    uint32_t page_size = 20;
    uint32_t total_pages = 0;
};

struct KeywordCount {
    std::string keyword;
    uint32_t count = 0;
};

struct MemoryStats {
    std::string user_id;
    uint32_t total_episodic = 0;
    uint32_t total_semantic = 0;
    uint32_t active_episodic = 0;
    uint32_t archived_episodic = 0;
    uint32_t compressed_episodic = 0;
    std::vector<KeywordCount> top_keywords;
    std::map<std::string, uint32_t> event_type_distribution;
    std::optional<uint64_t> oldest_at;
    std::optional<uint64_t> newest_at;
};

enum class ExportFormat { Json, Csv };

nlohmann::json stats_to_json(const MemoryStats& stats);

// Browsing and maintenance of stored memories across all indexes
class MemoryManager {
public:
    MemoryManager(VectorStore& vectors, DocumentStore& documents, GraphStore& graph);

    std::optional<Document> get_episodic(const std::string& memory_id);
    std::optional<Document> get_semantic(const std::string& memory_id);

    // Newest first; page is 1-based. Filters apply before paging.
    MemoryPage list_episodic(const std::string& user_id, uint32_t page = 1,
                             uint32_t page_size = 20, const EpisodicFilter& filter = {});
    MemoryPage list_semantic(const std::string& user_id, uint32_t page = 1,
                             uint32_t page_size = 20,
                             const std::optional<std::string>& category = std::nullopt);

    // Only summary, keywords, importance, event_type, participants, location
    // and is_archived may change. False when nothing allowed was given.
    bool update_episodic(const std::string& memory_id, const Document& updates);

    bool delete_episodic(const std::string& memory_id);
    bool delete_semantic(const std::string& memory_id);

    // Returns {episodic_deleted, semantic_deleted}
    std::pair<uint32_t, uint32_t> clear_user(const std::string& user_id);

    MemoryStats stats(const std::string& user_id);

    std::string export_memories(const std::string& user_id, ExportFormat format = ExportFormat::Json);

private:
    std::vector<Document> all_for_user(const std::string& collection, const std::string& user_id);

    VectorStore& vectors_;
    DocumentStore& documents_;
    GraphStore& graph_;
};

} // namespace engram
