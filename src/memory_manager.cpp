#include "memory_manager.hpp"
#include "extractor.hpp"
#include "memory_json.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace engram {

static constexpr uint32_t kExportLimit = 10000;
static constexpr uint32_t kStatsSample = 500;
static constexpr size_t kTopKeywords = 20;

static const std::set<std::string>& updatable_fields() {
    static const std::set<std::string> fields = {
        "summary", "keywords", "importance", "event_type",
        "participants", "location", "is_archived"
    };
    return fields;
}

json stats_to_json(const MemoryStats& stats) {
    json keywords = json::array();
    for (const auto& kc : stats.top_keywords) {
        keywords.push_back({{"keyword", kc.keyword}, {"count", kc.count}});
    }
    return {
        {"user_id", stats.user_id},
        {"total_episodic", stats.total_episodic},
        {"total_semantic", stats.total_semantic},
        {"active_episodic", stats.active_episodic},
        {"archived_episodic", stats.archived_episodic},
        {"compressed_episodic", stats.compressed_episodic},
        {"top_keywords", keywords},
        {"event_type_distribution", stats.event_type_distribution},
        {"oldest_memory_at", stats.oldest_at ? json(format_timestamp(*stats.oldest_at)) : json(nullptr)},
        {"newest_memory_at", stats.newest_at ? json(format_timestamp(*stats.newest_at)) : json(nullptr)}
    };
}

MemoryManager::MemoryManager(VectorStore& vectors, DocumentStore& documents, GraphStore& graph)
    : vectors_(vectors), documents_(documents), graph_(graph) {}

std::optional<Document> MemoryManager::get_episodic(const std::string& memory_id) {
    return documents_.find_by_id(kEpisodicCollection, memory_id);
}

std::optional<Document> MemoryManager::get_semantic(const std::string& memory_id) {
    return documents_.find_by_id(kSemanticCollection, memory_id);
}

std::vector<Document> MemoryManager::all_for_user(const std::string& collection,
                                                  const std::string& user_id) {
    FindOptions opts;
    opts.limit = kExportLimit;
    return documents_.find(collection, {{"user_id", user_id}}, opts);
}

static MemoryPage paginate(std::vector<Document> items, uint32_t page, uint32_t page_size) {
    MemoryPage out;
    out.page = std::max<uint32_t>(page, 1);
    out.page_size = std::max<uint32_t>(page_size, 1);
    out.total = static_cast<uint32_t>(items.size());
    out.total_pages = (out.total + out.page_size - 1) / out.page_size;

    size_t begin = static_cast<size_t>(out.page - 1) * out.page_size;
    if (begin < items.size()) {
        size_t end = std::min(items.size(), begin + out.page_size);
        out.items.assign(std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(begin)),
                         std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return out;
}

static bool matches_keywords(const Document& doc, const std::vector<std::string>& wanted) {
    if (wanted.empty()) return true;
    std::vector<std::string> have;
    if (doc.contains("keywords") && doc["keywords"].is_array()) {
        for (const auto& k : doc["keywords"]) {
            if (k.is_string()) have.push_back(to_lower(k.get<std::string>()));
        }
    }
    for (const auto& w : wanted) {
        std::string lw = to_lower(w);
        for (const auto& h : have) {
            if (h.find(lw) != std::string::npos) return true;
        }
    }
    return false;
}

MemoryPage MemoryManager::list_episodic(const std::string& user_id, uint32_t page,
                                        uint32_t page_size, const EpisodicFilter& filter) {
    json query = {{"user_id", user_id}};
    if (filter.event_type) query["event_type"] = *filter.event_type;

    FindOptions opts;
    opts.limit = kExportLimit;
    std::vector<Document> matched;
    for (auto& doc : documents_.find(kEpisodicCollection, query, opts)) {
        if (filter.min_importance && doc.value("importance", 0.0) < *filter.min_importance) continue;
        if (!matches_keywords(doc, filter.keywords)) continue;
        matched.push_back(std::move(doc));
    }
    return paginate(std::move(matched), page, page_size);
}

MemoryPage MemoryManager::list_semantic(const std::string& user_id, uint32_t page,
                                        uint32_t page_size,
                                        const std::optional<std::string>& category) {
    json query = {{"user_id", user_id}};
    if (category) query["category"] = *category;

    FindOptions opts;
    opts.limit = kExportLimit;
    return paginate(documents_.find(kSemanticCollection, query, opts), page, page_size);
}

bool MemoryManager::update_episodic(const std::string& memory_id, const Document& updates) {
    if (!updates.is_object()) return false;

    json allowed = json::object();
    for (auto it = updates.begin(); it != updates.end(); ++it) {
        if (!updatable_fields().count(it.key())) continue;
        if (it.key() == "importance" && !it.value().is_number()) {
            std::cerr << "[manager] Ignoring non-numeric importance for " << memory_id << "\n";
            continue;
        }
        allowed[it.key()] = it.value();
    }
    if (allowed.empty()) return false;

    if (allowed.contains("importance")) {
        allowed["importance"] = clamp_unit(allowed["importance"].get<double>());
    }
    if (allowed.contains("event_type") && allowed["event_type"].is_string()) {
        allowed["event_type"] = normalize_event_type(allowed["event_type"].get<std::string>());
    }
    return documents_.update(kEpisodicCollection, memory_id, allowed);
}

bool MemoryManager::delete_episodic(const std::string& memory_id) {
    if (!vectors_.remove(memory_id, kEpisodicIndex)) {
        std::cerr << "[manager] No vector for " << memory_id << "\n";
    }
    if (!graph_.delete_node(memory_id, true)) {
        std::cerr << "[manager] No graph node for " << memory_id << "\n";
    }
    return documents_.remove(kEpisodicCollection, memory_id);
}

bool MemoryManager::delete_semantic(const std::string& memory_id) {
    auto doc = documents_.find_by_id(kSemanticCollection, memory_id);
    if (!vectors_.remove(memory_id, kSemanticIndex)) {
        std::cerr << "[manager] No vector for " << memory_id << "\n";
    }
    if (doc) {
        // Entity nodes are shared between triples; only the triple's edge goes
        if (!graph_.delete_edge("entity_" + doc->value("subject", ""),
                                "entity_" + doc->value("object", ""),
                                relation_for_predicate(doc->value("predicate", "")))) {
            std::cerr << "[manager] No graph edge for " << memory_id << "\n";
        }
    }
    return documents_.remove(kSemanticCollection, memory_id);
}

std::pair<uint32_t, uint32_t> MemoryManager::clear_user(const std::string& user_id) {
    uint32_t episodic = 0;
    uint32_t semantic = 0;
    for (const auto& doc : all_for_user(kEpisodicCollection, user_id)) {
        if (delete_episodic(doc.value("id", ""))) episodic++;
    }
    for (const auto& doc : all_for_user(kSemanticCollection, user_id)) {
        if (delete_semantic(doc.value("id", ""))) semantic++;
    }
    if (!graph_.delete_node("user_" + user_id, true)) {
        std::cerr << "[manager] No graph node for user " << user_id << "\n";
    }
    std::cerr << "[manager] Cleared " << episodic << " episodic, " << semantic
              << " semantic memories for " << user_id << "\n";
    return {episodic, semantic};
}

MemoryStats MemoryManager::stats(const std::string& user_id) {
    MemoryStats s;
    s.user_id = user_id;
    s.total_episodic = documents_.count(kEpisodicCollection, {{"user_id", user_id}});
    s.active_episodic = documents_.count(kEpisodicCollection,
                                          {{"user_id", user_id}, {"is_archived", false}});
    s.archived_episodic = documents_.count(kEpisodicCollection,
                                            {{"user_id", user_id}, {"is_archived", true}});
    s.total_semantic = documents_.count(kSemanticCollection, {{"user_id", user_id}});

    FindOptions opts;
    opts.limit = kStatsSample;
    std::unordered_map<std::string, uint32_t> keyword_counts;
    std::vector<std::string> keyword_order;

    for (const auto& doc : documents_.find(kEpisodicCollection, {{"user_id", user_id}}, opts)) {
        for (const auto& kw : string_list(doc, "keywords")) {
            if (keyword_counts[kw]++ == 0) keyword_order.push_back(kw);
        }
        s.event_type_distribution[doc.value("event_type", "unknown")]++;
        if (doc.value("is_compressed", false)) s.compressed_episodic++;

        uint64_t created = doc.value("created_at", uint64_t{0});
        if (created == 0) continue;
        if (!s.oldest_at || created < *s.oldest_at) s.oldest_at = created;
        if (!s.newest_at || created > *s.newest_at) s.newest_at = created;
    }

    for (const auto& kw : keyword_order) s.top_keywords.push_back({kw, keyword_counts[kw]});
    std::stable_sort(s.top_keywords.begin(), s.top_keywords.end(),
                     [](const KeywordCount& a, const KeywordCount& b) { return a.count > b.count; });
    if (s.top_keywords.size() > kTopKeywords) s.top_keywords.resize(kTopKeywords);
    return s;
}

static std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    return "\"" + replace_all(value, "\"", "\"\"") + "\"";
}

static std::string number_field(const json& doc, const char* key) {
    if (!doc.contains(key) || doc[key].is_null()) return "";
    return doc[key].dump();
}

std::string MemoryManager::export_memories(const std::string& user_id, ExportFormat format) {
    auto episodic = all_for_user(kEpisodicCollection, user_id);
    auto semantic = all_for_user(kSemanticCollection, user_id);

    if (format == ExportFormat::Json) {
        json out = {
            {"user_id", user_id},
            {"exported_at", timestamp_now()},
            {"episodic_memories", episodic},
            {"semantic_memories", semantic}
        };
        return out.dump(2);
    }

    std::ostringstream ss;
    ss << "type,id,content,importance,created_at\n";
    for (const auto& doc : episodic) {
        ss << "episodic," << csv_field(doc.value("id", "")) << ","
           << csv_field(doc.value("summary", "")) << ","
           << number_field(doc, "importance") << ","
           << number_field(doc, "created_at") << "\n";
    }
    for (const auto& doc : semantic) {
        std::string triple = doc.value("subject", "") + " " + doc.value("predicate", "") + " " +
                             doc.value("object", "");
        ss << "semantic," << csv_field(doc.value("id", "")) << ","
           << csv_field(triple) << ","
           << number_field(doc, "confidence") << ","
           << number_field(doc, "created_at") << "\n";
    }
    return ss.str();
}

} // namespace engram
