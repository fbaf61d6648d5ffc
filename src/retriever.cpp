#include "retriever.hpp"
#include "embedder.hpp"
#include "generator.hpp"
#include "memory_json.hpp"
#include "prompt.hpp"
#include "storage.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <set>
#include <unordered_map>

using json = nlohmann::json;

namespace engram {

std::vector<std::pair<std::string, double>> rrf_fuse(const std::vector<Candidate>& candidates,
                                                     uint32_t k) {
    // Group by source, keeping first-seen order of both sources and ids
    std::vector<std::string> sources;
    std::unordered_map<std::string, std::vector<const Candidate*>> by_source;
    std::vector<std::string> first_seen;
    std::unordered_map<std::string, double> fused;

    for (const auto& c : candidates) {
        auto& list = by_source[c.source];
        if (list.empty()) sources.push_back(c.source);
        list.push_back(&c);
        if (fused.emplace(c.memory_id, 0.0).second) first_seen.push_back(c.memory_id);
    }

    for (const auto& source : sources) {
        auto& list = by_source[source];
        std::stable_sort(list.begin(), list.end(),
                         [](const Candidate* a, const Candidate* b) { return a->score > b->score; });
        for (size_t i = 0; i < list.size(); ++i) {
            fused[list[i]->memory_id] += 1.0 / (static_cast<double>(k) + static_cast<double>(i + 1));
        }
    }

    std::vector<std::pair<std::string, double>> ranked;
    ranked.reserve(first_seen.size());
    for (const auto& id : first_seen) ranked.emplace_back(id, fused[id]);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return ranked;
}

Retriever::Retriever(Generator& generator, Embedder& embedder,
                     VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
                     const MemoryConfig& config)
    : generator_(generator), embedder_(embedder),
      vectors_(vectors), documents_(documents), graph_(graph),
      config_(config) {}

RetrievalResult Retriever::retrieve(const RetrievalQuery& query) {
    auto start = std::chrono::steady_clock::now();
    RetrievalResult result;

    QueryIntent intent = analyze_intent(query.query);
    std::string plan = "intent: " + intent.intent;

    Embedding query_embedding;
    if (query.include_episodic || query.include_semantic) {
        query_embedding = embedder_.embed(query.query);
        if (query_embedding.empty()) {
            std::cerr << "[retriever] Query embedding failed; vector search skipped\n";
        }
    }

    if (query.include_episodic) {
        result.episodic_memories = retrieve_episodic(query, intent, query_embedding);
        plan += " | episodic: " + std::to_string(result.episodic_memories.size());
    }
    if (query.include_semantic) {
        result.semantic_memories = retrieve_semantic(query, intent, query_embedding);
        plan += " | semantic: " + std::to_string(result.semantic_memories.size());
    }

    for (const auto& mem : result.episodic_memories) {
        record_access(mem.memory_id);
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", elapsed);
    result.retrieval_plan = plan + " | elapsed: " + buf + " ms";
    result.total_retrieval_time_ms = elapsed;
    return result;
}

QueryIntent Retriever::analyze_intent(const std::string& query) {
    QueryIntent intent;
    json raw;
    try {
        raw = generator_.generate_json(build_intent_prompt(query), "", 0.2);
    } catch (const std::exception& e) {
        std::cerr << "[retriever] Intent analysis failed: " << e.what() << "\n";
        return intent;
    }

    if (raw.contains("intent") && raw["intent"].is_string() &&
        !raw["intent"].get<std::string>().empty()) {
        intent.intent = raw["intent"].get<std::string>();
    }
    for (const auto& kw : string_list(raw, "search_keywords")) {
        std::string t = trim(kw);
        if (!t.empty()) intent.search_keywords.push_back(t);
    }
    if (raw.contains("time_hint") && raw["time_hint"].is_string()) {
        intent.time_hint = raw["time_hint"].get<std::string>();
    }
    if (raw.contains("entity_hint") && raw["entity_hint"].is_string()) {
        intent.entity_hint = raw["entity_hint"].get<std::string>();
    }
    return intent;
}

// ── Episodic strategies ──────────────────────────────────────

void Retriever::vector_candidates(const RetrievalQuery& query, const Embedding& query_embedding,
                                  std::vector<Candidate>& out) {
    if (query_embedding.empty()) return;

    json filters = {{"user_id", query.user_id}};
    if (query.event_type) filters["event_type"] = *query.event_type;

    auto hits = vectors_.search(query_embedding, query.top_k * 3, kEpisodicIndex, filters,
                                config_.retrieval_score_threshold * 0.5);
    for (const auto& hit : hits) {
        out.push_back({hit.memory_id, hit.score, "semantic"});
    }
}

void Retriever::lexical_candidates(const RetrievalQuery& query, const QueryIntent& intent,
                                   std::vector<Candidate>& out) {
    std::string text;
    for (const auto& kw : intent.search_keywords) {
        if (!text.empty()) text += " ";
        text += kw;
    }
    if (text.empty()) text = query.query;

    auto docs = documents_.full_text_search(kEpisodicCollection, text,
                                            {"lossless_restatement", "summary", "keywords"},
                                            query.top_k * 2);
    for (size_t i = 0; i < docs.size(); ++i) {
        const auto& doc = docs[i];
        if (doc.value("user_id", "") != query.user_id) continue;
        // Rank is the position in the full result list
        double score = std::max(0.3, 1.0 - static_cast<double>(i) * 0.1);
        out.push_back({doc.value("id", ""), score, "lexical"});
    }
}

static std::string lower_string_prop(const json& props, const char* key) {
    if (props.contains(key) && props[key].is_string()) return to_lower(props[key].get<std::string>());
    return "";
}

void Retriever::graph_candidates(const RetrievalQuery& query, const QueryIntent& intent,
                                 std::vector<Candidate>& out) {
    std::vector<std::string> keywords;
    for (const auto& kw : intent.search_keywords) keywords.push_back(to_lower(kw));
    if (keywords.empty()) keywords.push_back(to_lower(query.query));

    auto neighbors = graph_.get_neighbors("user_" + query.user_id, std::nullopt,
                                          Direction::Outgoing, 2);
    for (const auto& nb : neighbors) {
        if (nb.node.id.rfind("mem_ep_", 0) != 0) continue;

        std::string summary = lower_string_prop(nb.node.properties, "summary");
        std::string name = lower_string_prop(nb.node.properties, "name");
        bool matched = std::any_of(keywords.begin(), keywords.end(), [&](const std::string& kw) {
            return summary.find(kw) != std::string::npos || name.find(kw) != std::string::npos;
        });
        if (matched) out.push_back({nb.node.id, 0.6 * nb.weight, "graph"});
    }
}

std::vector<ScoredMemory> Retriever::retrieve_episodic(const RetrievalQuery& query,
                                                       const QueryIntent& intent,
                                                       const Embedding& query_embedding) {
    std::vector<Candidate> candidates;
    vector_candidates(query, query_embedding, candidates);
    lexical_candidates(query, intent, candidates);
    graph_candidates(query, intent, candidates);

    std::unordered_map<std::string, std::set<std::string>> sources;
    for (const auto& c : candidates) sources[c.memory_id].insert(c.source);

    auto ranked = rrf_fuse(candidates, config_.rrf_k);
    if (ranked.size() > query.top_k) ranked.resize(query.top_k);

    std::vector<ScoredMemory> results;
    for (const auto& [id, fused] : ranked) {
        auto doc = documents_.find_by_id(kEpisodicCollection, id);
        if (!doc) continue;
        if (doc->value("is_archived", false)) continue;

        ScoredMemory mem;
        mem.memory_id = id;
        mem.memory_type = MemoryType::Episodic;
        mem.content = doc->value("summary", "");
        if (mem.content.empty()) mem.content = doc->value("lossless_restatement", "");
        mem.score = clamp_unit(fused);
        for (const auto& s : sources[id]) {
            if (!mem.source.empty()) mem.source += "+";
            mem.source += s;
        }
        mem.raw = std::move(*doc);
        results.push_back(std::move(mem));
    }
    return results;
}

// ── Semantic triples ─────────────────────────────────────────

std::vector<SemanticMemory> Retriever::retrieve_semantic(const RetrievalQuery& query,
                                                         const QueryIntent& intent,
                                                         const Embedding& query_embedding) {
    std::vector<SemanticMemory> results;
    std::set<std::string> seen;

    if (!query_embedding.empty()) {
        auto hits = vectors_.search(query_embedding, query.top_k * 2, kSemanticIndex,
                                    {{"user_id", query.user_id}});
        for (const auto& hit : hits) {
            if (!seen.insert(hit.memory_id).second) continue;
            auto doc = documents_.find_by_id(kSemanticCollection, hit.memory_id);
            if (doc) results.push_back(semantic_from_json(*doc));
        }
    }

    // Graph-assisted pass: entities named by the first keywords
    size_t n = std::min<size_t>(intent.search_keywords.size(), 3);
    for (size_t i = 0; i < n; ++i) {
        auto neighbors = graph_.get_neighbors("entity_" + intent.search_keywords[i],
                                              std::nullopt, Direction::Both, 1);
        for (const auto& nb : neighbors) {
            const auto& props = nb.edge_properties;
            if (!props.contains("memory_id") || !props["memory_id"].is_string()) continue;
            std::string mem_id = props["memory_id"].get<std::string>();
            if (seen.count(mem_id)) continue;

            auto doc = documents_.find_by_id(kSemanticCollection, mem_id);
            if (!doc || doc->value("user_id", "") != query.user_id) continue;
            seen.insert(mem_id);
            results.push_back(semantic_from_json(*doc));
        }
    }

    if (results.size() > query.top_k) results.resize(query.top_k);
    return results;
}

// ── Access feedback ──────────────────────────────────────────

void Retriever::record_access(const std::string& memory_id) {
    // Serialize the read-modify-write of access_count
    std::lock_guard<std::mutex> lock(access_mutex_);
    auto doc = documents_.find_by_id(kEpisodicCollection, memory_id);
    if (!doc) {
        std::cerr << "[retriever] Access update skipped, " << memory_id << " not found\n";
        return;
    }
    json partial = {
        {"access_count", doc->value("access_count", uint32_t{0}) + 1},
        {"last_accessed_at", epoch_seconds()}
    };
    if (!documents_.update(kEpisodicCollection, memory_id, partial)) {
        std::cerr << "[retriever] Access update failed for " << memory_id << "\n";
    }
}

} // namespace engram
