#include "forgetter.hpp"
#include "embedder.hpp"
#include "memory_json.hpp"
#include "storage.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace engram {

static constexpr double kMaxAccessBoost = 0.3;
static constexpr uint64_t kSecondsPerDay = 86400;

double effective_importance(const EpisodicMemory& memory,
                            const ForgettingConfig& config,
                            uint64_t now) {
    uint64_t days = now > memory.created_at ? (now - memory.created_at) / kSecondsPerDay : 0;
    double decay = std::pow(config.time_decay_factor, static_cast<double>(days));
    double boost = std::min(config.access_boost_factor * memory.access_count, kMaxAccessBoost);
    return clamp_unit(memory.importance * decay + boost);
}

ForgettingConfig forgetting_config_from(const MemoryConfig& config) {
    ForgettingConfig fc;
    fc.importance_threshold = config.forgetting_importance_threshold;
    fc.time_decay_factor = config.forgetting_time_decay_factor;
    fc.access_boost_factor = config.forgetting_access_boost_factor;
    fc.similarity_threshold = config.forgetting_similarity_threshold;
    fc.max_memories_per_user = config.forgetting_max_memories_per_user;
    return fc;
}

Forgetter::Forgetter(Embedder& embedder, VectorStore& vectors, DocumentStore& documents,
                     const MemoryConfig& config, Clock clock)
    : embedder_(embedder), vectors_(vectors), documents_(documents),
      config_(config), clock_(std::move(clock)) {}

ForgettingResult Forgetter::run_forgetting_cycle(const std::string& user_id,
                                                 const std::optional<ForgettingConfig>& config) {
    auto start = std::chrono::steady_clock::now();
    ForgettingConfig cfg = config ? *config : forgetting_config_from(config_);
    ForgettingResult result;
    result.user_id = user_id;

    json active = {{"user_id", user_id}, {"is_archived", false}};
    FindOptions opts;
    opts.sort_by = "created_at";
    opts.sort_order = SortOrder::Ascending;
    uint64_t scan_limit = static_cast<uint64_t>(cfg.max_memories_per_user) * 2;
    opts.limit = static_cast<uint32_t>(
        std::min<uint64_t>(scan_limit, std::numeric_limits<uint32_t>::max()));

    std::vector<Document> docs;
    try {
        docs = documents_.find(kEpisodicCollection, active, opts);
    } catch (const std::exception& e) {
        std::cerr << "[forgetter] Loading memories for " << user_id << " failed: " << e.what() << "\n";
        result.details.push_back(std::string("load failed: ") + e.what());
        return result;
    }
    result.total_scanned = static_cast<uint32_t>(docs.size());
    if (docs.empty()) return result;

    uint64_t now = clock_ ? clock_() : epoch_seconds();
    std::vector<Scored> scored;
    scored.reserve(docs.size());
    for (const auto& doc : docs) {
        try {
            Scored s;
            s.memory = episodic_from_json(doc);
            s.effective = effective_importance(s.memory, cfg, now);
            scored.push_back(std::move(s));
        } catch (const std::exception& e) {
            std::cerr << "[forgetter] Skipping unreadable memory " << doc.value("id", "?")
                      << ": " << e.what() << "\n";
        }
    }

    std::vector<std::string> merged_ids;
    result.memories_compressed = compress_similar(scored, cfg, merged_ids, result.details);
    result.details.push_back("compressed " + std::to_string(result.memories_compressed) +
                             " similar pairs");

    enforce_threshold(scored, cfg, merged_ids, result);
    try {
        enforce_capacity(user_id, cfg, result);
    } catch (const std::exception& e) {
        std::cerr << "[forgetter] Capacity pass for " << user_id << " failed: " << e.what() << "\n";
        result.details.push_back(std::string("capacity pass failed: ") + e.what());
    }

    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", result.execution_time_ms);
    result.details.push_back(std::string("elapsed: ") + buf + " ms");

    std::cerr << "[forgetter] Cycle for " << user_id << ": scanned=" << result.total_scanned
              << " compressed=" << result.memories_compressed
              << " archived=" << result.memories_archived
              << " deleted=" << result.memories_deleted << "\n";
    return result;
}

uint32_t Forgetter::compress_similar(std::vector<Scored>& scored, const ForgettingConfig& config,
                                     std::vector<std::string>& merged_ids,
                                     std::vector<std::string>& details) {
    std::vector<Scored*> low;
    for (auto& s : scored) {
        if (s.effective < config.importance_threshold * 2) low.push_back(&s);
    }
    if (low.size() < 2) return 0;

    auto merged = [&](const std::string& id) {
        return std::find(merged_ids.begin(), merged_ids.end(), id) != merged_ids.end();
    };

    uint32_t compressed = 0;
    for (size_t i = 0; i < low.size(); ++i) {
        if (merged(low[i]->memory.id)) continue;
        for (size_t j = i + 1; j < low.size(); ++j) {
            if (merged(low[j]->memory.id)) continue;

            auto sim = embedder_.similarity(low[i]->memory.lossless_restatement,
                                            low[j]->memory.lossless_restatement);
            if (!sim || *sim <= config.similarity_threshold) continue;

            Scored* keep = low[i]->effective >= low[j]->effective ? low[i] : low[j];
            Scored* discard = keep == low[i] ? low[j] : low[i];

            std::vector<std::string> merged_from = keep->memory.merged_from;
            merged_from.push_back(discard->memory.id);
            if (!documents_.update(kEpisodicCollection, keep->memory.id,
                                   {{"merged_from", merged_from}, {"is_compressed", true}})) {
                std::cerr << "[forgetter] Merge into " << keep->memory.id << " failed\n";
                continue;
            }
            keep->memory.merged_from = std::move(merged_from);
            keep->memory.is_compressed = true;

            if (!archive(discard->memory.id)) {
                std::cerr << "[forgetter] Archiving merged " << discard->memory.id << " failed\n";
            }
            merged_ids.push_back(discard->memory.id);
            details.push_back("merged " + discard->memory.id + " into " + keep->memory.id);
            compressed++;

            // The slot at i may have just been merged away
            if (discard == low[i]) break;
        }
    }
    return compressed;
}

void Forgetter::enforce_threshold(const std::vector<Scored>& scored, const ForgettingConfig& config,
                                  const std::vector<std::string>& merged_ids,
                                  ForgettingResult& result) {
    for (const auto& s : scored) {
        const auto& id = s.memory.id;
        if (std::find(merged_ids.begin(), merged_ids.end(), id) != merged_ids.end()) continue;
        if (s.effective >= config.importance_threshold) continue;

        if (config.archive_instead_of_delete) {
            if (archive(id)) {
                result.memories_archived++;
            } else {
                std::cerr << "[forgetter] Archiving " << id << " failed\n";
            }
        } else {
            if (documents_.remove(kEpisodicCollection, id)) {
                if (!vectors_.remove(id, kEpisodicIndex)) {
                    std::cerr << "[forgetter] Vector for " << id << " not removed\n";
                }
                result.memories_deleted++;
            } else {
                std::cerr << "[forgetter] Deleting " << id << " failed\n";
            }
        }
    }
}

void Forgetter::enforce_capacity(const std::string& user_id, const ForgettingConfig& config,
                                 ForgettingResult& result) {
    json active = {{"user_id", user_id}, {"is_archived", false}};
    uint32_t total_active = documents_.count(kEpisodicCollection, active);
    if (total_active <= config.max_memories_per_user) return;

    FindOptions opts;
    opts.sort_by = "importance";
    opts.sort_order = SortOrder::Ascending;
    opts.limit = total_active - config.max_memories_per_user;

    uint32_t archived = 0;
    for (const auto& doc : documents_.find(kEpisodicCollection, active, opts)) {
        std::string id = doc.value("id", "");
        if (archive(id)) {
            archived++;
        } else {
            std::cerr << "[forgetter] Archiving overflow " << id << " failed\n";
        }
    }
    result.memories_archived += archived;
    result.details.push_back("capacity: archived " + std::to_string(archived) + " over the limit");
}

bool Forgetter::archive(const std::string& memory_id) {
    return documents_.update(kEpisodicCollection, memory_id, {{"is_archived", true}});
}

} // namespace engram
