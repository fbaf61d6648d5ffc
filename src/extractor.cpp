#include "extractor.hpp"
#include "embedder.hpp"
#include "generator.hpp"
#include "memory_json.hpp"
#include "prompt.hpp"
#include "storage.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <tuple>

using json = nlohmann::json;

namespace engram {

std::vector<std::pair<size_t, size_t>> extraction_windows(size_t message_count,
                                                          uint32_t window_size,
                                                          uint32_t overlap) {
    std::vector<std::pair<size_t, size_t>> windows;
    size_t step = window_size > overlap ? window_size - overlap : 1;
    for (size_t start = 0; start < message_count; start += step) {
        size_t end = std::min(message_count, start + window_size);
        if (end - start < 2) continue;
        windows.emplace_back(start, end);
    }
    return windows;
}

// ── Candidate parsing ────────────────────────────────────────

static std::string string_field(const json& item, const char* key) {
    if (item.contains(key) && item[key].is_string()) return trim(item[key].get<std::string>());
    return "";
}

static double unit_field(const json& item, const char* key, double fallback) {
    if (item.contains(key) && item[key].is_number()) return clamp_unit(item[key].get<double>());
    return fallback;
}

static std::vector<std::string> clean_list(const json& item, const char* key) {
    std::vector<std::string> out;
    for (const auto& s : string_list(item, key)) {
        std::string t = trim(s);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

std::optional<EpisodicMemory> parse_episodic_candidate(const json& item,
                                                       double min_confidence) {
    if (!item.is_object()) return std::nullopt;

    std::string restatement = string_field(item, "lossless_restatement");
    if (restatement.empty()) return std::nullopt;

    double confidence = unit_field(item, "confidence", 0.8);
    if (confidence < min_confidence) return std::nullopt;

    EpisodicMemory mem;
    mem.lossless_restatement = restatement;
    mem.summary = string_field(item, "summary");
    if (mem.summary.empty()) mem.summary = utf8_prefix(restatement, 50);
    mem.keywords = clean_list(item, "keywords");
    mem.event_type = normalize_event_type(string_field(item, "event_type"));
    mem.participants = clean_list(item, "participants");
    std::string location = string_field(item, "location");
    if (!location.empty()) mem.location = location;
    mem.importance = unit_field(item, "importance", 0.5);
    mem.confidence = confidence;
    return mem;
}

std::optional<SemanticMemory> parse_semantic_candidate(const json& item,
                                                       double min_confidence) {
    if (!item.is_object()) return std::nullopt;

    SemanticMemory mem;
    mem.subject = string_field(item, "subject");
    mem.predicate = string_field(item, "predicate");
    mem.object = string_field(item, "object");
    if (mem.subject.empty() || mem.predicate.empty() || mem.object.empty()) return std::nullopt;

    mem.confidence = unit_field(item, "confidence", 0.8);
    if (mem.confidence < min_confidence) return std::nullopt;

    mem.category = normalize_category(string_field(item, "category"));
    return mem;
}

std::string relation_for_predicate(const std::string& predicate) {
    std::string rel = replace_all(predicate, " ", "_");
    for (auto& c : rel) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return rel;
}

// ── Extractor ────────────────────────────────────────────────

Extractor::Extractor(Generator& generator, Embedder& embedder,
                     VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
                     const MemoryConfig& config)
    : generator_(generator), embedder_(embedder),
      vectors_(vectors), documents_(documents), graph_(graph),
      config_(config) {}

ExtractionResult Extractor::extract(const std::vector<ConversationMessage>& messages,
                                    const std::string& user_id,
                                    const std::string& agent_id,
                                    const std::string& session_id) {
    ExtractionResult result;
    if (messages.empty()) return result;

    std::vector<EpisodicMemory> episodic;
    std::vector<SemanticMemory> semantic;

    auto windows = extraction_windows(messages.size(), config_.extraction_window_size,
                                      config_.extraction_overlap);
    for (const auto& [start, end] : windows) {
        std::vector<ConversationMessage> window(messages.begin() + static_cast<std::ptrdiff_t>(start),
                                                messages.begin() + static_cast<std::ptrdiff_t>(end));
        try {
            extract_window(window, user_id, agent_id, session_id, episodic, semantic);
            result.windows_processed++;
        } catch (const std::exception& e) {
            result.windows_failed++;
            std::cerr << "[extractor] Window extraction failed (start=" << start
                      << "): " << e.what() << "\n";
        }
    }

    result.episodic = deduplicate_episodic(episodic);
    result.semantic = deduplicate_semantic(semantic);

    for (const auto& mem : result.episodic) {
        try {
            persist_episodic(mem, result.write_failures);
        } catch (const std::exception& e) {
            result.write_failures.push_back(mem.id + ": " + e.what());
            std::cerr << "[extractor] Persisting " << mem.id << " failed: " << e.what() << "\n";
        }
    }
    for (const auto& mem : result.semantic) {
        try {
            persist_semantic(mem, result.write_failures);
        } catch (const std::exception& e) {
            result.write_failures.push_back(mem.id + ": " + e.what());
            std::cerr << "[extractor] Persisting " << mem.id << " failed: " << e.what() << "\n";
        }
    }

    std::cerr << "[extractor] Extracted " << result.episodic.size() << " episodic, "
              << result.semantic.size() << " semantic memories for " << user_id
              << " (" << result.windows_processed << "/" << windows.size() << " windows";
    if (!result.write_failures.empty()) {
        std::cerr << ", " << result.write_failures.size() << " write failures";
    }
    std::cerr << ")\n";
    return result;
}

void Extractor::extract_window(const std::vector<ConversationMessage>& window,
                               const std::string& user_id, const std::string& agent_id,
                               const std::string& session_id,
                               std::vector<EpisodicMemory>& episodic,
                               std::vector<SemanticMemory>& semantic) {
    json raw = generator_.generate_json(build_extraction_prompt(window),
                                        build_extraction_system_prompt(),
                                        kJsonTemperature);
    uint64_t now = epoch_seconds();

    if (raw.contains("episodic_memories") && raw["episodic_memories"].is_array()) {
        for (const auto& item : raw["episodic_memories"]) {
            auto mem = parse_episodic_candidate(item, config_.extraction_min_confidence);
            if (!mem) continue;
            mem->id = generate_id("mem_ep_");
            mem->user_id = user_id;
            mem->agent_id = agent_id;
            mem->source_session_id = session_id;
            mem->created_at = now;
            mem->updated_at = now;
            episodic.push_back(std::move(*mem));
        }
    }

    if (raw.contains("semantic_memories") && raw["semantic_memories"].is_array()) {
        for (const auto& item : raw["semantic_memories"]) {
            auto mem = parse_semantic_candidate(item, config_.extraction_min_confidence);
            if (!mem) continue;
            mem->id = generate_id("mem_sem_");
            mem->user_id = user_id;
            mem->agent_id = agent_id;
            mem->source_session_id = session_id;
            mem->created_at = now;
            mem->updated_at = now;
            semantic.push_back(std::move(*mem));
        }
    }
}

std::vector<EpisodicMemory> Extractor::deduplicate_episodic(const std::vector<EpisodicMemory>& memories) {
    if (memories.size() <= 1) return memories;

    std::vector<EpisodicMemory> unique;
    unique.push_back(memories[0]);
    for (size_t i = 1; i < memories.size(); ++i) {
        const auto& mem = memories[i];
        bool duplicate = false;
        for (auto it = unique.begin(); it != unique.end(); ++it) {
            auto sim = embedder_.similarity(mem.lossless_restatement, it->lossless_restatement);
            if (!sim) continue;
            if (*sim > config_.forgetting_similarity_threshold) {
                // Keep the more important of the pair
                if (mem.importance > it->importance) {
                    unique.erase(it);
                    unique.push_back(mem);
                }
                duplicate = true;
                break;
            }
        }
        if (!duplicate) unique.push_back(mem);
    }
    return unique;
}

std::vector<SemanticMemory> Extractor::deduplicate_semantic(const std::vector<SemanticMemory>& memories) {
    std::set<std::tuple<std::string, std::string, std::string>> seen;
    std::vector<SemanticMemory> unique;
    for (const auto& mem : memories) {
        if (seen.emplace(to_lower(mem.subject), to_lower(mem.predicate),
                         to_lower(mem.object)).second) {
            unique.push_back(mem);
        }
    }
    return unique;
}

// Each write is independent: a failed one is recorded and the rest still run.
void Extractor::persist_episodic(const EpisodicMemory& memory, std::vector<std::string>& failures) {
    auto fail = [&](const std::string& what) {
        failures.push_back(memory.id + ": " + what);
        std::cerr << "[extractor] " << memory.id << ": " << what << " write failed\n";
    };

    if (!documents_.insert(kEpisodicCollection, episodic_to_json(memory))) fail("document");

    Embedding embedding = embedder_.embed(memory.lossless_restatement);
    if (embedding.empty()) {
        fail("embedding");
    } else {
        json metadata = {
            {"user_id", memory.user_id},
            {"event_type", memory.event_type},
            {"importance", memory.importance},
            {"created_at", memory.created_at}
        };
        if (!vectors_.upsert(memory.id, embedding, metadata, kEpisodicIndex)) fail("vector");
    }

    std::string user_node = "user_" + memory.user_id;
    bool graph_ok = graph_.add_node({user_node, "User", {{"user_id", memory.user_id}}});
    graph_ok &= graph_.add_node({memory.id, "Event", {
        {"summary", memory.summary},
        {"event_type", memory.event_type},
        {"importance", memory.importance}
    }});
    graph_ok &= graph_.add_edge({user_node, memory.id, "EXPERIENCED", memory.importance});

    if (memory.location) {
        std::string loc_id = "loc_" + *memory.location;
        graph_ok &= graph_.add_node({loc_id, "Location", {{"name", *memory.location}}});
        graph_ok &= graph_.add_edge({memory.id, loc_id, "AT_LOCATION", 1.0});
    }
    for (const auto& person : memory.participants) {
        std::string person_id = "person_" + person;
        graph_ok &= graph_.add_node({person_id, "Person", {{"name", person}}});
        graph_ok &= graph_.add_edge({memory.id, person_id, "INVOLVES", 1.0});
    }
    if (!graph_ok) fail("graph");
}

void Extractor::persist_semantic(const SemanticMemory& memory, std::vector<std::string>& failures) {
    auto fail = [&](const std::string& what) {
        failures.push_back(memory.id + ": " + what);
        std::cerr << "[extractor] " << memory.id << ": " << what << " write failed\n";
    };

    if (!documents_.insert(kSemanticCollection, semantic_to_json(memory))) fail("document");

    Embedding embedding = embedder_.embed(memory.subject + " " + memory.predicate + " " + memory.object);
    if (embedding.empty()) {
        fail("embedding");
    } else {
        json metadata = {
            {"user_id", memory.user_id},
            {"category", memory.category},
            {"subject", memory.subject},
            {"predicate", memory.predicate},
            {"object", memory.object}
        };
        if (!vectors_.upsert(memory.id, embedding, metadata, kSemanticIndex)) fail("vector");
    }

    std::string subj_id = "entity_" + memory.subject;
    std::string obj_id = "entity_" + memory.object;
    bool graph_ok = graph_.add_node({subj_id, "Entity", {{"name", memory.subject}}});
    graph_ok &= graph_.add_node({obj_id, "Entity", {{"name", memory.object}}});
    graph_ok &= graph_.add_edge({subj_id, obj_id, relation_for_predicate(memory.predicate),
                                 memory.confidence,
                                 {{"category", memory.category}, {"memory_id", memory.id}}});
    if (!graph_ok) fail("graph");
}

} // namespace engram
