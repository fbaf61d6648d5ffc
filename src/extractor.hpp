#pragma once
#include "config.hpp"
#include "models.hpp"
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace engram {

class Generator;
class Embedder;
class VectorStore;
class DocumentStore;
class GraphStore;

// [start, end) message ranges of the extraction windows. Advances by
// max(1, window - overlap); windows shorter than 2 messages are skipped.
std::vector<std::pair<size_t, size_t>> extraction_windows(size_t message_count,
                                                          uint32_t window_size,
                                                          uint32_t overlap);

// Parse one model-proposed memory. Returns nullopt for candidates missing a
// required field or below min_confidence. Never throws.
std::optional<EpisodicMemory> parse_episodic_candidate(const nlohmann::json& item,
                                                       double min_confidence);
std::optional<SemanticMemory> parse_semantic_candidate(const nlohmann::json& item,
                                                       double min_confidence);

// Graph relation for a predicate: upper-cased, spaces to underscores
std::string relation_for_predicate(const std::string& predicate);

// Turns conversation windows into deduplicated memories and writes each one
// to the document, vector and graph stores.
class Extractor {
public:
    Extractor(Generator& generator, Embedder& embedder,
              VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
              const MemoryConfig& config);

    ExtractionResult extract(const std::vector<ConversationMessage>& messages,
                             const std::string& user_id,
                             const std::string& agent_id = "default",
                             const std::string& session_id = "");

    // Batch-local dedup; exposed for testing
    std::vector<EpisodicMemory> deduplicate_episodic(const std::vector<EpisodicMemory>& memories);
    static std::vector<SemanticMemory> deduplicate_semantic(const std::vector<SemanticMemory>& memories);

private:
    // Throws on generation failure
    void extract_window(const std::vector<ConversationMessage>& window,
                        const std::string& user_id, const std::string& agent_id,
                        const std::string& session_id,
                        std::vector<EpisodicMemory>& episodic,
                        std::vector<SemanticMemory>& semantic);

    void persist_episodic(const EpisodicMemory& memory, std::vector<std::string>& failures);
    void persist_semantic(const SemanticMemory& memory, std::vector<std::string>& failures);

    Generator& generator_;
    Embedder& embedder_;
    VectorStore& vectors_;
    DocumentStore& documents_;
    GraphStore& graph_;
    MemoryConfig config_;
};

} // namespace engram
