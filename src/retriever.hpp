#pragma once
#include "config.hpp"
#include "models.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace engram {

class Generator;
class Embedder;
class VectorStore;
class DocumentStore;
class GraphStore;

struct QueryIntent {
    std::string intent = "unknown";
    std::vector<std::string> search_keywords;
    std::string time_hint;
    std::string entity_hint;
};

// One strategy's vote for a memory
struct Candidate {
    std::string memory_id;
    double score = 0.0;
    std::string source;  // "semantic" | "lexical" | "graph"
};

// Reciprocal Rank Fusion. Each source's candidates are ranked by score
// (descending, rank from 1); a memory's fused score is the sum of
// 1 / (k + rank) over the sources that returned it. Result is sorted by fused
// score descending, ties in first-seen order.
std::vector<std::pair<std::string, double>> rrf_fuse(const std::vector<Candidate>& candidates,
                                                     uint32_t k);

// Hybrid episodic retrieval (vector + lexical + graph, fused with RRF) plus
// semantic-triple retrieval. Returned episodic memories get their access
// count bumped.
class Retriever {
public:
    Retriever(Generator& generator, Embedder& embedder,
              VectorStore& vectors, DocumentStore& documents, GraphStore& graph,
              const MemoryConfig& config);

    RetrievalResult retrieve(const RetrievalQuery& query);

    // Falls back to {intent: "unknown", search_keywords: []} on any failure
    QueryIntent analyze_intent(const std::string& query);

private:
    std::vector<ScoredMemory> retrieve_episodic(const RetrievalQuery& query,
                                                const QueryIntent& intent,
                                                const Embedding& query_embedding);
    std::vector<SemanticMemory> retrieve_semantic(const RetrievalQuery& query,
                                                  const QueryIntent& intent,
                                                  const Embedding& query_embedding);

    void vector_candidates(const RetrievalQuery& query, const Embedding& query_embedding,
                           std::vector<Candidate>& out);
    void lexical_candidates(const RetrievalQuery& query, const QueryIntent& intent,
                            std::vector<Candidate>& out);
    void graph_candidates(const RetrievalQuery& query, const QueryIntent& intent,
                          std::vector<Candidate>& out);

    void record_access(const std::string& memory_id);

    Generator& generator_;
    Embedder& embedder_;
    VectorStore& vectors_;
    DocumentStore& documents_;
    GraphStore& graph_;
    MemoryConfig config_;
    std::mutex access_mutex_;
};

} // namespace engram
