#pragma once
#include "config.hpp"
#include "models.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace engram {

class Embedder;
class VectorStore;
class DocumentStore;

// base × decay^days + min(boost × access_count, 0.3), clamped to [0, 1].
// days is the whole-day floor of (now - created_at).
double effective_importance(const EpisodicMemory& memory,
                            const ForgettingConfig& config,
                            uint64_t now);

ForgettingConfig forgetting_config_from(const MemoryConfig& config);

// Per-user maintenance pass: compress near-duplicates among low-value
// memories, archive (or delete) whatever falls below the threshold, then
// enforce the per-user capacity.
class Forgetter {
public:
    using Clock = std::function<uint64_t()>;

    Forgetter(Embedder& embedder, VectorStore& vectors, DocumentStore& documents,
              const MemoryConfig& config, Clock clock = {});

    // Never throws; per-memory failures are logged and skipped.
    ForgettingResult run_forgetting_cycle(const std::string& user_id,
                                          const std::optional<ForgettingConfig>& config = std::nullopt);

private:
    struct Scored {
        EpisodicMemory memory;
        double effective = 0.0;
    };

    uint32_t compress_similar(std::vector<Scored>& scored, const ForgettingConfig& config,
                              std::vector<std::string>& merged_ids,
                              std::vector<std::string>& details);
    void enforce_threshold(const std::vector<Scored>& scored, const ForgettingConfig& config,
                           const std::vector<std::string>& merged_ids,
                           ForgettingResult& result);
    void enforce_capacity(const std::string& user_id, const ForgettingConfig& config,
                          ForgettingResult& result);

    bool archive(const std::string& memory_id);

    Embedder& embedder_;
    VectorStore& vectors_;
    DocumentStore& documents_;
    MemoryConfig config_;
    Clock clock_;
};

} // namespace engram
