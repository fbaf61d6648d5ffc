#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

// ── Conversation ─────────────────────────────────────────────

enum class Role { User, Assistant, System };

struct ConversationMessage {
    Role role = Role::User;
    std::string content;
    uint64_t timestamp = 0;
};

// Rolling session buffer owned by the session store
struct WorkingMemory {
    std::string session_id;
    std::string user_id;
    std::string agent_id = "default";
    std::vector<ConversationMessage> messages;
    uint32_t turn_count = 0;
    uint64_t created_at = 0;
    uint64_t expires_at = 0;
};

// ── Long-term memories ───────────────────────────────────────

enum class MemoryType { Episodic, Semantic };

struct EpisodicMemory {
    std::string id;
    std::string user_id;
    std::string agent_id = "default";
    std::string lossless_restatement;
    std::string summary;
    std::vector<std::string> keywords;
    std::string event_type = "general_conversation";
    std::vector<std::string> participants;
    std::optional<std::string> location;
    double importance = 0.5;
    double confidence = 0.8;
    uint32_t access_count = 0;
    std::optional<uint64_t> last_accessed_at;
    bool is_archived = false;
    bool is_compressed = false;
    std::vector<std::string> merged_from;
    std::string source_session_id;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

struct SemanticMemory {
    std::string id;
    std::string user_id;
    std::string agent_id = "default";
    std::string subject;
    std::string predicate;
    std::string object;
    std::string category = "fact";  // preference | fact | relationship | habit | knowledge
    double confidence = 0.8;
    std::string source_session_id;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

// ── Graph index ──────────────────────────────────────────────

enum class Direction { Outgoing, Incoming, Both };

struct GraphNode {
    std::string id;
    std::string label;
    nlohmann::json properties = nlohmann::json::object();
    uint64_t created_at = 0;
};

struct GraphEdge {
    std::string source_id;
    std::string target_id;
    std::string relation;
    double weight = 1.0;
    nlohmann::json properties = nlohmann::json::object();
};

// One hop (or a multi-hop reach) from a start node
struct Neighbor {
    GraphNode node;
    std::string relation;
    Direction direction = Direction::Outgoing;
    double weight = 1.0;
    uint32_t depth = 1;
    nlohmann::json edge_properties = nlohmann::json::object();
};

struct Subgraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

// ── Vector index ─────────────────────────────────────────────

using Embedding = std::vector<float>;

struct VectorHit {
    std::string memory_id;
    double score = 0.0;  // normalized to [0, 1]
    nlohmann::json metadata = nlohmann::json::object();
};

// ── Retrieval ────────────────────────────────────────────────

struct RetrievalQuery {
    std::string user_id;
    std::string query;
    uint32_t top_k = 5;
    bool include_episodic = true;
    bool include_semantic = true;
    std::optional<std::string> event_type;
};

struct ScoredMemory {
    std::string memory_id;
    MemoryType memory_type = MemoryType::Episodic;
    std::string content;
    double score = 0.0;
    std::string source;  // contributing strategies joined by '+'
    nlohmann::json raw = nlohmann::json::object();
};

struct RetrievalResult {
    std::vector<ScoredMemory> episodic_memories;
    std::vector<SemanticMemory> semantic_memories;
    std::string retrieval_plan;
    double total_retrieval_time_ms = 0.0;
};

// ── Forgetting ───────────────────────────────────────────────

struct ForgettingConfig {
    double importance_threshold = 0.3;
    double time_decay_factor = 0.95;
    double access_boost_factor = 0.1;
    double similarity_threshold = 0.85;
    uint32_t max_memories_per_user = 10000;
    bool archive_instead_of_delete = true;
};

struct ForgettingResult {
    std::string user_id;
    uint32_t total_scanned = 0;
    uint32_t memories_compressed = 0;
    uint32_t memories_archived = 0;
    uint32_t memories_deleted = 0;
    double execution_time_ms = 0.0;
    std::vector<std::string> details;
};

// ── Extraction ───────────────────────────────────────────────

struct ExtractionResult {
    std::vector<EpisodicMemory> episodic;
    std::vector<SemanticMemory> semantic;
    uint32_t windows_processed = 0;
    uint32_t windows_failed = 0;
    std::vector<std::string> write_failures;
};

// Collection names shared by the document and vector stores
inline constexpr const char* kEpisodicCollection = "episodic_memories";
inline constexpr const char* kSemanticCollection = "semantic_memories";
inline constexpr const char* kEpisodicIndex = "episodic";
inline constexpr const char* kSemanticIndex = "semantic";

// Enum string conversions
std::string role_to_string(Role role);
Role role_from_string(const std::string& s);
std::string memory_type_to_string(MemoryType type);
std::string direction_to_string(Direction dir);
Direction direction_from_string(const std::string& s);

// Known event categories; anything else is normalized to "custom"
const std::vector<std::string>& event_types();
std::string normalize_event_type(const std::string& s);

// Known semantic categories; anything else is normalized to "fact"
std::string normalize_category(const std::string& s);

double clamp_unit(double v);

} // namespace engram
