#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct LlmConfig {
    std::string provider = "openai";
    std::string api_key;
    std::string base_url;  // empty = provider default
    std::string model = "gpt-4.1-mini";
    std::string embedding_model = "text-embedding-3-small";
    uint32_t embedding_dimension = 1536;
    double temperature = 0.7;
    uint32_t max_tokens = 2048;
    uint32_t max_retries = 3;
    uint32_t timeout_seconds = 120;
};

struct MemoryConfig {
    // Working memory
    uint32_t working_memory_ttl = 1800;            // seconds
    uint32_t working_memory_max_sessions = 1000;
    uint32_t working_memory_max_messages = 50;

    // Extraction
    uint32_t extraction_window_size = 8;
    uint32_t extraction_overlap = 2;
    double extraction_min_confidence = 0.6;

    // Retrieval
    uint32_t retrieval_top_k = 5;
    double retrieval_score_threshold = 0.5;
    uint32_t rrf_k = 60;

    // Forgetting
    double forgetting_importance_threshold = 0.3;
    double forgetting_time_decay_factor = 0.95;
    double forgetting_access_boost_factor = 0.1;
    double forgetting_similarity_threshold = 0.85;
    uint32_t forgetting_max_memories_per_user = 10000;

    // Session messages sent to the generator per turn
    uint32_t history_messages = 10;
};

struct StorageConfig {
    std::string mode = "local";  // "local" | "production"
    std::string sqlite_path;     // empty = ~/.engram/engram.db
};

struct Config {
    LlmConfig llm;
    MemoryConfig memory;
    StorageConfig storage;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Load an explicit file (no write-back) + env vars
    static Config load_file(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document; wrongly-typed values keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Apply environment variable overrides
    void apply_env();

    // Resolved SQLite database path
    std::string sqlite_path() const;
};

} // namespace engram
