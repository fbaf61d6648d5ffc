#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace engram {

nlohmann::json Config::defaults_json() {
    return {
        {"llm", {
            {"provider", "openai"},
            {"api_key", ""},
            {"base_url", ""},
            {"model", "gpt-4.1-mini"},
            {"embedding_model", "text-embedding-3-small"},
            {"embedding_dimension", 1536},
            {"temperature", 0.7},
            {"max_tokens", 2048},
            {"max_retries", 3},
            {"timeout_seconds", 120}
        }},
        {"memory", {
            {"working_memory_ttl", 1800},
            {"working_memory_max_sessions", 1000},
            {"working_memory_max_messages", 50},
            {"extraction_window_size", 8},
            {"extraction_overlap", 2},
            {"extraction_min_confidence", 0.6},
            {"retrieval_top_k", 5},
            {"retrieval_score_threshold", 0.5},
            {"rrf_k", 60},
            {"forgetting_importance_threshold", 0.3},
            {"forgetting_time_decay_factor", 0.95},
            {"forgetting_access_boost_factor", 0.1},
            {"forgetting_similarity_threshold", 0.85},
            {"forgetting_max_memories_per_user", 10000},
            {"history_messages", 10}
        }},
        {"storage", {
            {"mode", "local"},
            {"sqlite_path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] " << key << " is out of range, keeping " << out << "\n";
        return;
    }
    out = static_cast<uint32_t>(value);
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("llm") && j["llm"].is_object()) {
        const auto& l = j["llm"];
        read_string(l, "provider", cfg.llm.provider);
        read_string(l, "api_key", cfg.llm.api_key);
        read_string(l, "base_url", cfg.llm.base_url);
        read_string(l, "model", cfg.llm.model);
        read_string(l, "embedding_model", cfg.llm.embedding_model);
        read_uint(l, "embedding_dimension", cfg.llm.embedding_dimension);
        read_double(l, "temperature", cfg.llm.temperature);
        read_uint(l, "max_tokens", cfg.llm.max_tokens);
        read_uint(l, "max_retries", cfg.llm.max_retries);
        read_uint(l, "timeout_seconds", cfg.llm.timeout_seconds);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        const auto& m = j["memory"];
        auto& mc = cfg.memory;
        read_uint(m, "working_memory_ttl", mc.working_memory_ttl);
        read_uint(m, "working_memory_max_sessions", mc.working_memory_max_sessions);
        read_uint(m, "working_memory_max_messages", mc.working_memory_max_messages);
        read_uint(m, "extraction_window_size", mc.extraction_window_size);
        read_uint(m, "extraction_overlap", mc.extraction_overlap);
        read_double(m, "extraction_min_confidence", mc.extraction_min_confidence);
        read_uint(m, "retrieval_top_k", mc.retrieval_top_k);
        read_double(m, "retrieval_score_threshold", mc.retrieval_score_threshold);
        read_uint(m, "rrf_k", mc.rrf_k);
        read_double(m, "forgetting_importance_threshold", mc.forgetting_importance_threshold);
        read_double(m, "forgetting_time_decay_factor", mc.forgetting_time_decay_factor);
        read_double(m, "forgetting_access_boost_factor", mc.forgetting_access_boost_factor);
        read_double(m, "forgetting_similarity_threshold", mc.forgetting_similarity_threshold);
        read_uint(m, "forgetting_max_memories_per_user", mc.forgetting_max_memories_per_user);
        read_uint(m, "history_messages", mc.history_messages);
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        const auto& s = j["storage"];
        read_string(s, "mode", cfg.storage.mode);
        read_string(s, "sqlite_path", cfg.storage.sqlite_path);
    }

    return cfg;
}

void Config::apply_env() {
    // Environment variables always override the config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        llm.api_key = v;
    if (const char* v = std::getenv("OPENAI_BASE_URL"))
        llm.base_url = v;
    if (const char* v = std::getenv("LLM_MODEL"))
        llm.model = v;
    if (const char* v = std::getenv("EMBEDDING_MODEL"))
        llm.embedding_model = v;
    if (const char* v = std::getenv("STORAGE_MODE"))
        storage.mode = v;
    if (const char* v = std::getenv("SQLITE_DB_PATH"))
        storage.sqlite_path = v;
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original && atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

std::string Config::sqlite_path() const {
    if (!storage.sqlite_path.empty()) return expand_home(storage.sqlite_path);
    return expand_home("~/.engram/engram.db");
}

} // namespace engram
