#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <atomic>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace engram {

// HTTP embedder for OpenAI-compatible /embeddings endpoints.
// Successful embeddings are kept in a bounded least-recently-used cache
// keyed by the input text.
class HttpEmbedder : public Embedder {
public:
    struct Config {
        std::string name;           // e.g. "openai"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        uint32_t default_dims;      // fallback until first response
        size_t cache_capacity = 1024;  // 0 disables the cache
    };

    HttpEmbedder(Config config, HttpClient& http);

    Embedding embed(const std::string& text) override;
    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override { return config_.name; }

    size_t cache_size() const;

private:
    // POSTs the input (string or array) and returns the response "data" array
    std::optional<nlohmann::json> request(const nlohmann::json& input);
    std::optional<Embedding> cached(const std::string& text);
    void remember(const std::string& text, const Embedding& embedding);

    Config config_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_;

    // Most recently used first
    std::list<std::pair<std::string, Embedding>> cache_;
    std::unordered_map<std::string, std::list<std::pair<std::string, Embedding>>::iterator> cache_index_;
    mutable std::mutex cache_mutex_;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model,
    uint32_t dimensions = 1536);

} // namespace engram
