#include "http_embedder.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace engram {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

static Embedding to_embedding(const json& arr) {
    Embedding result;
    if (!arr.is_array()) return result;
    result.reserve(arr.size());
    for (const auto& val : arr) {
        if (!val.is_number()) return {};
        result.push_back(val.get<float>());
    }
    return result;
}

std::optional<json> HttpEmbedder::request(const json& input) {
    json body = {
        {"model", config_.model},
        {"input", input}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(
        config_.base_url + config_.endpoint, body.dump(), headers, 30);
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[embedder] " << config_.name << " HTTP "
                  << response.status_code << "\n";
        return std::nullopt;
    }

    json j = json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.contains("data") || !j["data"].is_array()) {
        std::cerr << "[embedder] " << config_.name << " returned an unexpected body\n";
        return std::nullopt;
    }
    return j["data"];
}

std::optional<Embedding> HttpEmbedder::cached(const std::string& text) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_index_.find(text);
    if (it == cache_index_.end()) return std::nullopt;
    cache_.splice(cache_.begin(), cache_, it->second);
    return it->second->second;
}

void HttpEmbedder::remember(const std::string& text, const Embedding& embedding) {
    if (config_.cache_capacity == 0) return;
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_index_.find(text);
    if (it != cache_index_.end()) {
        it->second->second = embedding;
        cache_.splice(cache_.begin(), cache_, it->second);
        return;
    }
    cache_.emplace_front(text, embedding);
    cache_index_[text] = cache_.begin();
    while (cache_.size() > config_.cache_capacity) {
        cache_index_.erase(cache_.back().first);
        cache_.pop_back();
    }
}

size_t HttpEmbedder::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

Embedding HttpEmbedder::embed(const std::string& text) {
    if (auto hit = cached(text)) return *hit;

    auto data = request(text);
    if (!data || data->empty()) return {};

    Embedding result = to_embedding((*data)[0].value("embedding", json()));
    if (result.empty()) return {};

    dimensions_ = static_cast<uint32_t>(result.size());
    remember(text, result);
    return result;
}

std::vector<Embedding> HttpEmbedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<Embedding> out(texts.size());

    // Only send texts that are not cached yet
    json pending = json::array();
    std::vector<size_t> positions;
    for (size_t i = 0; i < texts.size(); ++i) {
        if (auto hit = cached(texts[i])) {
            out[i] = std::move(*hit);
        } else {
            pending.push_back(texts[i]);
            positions.push_back(i);
        }
    }
    if (positions.empty()) return out;

    auto data = request(pending);
    if (!data) return out;

    // Items carry their input index; the response order is not guaranteed
    for (size_t n = 0; n < data->size(); ++n) {
        const auto& item = (*data)[n];
        size_t index = n;
        if (item.contains("index") && item["index"].is_number_unsigned()) {
            index = item["index"].get<size_t>();
        }
        if (index >= positions.size()) continue;

        Embedding e = to_embedding(item.value("embedding", json()));
        if (e.empty()) continue;
        dimensions_ = static_cast<uint32_t>(e.size());
        remember(texts[positions[index]], e);
        out[positions[index]] = std::move(e);
    }
    return out;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model,
    uint32_t dimensions) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.default_dims = dimensions;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace engram
