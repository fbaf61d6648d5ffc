#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>
#include <stdexcept>

namespace engram {

std::vector<Embedding> Embedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed(text));
    }
    return out;
}

std::optional<double> Embedder::similarity(const std::string& a, const std::string& b) {
    Embedding ea = embed(a);
    Embedding eb = embed(b);
    if (ea.empty() || eb.empty() || ea.size() != eb.size()) {
        std::cerr << "[embedder] Similarity unavailable: embedding failed\n";
        return std::nullopt;
    }
    return clamp_unit(cosine_similarity(ea, eb));
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& llm = config.llm;
    if (llm.provider != "openai" && llm.provider != "compatible") {
        throw std::invalid_argument("Unknown embedding provider: " + llm.provider);
    }
    if (llm.api_key.empty()) {
        std::cerr << "[embedder] No API key configured; embedding calls will fail\n";
    }
    return create_openai_embedder(llm.api_key, http, llm.base_url,
                                  llm.embedding_model, llm.embedding_dimension);
}

} // namespace engram
