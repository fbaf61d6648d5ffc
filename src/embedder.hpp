#pragma once
#include "models.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <cmath>

namespace engram {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text. Empty on failure.
    virtual Embedding embed(const std::string& text) = 0;

    // One embedding per input, in input order. Failed entries are empty.
    virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts);

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai")
    virtual std::string embedder_name() const = 0;

    // Cosine similarity of the two texts' embeddings, clamped to [0, 1].
    // Empty when either embedding could not be computed.
    std::optional<double> similarity(const std::string& a, const std::string& b);
};

// Cosine similarity between two embedding vectors.
// Returns value in [-1, 1]. Assumes vectors are the same length.
// Returns 0.0 if either vector is empty or zero-magnitude.
inline double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    return dot / denom;
}

// Create an embedder from config. Throws std::invalid_argument when the
// configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace engram
