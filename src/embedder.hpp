#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cmath>

namespace engram {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface.
// embed() throws EmbeddingError when the service is unavailable.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Declared dimensionality (0 = not known yet)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Guards the denominator of cosine_similarity.
inline constexpr double kCosineEpsilon = 1e-8;

// Cosine similarity dot(a,b) / (|a| * |b| + eps).
// Returns value in [-1, 1]. Returns 0.0 if either vector is empty or the
// lengths differ; zero-magnitude vectors score 0.0 through the epsilon.
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

    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b) + kCosineEpsilon);
}

// Create an embedder from config. Returns nullptr if no provider is
// configured or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace engram
