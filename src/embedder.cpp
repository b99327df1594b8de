#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace engram {

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;

    // Resolve provider: explicit config, or auto-detect from an API key
    std::string provider = emb.provider;
    if (provider.empty() && !emb.api_key.empty()) {
        provider = "openai";
        std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
    }
    if (provider.empty()) return nullptr;

    long timeout = static_cast<long>(emb.timeout_seconds);

    if (provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, emb.model, timeout);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model, timeout);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace engram
