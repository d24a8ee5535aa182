/**
 * @file embedding.cpp
 * @brief Hashing and remote embedding providers, provider factory.
 */

#include "embedding.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <thread>

#include <nlohmann/json.hpp>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "errors.hpp"
#include "logging.hpp"
#include "onnx_embedding.hpp"

namespace rfpindex {

namespace {

uint64_t fnv1a64(const std::string& s) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

} // namespace

//=============================================================================
// EmbeddingProvider
//=============================================================================

std::vector<float> EmbeddingProvider::embed_one(const std::string& text) {
    auto vectors = embed({text});
    if (vectors.size() != 1) {
        throw EmbeddingError("Provider returned " + std::to_string(vectors.size()) + " vectors for one text");
    }
    return std::move(vectors.front());
}

std::future<std::vector<std::vector<float>>> EmbeddingProvider::embed_async(std::vector<std::string> texts) {
    return std::async(std::launch::async, [this, texts = std::move(texts)]() { return embed(texts); });
}

//=============================================================================
// HashingEmbeddingProvider
//=============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension, std::string model_name)
    : dimension_(dimension)
    , model_name_(std::move(model_name))
{
    if (dimension_ == 0) {
        throw InitializationError("Hashing embedder needs a positive dimension");
    }
}

std::vector<std::string> HashingEmbeddingProvider::analyze(const std::string& text) {
    static const absl::flat_hash_set<std::string> stopwords = {
        "a", "an", "and", "are", "as", "at", "be", "but", "by",
        "for", "if", "in", "into", "is", "it", "no", "not", "of",
        "on", "or", "such", "that", "the", "their", "then", "there",
        "these", "they", "this", "to", "was", "will", "with"
    };

    std::vector<std::string> terms;
    std::string current;
    current.reserve(32);

    auto flush = [&]() {
        if (current.size() >= 2 && !stopwords.contains(current)) {
            terms.push_back(current);
        }
        current.clear();
    };

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current += static_cast<char>(std::tolower(uc));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

std::vector<float> HashingEmbeddingProvider::embed_text(const std::string& text) const {
    std::vector<float> vec(dimension_, 0.0f);
    auto terms = analyze(text);
    if (terms.empty()) {
        return vec;
    }

    absl::flat_hash_map<std::string, uint32_t> term_freqs;
    for (size_t i = 0; i < terms.size(); ++i) {
        term_freqs[terms[i]]++;
        if (i + 1 < terms.size()) {
            term_freqs[terms[i] + ' ' + terms[i + 1]]++;
        }
    }

    for (const auto& [term, tf] : term_freqs) {
        uint64_t h = fnv1a64(term);
        size_t bucket = static_cast<size_t>(h % dimension_);
        float sign = (h >> 63) ? -1.0f : 1.0f;
        // Pairs count half as much as single terms.
        float weight = (1.0f + std::log(static_cast<float>(tf))) *
                       (term.find(' ') == std::string::npos ? 1.0f : 0.5f);
        vec[bucket] += sign * weight;
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

std::vector<std::vector<float>> HashingEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out(texts.size());
    const int64_t n = static_cast<int64_t>(texts.size());

    #pragma omp parallel for if(n > 256)
    for (int64_t i = 0; i < n; ++i) {
        out[i] = embed_text(texts[i]);
    }
    return out;
}

//=============================================================================
// RemoteEmbeddingProvider
//=============================================================================

RemoteEmbeddingProvider::RemoteEmbeddingProvider(const IndexConfig& config, HttpTransport transport)
    : model_name_(config.embedding_model)
    , dimension_(0)
    , url_(config.embedding_url)
    , api_key_(config.api_key)
    , timeout_ms_(config.request_timeout_ms)
    , max_retries_(config.max_retries)
    , transport_(std::move(transport))
{
    if (api_key_.empty()) {
        throw InitializationError("No API key configured for embedding model " + model_name_);
    }
    if (!transport_) {
        throw InitializationError("No HTTP transport for embedding model " + model_name_);
    }
    EmbeddingModelInfo info = embedding_model_info(model_name_);
    if (info.provider != "remote") {
        throw InitializationError("Unknown remote embedding model " + model_name_);
    }
    dimension_ = info.dimension;

    while (!url_.empty() && url_.back() == '/') {
        url_.pop_back();
    }
    url_ += "/embeddings";
    RFPINDEX_LOG_INFO("Embedding", "Remote provider ready: model=", model_name_, " dim=", dimension_);
}

std::vector<std::vector<float>> RemoteEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (size_t begin = 0; begin < texts.size(); begin += kMaxTextsPerRequest) {
        size_t end = std::min(begin + kMaxTextsPerRequest, texts.size());
        auto batch = embed_batch(texts, begin, end);
        for (auto& v : batch) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

std::vector<std::vector<float>> RemoteEmbeddingProvider::embed_batch(const std::vector<std::string>& texts,
                                                                     size_t begin, size_t end) {
    nlohmann::json body = {
        {"model", model_name_},
        {"input", std::vector<std::string>(texts.begin() + begin, texts.begin() + end)},
    };
    const std::string payload = body.dump();
    const std::vector<std::string> headers = {"Authorization: Bearer " + api_key_};

    HttpResponse resp;
    std::string last_error;
    bool ok = false;
    for (size_t attempt = 0; attempt <= max_retries_; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
        }
        try {
            resp = transport_(url_, payload, headers, timeout_ms_);
        } catch (const std::exception& e) {
            last_error = e.what();
            RFPINDEX_LOG_WARN("Embedding", "Request failed (attempt ", attempt + 1, "): ", e.what());
            continue;
        }
        if (resp.status >= 200 && resp.status < 300) {
            ok = true;
            break;
        }
        last_error = "HTTP " + std::to_string(resp.status) + ": " + resp.body.substr(0, 200);
        if (resp.status != 429 && resp.status < 500) {
            break;
        }
        RFPINDEX_LOG_WARN("Embedding", "Retryable response (attempt ", attempt + 1, "): ", last_error);
    }
    if (!ok) {
        throw EmbeddingError("Embedding request failed: " + last_error);
    }

    const size_t expected = end - begin;
    std::vector<std::vector<float>> vectors(expected);
    try {
        auto j = nlohmann::json::parse(resp.body);
        const auto& data = j.at("data");
        if (!data.is_array() || data.size() != expected) {
            throw EmbeddingError("Embedding response has " + std::to_string(data.size()) + " items, expected " +
                                 std::to_string(expected));
        }
        for (size_t i = 0; i < data.size(); ++i) {
            size_t slot = data[i].contains("index") ? data[i]["index"].get<size_t>() : i;
            if (slot >= expected) {
                throw EmbeddingError("Embedding response index out of range");
            }
            vectors[slot] = data[i].at("embedding").get<std::vector<float>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw EmbeddingError(std::string("Malformed embedding response: ") + e.what());
    }

    for (const auto& v : vectors) {
        if (v.size() != dimension_) {
            throw EmbeddingError("Embedding width " + std::to_string(v.size()) + " differs from model width " +
                                 std::to_string(dimension_));
        }
    }
    return vectors;
}

//=============================================================================
// Factory
//=============================================================================

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const IndexConfig& config) {
    if (config.embedding_backend() == EmbeddingBackend::REMOTE) {
        return std::make_unique<RemoteEmbeddingProvider>(config);
    }
    if (is_hashing_model(config.embedding_model)) {
        return std::make_unique<HashingEmbeddingProvider>(embedding_model_info(config.embedding_model).dimension,
                                                          config.embedding_model);
    }
    return std::make_unique<OnnxEmbeddingProvider>(config);
}

std::unique_ptr<EmbeddingProvider> create_default_embedding_provider() {
    return std::make_unique<HashingEmbeddingProvider>(embedding_model_info(kFallbackEmbeddingModel).dimension,
                                                      kFallbackEmbeddingModel);
}

} // namespace rfpindex
