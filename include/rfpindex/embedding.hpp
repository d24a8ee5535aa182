/**
 * @file embedding.hpp
 * @brief Embedding providers: text -> fixed-width float vectors.
 *
 * Three variants sit behind EmbeddingProvider and are chosen by
 * configuration:
 * - OnnxEmbeddingProvider (onnx_embedding.hpp) runs the catalogue's local
 *   sentence-transformer models.
 * - HashingEmbeddingProvider needs no model files; it serves the
 *   "hashing-bow-<N>" names and is the fallback.
 * - RemoteEmbeddingProvider calls an OpenAI-compatible /embeddings API.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "http_client.hpp"

namespace rfpindex {

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * One vector of dimension() floats per input text, in input order.
     * @throws EmbeddingError if the backend fails
     */
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;

    virtual size_t dimension() const = 0;

    virtual const std::string& model_name() const = 0;

    virtual EmbeddingBackend backend() const = 0;

    std::vector<float> embed_one(const std::string& text);

    /**
     * Run embed() on a separate thread. The provider must outlive the
     * returned future.
     */
    std::future<std::vector<std::vector<float>>> embed_async(std::vector<std::string> texts);
};

//=============================================================================
// Local provider
//=============================================================================

/**
 * Feature-hashing bag-of-words embedder.
 *
 * Terms are lowercased alphanumeric runs of at least two characters with
 * English stopwords removed. Each term and each adjacent term pair is
 * hashed (FNV-1a) into one of dimension() buckets with a hash-derived
 * sign and a sublinear term-frequency weight; the result is L2
 * normalized. Texts without terms map to the zero vector.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    /**
     * @throws InitializationError if dimension is 0
     */
    HashingEmbeddingProvider(size_t dimension, std::string model_name);

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return dimension_; }
    const std::string& model_name() const override { return model_name_; }
    EmbeddingBackend backend() const override { return EmbeddingBackend::LOCAL; }

    std::vector<float> embed_text(const std::string& text) const;

    /**
     * Terms fed to the hasher.
     */
    static std::vector<std::string> analyze(const std::string& text);

private:
    size_t dimension_;
    std::string model_name_;
};

//=============================================================================
// Remote provider
//=============================================================================

/**
 * Transport used by RemoteEmbeddingProvider; replaceable in tests.
 */
using HttpTransport = std::function<HttpResponse(const std::string& url, const std::string& body,
                                                 const std::vector<std::string>& headers, long timeout_ms)>;

class RemoteEmbeddingProvider : public EmbeddingProvider {
public:
    static constexpr size_t kMaxTextsPerRequest = 100;

    /**
     * @throws InitializationError without an API key or for a model whose
     *         output width is unknown
     */
    explicit RemoteEmbeddingProvider(const IndexConfig& config, HttpTransport transport = http_post_json);

    /**
     * Sends at most kMaxTextsPerRequest texts per request. Transport
     * failures, 429 and 5xx answers are retried up to max_retries times.
     */
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return dimension_; }
    const std::string& model_name() const override { return model_name_; }
    EmbeddingBackend backend() const override { return EmbeddingBackend::REMOTE; }

private:
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts, size_t begin, size_t end);

    std::string model_name_;
    size_t dimension_;
    std::string url_;
    std::string api_key_;
    long timeout_ms_;
    size_t max_retries_;
    HttpTransport transport_;
};

//=============================================================================
// Factory
//=============================================================================

/**
 * Provider for config.embedding_model: remote for "text-embedding*"
 * models, hashing for "hashing-bow-<N>", ONNX Runtime otherwise.
 * @throws InitializationError if the provider cannot be created
 */
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const IndexConfig& config);

/**
 * The known-good fallback: kFallbackEmbeddingModel, 384 dimensions.
 */
std::unique_ptr<EmbeddingProvider> create_default_embedding_provider();

} // namespace rfpindex
