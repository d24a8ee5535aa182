/**
 * @file config.hpp
 * @brief Index engine configuration.
 *
 * IndexConfig is a plain value handed to the VectorStore constructor.
 * It can be built from defaults, from VECTOR_* environment variables,
 * from JSON, or from one of the named use-case presets.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rfpindex {

//=============================================================================
// Enumerations
//=============================================================================

enum class IndexAlgorithm : uint8_t {
    FLAT_IP = 0,   // exhaustive inner product
    FLAT_L2 = 1,   // exhaustive squared L2
    IVF_FLAT = 2,  // inverted file over k-means clusters
    HNSW = 3,      // hierarchical navigable small world graph
};

enum class Metric : uint8_t {
    COSINE = 0,
    EUCLIDEAN = 1,
};

/**
 * Embedding backends. The set is closed; the backend is derived from the
 * configured model name.
 */
enum class EmbeddingBackend : uint8_t {
    LOCAL = 0,   // in-process feature hashing
    REMOTE = 1,  // OpenAI-compatible HTTP API
};

const char* algorithm_to_string(IndexAlgorithm algorithm);

/**
 * Accepts the short names ("flat_ip", "hnsw", ...) and the legacy index
 * class names ("IndexFlatIP", "IndexIVFFlat", ...).
 * @throws std::invalid_argument for unknown names
 */
IndexAlgorithm string_to_algorithm(const std::string& name);

const char* metric_to_string(Metric metric);
Metric string_to_metric(const std::string& name);

const char* backend_to_string(EmbeddingBackend backend);

//=============================================================================
// Embedding model catalogue
//=============================================================================

struct EmbeddingModelInfo {
    std::string name;
    std::string provider;     // "local", "remote" or "unknown"
    size_t dimension = 384;
    size_t max_sequence_length = 256;
    std::string description;

    nlohmann::json to_json() const;
};

EmbeddingModelInfo embedding_model_info(const std::string& model_name);

std::vector<EmbeddingModelInfo> known_embedding_models();

/**
 * Models named "text-embedding*" are served by the remote API; everything
 * else runs locally.
 */
EmbeddingBackend backend_for_model(const std::string& model_name);

constexpr const char* kDefaultEmbeddingModel = "all-MiniLM-L6-v2";
constexpr size_t kDefaultDimension = 384;

// "hashing-bow-<N>" names the feature-hashing embedder with N dimensions.
constexpr const char* kHashingModelPrefix = "hashing-bow-";
constexpr const char* kFallbackEmbeddingModel = "hashing-bow-384";

bool is_hashing_model(const std::string& model_name);

//=============================================================================
// IndexConfig
//=============================================================================

struct ConfigValidation {
    std::vector<std::string> issues;    // make the config unusable
    std::vector<std::string> warnings;  // usable but suspicious

    bool valid() const { return issues.empty(); }
    nlohmann::json to_json() const;
};

struct IndexConfig {
    // Index
    size_t dimension = kDefaultDimension;
    IndexAlgorithm algorithm = IndexAlgorithm::FLAT_IP;
    Metric metric = Metric::COSINE;
    size_t nlist = 100;
    size_t nprobe = 10;
    size_t hnsw_m = 32;
    size_t ef_construction = 200;
    size_t ef_search = 64;

    // Embedding
    std::string embedding_model = kDefaultEmbeddingModel;
    std::string embedding_url = "https://api.openai.com/v1";
    std::string api_key;
    long request_timeout_ms = 30000;
    size_t batch_size = 32;
    size_t max_retries = 3;
    std::string model_dir = "data/models";  // {model_dir}/{embedding_model}/model.onnx

    // Chunking and search
    size_t chunk_size = 1000;
    size_t chunk_overlap = 100;
    size_t over_fetch_factor = 2;

    // Persistence
    bool store_on_disk = true;
    std::string index_path = "data/embeddings/vector_index.bin";
    std::string metadata_path = "data/embeddings/metadata.json";

    std::string log_level = "INFO";

    EmbeddingBackend embedding_backend() const { return backend_for_model(embedding_model); }

    /**
     * True when vectors are compared by inner product and must be unit
     * length before they enter the index.
     */
    bool uses_inner_product() const;

    ConfigValidation validate() const;

    nlohmann::json to_json() const;

    /**
     * Missing keys keep their defaults.
     * @throws std::invalid_argument on unknown algorithm or metric names
     */
    static IndexConfig from_json(const nlohmann::json& j);

    /**
     * Defaults overridden by VECTOR_* variables and OPENAI_API_KEY.
     * Malformed numbers are logged and ignored.
     */
    static IndexConfig from_env();
};

/**
 * Preset for a named use case: general, high_quality, large_scale, openai,
 * multilingual, qa_optimized.
 * @throws std::invalid_argument for unknown use cases
 */
IndexConfig recommended_config(const std::string& use_case);

std::vector<std::string> recommended_use_cases();

/**
 * "foo/index.bin" -> "foo/index_metadata.json".
 */
std::string metadata_path_for(const std::string& index_path);

} // namespace rfpindex
