/**
 * @file config.cpp
 * @brief IndexConfig parsing, validation and presets.
 */

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "logging.hpp"

namespace rfpindex {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::vector<EmbeddingModelInfo>& model_table() {
    static const std::vector<EmbeddingModelInfo> table = {
        {"all-MiniLM-L6-v2", "local", 384, 256,
         "Lightweight, fast model good for general purpose"},
        {"all-mpnet-base-v2", "local", 768, 384,
         "Higher quality model with better semantic understanding"},
        {"multi-qa-MiniLM-L6-cos-v1", "local", 384, 512,
         "Optimized for question-answering and retrieval"},
        {"paraphrase-multilingual-MiniLM-L12-v2", "local", 384, 128,
         "Multilingual model supporting 50+ languages"},
        {"hashing-bow-384", "local", 384, 512,
         "Feature-hashing bag-of-words fallback; needs no model files"},
        {"text-embedding-ada-002", "remote", 1536, 8191,
         "OpenAI's general-purpose embedding model"},
        {"text-embedding-3-small", "remote", 1536, 8191,
         "OpenAI's newer, improved small model"},
        {"text-embedding-3-large", "remote", 3072, 8191,
         "OpenAI's most capable embedding model"},
    };
    return table;
}

// Reads an unsigned integer variable; malformed or negative values keep the default.
void read_env_size(const char* name, size_t& target) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    try {
        long long value = std::stoll(raw);
        if (value < 0) {
            throw std::out_of_range("negative");
        }
        target = static_cast<size_t>(value);
    } catch (const std::exception& e) {
        RFPINDEX_LOG_WARN("Config", "Ignoring invalid ", name, "='", raw, "': ", e.what());
    }
}

bool parse_bool(const std::string& raw) {
    std::string v = to_lower(raw);
    return v == "true" || v == "1" || v == "yes";
}

} // namespace

//=============================================================================
// Enum conversions
//=============================================================================

const char* algorithm_to_string(IndexAlgorithm algorithm) {
    switch (algorithm) {
        case IndexAlgorithm::FLAT_IP:  return "flat_ip";
        case IndexAlgorithm::FLAT_L2:  return "flat_l2";
        case IndexAlgorithm::IVF_FLAT: return "ivf_flat";
        case IndexAlgorithm::HNSW:     return "hnsw";
        default: return "unknown";
    }
}

IndexAlgorithm string_to_algorithm(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "flat_ip" || n == "indexflatip") return IndexAlgorithm::FLAT_IP;
    if (n == "flat_l2" || n == "indexflatl2") return IndexAlgorithm::FLAT_L2;
    if (n == "ivf_flat" || n == "indexivfflat") return IndexAlgorithm::IVF_FLAT;
    if (n == "hnsw" || n == "indexhnsw") return IndexAlgorithm::HNSW;
    throw std::invalid_argument("Unknown index algorithm: " + name);
}

const char* metric_to_string(Metric metric) {
    switch (metric) {
        case Metric::COSINE:    return "cosine";
        case Metric::EUCLIDEAN: return "euclidean";
        default: return "unknown";
    }
}

Metric string_to_metric(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "cosine" || n == "ip" || n == "inner_product") return Metric::COSINE;
    if (n == "euclidean" || n == "l2") return Metric::EUCLIDEAN;
    throw std::invalid_argument("Unknown metric: " + name);
}

const char* backend_to_string(EmbeddingBackend backend) {
    return backend == EmbeddingBackend::REMOTE ? "remote" : "local";
}

//=============================================================================
// Model catalogue
//=============================================================================

nlohmann::json EmbeddingModelInfo::to_json() const {
    return {
        {"name", name},
        {"provider", provider},
        {"dimension", dimension},
        {"max_seq_length", max_sequence_length},
        {"description", description},
    };
}

EmbeddingModelInfo embedding_model_info(const std::string& model_name) {
    for (const auto& info : model_table()) {
        if (info.name == model_name) {
            return info;
        }
    }
    if (is_hashing_model(model_name)) {
        EmbeddingModelInfo hashing;
        hashing.name = model_name;
        hashing.provider = "local";
        hashing.dimension = std::stoul(model_name.substr(std::string(kHashingModelPrefix).size()));
        hashing.max_sequence_length = 512;
        hashing.description = "Feature-hashing bag-of-words embedder";
        return hashing;
    }
    EmbeddingModelInfo unknown;
    unknown.name = model_name;
    unknown.provider = "unknown";
    unknown.dimension = kDefaultDimension;
    unknown.max_sequence_length = 512;
    unknown.description = "Unknown model";
    return unknown;
}

std::vector<EmbeddingModelInfo> known_embedding_models() {
    return model_table();
}

bool is_hashing_model(const std::string& model_name) {
    const std::string prefix = kHashingModelPrefix;
    if (model_name.size() <= prefix.size() || model_name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    const std::string width = model_name.substr(prefix.size());
    if (width.size() > 5 || !std::all_of(width.begin(), width.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    size_t dim = std::stoul(width);
    return dim >= 1 && dim <= 10000;
}

EmbeddingBackend backend_for_model(const std::string& model_name) {
    return model_name.rfind("text-embedding", 0) == 0 ? EmbeddingBackend::REMOTE : EmbeddingBackend::LOCAL;
}

//=============================================================================
// IndexConfig
//=============================================================================

bool IndexConfig::uses_inner_product() const {
    switch (algorithm) {
        case IndexAlgorithm::FLAT_IP:
            return true;
        case IndexAlgorithm::FLAT_L2:
            return false;
        default:
            return metric == Metric::COSINE;
    }
}

nlohmann::json ConfigValidation::to_json() const {
    return {{"valid", valid()}, {"issues", issues}, {"warnings", warnings}};
}

ConfigValidation IndexConfig::validate() const {
    ConfigValidation result;

    if (dimension < 1 || dimension > 10000) {
        result.issues.push_back("Invalid dimension: " + std::to_string(dimension) + " (expected 1..10000)");
    }
    if (chunk_size == 0) {
        result.issues.push_back("Chunk size must be positive");
    } else if (chunk_overlap >= chunk_size) {
        result.issues.push_back("Chunk overlap (" + std::to_string(chunk_overlap) +
                                ") must be smaller than chunk size (" + std::to_string(chunk_size) + ")");
    }
    if (algorithm == IndexAlgorithm::IVF_FLAT && nlist == 0) {
        result.issues.push_back("nlist must be positive for ivf_flat");
    }
    if (algorithm == IndexAlgorithm::HNSW && hnsw_m < 2) {
        result.issues.push_back("hnsw_m must be at least 2");
    }
    if (over_fetch_factor == 0) {
        result.issues.push_back("over_fetch_factor must be at least 1");
    }
    if (store_on_disk && (index_path.empty() || metadata_path.empty())) {
        result.issues.push_back("store_on_disk requires index_path and metadata_path");
    }
    if (embedding_backend() == EmbeddingBackend::REMOTE && api_key.empty()) {
        result.issues.push_back("Model " + embedding_model + " needs an API key (OPENAI_API_KEY)");
    }

    if (batch_size < 1 || batch_size > 1000) {
        result.warnings.push_back("Batch size " + std::to_string(batch_size) + " is outside 1..1000");
    }
    if (algorithm == IndexAlgorithm::IVF_FLAT && nprobe > nlist) {
        result.warnings.push_back("nprobe is larger than nlist; every list will be probed");
    }
    EmbeddingModelInfo info = embedding_model_info(embedding_model);
    if (info.provider == "unknown") {
        result.warnings.push_back("Unknown embedding model: " + embedding_model);
    } else if (info.dimension != dimension) {
        result.warnings.push_back("Dimension " + std::to_string(dimension) + " differs from " + embedding_model +
                                  " output width " + std::to_string(info.dimension) +
                                  "; it will be replaced at startup");
    }
    return result;
}

nlohmann::json IndexConfig::to_json() const {
    return {
        {"dimension", dimension},
        {"index_type", algorithm_to_string(algorithm)},
        {"metric", metric_to_string(metric)},
        {"nlist", nlist},
        {"nprobe", nprobe},
        {"hnsw_m", hnsw_m},
        {"ef_construction", ef_construction},
        {"ef_search", ef_search},
        {"embedding_model", embedding_model},
        {"embedding_backend", backend_to_string(embedding_backend())},
        {"embedding_url", embedding_url},
        {"request_timeout_ms", request_timeout_ms},
        {"batch_size", batch_size},
        {"max_retries", max_retries},
        {"model_dir", model_dir},
        {"chunk_size", chunk_size},
        {"chunk_overlap", chunk_overlap},
        {"over_fetch_factor", over_fetch_factor},
        {"store_on_disk", store_on_disk},
        {"index_path", index_path},
        {"metadata_path", metadata_path},
        {"log_level", log_level},
    };
}

IndexConfig IndexConfig::from_json(const nlohmann::json& j) {
    IndexConfig config;
    if (!j.is_object()) {
        return config;
    }
    config.dimension = j.value("dimension", config.dimension);
    if (j.contains("index_type")) {
        config.algorithm = string_to_algorithm(j["index_type"].get<std::string>());
    }
    if (j.contains("metric")) {
        config.metric = string_to_metric(j["metric"].get<std::string>());
    }
    config.nlist = j.value("nlist", config.nlist);
    config.nprobe = j.value("nprobe", config.nprobe);
    config.hnsw_m = j.value("hnsw_m", config.hnsw_m);
    config.ef_construction = j.value("ef_construction", config.ef_construction);
    config.ef_search = j.value("ef_search", config.ef_search);
    config.embedding_model = j.value("embedding_model", config.embedding_model);
    config.embedding_url = j.value("embedding_url", config.embedding_url);
    config.api_key = j.value("api_key", config.api_key);
    config.request_timeout_ms = j.value("request_timeout_ms", config.request_timeout_ms);
    config.batch_size = j.value("batch_size", config.batch_size);
    config.max_retries = j.value("max_retries", config.max_retries);
    config.model_dir = j.value("model_dir", config.model_dir);
    config.chunk_size = j.value("chunk_size", config.chunk_size);
    config.chunk_overlap = j.value("chunk_overlap", config.chunk_overlap);
    config.over_fetch_factor = j.value("over_fetch_factor", config.over_fetch_factor);
    config.store_on_disk = j.value("store_on_disk", config.store_on_disk);
    config.index_path = j.value("index_path", config.index_path);
    config.metadata_path = j.value("metadata_path", config.metadata_path);
    config.log_level = j.value("log_level", config.log_level);
    return config;
}

IndexConfig IndexConfig::from_env() {
    IndexConfig config;

    if (const char* v = std::getenv("VECTOR_EMBEDDING_MODEL")) {
        config.embedding_model = v;
        config.dimension = embedding_model_info(config.embedding_model).dimension;
    }
    if (const char* v = std::getenv("VECTOR_INDEX_TYPE")) {
        try {
            config.algorithm = string_to_algorithm(v);
        } catch (const std::invalid_argument& e) {
            RFPINDEX_LOG_WARN("Config", e.what(), ", keeping ", algorithm_to_string(config.algorithm));
        }
    }
    if (const char* v = std::getenv("VECTOR_METRIC")) {
        try {
            config.metric = string_to_metric(v);
        } catch (const std::invalid_argument& e) {
            RFPINDEX_LOG_WARN("Config", e.what(), ", keeping ", metric_to_string(config.metric));
        }
    }

    read_env_size("VECTOR_BATCH_SIZE", config.batch_size);
    read_env_size("VECTOR_CHUNK_SIZE", config.chunk_size);
    read_env_size("VECTOR_CHUNK_OVERLAP", config.chunk_overlap);
    read_env_size("VECTOR_NLIST", config.nlist);
    read_env_size("VECTOR_NPROBE", config.nprobe);
    read_env_size("VECTOR_HNSW_M", config.hnsw_m);
    read_env_size("VECTOR_EF_SEARCH", config.ef_search);
    read_env_size("VECTOR_OVER_FETCH", config.over_fetch_factor);

    if (const char* v = std::getenv("VECTOR_STORE_ON_DISK")) {
        config.store_on_disk = parse_bool(v);
    }
    if (const char* v = std::getenv("VECTOR_INDEX_PATH")) {
        config.index_path = v;
        config.metadata_path = metadata_path_for(config.index_path);
    }
    if (const char* v = std::getenv("VECTOR_MODEL_DIR")) {
        config.model_dir = v;
    }
    if (const char* v = std::getenv("VECTOR_EMBEDDING_URL")) {
        config.embedding_url = v;
    }
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        config.api_key = v;
    }
    if (const char* v = std::getenv("RFPINDEX_LOG_LEVEL")) {
        config.log_level = v;
    }
    return config;
}

//=============================================================================
// Presets
//=============================================================================

std::vector<std::string> recommended_use_cases() {
    return {"general", "high_quality", "large_scale", "openai", "multilingual", "qa_optimized"};
}

IndexConfig recommended_config(const std::string& use_case) {
    IndexConfig config;
    auto apply = [&config](const std::string& model, IndexAlgorithm algorithm, size_t batch, size_t chunk,
                           size_t overlap) {
        config.embedding_model = model;
        config.dimension = embedding_model_info(model).dimension;
        config.algorithm = algorithm;
        config.batch_size = batch;
        config.chunk_size = chunk;
        config.chunk_overlap = overlap;
    };

    if (use_case == "general") {
        apply("all-MiniLM-L6-v2", IndexAlgorithm::FLAT_IP, 32, 1000, 100);
    } else if (use_case == "high_quality") {
        apply("all-mpnet-base-v2", IndexAlgorithm::FLAT_IP, 16, 1200, 120);
    } else if (use_case == "large_scale") {
        apply("all-MiniLM-L6-v2", IndexAlgorithm::IVF_FLAT, 64, 800, 80);
        config.nlist = 500;
        config.nprobe = 20;
    } else if (use_case == "openai") {
        apply("text-embedding-3-small", IndexAlgorithm::FLAT_IP, 100, 1500, 150);
    } else if (use_case == "multilingual") {
        apply("paraphrase-multilingual-MiniLM-L12-v2", IndexAlgorithm::FLAT_IP, 24, 1000, 100);
    } else if (use_case == "qa_optimized") {
        apply("multi-qa-MiniLM-L6-cos-v1", IndexAlgorithm::FLAT_IP, 32, 600, 60);
    } else {
        throw std::invalid_argument("Unknown use case: " + use_case);
    }
    return config;
}

std::string metadata_path_for(const std::string& index_path) {
    size_t slash = index_path.find_last_of('/');
    size_t dot = index_path.find_last_of('.');
    std::string stem = (dot != std::string::npos && (slash == std::string::npos || dot > slash))
                           ? index_path.substr(0, dot)
                           : index_path;
    return stem + "_metadata.json";
}

} // namespace rfpindex
