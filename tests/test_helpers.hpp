#pragma once

#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

#include "config.hpp"
#include "embedding.hpp"
#include "errors.hpp"

namespace rfpindex::testing {

/**
 * Scratch directory removed when the test ends.
 */
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "rfpindex";
        for (char& c : name) {
            if (c == '/') c = '_';
        }
        path_ = std::filesystem::temp_directory_path() /
                ("rfpindex_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/**
 * Deterministic provider for store tests. Every component is at least 1,
 * so any two vectors have positive cosine similarity.
 */
class StubProvider : public EmbeddingProvider {
public:
    explicit StubProvider(size_t dim = 8, std::string name = "stub-model")
        : dim_(dim), name_(std::move(name)) {}

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
        calls.fetch_add(1);
        texts_embedded.fetch_add(texts.size());
        if (fail.load()) {
            throw EmbeddingError("stub provider failure");
        }
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            std::vector<float> v(dim_, 1.0f);
            for (unsigned char c : text) {
                v[c % dim_] += 1.0f;
            }
            out.push_back(std::move(v));
        }
        return out;
    }

    size_t dimension() const override { return dim_; }
    const std::string& model_name() const override { return name_; }
    EmbeddingBackend backend() const override { return EmbeddingBackend::LOCAL; }

    std::atomic<bool> fail{false};
    std::atomic<size_t> calls{0};
    std::atomic<size_t> texts_embedded{0};

private:
    size_t dim_;
    std::string name_;
};

inline IndexConfig store_config(const TempDir& dir, IndexAlgorithm algorithm = IndexAlgorithm::FLAT_IP,
                                size_t dimension = 8) {
    IndexConfig config;
    config.dimension = dimension;
    config.algorithm = algorithm;
    config.embedding_model = "stub-model";
    config.nlist = 4;
    config.nprobe = 4;
    config.hnsw_m = 8;
    config.ef_construction = 64;
    config.ef_search = 64;
    config.index_path = dir.file("index.bin");
    config.metadata_path = dir.file("index_metadata.json");
    return config;
}

inline std::vector<float> random_vector(std::mt19937& rng, size_t dim) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> v(dim);
    for (auto& x : v) {
        x = dist(rng);
    }
    return v;
}

} // namespace rfpindex::testing
