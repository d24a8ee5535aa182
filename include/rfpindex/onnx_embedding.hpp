/**
 * @file onnx_embedding.hpp
 * @brief Sentence-transformer models run in-process through ONNX Runtime.
 *
 * A model named M is read from {model_dir}/M/model.onnx with its WordPiece
 * vocabulary in {model_dir}/M/vocab.txt. Token embeddings are mean pooled
 * over the attention mask and L2 normalized.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "embedding.hpp"

namespace rfpindex {

/**
 * BERT-style tokenizer: lowercases ASCII, splits on whitespace and
 * punctuation, then applies greedy longest-match WordPiece.
 */
class WordPieceTokenizer {
public:
    /**
     * vocab[i] is the token with id i. Special tokens are looked up as
     * [CLS]/[SEP]/[PAD]/[UNK], or <s>/</s>/<pad>/<unk> for RoBERTa-style
     * vocabularies.
     * @throws InitializationError if a start, end or unknown token is missing
     */
    explicit WordPieceTokenizer(const std::vector<std::string>& vocab);

    /**
     * One token per line.
     * @throws InitializationError if the file cannot be read
     */
    static WordPieceTokenizer from_vocab_file(const std::string& path);

    std::vector<std::string> tokenize(const std::string& text) const;

    /**
     * [CLS] pieces... [SEP], truncated to max_length ids. No padding.
     * @throws std::invalid_argument if max_length < 2
     */
    std::vector<int64_t> encode(const std::string& text, size_t max_length) const;

    int64_t cls_id() const { return cls_id_; }
    int64_t sep_id() const { return sep_id_; }
    int64_t pad_id() const { return pad_id_; }
    int64_t unk_id() const { return unk_id_; }
    size_t vocab_size() const { return vocab_.size(); }

private:
    static constexpr size_t kMaxCharsPerWord = 100;

    std::vector<std::string> wordpiece(const std::string& word) const;
    const std::string* special(const char* bert, const char* roberta) const;

    absl::flat_hash_map<std::string, int64_t> vocab_;
    std::string unk_token_;
    int64_t cls_id_ = 0;
    int64_t sep_id_ = 0;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = 0;
};

class OnnxEmbeddingProvider : public EmbeddingProvider {
public:
    /**
     * Loads config.embedding_model from config.model_dir. The output width
     * is the catalogue width, or config.dimension for models the catalogue
     * does not list; the model's hidden size must agree with it.
     * @throws InitializationError if the files are missing or the runtime
     *         rejects the model
     */
    explicit OnnxEmbeddingProvider(const IndexConfig& config);
    ~OnnxEmbeddingProvider() override;

    OnnxEmbeddingProvider(const OnnxEmbeddingProvider&) = delete;
    OnnxEmbeddingProvider& operator=(const OnnxEmbeddingProvider&) = delete;

    /**
     * Runs batch_size texts per inference call, each padded to the longest
     * text in its batch.
     */
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

    size_t dimension() const override { return dimension_; }
    const std::string& model_name() const override { return model_name_; }
    EmbeddingBackend backend() const override { return EmbeddingBackend::LOCAL; }

    static std::string model_path(const IndexConfig& config);
    static std::string vocab_path(const IndexConfig& config);

private:
    struct Impl;

    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts, size_t begin, size_t end);

    std::string model_name_;
    size_t dimension_;
    size_t max_seq_length_;
    size_t batch_size_;
    std::unique_ptr<WordPieceTokenizer> tokenizer_;
    std::unique_ptr<Impl> impl_;
};

} // namespace rfpindex
