/**
 * @file onnx_embedding.cpp
 * @brief WordPiece tokenizer and ONNX Runtime embedding provider.
 */

#include "onnx_embedding.hpp"

#include <onnxruntime_c_api.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "errors.hpp"
#include "logging.hpp"

namespace rfpindex {

namespace {

bool is_ascii_punctuation(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

const OrtApi* ort_api() {
    static const OrtApi* api = []() -> const OrtApi* {
        const OrtApiBase* base = OrtGetApiBase();
        return base ? base->GetApi(ORT_API_VERSION) : nullptr;
    }();
    return api;
}

// Converts a failed OrtStatus into ErrorT and releases it.
template <typename ErrorT>
void check(OrtStatus* status, const std::string& what) {
    if (status == nullptr) {
        return;
    }
    std::string message = what + ": " + ort_api()->GetErrorMessage(status);
    ort_api()->ReleaseStatus(status);
    throw ErrorT(message);
}

struct EnvDeleter {
    void operator()(OrtEnv* p) const { ort_api()->ReleaseEnv(p); }
};
struct SessionDeleter {
    void operator()(OrtSession* p) const { ort_api()->ReleaseSession(p); }
};
struct SessionOptionsDeleter {
    void operator()(OrtSessionOptions* p) const { ort_api()->ReleaseSessionOptions(p); }
};
struct MemoryInfoDeleter {
    void operator()(OrtMemoryInfo* p) const { ort_api()->ReleaseMemoryInfo(p); }
};
struct ValueDeleter {
    void operator()(OrtValue* p) const { ort_api()->ReleaseValue(p); }
};
struct ShapeInfoDeleter {
    void operator()(OrtTensorTypeAndShapeInfo* p) const { ort_api()->ReleaseTensorTypeAndShapeInfo(p); }
};
struct TypeInfoDeleter {
    void operator()(OrtTypeInfo* p) const { ort_api()->ReleaseTypeInfo(p); }
};

using ValuePtr = std::unique_ptr<OrtValue, ValueDeleter>;

ValuePtr int64_tensor(const OrtMemoryInfo* memory_info, std::vector<int64_t>& data, const int64_t* shape) {
    OrtValue* raw = nullptr;
    check<EmbeddingError>(ort_api()->CreateTensorWithDataAsOrtValue(
                              memory_info, data.data(), data.size() * sizeof(int64_t), shape, 2,
                              ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64, &raw),
                          "Cannot create input tensor");
    return ValuePtr(raw);
}

void normalize(std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm > 1e-16) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) {
            x *= inv;
        }
    }
}

} // namespace

//=============================================================================
// WordPieceTokenizer
//=============================================================================

WordPieceTokenizer::WordPieceTokenizer(const std::vector<std::string>& vocab) {
    vocab_.reserve(vocab.size());
    for (size_t i = 0; i < vocab.size(); ++i) {
        vocab_.try_emplace(vocab[i], static_cast<int64_t>(i));
    }

    const std::string* cls = special("[CLS]", "<s>");
    const std::string* sep = special("[SEP]", "</s>");
    const std::string* unk = special("[UNK]", "<unk>");
    if (!cls || !sep || !unk) {
        throw InitializationError("Vocabulary lacks a start, end or unknown token");
    }
    cls_id_ = vocab_.at(*cls);
    sep_id_ = vocab_.at(*sep);
    unk_id_ = vocab_.at(*unk);
    unk_token_ = *unk;
    if (const std::string* pad = special("[PAD]", "<pad>")) {
        pad_id_ = vocab_.at(*pad);
    }
}

WordPieceTokenizer WordPieceTokenizer::from_vocab_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InitializationError("Cannot read vocabulary " + path);
    }
    std::vector<std::string> vocab;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        vocab.push_back(line);
    }
    if (vocab.empty()) {
        throw InitializationError("Empty vocabulary " + path);
    }
    return WordPieceTokenizer(vocab);
}

const std::string* WordPieceTokenizer::special(const char* bert, const char* roberta) const {
    for (const char* name : {bert, roberta}) {
        auto it = vocab_.find(name);
        if (it != vocab_.end()) {
            return &it->first;
        }
    }
    return nullptr;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& word) const {
    if (word.size() > kMaxCharsPerWord) {
        return {unk_token_};
    }
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        std::string match;
        while (start < end) {
            std::string candidate = word.substr(start, end - start);
            if (start > 0) {
                candidate.insert(0, "##");
            }
            if (vocab_.contains(candidate)) {
                match = std::move(candidate);
                break;
            }
            --end;
        }
        if (match.empty()) {
            return {unk_token_};
        }
        pieces.push_back(std::move(match));
        start = end;
    }
    return pieces;
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string word;

    auto flush = [&]() {
        if (word.empty()) {
            return;
        }
        for (auto& piece : wordpiece(word)) {
            tokens.push_back(std::move(piece));
        }
        word.clear();
    };

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isspace(c)) {
            flush();
        } else if (c < 0x80 && is_ascii_punctuation(c)) {
            flush();
            word.push_back(ch);
            flush();
        } else if (c < 0x80) {
            word.push_back(static_cast<char>(std::tolower(c)));
        } else {
            word.push_back(ch);
        }
    }
    flush();
    return tokens;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_length) const {
    if (max_length < 2) {
        throw std::invalid_argument("max_length must leave room for the start and end tokens");
    }
    std::vector<int64_t> ids;
    ids.push_back(cls_id_);
    for (const auto& piece : tokenize(text)) {
        if (ids.size() >= max_length - 1) {
            break;
        }
        auto it = vocab_.find(piece);
        ids.push_back(it == vocab_.end() ? unk_id_ : it->second);
    }
    ids.push_back(sep_id_);
    return ids;
}

//=============================================================================
// OnnxEmbeddingProvider
//=============================================================================

struct OnnxEmbeddingProvider::Impl {
    std::unique_ptr<OrtEnv, EnvDeleter> env;
    std::unique_ptr<OrtSession, SessionDeleter> session;
    std::unique_ptr<OrtMemoryInfo, MemoryInfoDeleter> memory_info;
    // Model inputs in session order; each is input_ids, attention_mask or token_type_ids.
    std::vector<std::string> input_names;
    std::string output_name;
};

std::string OnnxEmbeddingProvider::model_path(const IndexConfig& config) {
    return (std::filesystem::path(config.model_dir) / config.embedding_model / "model.onnx").string();
}

std::string OnnxEmbeddingProvider::vocab_path(const IndexConfig& config) {
    return (std::filesystem::path(config.model_dir) / config.embedding_model / "vocab.txt").string();
}

OnnxEmbeddingProvider::OnnxEmbeddingProvider(const IndexConfig& config)
    : model_name_(config.embedding_model)
    , dimension_(config.dimension)
    , max_seq_length_(512)
    , batch_size_(std::max<size_t>(config.batch_size, 1))
    , impl_(std::make_unique<Impl>())
{
    EmbeddingModelInfo info = embedding_model_info(model_name_);
    if (info.provider == "local") {
        dimension_ = info.dimension;
        max_seq_length_ = std::min<size_t>(info.max_sequence_length, 512);
    }
    if (dimension_ == 0) {
        throw InitializationError("No output width known for embedding model " + model_name_);
    }

    const std::string model_file = model_path(config);
    if (!std::filesystem::exists(model_file)) {
        throw InitializationError("Model file not found: " + model_file);
    }
    tokenizer_ = std::make_unique<WordPieceTokenizer>(WordPieceTokenizer::from_vocab_file(vocab_path(config)));

    const OrtApi* api = ort_api();
    if (!api) {
        throw InitializationError("ONNX Runtime API version " + std::to_string(ORT_API_VERSION) +
                                  " is not available");
    }

    OrtEnv* env = nullptr;
    check<InitializationError>(api->CreateEnv(ORT_LOGGING_LEVEL_WARNING, "rfpindex", &env),
                               "Cannot create ONNX Runtime environment");
    impl_->env.reset(env);

    OrtSessionOptions* raw_options = nullptr;
    check<InitializationError>(api->CreateSessionOptions(&raw_options), "Cannot create session options");
    std::unique_ptr<OrtSessionOptions, SessionOptionsDeleter> options(raw_options);
    check<InitializationError>(api->SetSessionGraphOptimizationLevel(options.get(), ORT_ENABLE_ALL),
                               "Cannot set graph optimization level");

    OrtSession* session = nullptr;
    check<InitializationError>(api->CreateSession(impl_->env.get(), model_file.c_str(), options.get(), &session),
                               "Cannot load model " + model_file);
    impl_->session.reset(session);

    OrtAllocator* allocator = nullptr;
    check<InitializationError>(api->GetAllocatorWithDefaultOptions(&allocator), "No default allocator");

    size_t input_count = 0;
    check<InitializationError>(api->SessionGetInputCount(session, &input_count), "Cannot count model inputs");
    bool has_ids = false;
    bool has_mask = false;
    for (size_t i = 0; i < input_count; ++i) {
        char* raw_name = nullptr;
        check<InitializationError>(api->SessionGetInputName(session, i, allocator, &raw_name),
                                   "Cannot read model input name");
        std::string name(raw_name);
        check<InitializationError>(api->AllocatorFree(allocator, raw_name), "Cannot free model input name");
        if (name == "input_ids") {
            has_ids = true;
        } else if (name == "attention_mask") {
            has_mask = true;
        } else if (name != "token_type_ids") {
            throw InitializationError("Model " + model_name_ + " has unsupported input " + name);
        }
        impl_->input_names.push_back(std::move(name));
    }
    if (!has_ids || !has_mask) {
        throw InitializationError("Model " + model_name_ + " needs input_ids and attention_mask inputs");
    }

    size_t output_count = 0;
    check<InitializationError>(api->SessionGetOutputCount(session, &output_count), "Cannot count model outputs");
    if (output_count == 0) {
        throw InitializationError("Model " + model_name_ + " has no outputs");
    }
    size_t output_index = 0;
    for (size_t i = 0; i < output_count; ++i) {
        char* raw_name = nullptr;
        check<InitializationError>(api->SessionGetOutputName(session, i, allocator, &raw_name),
                                   "Cannot read model output name");
        std::string name(raw_name);
        check<InitializationError>(api->AllocatorFree(allocator, raw_name), "Cannot free model output name");
        if (i == 0 || name == "last_hidden_state" || name == "token_embeddings") {
            impl_->output_name = name;
            output_index = i;
        }
    }

    // Fixed hidden sizes must match the width the index is built for.
    OrtTypeInfo* raw_type = nullptr;
    check<InitializationError>(api->SessionGetOutputTypeInfo(session, output_index, &raw_type),
                               "Cannot read model output type");
    std::unique_ptr<OrtTypeInfo, TypeInfoDeleter> type_info(raw_type);
    const OrtTensorTypeAndShapeInfo* tensor_info = nullptr;
    check<InitializationError>(api->CastTypeInfoToTensorInfo(type_info.get(), &tensor_info),
                               "Model output is not a tensor");
    if (tensor_info) {
        size_t rank = 0;
        check<InitializationError>(api->GetDimensionsCount(tensor_info, &rank), "Cannot read output rank");
        if (rank > 0) {
            std::vector<int64_t> dims(rank);
            check<InitializationError>(api->GetDimensions(tensor_info, dims.data(), rank),
                                       "Cannot read output shape");
            if (dims.back() > 0 && static_cast<size_t>(dims.back()) != dimension_) {
                throw InitializationError("Model " + model_name_ + " produces " + std::to_string(dims.back()) +
                                          " dimensions, expected " + std::to_string(dimension_));
            }
        }
    }

    OrtMemoryInfo* memory_info = nullptr;
    check<InitializationError>(api->CreateCpuMemoryInfo(OrtArenaAllocator, OrtMemTypeDefault, &memory_info),
                               "Cannot create CPU memory info");
    impl_->memory_info.reset(memory_info);

    RFPINDEX_LOG_INFO("Embedding", "ONNX provider ready: model=", model_name_, " dim=", dimension_,
                      " max_seq_length=", max_seq_length_, " vocab=", tokenizer_->vocab_size());
}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() = default;

std::vector<std::vector<float>> OnnxEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (size_t begin = 0; begin < texts.size(); begin += batch_size_) {
        size_t end = std::min(begin + batch_size_, texts.size());
        auto batch = embed_batch(texts, begin, end);
        for (auto& v : batch) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

std::vector<std::vector<float>> OnnxEmbeddingProvider::embed_batch(const std::vector<std::string>& texts,
                                                                   size_t begin, size_t end) {
    const OrtApi* api = ort_api();
    const size_t batch = end - begin;

    std::vector<std::vector<int64_t>> encoded;
    encoded.reserve(batch);
    size_t seq_len = 0;
    for (size_t i = begin; i < end; ++i) {
        encoded.push_back(tokenizer_->encode(texts[i], max_seq_length_));
        seq_len = std::max(seq_len, encoded.back().size());
    }

    std::vector<int64_t> input_ids(batch * seq_len, tokenizer_->pad_id());
    std::vector<int64_t> attention_mask(batch * seq_len, 0);
    std::vector<int64_t> token_type_ids(batch * seq_len, 0);
    for (size_t b = 0; b < batch; ++b) {
        std::copy(encoded[b].begin(), encoded[b].end(), input_ids.begin() + b * seq_len);
        std::fill_n(attention_mask.begin() + b * seq_len, encoded[b].size(), 1);
    }

    const int64_t shape[2] = {static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};
    std::vector<ValuePtr> tensors;
    std::vector<const char*> names;
    std::vector<const OrtValue*> inputs;
    for (const auto& name : impl_->input_names) {
        std::vector<int64_t>& data = name == "input_ids"        ? input_ids
                                     : name == "attention_mask" ? attention_mask
                                                                : token_type_ids;
        tensors.push_back(int64_tensor(impl_->memory_info.get(), data, shape));
        names.push_back(name.c_str());
        inputs.push_back(tensors.back().get());
    }

    const char* output_name = impl_->output_name.c_str();
    OrtValue* raw_output = nullptr;
    check<EmbeddingError>(api->Run(impl_->session.get(), nullptr, names.data(), inputs.data(), inputs.size(),
                                   &output_name, 1, &raw_output),
                          "ONNX inference failed for model " + model_name_);
    ValuePtr output(raw_output);

    OrtTensorTypeAndShapeInfo* raw_shape = nullptr;
    check<EmbeddingError>(api->GetTensorTypeAndShape(output.get(), &raw_shape), "Cannot read output shape");
    std::unique_ptr<OrtTensorTypeAndShapeInfo, ShapeInfoDeleter> shape_info(raw_shape);
    ONNXTensorElementDataType element_type = ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
    check<EmbeddingError>(api->GetTensorElementType(shape_info.get(), &element_type), "Cannot read output type");
    if (element_type != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw EmbeddingError("Model " + model_name_ + " output is not float32");
    }
    size_t rank = 0;
    check<EmbeddingError>(api->GetDimensionsCount(shape_info.get(), &rank), "Cannot read output rank");
    std::vector<int64_t> dims(rank);
    check<EmbeddingError>(api->GetDimensions(shape_info.get(), dims.data(), rank), "Cannot read output shape");

    float* data = nullptr;
    check<EmbeddingError>(api->GetTensorMutableData(output.get(), reinterpret_cast<void**>(&data)),
                          "Cannot read output data");

    std::vector<std::vector<float>> vectors(batch, std::vector<float>(dimension_, 0.0f));
    if (rank == 3 && dims[0] == shape[0] && dims[1] == shape[1] && static_cast<size_t>(dims[2]) == dimension_) {
        // Token embeddings: mean over positions with attention_mask == 1.
        for (size_t b = 0; b < batch; ++b) {
            const size_t tokens = encoded[b].size();
            const float* row = data + b * seq_len * dimension_;
            for (size_t t = 0; t < tokens; ++t) {
                for (size_t d = 0; d < dimension_; ++d) {
                    vectors[b][d] += row[t * dimension_ + d];
                }
            }
            for (float& x : vectors[b]) {
                x /= static_cast<float>(tokens);
            }
        }
    } else if (rank == 2 && dims[0] == shape[0] && static_cast<size_t>(dims[1]) == dimension_) {
        // Already pooled sentence embeddings.
        for (size_t b = 0; b < batch; ++b) {
            std::copy_n(data + b * dimension_, dimension_, vectors[b].begin());
        }
    } else {
        std::string got;
        for (int64_t d : dims) {
            got += (got.empty() ? "" : "x") + std::to_string(d);
        }
        throw EmbeddingError("Model " + model_name_ + " returned an output of shape " + got);
    }

    for (auto& v : vectors) {
        normalize(v);
    }
    return vectors;
}

} // namespace rfpindex
