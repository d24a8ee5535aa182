#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "distance.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "onnx_embedding.hpp"
#include "test_helpers.hpp"

using namespace rfpindex;
using rfpindex::testing::TempDir;

namespace {

float cosine(const std::vector<float>& a, const std::vector<float>& b) {
    return distance::InnerProduct(a.data(), b.data(), a.size());
}

float norm(const std::vector<float>& v) {
    return std::sqrt(distance::InnerProduct(v.data(), v.data(), v.size()));
}

IndexConfig remote_config() {
    IndexConfig config;
    config.embedding_model = "text-embedding-3-small";
    config.api_key = "sk-test";
    config.embedding_url = "https://embeddings.example/v1/";
    config.max_retries = 2;
    return config;
}

// Answers like the embeddings API: one vector per input, reversed order
// with explicit indices.
struct FakeApi {
    size_t dim = 1536;
    std::vector<nlohmann::json> requests;
    std::vector<std::string> urls;
    std::vector<std::vector<std::string>> headers;
    std::vector<HttpResponse> scripted;  // consumed before normal answers

    HttpResponse operator()(const std::string& url, const std::string& body,
                            const std::vector<std::string>& hdrs, long) {
        urls.push_back(url);
        headers.push_back(hdrs);
        auto request = nlohmann::json::parse(body);
        requests.push_back(request);
        if (!scripted.empty()) {
            HttpResponse r = scripted.front();
            scripted.erase(scripted.begin());
            return r;
        }
        nlohmann::json data = nlohmann::json::array();
        const auto& input = request["input"];
        for (size_t i = input.size(); i-- > 0;) {
            std::vector<float> v(dim, 0.0f);
            v[input[i].get<std::string>().size() % dim] = 1.0f;
            data.push_back({{"index", i}, {"embedding", v}});
        }
        return {200, nlohmann::json{{"data", data}}.dump()};
    }
};

} // namespace

//=============================================================================
// HashingEmbeddingProvider
//=============================================================================

TEST(HashingEmbeddingTest, ProducesUnitVectorsOfConfiguredWidth) {
    HashingEmbeddingProvider provider(64, "hashing-bow-64");
    auto vectors = provider.embed({"Cloud migration services", "Road maintenance tender"});
    ASSERT_EQ(vectors.size(), 2u);
    for (const auto& v : vectors) {
        EXPECT_EQ(v.size(), 64u);
        EXPECT_NEAR(norm(v), 1.0f, 1e-5);
    }
    EXPECT_EQ(provider.backend(), EmbeddingBackend::LOCAL);
}

TEST(HashingEmbeddingTest, Deterministic) {
    HashingEmbeddingProvider a(128, "m");
    HashingEmbeddingProvider b(128, "m");
    EXPECT_EQ(a.embed_one("Solar farm installation"), b.embed_one("Solar farm installation"));
}

TEST(HashingEmbeddingTest, TextWithoutTermsIsZero) {
    HashingEmbeddingProvider provider(32, "m");
    auto v = provider.embed_one("the a of !!");
    EXPECT_EQ(norm(v), 0.0f);
}

TEST(HashingEmbeddingTest, SharedTermsRaiseSimilarity) {
    HashingEmbeddingProvider provider(384, kFallbackEmbeddingModel);
    auto a = provider.embed_one("Government cloud migration services");
    auto b = provider.embed_one("cloud migration for the government");
    auto c = provider.embed_one("Chocolate cake bakery recipes");
    EXPECT_GT(cosine(a, b), cosine(a, c));
    EXPECT_GT(cosine(a, b), 0.4f);
}

TEST(HashingEmbeddingTest, AnalyzerLowercasesAndDropsStopwords) {
    auto terms = HashingEmbeddingProvider::analyze("The ISO-27001 audit, and a Q3 plan");
    std::vector<std::string> expected = {"iso", "27001", "audit", "q3", "plan"};
    EXPECT_EQ(terms, expected);
}

TEST(HashingEmbeddingTest, RejectsZeroDimension) {
    EXPECT_THROW(HashingEmbeddingProvider(0, "m"), InitializationError);
}

TEST(HashingEmbeddingTest, AsyncMatchesSync) {
    HashingEmbeddingProvider provider(48, "m");
    auto fut = provider.embed_async({"bridge inspection"});
    auto async_result = fut.get();
    EXPECT_EQ(async_result, provider.embed({"bridge inspection"}));
}

//=============================================================================
// RemoteEmbeddingProvider
//=============================================================================

TEST(RemoteEmbeddingTest, BatchesRequestsAndRestoresOrder) {
    auto api = std::make_shared<FakeApi>();
    RemoteEmbeddingProvider provider(remote_config(),
                                     [api](const std::string& u, const std::string& b,
                                           const std::vector<std::string>& h, long t) { return (*api)(u, b, h, t); });
    EXPECT_EQ(provider.dimension(), 1536u);

    std::vector<std::string> texts;
    for (size_t i = 0; i < 250; ++i) {
        texts.push_back(std::string(i % 50 + 1, 'x'));
    }
    auto vectors = provider.embed(texts);
    ASSERT_EQ(vectors.size(), 250u);
    ASSERT_EQ(api->requests.size(), 3u);
    EXPECT_EQ(api->requests[0]["input"].size(), 100u);
    EXPECT_EQ(api->requests[2]["input"].size(), 50u);
    EXPECT_EQ(api->requests[0]["model"], "text-embedding-3-small");
    EXPECT_EQ(api->urls[0], "https://embeddings.example/v1/embeddings");
    EXPECT_NE(std::find(api->headers[0].begin(), api->headers[0].end(), "Authorization: Bearer sk-test"),
              api->headers[0].end());

    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(vectors[i][texts[i].size()], 1.0f) << i;
    }
}

TEST(RemoteEmbeddingTest, RetriesServerErrors) {
    auto api = std::make_shared<FakeApi>();
    api->scripted = {{503, "busy"}, {429, "slow down"}};
    RemoteEmbeddingProvider provider(remote_config(),
                                     [api](const std::string& u, const std::string& b,
                                           const std::vector<std::string>& h, long t) { return (*api)(u, b, h, t); });
    auto vectors = provider.embed({"hello"});
    EXPECT_EQ(vectors.size(), 1u);
    EXPECT_EQ(api->requests.size(), 3u);
}

TEST(RemoteEmbeddingTest, ClientErrorIsNotRetried) {
    auto api = std::make_shared<FakeApi>();
    api->scripted = {{401, "bad key"}};
    RemoteEmbeddingProvider provider(remote_config(),
                                     [api](const std::string& u, const std::string& b,
                                           const std::vector<std::string>& h, long t) { return (*api)(u, b, h, t); });
    EXPECT_THROW(provider.embed({"hello"}), EmbeddingError);
    EXPECT_EQ(api->requests.size(), 1u);
}

TEST(RemoteEmbeddingTest, TransportFailuresExhaustRetries) {
    size_t calls = 0;
    RemoteEmbeddingProvider provider(remote_config(),
                                     [&calls](const std::string&, const std::string&,
                                              const std::vector<std::string>&, long) -> HttpResponse {
                                         ++calls;
                                         throw std::runtime_error("connection refused");
                                     });
    EXPECT_THROW(provider.embed({"hello"}), EmbeddingError);
    EXPECT_EQ(calls, 3u);
}

TEST(RemoteEmbeddingTest, WrongWidthIsAnError) {
    auto api = std::make_shared<FakeApi>();
    api->dim = 12;
    RemoteEmbeddingProvider provider(remote_config(),
                                     [api](const std::string& u, const std::string& b,
                                           const std::vector<std::string>& h, long t) { return (*api)(u, b, h, t); });
    EXPECT_THROW(provider.embed({"hello"}), EmbeddingError);
}

TEST(RemoteEmbeddingTest, MalformedBodyIsAnError) {
    auto api = std::make_shared<FakeApi>();
    api->scripted = {{200, "{\"unexpected\": true}"}};
    RemoteEmbeddingProvider provider(remote_config(),
                                     [api](const std::string& u, const std::string& b,
                                           const std::vector<std::string>& h, long t) { return (*api)(u, b, h, t); });
    EXPECT_THROW(provider.embed({"hello"}), EmbeddingError);
}

TEST(RemoteEmbeddingTest, RequiresApiKey) {
    IndexConfig config = remote_config();
    config.api_key.clear();
    EXPECT_THROW(RemoteEmbeddingProvider provider(config), InitializationError);
}

//=============================================================================
// Factory
//=============================================================================

TEST(EmbeddingFactoryTest, HashingNamesSelectHashingProvider) {
    IndexConfig config;
    config.embedding_model = "hashing-bow-96";
    config.dimension = 10;
    auto provider = create_embedding_provider(config);
    EXPECT_NE(dynamic_cast<HashingEmbeddingProvider*>(provider.get()), nullptr);
    EXPECT_EQ(provider->dimension(), 96u);
    EXPECT_EQ(provider->model_name(), "hashing-bow-96");
    EXPECT_EQ(provider->backend(), EmbeddingBackend::LOCAL);
}

TEST(EmbeddingFactoryTest, CatalogueModelsNeedModelFiles) {
    TempDir dir;
    IndexConfig config;
    config.model_dir = dir.file("models");
    for (const char* model : {"all-MiniLM-L6-v2", "all-mpnet-base-v2", "in-house-encoder"}) {
        config.embedding_model = model;
        EXPECT_THROW(create_embedding_provider(config), InitializationError) << model;
    }
}

TEST(EmbeddingFactoryTest, RemoteWithoutKeyFails) {
    IndexConfig config;
    config.embedding_model = "text-embedding-ada-002";
    EXPECT_THROW(create_embedding_provider(config), InitializationError);
}

TEST(EmbeddingFactoryTest, DefaultProvider) {
    auto provider = create_default_embedding_provider();
    EXPECT_EQ(provider->dimension(), 384u);
    EXPECT_EQ(provider->model_name(), "hashing-bow-384");
    EXPECT_EQ(provider->backend(), EmbeddingBackend::LOCAL);
}

//=============================================================================
// WordPieceTokenizer
//=============================================================================

namespace {

WordPieceTokenizer bert_tokenizer() {
    std::vector<std::string> vocab = {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "the",   "bid", "##s",
                                      "un",    "##want", "##ed", "runn",  "##ing", ",",   "!"};
    return WordPieceTokenizer(vocab);
}

void write_lines(const std::string& path, const std::vector<std::string>& lines, const char* eol) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    for (const auto& line : lines) {
        out << line << eol;
    }
}

} // namespace

TEST(WordPieceTokenizerTest, SplitsWordsIntoPieces) {
    auto tokenizer = bert_tokenizer();
    std::vector<std::string> expected = {"the", "bid", "##s", ",", "un", "##want", "##ed", "runn", "##ing", "!"};
    EXPECT_EQ(tokenizer.tokenize("The  BIDS, unwanted\trunning!"), expected);
    EXPECT_EQ(tokenizer.tokenize("xyz bids"), (std::vector<std::string>{"[UNK]", "bid", "##s"}));
    EXPECT_TRUE(tokenizer.tokenize(" \n ").empty());
}

TEST(WordPieceTokenizerTest, EncodeAddsSpecialTokensAndTruncates) {
    auto tokenizer = bert_tokenizer();
    EXPECT_EQ(tokenizer.cls_id(), 2);
    EXPECT_EQ(tokenizer.sep_id(), 3);
    EXPECT_EQ(tokenizer.pad_id(), 0);
    EXPECT_EQ(tokenizer.encode("the bids", 16), (std::vector<int64_t>{2, 4, 5, 6, 3}));
    EXPECT_EQ(tokenizer.encode("the bids", 4), (std::vector<int64_t>{2, 4, 5, 3}));
    EXPECT_EQ(tokenizer.encode("", 8), (std::vector<int64_t>{2, 3}));
    EXPECT_EQ(tokenizer.encode("qqq", 8), (std::vector<int64_t>{2, 1, 3}));
    EXPECT_THROW(tokenizer.encode("the", 1), std::invalid_argument);
}

TEST(WordPieceTokenizerTest, RobertaStyleSpecialTokens) {
    std::vector<std::string> vocab = {"<s>", "<pad>", "</s>", "<unk>", "hello"};
    WordPieceTokenizer tokenizer(vocab);
    EXPECT_EQ(tokenizer.cls_id(), 0);
    EXPECT_EQ(tokenizer.pad_id(), 1);
    EXPECT_EQ(tokenizer.sep_id(), 2);
    EXPECT_EQ(tokenizer.unk_id(), 3);
    EXPECT_EQ(tokenizer.encode("Hello world", 8), (std::vector<int64_t>{0, 4, 3, 2}));
}

TEST(WordPieceTokenizerTest, RejectsVocabularyWithoutSpecialTokens) {
    std::vector<std::string> vocab = {"[PAD]", "[UNK]", "hello"};
    EXPECT_THROW(WordPieceTokenizer tokenizer(vocab), InitializationError);
}

TEST(WordPieceTokenizerTest, LoadsVocabularyFile) {
    TempDir dir;
    const std::string path = dir.file("vocab.txt");
    write_lines(path, {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "tender"}, "\r\n");
    auto tokenizer = WordPieceTokenizer::from_vocab_file(path);
    EXPECT_EQ(tokenizer.vocab_size(), 5u);
    EXPECT_EQ(tokenizer.encode("Tender", 8), (std::vector<int64_t>{2, 4, 3}));
    EXPECT_THROW(WordPieceTokenizer::from_vocab_file(dir.file("missing.txt")), InitializationError);
}

//=============================================================================
// OnnxEmbeddingProvider
//=============================================================================

TEST(OnnxEmbeddingTest, ModelPathsFollowModelDir) {
    IndexConfig config;
    config.model_dir = "/opt/models";
    config.embedding_model = "all-MiniLM-L6-v2";
    EXPECT_EQ(OnnxEmbeddingProvider::model_path(config), "/opt/models/all-MiniLM-L6-v2/model.onnx");
    EXPECT_EQ(OnnxEmbeddingProvider::vocab_path(config), "/opt/models/all-MiniLM-L6-v2/vocab.txt");
}

TEST(OnnxEmbeddingTest, MissingModelFileIsAnInitializationError) {
    TempDir dir;
    IndexConfig config;
    config.model_dir = dir.path().string();
    config.embedding_model = "all-MiniLM-L6-v2";
    EXPECT_THROW(OnnxEmbeddingProvider provider(config), InitializationError);

    // Model present but vocabulary missing.
    write_lines(OnnxEmbeddingProvider::model_path(config), {"not a model"}, "\n");
    EXPECT_THROW(OnnxEmbeddingProvider provider(config), InitializationError);
}

TEST(OnnxEmbeddingTest, RuntimeRejectsInvalidModel) {
    TempDir dir;
    IndexConfig config;
    config.model_dir = dir.path().string();
    config.embedding_model = "all-MiniLM-L6-v2";
    write_lines(OnnxEmbeddingProvider::model_path(config), {"definitely not protobuf"}, "\n");
    write_lines(OnnxEmbeddingProvider::vocab_path(config), {"[PAD]", "[UNK]", "[CLS]", "[SEP]"}, "\n");
    EXPECT_THROW(OnnxEmbeddingProvider provider(config), InitializationError);
}
