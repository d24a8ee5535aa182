#include <gtest/gtest.h>

#include "document.hpp"

using namespace rfpindex;

TEST(TimestampTest, FormatsIsoWithMicroseconds) {
    Timestamp ts = parse_timestamp("2024-03-01T12:34:56.123456Z");
    EXPECT_EQ(format_timestamp(ts), "2024-03-01T12:34:56.123456Z");
}

TEST(TimestampTest, ParsesWithoutFractionOrSuffix) {
    EXPECT_EQ(format_timestamp(parse_timestamp("2023-12-31T23:59:59")), "2023-12-31T23:59:59.000000Z");
    EXPECT_EQ(format_timestamp(parse_timestamp("2023-01-02T03:04:05.5Z")), "2023-01-02T03:04:05.500000Z");
}

TEST(TimestampTest, RejectsMalformedInput) {
    EXPECT_THROW(parse_timestamp("yesterday"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-03-01"), std::invalid_argument);
}

TEST(TimestampTest, NowSurvivesTextRoundTrip) {
    Timestamp now = now_timestamp();
    EXPECT_EQ(parse_timestamp(format_timestamp(now)), now);
}

TEST(VectorDocumentTest, ConstructorDefaults) {
    VectorDocument doc("d1", "hello");
    EXPECT_TRUE(doc.metadata.is_object());
    EXPECT_TRUE(doc.metadata.empty());
    EXPECT_FALSE(doc.embedding.has_value());
    EXPECT_EQ(doc.created_at, doc.updated_at);

    VectorDocument null_meta("d2", "x", nullptr);
    EXPECT_TRUE(null_meta.metadata.is_object());
}

TEST(VectorDocumentTest, JsonRoundTrip) {
    VectorDocument doc("proposal_1_chunk_2", "Chunk body", {{"type", "proposal"}, {"score", 4.5}});
    doc.source = "proposal";
    doc.chunk_index = 2;
    doc.parent_document_id = "proposal_1";
    doc.embedding = std::vector<float>{0.5f, -0.5f};

    nlohmann::json j = doc.to_json();
    EXPECT_FALSE(j.contains("embedding"));
    EXPECT_EQ(j["chunk_index"], 2);

    VectorDocument back = VectorDocument::from_json(j);
    EXPECT_EQ(back.id, doc.id);
    EXPECT_EQ(back.content, doc.content);
    EXPECT_EQ(back.metadata, doc.metadata);
    EXPECT_EQ(back.source, doc.source);
    EXPECT_EQ(back.chunk_index, doc.chunk_index);
    EXPECT_EQ(back.parent_document_id, doc.parent_document_id);
    EXPECT_EQ(back.created_at, doc.created_at);
    EXPECT_EQ(back.updated_at, doc.updated_at);
    EXPECT_FALSE(back.embedding.has_value());

    VectorDocument with_vec = VectorDocument::from_json(doc.to_json(true));
    ASSERT_TRUE(with_vec.embedding.has_value());
    EXPECT_EQ(*with_vec.embedding, *doc.embedding);
}

TEST(VectorDocumentTest, FromJsonRequiresIdAndContent) {
    EXPECT_THROW(VectorDocument::from_json({{"content", "x"}}), nlohmann::json::exception);
    EXPECT_THROW(VectorDocument::from_json({{"id", "x"}}), nlohmann::json::exception);
}

TEST(VectorDocumentTest, MetadataStringOnlyForStrings) {
    VectorDocument doc("d", "c", {{"type", "won_bid"}, {"year", 2021}});
    EXPECT_EQ(doc.metadata_string("type"), std::optional<std::string>("won_bid"));
    EXPECT_FALSE(doc.metadata_string("year").has_value());
    EXPECT_FALSE(doc.metadata_string("missing").has_value());
}

TEST(FilterTest, EmptyAndNullMatchEverything) {
    VectorDocument doc("d", "c", {{"type", "a"}});
    EXPECT_TRUE(matches_filters(doc, nullptr));
    EXPECT_TRUE(matches_filters(doc, nlohmann::json::object()));
}

TEST(FilterTest, MetadataEquality) {
    VectorDocument doc("d", "c", {{"type", "requirement"}, {"is_mandatory", true}, {"opportunity_id", "9"}});
    EXPECT_TRUE(matches_filters(doc, {{"type", "requirement"}}));
    EXPECT_TRUE(matches_filters(doc, {{"type", "requirement"}, {"is_mandatory", true}}));
    EXPECT_FALSE(matches_filters(doc, {{"type", "opportunity"}}));
    EXPECT_FALSE(matches_filters(doc, {{"opportunity_id", 9}}));
}

TEST(FilterTest, MissingKeyExcludesDocument) {
    VectorDocument doc("d", "c", {{"type", "a"}});
    EXPECT_FALSE(matches_filters(doc, {{"region", "EU"}}));
}

TEST(FilterTest, SourceAndParentUseDocumentFields) {
    VectorDocument doc("p_chunk_0", "c", {{"type", "proposal"}});
    doc.source = "proposal";
    doc.parent_document_id = "p";
    EXPECT_TRUE(matches_filters(doc, {{"source", "proposal"}}));
    EXPECT_TRUE(matches_filters(doc, {{"parent_document_id", "p"}}));
    EXPECT_FALSE(matches_filters(doc, {{"parent_document_id", "q"}}));

    VectorDocument plain("x", "c");
    EXPECT_FALSE(matches_filters(plain, {{"source", "proposal"}}));
}

TEST(FilterTest, NonObjectFilterIsRejected) {
    VectorDocument doc("d", "c");
    EXPECT_THROW(matches_filters(doc, nlohmann::json::array({1, 2})), std::invalid_argument);
}

TEST(SearchResultTest, JsonIncludesRankAndScore) {
    SearchResult r;
    r.document = VectorDocument("d", "c");
    r.similarity_score = 0.75f;
    r.rank = 1;
    nlohmann::json j = r.to_json();
    EXPECT_EQ(j["rank"], 1);
    EXPECT_FLOAT_EQ(j["similarity_score"].get<float>(), 0.75f);
    EXPECT_EQ(j["document"]["id"], "d");
}
