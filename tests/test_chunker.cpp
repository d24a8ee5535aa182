#include <gtest/gtest.h>

#include <string>

#include "chunker.hpp"

using namespace rfpindex;

TEST(ChunkerTest, ShortTextYieldsSingleTrimmedChunk) {
    auto chunks = chunk_text("   Scope of work.  \n", 100, 10);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "Scope of work.");
}

TEST(ChunkerTest, TextOfExactlyMaxSizeIsOneChunk) {
    std::string text(50, 'a');
    auto chunks = chunk_text(text, 50, 5);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], text);
}

TEST(ChunkerTest, WhitespaceOnlyTextYieldsNothing) {
    EXPECT_TRUE(chunk_text("   \n\t ", 100, 10).empty());
    EXPECT_TRUE(chunk_text("", 100, 10).empty());
}

TEST(ChunkerTest, RejectsBadParameters) {
    EXPECT_THROW(chunk_text("abc", 0, 0), std::invalid_argument);
    EXPECT_THROW(chunk_text("abc", 10, 10), std::invalid_argument);
    EXPECT_THROW(chunk_text("abc", 10, 20), std::invalid_argument);
}

TEST(ChunkerTest, LongTextChunksRespectMaxSize) {
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "Sentence number " + std::to_string(i) + " describes a requirement. ";
    }
    auto chunks = chunk_text(text, 120, 20);
    ASSERT_GT(chunks.size(), 1u);
    for (const auto& c : chunks) {
        EXPECT_LE(c.size(), 120u);
        EXPECT_FALSE(c.empty());
    }
}

TEST(ChunkerTest, CutsAfterSentenceBoundaryPastMidpoint) {
    // Boundary at index 69, past the midpoint of a 100-character window.
    std::string text = std::string(69, 'x') + "." + std::string(100, 'y');
    auto chunks = chunk_text(text, 100, 10);
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], std::string(69, 'x') + ".");
}

TEST(ChunkerTest, IgnoresBoundaryBeforeMidpoint) {
    std::string text = std::string(10, 'x') + "." + std::string(200, 'y');
    auto chunks = chunk_text(text, 100, 10);
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].size(), 100u);
}

TEST(ChunkerTest, ChunksCoverTextAndOverlap) {
    // No boundaries and no whitespace: every cut lands on the window end.
    std::string text;
    for (int i = 0; i < 1000; ++i) {
        text += static_cast<char>('a' + (i * 7) % 26);
    }
    const size_t max_size = 100;
    const size_t overlap = 15;
    auto chunks = chunk_text(text, max_size, overlap);

    size_t pos = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        size_t found = text.find(chunks[i], pos > overlap ? pos - overlap - 1 : 0);
        ASSERT_NE(found, std::string::npos) << "chunk " << i;
        EXPECT_LE(found, pos) << "gap before chunk " << i;
        if (i > 0) {
            EXPECT_EQ(pos - found, overlap) << "chunk " << i;
        }
        pos = found + chunks[i].size();
    }
    EXPECT_EQ(pos, text.size());
}

TEST(ChunkerTest, DocumentChunksCarryParentAndIndex) {
    std::string text;
    for (int i = 0; i < 30; ++i) {
        text += "Deliverable " + std::to_string(i) + " is due at month end.\n";
    }
    nlohmann::json meta = {{"type", "proposal"}, {"source", "upload"}};
    auto docs = create_document_chunks("proposal_7", text, meta, 200, 20);
    ASSERT_GT(docs.size(), 1u);
    for (size_t i = 0; i < docs.size(); ++i) {
        EXPECT_EQ(docs[i].id, "proposal_7_chunk_" + std::to_string(i));
        ASSERT_TRUE(docs[i].chunk_index.has_value());
        EXPECT_EQ(*docs[i].chunk_index, static_cast<int64_t>(i));
        EXPECT_EQ(docs[i].parent_document_id, std::optional<std::string>("proposal_7"));
        EXPECT_EQ(docs[i].source, std::optional<std::string>("upload"));
        EXPECT_EQ(docs[i].metadata["type"], "proposal");
        EXPECT_FALSE(docs[i].embedding.has_value());
    }
}

TEST(ChunkerTest, TrimStripsBothEnds) {
    EXPECT_EQ(trim("  a b \n"), "a b");
    EXPECT_EQ(trim("\t\n"), "");
    EXPECT_EQ(trim("x"), "x");
}
