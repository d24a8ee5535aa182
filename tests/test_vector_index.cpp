#include <gtest/gtest.h>

#include <fstream>
#include <random>

#include "distance.hpp"
#include "errors.hpp"
#include "flat_index.hpp"
#include "hnsw_index.hpp"
#include "ivf_index.hpp"
#include "test_helpers.hpp"
#include "vector_index.hpp"

using namespace rfpindex;
using rfpindex::testing::TempDir;
using rfpindex::testing::random_vector;

namespace {

std::vector<float> random_dataset(size_t n, size_t dim, uint32_t seed, bool normalized) {
    std::mt19937 rng(seed);
    std::vector<float> data;
    data.reserve(n * dim);
    for (size_t i = 0; i < n; ++i) {
        auto v = random_vector(rng, dim);
        if (normalized) {
            distance::normalize(v.data(), dim);
        }
        data.insert(data.end(), v.begin(), v.end());
    }
    return data;
}

// Fraction of points whose own vector comes back as the top hit.
double self_recall(const VectorIndex& index, const std::vector<float>& data, size_t n) {
    const size_t dim = index.dimension();
    size_t hits = 0;
    for (size_t i = 0; i < n; ++i) {
        auto result = index.search(data.data() + i * dim, 1);
        if (!result.empty() && result[0].second == static_cast<int64_t>(i)) {
            ++hits;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(n);
}

} // namespace

//=============================================================================
// Distance kernels
//=============================================================================

TEST(DistanceTest, KernelsMatchScalarReference) {
    std::mt19937 rng(7);
    for (size_t dim : {3u, 4u, 16u, 17u, 33u, 384u}) {
        auto a = random_vector(rng, dim);
        auto b = random_vector(rng, dim);
        EXPECT_NEAR(distance::L2Sqr(a.data(), b.data(), dim), distance::L2SqrScalar(a.data(), b.data(), dim), 1e-4)
            << dim;
        EXPECT_NEAR(distance::InnerProduct(a.data(), b.data(), dim),
                    distance::InnerProductScalar(a.data(), b.data(), dim), 1e-4)
            << dim;
    }
}

TEST(DistanceTest, SimilarityConventions) {
    EXPECT_FLOAT_EQ(distance::SquaredL2::to_similarity(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(distance::SquaredL2::to_similarity(1.0f), 0.5f);
    EXPECT_FLOAT_EQ(distance::InnerProductDistance::to_similarity(0.25f), 0.75f);

    std::vector<float> v = {3.0f, 4.0f};
    distance::normalize(v.data(), v.size());
    EXPECT_FLOAT_EQ(v[0], 0.6f);
    EXPECT_FLOAT_EQ(v[1], 0.8f);

    std::vector<float> zero = {0.0f, 0.0f};
    distance::normalize(zero.data(), zero.size());
    EXPECT_EQ(zero[0], 0.0f);
}

//=============================================================================
// Flat
//=============================================================================

TEST(FlatIndexTest, L2ReturnsNearestFirst) {
    FlatIndex<distance::SquaredL2> index(2, IndexMetric::L2);
    std::vector<float> data = {0, 0, 1, 0, 5, 5, 0.5f, 0};
    index.add(data.data(), 4);
    EXPECT_EQ(index.size(), 4u);
    EXPECT_EQ(index.algorithm(), IndexAlgorithm::FLAT_L2);

    float q[2] = {0.9f, 0.0f};
    auto hits = index.search(q, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].second, 1);
    EXPECT_EQ(hits[1].second, 3);
    EXPECT_EQ(hits[2].second, 0);
    EXPECT_LE(hits[0].first, hits[1].first);
}

TEST(FlatIndexTest, SearchClampsKAndHandlesEmpty) {
    FlatIndex<distance::InnerProductDistance> index(2, IndexMetric::INNER_PRODUCT);
    float q[2] = {1.0f, 0.0f};
    EXPECT_TRUE(index.search(q, 5).empty());

    std::vector<float> data = {1, 0, 0, 1};
    index.add(data.data(), 2);
    EXPECT_EQ(index.algorithm(), IndexAlgorithm::FLAT_IP);
    auto hits = index.search(q, 10);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].second, 0);
    EXPECT_FLOAT_EQ(index.to_similarity(hits[0].first), 1.0f);
    EXPECT_FLOAT_EQ(index.to_similarity(hits[1].first), 0.0f);
}

TEST(FlatIndexTest, TiesKeepInsertionOrder) {
    auto hits = select_top_k({0.5f, 0.1f, 0.5f, 0.1f}, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].second, 1);
    EXPECT_EQ(hits[1].second, 3);
    EXPECT_EQ(hits[2].second, 0);
}

TEST(FlatIndexTest, ReconstructReturnsStoredVector) {
    FlatIndex<distance::SquaredL2> index(3, IndexMetric::L2);
    std::vector<float> data = {1, 2, 3, 4, 5, 6};
    index.add(data.data(), 2);
    EXPECT_EQ(index.reconstruct(1), (std::vector<float>{4, 5, 6}));
    EXPECT_THROW(index.reconstruct(2), std::out_of_range);
    EXPECT_THROW(index.reconstruct(-1), std::out_of_range);
}

//=============================================================================
// IVF
//=============================================================================

TEST(IvfIndexTest, ScansExhaustivelyUntilTrained) {
    const size_t dim = 8;
    auto data = random_dataset(20, dim, 11, true);
    IvfFlatIndex<distance::InnerProductDistance> index(dim, IndexMetric::INNER_PRODUCT, 32, 1);
    index.add(data.data(), 20);
    EXPECT_FALSE(index.is_trained());
    EXPECT_DOUBLE_EQ(self_recall(index, data, 20), 1.0);
}

TEST(IvfIndexTest, TrainsOnceEnoughVectorsArrive) {
    const size_t dim = 16;
    const size_t n = 400;
    auto data = random_dataset(n, dim, 5, true);
    IvfFlatIndex<distance::InnerProductDistance> index(dim, IndexMetric::INNER_PRODUCT, 8, 8);
    index.add(data.data(), 4);
    EXPECT_FALSE(index.is_trained());
    index.add(data.data() + 4 * dim, n - 4);
    EXPECT_TRUE(index.is_trained());
    EXPECT_EQ(index.size(), n);

    auto sizes = index.list_sizes();
    ASSERT_EQ(sizes.size(), 8u);
    size_t total = 0;
    for (size_t s : sizes) {
        total += s;
    }
    EXPECT_EQ(total, n);

    // Probing every list is exhaustive.
    EXPECT_DOUBLE_EQ(self_recall(index, data, n), 1.0);

    index.set_nprobe(2);
    EXPECT_EQ(index.nprobe(), 2u);
    EXPECT_GT(self_recall(index, data, n), 0.9);
}

//=============================================================================
// HNSW
//=============================================================================

TEST(HnswIndexTest, HighSelfRecall) {
    const size_t dim = 16;
    const size_t n = 500;
    auto data = random_dataset(n, dim, 3, false);
    HnswIndex<distance::SquaredL2> index(dim, IndexMetric::L2, 8, 100, 64);
    index.add(data.data(), n);
    EXPECT_EQ(index.size(), n);
    EXPECT_GE(self_recall(index, data, n), 0.95);
}

TEST(HnswIndexTest, DegreeIsBounded) {
    const size_t dim = 8;
    const size_t n = 300;
    auto data = random_dataset(n, dim, 9, true);
    HnswIndex<distance::InnerProductDistance> index(dim, IndexMetric::INNER_PRODUCT, 6, 50, 32);
    index.add(data.data(), n);
    for (uint32_t node = 0; node < n; ++node) {
        EXPECT_LE(index.neighbors(node, 0).size(), 12u);
        EXPECT_LE(index.neighbors(node, 1).size(), 6u);
    }
}

TEST(HnswIndexTest, ResultsAreSortedAndDistinct) {
    const size_t dim = 8;
    auto data = random_dataset(200, dim, 21, true);
    HnswIndex<distance::InnerProductDistance> index(dim, IndexMetric::INNER_PRODUCT, 8, 64, 16);
    index.add(data.data(), 200);
    auto hits = index.search(data.data(), 40);
    ASSERT_EQ(hits.size(), 40u);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_LE(hits[i - 1].first, hits[i].first);
        EXPECT_NE(hits[i - 1].second, hits[i].second);
    }
}

//=============================================================================
// Factory and persistence
//=============================================================================

TEST(VectorIndexTest, FactoryPicksMetric) {
    IndexConfig config;
    config.dimension = 4;

    config.algorithm = IndexAlgorithm::FLAT_L2;
    EXPECT_EQ(create_vector_index(config)->metric(), IndexMetric::L2);

    config.algorithm = IndexAlgorithm::HNSW;
    config.metric = Metric::EUCLIDEAN;
    auto hnsw = create_vector_index(config);
    EXPECT_EQ(hnsw->metric(), IndexMetric::L2);
    EXPECT_EQ(hnsw->algorithm(), IndexAlgorithm::HNSW);

    config.algorithm = IndexAlgorithm::IVF_FLAT;
    config.metric = Metric::COSINE;
    EXPECT_EQ(create_vector_index(config)->metric(), IndexMetric::INNER_PRODUCT);

    config.dimension = 0;
    EXPECT_THROW(create_vector_index(config), std::invalid_argument);
}

class IndexPersistenceTest : public ::testing::TestWithParam<IndexAlgorithm> {};

TEST_P(IndexPersistenceTest, SaveLoadRoundTrip) {
    TempDir dir;
    const size_t dim = 12;
    const size_t n = 150;
    IndexConfig config;
    config.dimension = dim;
    config.algorithm = GetParam();
    config.nlist = 6;
    config.nprobe = 3;
    config.hnsw_m = 8;
    config.ef_construction = 40;
    config.ef_search = 20;

    auto data = random_dataset(n, dim, 17, true);
    auto index = create_vector_index(config);
    index->add(data.data(), n);

    const std::string path = dir.file("index.bin");
    index->save(path);
    auto loaded = VectorIndex::load(path);

    EXPECT_EQ(loaded->algorithm(), index->algorithm());
    EXPECT_EQ(loaded->metric(), index->metric());
    EXPECT_EQ(loaded->dimension(), dim);
    EXPECT_EQ(loaded->size(), n);
    for (int64_t pos : {int64_t{0}, int64_t{77}, int64_t{149}}) {
        EXPECT_EQ(loaded->reconstruct(pos), index->reconstruct(pos));
    }
    for (size_t q = 0; q < 10; ++q) {
        EXPECT_EQ(loaded->search(data.data() + q * dim, 5), index->search(data.data() + q * dim, 5));
    }
}

INSTANTIATE_TEST_SUITE_P(AllAlgorithms, IndexPersistenceTest,
                         ::testing::Values(IndexAlgorithm::FLAT_IP, IndexAlgorithm::FLAT_L2,
                                           IndexAlgorithm::IVF_FLAT, IndexAlgorithm::HNSW));

TEST(VectorIndexTest, LoadRejectsForeignFiles) {
    TempDir dir;
    const std::string path = dir.file("garbage.bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not an index";
    }
    EXPECT_THROW(VectorIndex::load(path), PersistenceError);
    EXPECT_THROW(VectorIndex::load(dir.file("missing.bin")), PersistenceError);
}

TEST(VectorIndexTest, LoadRejectsTruncatedFiles) {
    TempDir dir;
    IndexConfig config;
    config.dimension = 4;
    auto index = create_vector_index(config);
    std::vector<float> data(40, 0.5f);
    index->add(data.data(), 10);
    const std::string path = dir.file("index.bin");
    index->save(path);
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 8);
    EXPECT_THROW(VectorIndex::load(path), PersistenceError);
}

namespace {

struct SavedIvf {
    std::string path;
    // Distance from the end of the file to the last entry of an inverted
    // list holding at least two positions.
    std::streamoff last_entry_offset = 0;
};

// Inverted lists are the final section of an IVF file, written in order.
SavedIvf save_trained_ivf(const TempDir& dir) {
    const size_t dim = 8;
    const size_t n = 120;
    auto data = random_dataset(n, dim, 23, true);
    IvfFlatIndex<distance::InnerProductDistance> index(dim, IndexMetric::INNER_PRODUCT, 4, 4);
    index.add(data.data(), n);
    EXPECT_TRUE(index.is_trained());

    SavedIvf saved;
    saved.path = dir.file("ivf.bin");
    index.save(saved.path);

    auto sizes = index.list_sizes();
    std::streamoff after = 0;
    for (size_t i = sizes.size(); i-- > 0;) {
        if (sizes[i] >= 2) {
            saved.last_entry_offset = after + 8;
            break;
        }
        after += static_cast<std::streamoff>(8 + 8 * sizes[i]);
    }
    EXPECT_GT(saved.last_entry_offset, 0);
    return saved;
}

void overwrite_tail(const std::string& path, std::streamoff offset_from_end, int64_t value) {
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(-offset_from_end, std::ios::end);
    f.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

int64_t read_tail(const std::string& path, std::streamoff offset_from_end) {
    std::ifstream f(path, std::ios::binary);
    f.seekg(-offset_from_end, std::ios::end);
    int64_t value = 0;
    f.read(reinterpret_cast<char*>(&value), sizeof(value));
    return value;
}

} // namespace

TEST(VectorIndexTest, LoadRejectsIvfPositionOutOfRange) {
    TempDir dir;
    SavedIvf saved = save_trained_ivf(dir);
    ASSERT_GT(saved.last_entry_offset, 0);
    ASSERT_NO_THROW(VectorIndex::load(saved.path));
    overwrite_tail(saved.path, saved.last_entry_offset, int64_t{1} << 40);
    EXPECT_THROW(VectorIndex::load(saved.path), PersistenceError);
    overwrite_tail(saved.path, saved.last_entry_offset, -1);
    EXPECT_THROW(VectorIndex::load(saved.path), PersistenceError);
}

TEST(VectorIndexTest, LoadRejectsIvfDuplicatePosition) {
    TempDir dir;
    SavedIvf saved = save_trained_ivf(dir);
    ASSERT_GT(saved.last_entry_offset, 0);
    overwrite_tail(saved.path, saved.last_entry_offset, read_tail(saved.path, saved.last_entry_offset + 8));
    EXPECT_THROW(VectorIndex::load(saved.path), PersistenceError);
}
