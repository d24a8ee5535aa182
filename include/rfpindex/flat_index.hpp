#pragma once

#include <vector>

#include "distance.hpp"
#include "vector_index.hpp"

namespace rfpindex {

/**
 * Exhaustive index: every query is compared against every stored vector.
 */
template <typename DistanceMetric>
class FlatIndex : public VectorIndex {
public:
    FlatIndex(size_t dim, IndexMetric metric) : VectorIndex(dim, metric) {}

    void add(const float* vectors, size_t n) override;
    std::vector<IndexHit> search(const float* query, size_t k) const override;
    std::vector<float> reconstruct(int64_t position) const override;

    size_t size() const override { return count_; }

    IndexAlgorithm algorithm() const override {
        return metric_ == IndexMetric::INNER_PRODUCT ? IndexAlgorithm::FLAT_IP : IndexAlgorithm::FLAT_L2;
    }

protected:
    void write_payload(std::ostream& out) const override;
    void read_payload(std::istream& in, uint64_t count) override;

private:
    std::vector<float> data_;
    size_t count_ = 0;
};

/**
 * Top-k selection over a dense distance array, shared by the exhaustive
 * paths of the flat and IVF indexes.
 */
std::vector<IndexHit> select_top_k(const std::vector<float>& distances, size_t k);

} // namespace rfpindex
