#pragma once

#include <cstdint>
#include <vector>

#include "distance.hpp"
#include "vector_index.hpp"

namespace rfpindex {

/**
 * Inverted-file index with uncompressed vectors (IVF-Flat).
 *
 * A coarse quantizer of nlist centroids partitions the vectors; a query
 * scans only the nprobe lists whose centroids are closest to it. The
 * quantizer is trained with k-means++ and Lloyd iterations as soon as
 * the index holds nlist vectors. Until then every query is answered by an
 * exhaustive scan.
 */
template <typename DistanceMetric>
class IvfFlatIndex : public VectorIndex {
public:
    IvfFlatIndex(size_t dim, IndexMetric metric, size_t nlist, size_t nprobe);

    void add(const float* vectors, size_t n) override;
    std::vector<IndexHit> search(const float* query, size_t k) const override;
    std::vector<float> reconstruct(int64_t position) const override;

    size_t size() const override { return count_; }
    IndexAlgorithm algorithm() const override { return IndexAlgorithm::IVF_FLAT; }

    bool is_trained() const { return trained_; }
    size_t nlist() const { return nlist_; }
    size_t nprobe() const { return nprobe_; }
    void set_nprobe(size_t nprobe) { nprobe_ = nprobe == 0 ? 1 : nprobe; }

    /**
     * Number of vectors in each inverted list (empty before training).
     */
    std::vector<size_t> list_sizes() const;

protected:
    void write_payload(std::ostream& out) const override;
    void read_payload(std::istream& in, uint64_t count) override;

private:
    static constexpr uint32_t kKMeansIterations = 10;

    void train();
    void initializeCentroidsKMeansPlusPlus(const float* vectors, uint64_t n, float* centroids, uint32_t k);
    void kmeansStep(const float* vectors, uint64_t n, float* centroids, uint32_t k,
                    std::vector<uint32_t>& assignments);
    uint32_t nearestCentroid(const float* vector) const;
    const float* vectorAt(int64_t position) const { return data_.data() + position * dim_; }

    size_t nlist_;
    size_t nprobe_;
    bool trained_ = false;
    size_t count_ = 0;
    std::vector<float> data_;       // all vectors by position
    std::vector<float> centroids_;  // nlist_ * dim_
    std::vector<std::vector<int64_t>> lists_;
};

} // namespace rfpindex
