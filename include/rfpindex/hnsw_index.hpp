#ifndef RFPINDEX_HNSW_INDEX_HPP
#define RFPINDEX_HNSW_INDEX_HPP

#include <cstdint>
#include <limits>
#include <random>
#include <utility>
#include <vector>

#include "distance.hpp"
#include "vector_index.hpp"

namespace rfpindex {

/**
 * In-memory Hierarchical Navigable Small World graph.
 *
 * Node ids equal positions. Upper layers hold exponentially fewer nodes
 * (level ~ -ln(U) / ln(M)); layer 0 keeps up to 2*M links per node, upper
 * layers up to M. Neighbour lists are pruned with the diversity heuristic
 * of Malkov and Yashunin.
 */
template <typename DistanceMetric>
class HnswIndex : public VectorIndex {
public:
    static constexpr uint32_t MaxLevel = 16;
    static constexpr uint32_t invalid_node_id = std::numeric_limits<uint32_t>::max();

    HnswIndex(size_t dim, IndexMetric metric, size_t M, size_t ef_construction, size_t ef_search);

    void add(const float* vectors, size_t n) override;
    std::vector<IndexHit> search(const float* query, size_t k) const override;
    std::vector<float> reconstruct(int64_t position) const override;

    size_t size() const override { return levels_.size(); }
    IndexAlgorithm algorithm() const override { return IndexAlgorithm::HNSW; }

    void setEf(size_t ef) { ef_search_ = ef; }
    size_t getEf() const { return ef_search_; }
    size_t getM() const { return M_; }
    int maxLevel() const { return max_level_; }

    /**
     * Neighbour list of node at level (empty if the node does not reach
     * that level).
     */
    const std::vector<uint32_t>& neighbors(uint32_t node, uint32_t level) const;

protected:
    void write_payload(std::ostream& out) const override;
    void read_payload(std::istream& in, uint64_t count) override;

private:
    uint32_t getRandomLevel();
    void addPoint(const float* point, uint32_t node_id);

    // Beam search restricted to one layer. Result sorted closest first.
    std::vector<std::pair<float, uint32_t>> searchLayer(const float* query, uint32_t entry_point_id,
                                                        uint32_t level, size_t ef) const;

    // Greedy walk on one layer towards query.
    std::pair<float, uint32_t> greedyClosest(const float* query, uint32_t entry_point_id, float entry_dist,
                                             uint32_t level) const;

    std::vector<std::pair<float, uint32_t>> selectNeighborsHeuristic(
        const std::vector<std::pair<float, uint32_t>>& candidates, size_t M_limit) const;

    const float* getVector(uint32_t node_id) const { return data_.data() + static_cast<size_t>(node_id) * dim_; }

    float distanceTo(const float* query, uint32_t node_id) const {
        return DistanceMetric::compare(query, getVector(node_id), dim_);
    }

    size_t M_;
    size_t maxM0_;
    size_t ef_construction_;
    size_t ef_search_;
    double mult_factor_;

    std::vector<float> data_;
    std::vector<uint32_t> levels_;
    std::vector<std::vector<std::vector<uint32_t>>> links_;  // node -> level -> neighbours
    uint32_t enter_point_node_id_ = invalid_node_id;
    int max_level_ = -1;

    std::mt19937 level_generator_;
};

} // namespace rfpindex

#endif // RFPINDEX_HNSW_INDEX_HPP
