#include "hnsw_index.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <stdexcept>

#include "absl/container/flat_hash_set.h"

namespace rfpindex {

template <typename DistanceMetric>
HnswIndex<DistanceMetric>::HnswIndex(size_t dim, IndexMetric metric, size_t M, size_t ef_construction,
                                     size_t ef_search)
    : VectorIndex(dim, metric)
    , M_(std::max<size_t>(M, 2))
    , maxM0_(2 * std::max<size_t>(M, 2))
    , ef_construction_(std::max(ef_construction, std::max<size_t>(M, 2)))
    , ef_search_(ef_search == 0 ? 1 : ef_search)
    , mult_factor_(1.0 / std::log(static_cast<double>(std::max<size_t>(M, 2))))
    , level_generator_(100)
{
}

template <typename DistanceMetric>
const std::vector<uint32_t>& HnswIndex<DistanceMetric>::neighbors(uint32_t node, uint32_t level) const {
    static const std::vector<uint32_t> empty;
    if (node >= links_.size() || level >= links_[node].size()) {
        return empty;
    }
    return links_[node][level];
}

// --- Helper Functions ---
template <typename DistanceMetric>
uint32_t HnswIndex<DistanceMetric>::getRandomLevel() {
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    double u = distribution(level_generator_);
    if (u <= 0.0) {
        u = std::numeric_limits<double>::min();
    }
    double r = -std::log(u) * mult_factor_;
    return std::min(static_cast<uint32_t>(r), MaxLevel - 1);
}

template <typename DistanceMetric>
std::pair<float, uint32_t> HnswIndex<DistanceMetric>::greedyClosest(const float* query, uint32_t entry_point_id,
                                                                    float entry_dist, uint32_t level) const {
    uint32_t current = entry_point_id;
    float current_dist = entry_dist;
    bool changed = true;
    while (changed) {
        changed = false;
        for (uint32_t neighbor_id : neighbors(current, level)) {
            float d = distanceTo(query, neighbor_id);
            if (d < current_dist) {
                current_dist = d;
                current = neighbor_id;
                changed = true;
            }
        }
    }
    return {current_dist, current};
}

template <typename DistanceMetric>
std::vector<std::pair<float, uint32_t>> HnswIndex<DistanceMetric>::searchLayer(
    const float* query, uint32_t entry_point_id, uint32_t level, size_t ef) const {

    absl::flat_hash_set<uint32_t> visited;
    std::priority_queue<std::pair<float, uint32_t>> top_candidates;  // Max-heap to keep the best results
    std::priority_queue<std::pair<float, uint32_t>, std::vector<std::pair<float, uint32_t>>,
                        std::greater<std::pair<float, uint32_t>>>
        candidate_queue;  // Min-heap to explore candidates

    float entry_dist = distanceTo(query, entry_point_id);
    top_candidates.push({entry_dist, entry_point_id});
    candidate_queue.push({entry_dist, entry_point_id});
    visited.insert(entry_point_id);

    while (!candidate_queue.empty()) {
        auto current_pair = candidate_queue.top();
        candidate_queue.pop();

        if (top_candidates.size() >= ef && current_pair.first > top_candidates.top().first) {
            break;  // All further candidates are worse than the worst in our result set.
        }

        for (uint32_t neighbor_id : neighbors(current_pair.second, level)) {
            if (!visited.insert(neighbor_id).second) {
                continue;
            }
            float d = distanceTo(query, neighbor_id);
            if (top_candidates.size() < ef || d < top_candidates.top().first) {
                candidate_queue.push({d, neighbor_id});
                top_candidates.push({d, neighbor_id});
                if (top_candidates.size() > ef) {
                    top_candidates.pop();
                }
            }
        }
    }

    std::vector<std::pair<float, uint32_t>> result(top_candidates.size());
    for (size_t i = result.size(); i > 0; --i) {
        result[i - 1] = top_candidates.top();
        top_candidates.pop();
    }
    return result;
}

template <typename DistanceMetric>
std::vector<std::pair<float, uint32_t>> HnswIndex<DistanceMetric>::selectNeighborsHeuristic(
    const std::vector<std::pair<float, uint32_t>>& candidates, size_t M_limit) const {
    if (candidates.size() <= M_limit) {
        return candidates;
    }

    std::vector<std::pair<float, uint32_t>> result;
    result.reserve(M_limit);

    // candidates is sorted closest first.
    for (const auto& current_candidate : candidates) {
        if (result.size() >= M_limit) {
            break;
        }
        bool is_good_candidate = true;
        const float* candidate_vector = getVector(current_candidate.second);
        for (const auto& selected : result) {
            if (distanceTo(candidate_vector, selected.second) < current_candidate.first) {
                is_good_candidate = false;
                break;
            }
        }
        if (is_good_candidate) {
            result.push_back(current_candidate);
        }
    }
    return result;
}

template <typename DistanceMetric>
void HnswIndex<DistanceMetric>::addPoint(const float* point, uint32_t node_id) {
    const uint32_t node_level = getRandomLevel();
    levels_.push_back(node_level);
    links_.emplace_back(node_level + 1);

    if (enter_point_node_id_ == invalid_node_id) {
        enter_point_node_id_ = node_id;
        max_level_ = static_cast<int>(node_level);
        return;
    }

    uint32_t current = enter_point_node_id_;
    float current_dist = distanceTo(point, current);

    for (int level = max_level_; level > static_cast<int>(node_level); --level) {
        auto best = greedyClosest(point, current, current_dist, static_cast<uint32_t>(level));
        current_dist = best.first;
        current = best.second;
    }

    for (int level = std::min(static_cast<int>(node_level), max_level_); level >= 0; --level) {
        const uint32_t lvl = static_cast<uint32_t>(level);
        auto candidates = searchLayer(point, current, lvl, ef_construction_);
        auto selected = selectNeighborsHeuristic(candidates, M_);
        const size_t M_level = lvl == 0 ? maxM0_ : M_;

        auto& own_links = links_[node_id][lvl];
        own_links.reserve(selected.size());
        for (const auto& s : selected) {
            own_links.push_back(s.second);
        }

        for (const auto& s : selected) {
            auto& back_links = links_[s.second][lvl];
            back_links.push_back(node_id);
            if (back_links.size() <= M_level) {
                continue;
            }
            // Shrink the neighbour list of s back to M_level.
            const float* s_vector = getVector(s.second);
            std::vector<std::pair<float, uint32_t>> pruned;
            pruned.reserve(back_links.size());
            for (uint32_t n : back_links) {
                pruned.emplace_back(distanceTo(s_vector, n), n);
            }
            std::sort(pruned.begin(), pruned.end());
            pruned = selectNeighborsHeuristic(pruned, M_level);
            back_links.clear();
            for (const auto& p : pruned) {
                back_links.push_back(p.second);
            }
        }

        if (!candidates.empty()) {
            current = candidates.front().second;
        }
    }

    if (static_cast<int>(node_level) > max_level_) {
        max_level_ = static_cast<int>(node_level);
        enter_point_node_id_ = node_id;
    }
}

template <typename DistanceMetric>
void HnswIndex<DistanceMetric>::add(const float* vectors, size_t n) {
    if (levels_.size() + n >= invalid_node_id) {
        throw std::length_error("HNSW index is full");
    }
    data_.insert(data_.end(), vectors, vectors + n * dim_);
    for (size_t i = 0; i < n; ++i) {
        uint32_t node_id = static_cast<uint32_t>(levels_.size());
        addPoint(getVector(node_id), node_id);
    }
}

template <typename DistanceMetric>
std::vector<IndexHit> HnswIndex<DistanceMetric>::search(const float* query, size_t k) const {
    if (k == 0 || enter_point_node_id_ == invalid_node_id) {
        return {};
    }

    uint32_t current = enter_point_node_id_;
    float current_dist = distanceTo(query, current);
    for (int level = max_level_; level > 0; --level) {
        auto best = greedyClosest(query, current, current_dist, static_cast<uint32_t>(level));
        current_dist = best.first;
        current = best.second;
    }

    auto found = searchLayer(query, current, 0, std::max(ef_search_, k));
    std::vector<IndexHit> hits;
    hits.reserve(std::min(k, found.size()));
    for (size_t i = 0; i < found.size() && i < k; ++i) {
        hits.emplace_back(found[i].first, static_cast<int64_t>(found[i].second));
    }
    return hits;
}

template <typename DistanceMetric>
std::vector<float> HnswIndex<DistanceMetric>::reconstruct(int64_t position) const {
    if (position < 0 || static_cast<size_t>(position) >= levels_.size()) {
        throw std::out_of_range("position " + std::to_string(position) + " not in index");
    }
    const float* v = getVector(static_cast<uint32_t>(position));
    return std::vector<float>(v, v + dim_);
}

template <typename DistanceMetric>
void HnswIndex<DistanceMetric>::write_payload(std::ostream& out) const {
    index_io::write_pod(out, static_cast<uint64_t>(M_));
    index_io::write_pod(out, static_cast<uint64_t>(ef_construction_));
    index_io::write_pod(out, static_cast<uint64_t>(ef_search_));
    index_io::write_pod(out, static_cast<int32_t>(max_level_));
    index_io::write_pod(out, enter_point_node_id_);
    index_io::write_vector(out, data_);
    index_io::write_vector(out, levels_);
    for (const auto& node_links : links_) {
        for (const auto& level_links : node_links) {
            index_io::write_vector(out, level_links);
        }
    }
}

template <typename DistanceMetric>
void HnswIndex<DistanceMetric>::read_payload(std::istream& in, uint64_t count) {
    uint64_t M = 0;
    uint64_t ef_construction = 0;
    uint64_t ef_search = 0;
    int32_t max_level = -1;
    index_io::read_pod(in, M);
    index_io::read_pod(in, ef_construction);
    index_io::read_pod(in, ef_search);
    index_io::read_pod(in, max_level);
    index_io::read_pod(in, enter_point_node_id_);

    if (M < 2 || max_level >= static_cast<int32_t>(MaxLevel)) {
        throw std::runtime_error("corrupt hnsw index header");
    }
    M_ = M;
    maxM0_ = 2 * M;
    ef_construction_ = ef_construction;
    ef_search_ = ef_search == 0 ? 1 : ef_search;
    mult_factor_ = 1.0 / std::log(static_cast<double>(M));
    max_level_ = max_level;

    index_io::read_vector(in, data_, count * dim_);
    index_io::read_vector(in, levels_, count);
    if (data_.size() != count * dim_ || levels_.size() != count) {
        throw std::runtime_error("corrupt hnsw index: expected " + std::to_string(count) + " nodes");
    }
    if (count > 0 && enter_point_node_id_ >= count) {
        throw std::runtime_error("corrupt hnsw index: bad entry point");
    }

    links_.assign(count, std::vector<std::vector<uint32_t>>());
    for (uint64_t node = 0; node < count; ++node) {
        if (levels_[node] >= MaxLevel) {
            throw std::runtime_error("corrupt hnsw index: bad node level");
        }
        links_[node].resize(levels_[node] + 1);
        for (auto& level_links : links_[node]) {
            index_io::read_vector(in, level_links, count);
            for (uint32_t n : level_links) {
                if (n >= count) {
                    throw std::runtime_error("corrupt hnsw index: dangling link");
                }
            }
        }
    }
}

template class HnswIndex<distance::SquaredL2>;
template class HnswIndex<distance::InnerProductDistance>;

} // namespace rfpindex
