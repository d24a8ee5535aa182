#include "ivf_index.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>

#include "flat_index.hpp"
#include "logging.hpp"

namespace rfpindex {

template <typename DistanceMetric>
IvfFlatIndex<DistanceMetric>::IvfFlatIndex(size_t dim, IndexMetric metric, size_t nlist, size_t nprobe)
    : VectorIndex(dim, metric)
    , nlist_(nlist == 0 ? 1 : nlist)
    , nprobe_(nprobe == 0 ? 1 : nprobe)
{
}

template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::add(const float* vectors, size_t n) {
    const int64_t first = static_cast<int64_t>(count_);
    data_.insert(data_.end(), vectors, vectors + n * dim_);
    count_ += n;

    if (!trained_) {
        if (count_ >= nlist_) {
            train();
        }
        return;
    }
    for (size_t i = 0; i < n; ++i) {
        int64_t pos = first + static_cast<int64_t>(i);
        lists_[nearestCentroid(vectorAt(pos))].push_back(pos);
    }
}

// --- K-means++ Initialization ---
template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::initializeCentroidsKMeansPlusPlus(
    const float* vectors, uint64_t n, float* centroids, uint32_t k) {

    // Fixed seed: the same data always yields the same partitioning.
    std::mt19937 gen(0x1F5EEDu);

    std::uniform_int_distribution<uint64_t> dist(0, n - 1);
    uint64_t first_idx = dist(gen);
    std::memcpy(centroids, vectors + first_idx * dim_, dim_ * sizeof(float));

    std::vector<float> min_distances(n, std::numeric_limits<float>::max());

    for (uint32_t c = 1; c < k; ++c) {
        const float* last_centroid = centroids + (c - 1) * dim_;
        double sum_distances = 0.0;

        #pragma omp parallel for reduction(+:sum_distances) if(n > 10000)
        for (uint64_t i = 0; i < n; ++i) {
            float d = distance::L2Sqr(vectors + i * dim_, last_centroid, dim_);
            if (d < min_distances[i]) {
                min_distances[i] = d;
            }
            sum_distances += min_distances[i];
        }

        // Every point already coincides with a centroid; duplicate one.
        if (sum_distances <= 0.0) {
            std::memcpy(centroids + c * dim_, vectors + (c % n) * dim_, dim_ * sizeof(float));
            continue;
        }

        std::uniform_real_distribution<double> sample_dist(0.0, sum_distances);
        double target = sample_dist(gen);
        double cumsum = 0.0;
        uint64_t chosen_idx = n - 1;
        for (uint64_t i = 0; i < n; ++i) {
            cumsum += min_distances[i];
            if (cumsum >= target) {
                chosen_idx = i;
                break;
            }
        }
        std::memcpy(centroids + c * dim_, vectors + chosen_idx * dim_, dim_ * sizeof(float));
    }
}

// --- K-means Step ---
template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::kmeansStep(
    const float* vectors, uint64_t n, float* centroids, uint32_t k, std::vector<uint32_t>& assignments) {

    assignments.resize(n);

    #pragma omp parallel for if(n > 10000)
    for (uint64_t i = 0; i < n; ++i) {
        float min_dist = std::numeric_limits<float>::max();
        uint32_t best_cluster = 0;
        for (uint32_t c = 0; c < k; ++c) {
            float d = distance::L2Sqr(vectors + i * dim_, centroids + c * dim_, dim_);
            if (d < min_dist) {
                min_dist = d;
                best_cluster = c;
            }
        }
        assignments[i] = best_cluster;
    }

    std::vector<float> new_centroids(static_cast<size_t>(k) * dim_, 0.0f);
    std::vector<uint64_t> counts(k, 0);
    for (uint64_t i = 0; i < n; ++i) {
        uint32_t c = assignments[i];
        counts[c]++;
        for (size_t d = 0; d < dim_; ++d) {
            new_centroids[c * dim_ + d] += vectors[i * dim_ + d];
        }
    }

    // Empty clusters keep their previous centroid.
    for (uint32_t c = 0; c < k; ++c) {
        if (counts[c] > 0) {
            float inv_count = 1.0f / counts[c];
            for (size_t d = 0; d < dim_; ++d) {
                centroids[c * dim_ + d] = new_centroids[c * dim_ + d] * inv_count;
            }
        }
    }
}

template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::train() {
    const uint32_t k = static_cast<uint32_t>(nlist_);
    centroids_.assign(static_cast<size_t>(k) * dim_, 0.0f);

    initializeCentroidsKMeansPlusPlus(data_.data(), count_, centroids_.data(), k);
    std::vector<uint32_t> assignments;
    for (uint32_t iter = 0; iter < kKMeansIterations; ++iter) {
        kmeansStep(data_.data(), count_, centroids_.data(), k, assignments);
    }

    lists_.assign(k, std::vector<int64_t>());
    for (size_t pos = 0; pos < count_; ++pos) {
        lists_[nearestCentroid(vectorAt(static_cast<int64_t>(pos)))].push_back(static_cast<int64_t>(pos));
    }
    trained_ = true;
    RFPINDEX_LOG_INFO("IVF", "Trained coarse quantizer: nlist=", nlist_, " vectors=", count_);
}

template <typename DistanceMetric>
uint32_t IvfFlatIndex<DistanceMetric>::nearestCentroid(const float* vector) const {
    float min_dist = std::numeric_limits<float>::max();
    uint32_t best = 0;
    for (uint32_t c = 0; c < nlist_; ++c) {
        float d = distance::L2Sqr(vector, centroids_.data() + c * dim_, dim_);
        if (d < min_dist) {
            min_dist = d;
            best = c;
        }
    }
    return best;
}

template <typename DistanceMetric>
std::vector<IndexHit> IvfFlatIndex<DistanceMetric>::search(const float* query, size_t k) const {
    if (k == 0 || count_ == 0) {
        return {};
    }

    if (!trained_) {
        std::vector<float> distances(count_);
        for (size_t i = 0; i < count_; ++i) {
            distances[i] = DistanceMetric::compare(query, vectorAt(static_cast<int64_t>(i)), dim_);
        }
        return select_top_k(distances, k);
    }

    // Rank centroids and keep the nprobe closest lists.
    std::vector<std::pair<float, uint32_t>> centroid_dists(nlist_);
    for (uint32_t c = 0; c < nlist_; ++c) {
        centroid_dists[c] = {distance::L2Sqr(query, centroids_.data() + c * dim_, dim_), c};
    }
    size_t probes = std::min(nprobe_, nlist_);
    std::partial_sort(centroid_dists.begin(), centroid_dists.begin() + probes, centroid_dists.end());

    std::vector<IndexHit> candidates;
    for (size_t p = 0; p < probes; ++p) {
        for (int64_t pos : lists_[centroid_dists[p].second]) {
            candidates.emplace_back(DistanceMetric::compare(query, vectorAt(pos), dim_), pos);
        }
    }

    k = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + k, candidates.end());
    candidates.resize(k);
    return candidates;
}

template <typename DistanceMetric>
std::vector<float> IvfFlatIndex<DistanceMetric>::reconstruct(int64_t position) const {
    if (position < 0 || static_cast<size_t>(position) >= count_) {
        throw std::out_of_range("position " + std::to_string(position) + " not in index");
    }
    return std::vector<float>(vectorAt(position), vectorAt(position) + dim_);
}

template <typename DistanceMetric>
std::vector<size_t> IvfFlatIndex<DistanceMetric>::list_sizes() const {
    std::vector<size_t> sizes;
    sizes.reserve(lists_.size());
    for (const auto& list : lists_) {
        sizes.push_back(list.size());
    }
    return sizes;
}

template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::write_payload(std::ostream& out) const {
    index_io::write_pod(out, static_cast<uint64_t>(nlist_));
    index_io::write_pod(out, static_cast<uint64_t>(nprobe_));
    index_io::write_pod(out, static_cast<uint8_t>(trained_ ? 1 : 0));
    index_io::write_vector(out, data_);
    if (trained_) {
        index_io::write_vector(out, centroids_);
        for (const auto& list : lists_) {
            index_io::write_vector(out, list);
        }
    }
}

template <typename DistanceMetric>
void IvfFlatIndex<DistanceMetric>::read_payload(std::istream& in, uint64_t count) {
    uint64_t nlist = 0;
    uint64_t nprobe = 0;
    uint8_t trained = 0;
    index_io::read_pod(in, nlist);
    index_io::read_pod(in, nprobe);
    index_io::read_pod(in, trained);
    if (nlist == 0) {
        throw std::runtime_error("corrupt ivf index: nlist is 0");
    }
    nlist_ = nlist;
    nprobe_ = nprobe == 0 ? 1 : nprobe;

    index_io::read_vector(in, data_, count * dim_);
    if (data_.size() != count * dim_) {
        throw std::runtime_error("corrupt ivf index: expected " + std::to_string(count) + " vectors");
    }
    count_ = count;

    trained_ = trained != 0;
    lists_.clear();
    centroids_.clear();
    if (trained_) {
        index_io::read_vector(in, centroids_, nlist_ * dim_);
        if (centroids_.size() != nlist_ * dim_) {
            throw std::runtime_error("corrupt ivf index: centroid table size");
        }
        lists_.resize(nlist_);
        std::vector<bool> seen(count, false);
        uint64_t listed = 0;
        for (auto& list : lists_) {
            index_io::read_vector(in, list, count);
            for (int64_t pos : list) {
                if (pos < 0 || static_cast<uint64_t>(pos) >= count) {
                    throw std::runtime_error("corrupt ivf index: position out of range");
                }
                if (seen[pos]) {
                    throw std::runtime_error("corrupt ivf index: position " + std::to_string(pos) + " listed twice");
                }
                seen[pos] = true;
            }
            listed += list.size();
        }
        if (listed != count) {
            throw std::runtime_error("corrupt ivf index: lists hold " + std::to_string(listed) + " of " +
                                     std::to_string(count) + " vectors");
        }
    }
}

template class IvfFlatIndex<distance::SquaredL2>;
template class IvfFlatIndex<distance::InnerProductDistance>;

} // namespace rfpindex
