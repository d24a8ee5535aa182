#include "flat_index.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace rfpindex {

std::vector<IndexHit> select_top_k(const std::vector<float>& distances, size_t k) {
    std::vector<int64_t> order(distances.size());
    std::iota(order.begin(), order.end(), 0);
    k = std::min(k, order.size());

    auto closer = [&distances](int64_t a, int64_t b) {
        if (distances[a] != distances[b]) {
            return distances[a] < distances[b];
        }
        return a < b;
    };
    std::partial_sort(order.begin(), order.begin() + k, order.end(), closer);

    std::vector<IndexHit> hits;
    hits.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        hits.emplace_back(distances[order[i]], order[i]);
    }
    return hits;
}

template <typename DistanceMetric>
void FlatIndex<DistanceMetric>::add(const float* vectors, size_t n) {
    data_.insert(data_.end(), vectors, vectors + n * dim_);
    count_ += n;
}

template <typename DistanceMetric>
std::vector<IndexHit> FlatIndex<DistanceMetric>::search(const float* query, size_t k) const {
    if (k == 0 || count_ == 0) {
        return {};
    }
    std::vector<float> distances(count_);
    const int64_t n = static_cast<int64_t>(count_);

    #pragma omp parallel for if(n > 10000)
    for (int64_t i = 0; i < n; ++i) {
        distances[i] = DistanceMetric::compare(query, data_.data() + i * dim_, dim_);
    }
    return select_top_k(distances, k);
}

template <typename DistanceMetric>
std::vector<float> FlatIndex<DistanceMetric>::reconstruct(int64_t position) const {
    if (position < 0 || static_cast<size_t>(position) >= count_) {
        throw std::out_of_range("position " + std::to_string(position) + " not in index");
    }
    auto begin = data_.begin() + position * dim_;
    return std::vector<float>(begin, begin + dim_);
}

template <typename DistanceMetric>
void FlatIndex<DistanceMetric>::write_payload(std::ostream& out) const {
    index_io::write_vector(out, data_);
}

template <typename DistanceMetric>
void FlatIndex<DistanceMetric>::read_payload(std::istream& in, uint64_t count) {
    index_io::read_vector(in, data_, count * dim_);
    if (data_.size() != count * dim_) {
        throw std::runtime_error("corrupt flat index: expected " + std::to_string(count) + " vectors");
    }
    count_ = count;
}

template class FlatIndex<distance::SquaredL2>;
template class FlatIndex<distance::InnerProductDistance>;

} // namespace rfpindex
