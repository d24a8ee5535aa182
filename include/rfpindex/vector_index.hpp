/**
 * @file vector_index.hpp
 * @brief Abstract ANN index and its binary file format.
 *
 * Positions are dense and assigned in insertion order starting at 0. The
 * index never removes a vector; removal is handled above it as a
 * tombstone in the position mapping.
 *
 * File layout (native byte order):
 *   u64 magic | u32 version | u8 algorithm | u8 metric | u32 dim | u64 count
 *   algorithm-specific payload
 */

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"

namespace rfpindex {

//=============================================================================
// Constants
//=============================================================================

constexpr uint64_t INDEX_FILE_MAGIC = 0x5246504958564543ULL;  // "RFPIXVEC"
constexpr uint32_t INDEX_FILE_VERSION = 1;

/**
 * Distance family the index compares with. Inner-product indexes expect
 * unit-length vectors.
 */
enum class IndexMetric : uint8_t {
    INNER_PRODUCT = 0,
    L2 = 1,
};

/**
 * Hit from an index search: smaller distance is closer.
 */
using IndexHit = std::pair<float, int64_t>;

class VectorIndex {
public:
    VectorIndex(size_t dim, IndexMetric metric) : dim_(dim), metric_(metric) {}
    virtual ~VectorIndex() = default;

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * Append n vectors of dimension() floats each, at positions
     * size() .. size() + n - 1.
     */
    virtual void add(const float* vectors, size_t n) = 0;

    /**
     * Up to k hits ordered by increasing distance.
     */
    virtual std::vector<IndexHit> search(const float* query, size_t k) const = 0;

    /**
     * Copy of the vector stored at position.
     * @throws std::out_of_range for positions >= size()
     */
    virtual std::vector<float> reconstruct(int64_t position) const = 0;

    virtual size_t size() const = 0;

    virtual IndexAlgorithm algorithm() const = 0;

    size_t dimension() const { return dim_; }
    IndexMetric metric() const { return metric_; }

    /**
     * Convert a distance returned by search() into the similarity score
     * reported to callers (inner product, or 1 / (1 + squared L2)).
     */
    float to_similarity(float dist) const;

    /**
     * Write the index to path. Throws PersistenceError on I/O failure.
     */
    void save(const std::string& path) const;

    /**
     * Read an index written by save(), whatever its algorithm.
     * @throws PersistenceError on I/O failure or a corrupt file
     */
    static std::unique_ptr<VectorIndex> load(const std::string& path);

protected:
    virtual void write_payload(std::ostream& out) const = 0;
    virtual void read_payload(std::istream& in, uint64_t count) = 0;

    size_t dim_;
    IndexMetric metric_;
};

/**
 * Build an empty index for the configured algorithm. The metric follows
 * IndexConfig::uses_inner_product().
 */
std::unique_ptr<VectorIndex> create_vector_index(const IndexConfig& config);

//=============================================================================
// Binary I/O helpers shared by the index implementations
//=============================================================================

namespace index_io {

template <typename T>
void write_pod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
void read_pod(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) {
        throw std::runtime_error("unexpected end of index file");
    }
}

template <typename T>
void write_vector(std::ostream& out, const std::vector<T>& values) {
    write_pod(out, static_cast<uint64_t>(values.size()));
    if (!values.empty()) {
        out.write(reinterpret_cast<const char*>(values.data()), values.size() * sizeof(T));
    }
}

template <typename T>
void read_vector(std::istream& in, std::vector<T>& values, uint64_t max_elements) {
    uint64_t n = 0;
    read_pod(in, n);
    if (n > max_elements) {
        throw std::runtime_error("corrupt index file: vector length " + std::to_string(n));
    }
    values.resize(n);
    if (n > 0) {
        in.read(reinterpret_cast<char*>(values.data()), n * sizeof(T));
        if (!in) {
            throw std::runtime_error("unexpected end of index file");
        }
    }
}

} // namespace index_io

} // namespace rfpindex
