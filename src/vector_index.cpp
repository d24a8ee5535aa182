/**
 * @file vector_index.cpp
 * @brief Index factory, similarity conversion and file I/O.
 */

#include "vector_index.hpp"

#include <fstream>

#include "distance.hpp"
#include "errors.hpp"
#include "flat_index.hpp"
#include "hnsw_index.hpp"
#include "ivf_index.hpp"
#include "logging.hpp"

namespace rfpindex {

namespace {

std::unique_ptr<VectorIndex> make_index(IndexAlgorithm algorithm, IndexMetric metric, size_t dim,
                                        size_t nlist, size_t nprobe, size_t M, size_t ef_construction,
                                        size_t ef_search) {
    const bool ip = metric == IndexMetric::INNER_PRODUCT;
    switch (algorithm) {
        case IndexAlgorithm::FLAT_IP:
        case IndexAlgorithm::FLAT_L2:
            if (ip) {
                return std::make_unique<FlatIndex<distance::InnerProductDistance>>(dim, metric);
            }
            return std::make_unique<FlatIndex<distance::SquaredL2>>(dim, metric);
        case IndexAlgorithm::IVF_FLAT:
            if (ip) {
                return std::make_unique<IvfFlatIndex<distance::InnerProductDistance>>(dim, metric, nlist, nprobe);
            }
            return std::make_unique<IvfFlatIndex<distance::SquaredL2>>(dim, metric, nlist, nprobe);
        case IndexAlgorithm::HNSW:
            if (ip) {
                return std::make_unique<HnswIndex<distance::InnerProductDistance>>(dim, metric, M, ef_construction,
                                                                                   ef_search);
            }
            return std::make_unique<HnswIndex<distance::SquaredL2>>(dim, metric, M, ef_construction, ef_search);
        default:
            throw std::invalid_argument("Unsupported index algorithm");
    }
}

} // namespace

float VectorIndex::to_similarity(float dist) const {
    if (metric_ == IndexMetric::INNER_PRODUCT) {
        return distance::InnerProductDistance::to_similarity(dist);
    }
    return distance::SquaredL2::to_similarity(dist);
}

std::unique_ptr<VectorIndex> create_vector_index(const IndexConfig& config) {
    if (config.dimension == 0) {
        throw std::invalid_argument("index dimension must be positive");
    }
    IndexMetric metric = config.uses_inner_product() ? IndexMetric::INNER_PRODUCT : IndexMetric::L2;
    return make_index(config.algorithm, metric, config.dimension, config.nlist, config.nprobe, config.hnsw_m,
                      config.ef_construction, config.ef_search);
}

void VectorIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot open index file for writing", path);
    }

    index_io::write_pod(out, INDEX_FILE_MAGIC);
    index_io::write_pod(out, INDEX_FILE_VERSION);
    index_io::write_pod(out, static_cast<uint8_t>(algorithm()));
    index_io::write_pod(out, static_cast<uint8_t>(metric_));
    index_io::write_pod(out, static_cast<uint32_t>(dim_));
    index_io::write_pod(out, static_cast<uint64_t>(size()));
    write_payload(out);

    out.flush();
    if (!out) {
        throw PersistenceError("Failed writing index file", path);
    }
    RFPINDEX_LOG_DEBUG("VectorIndex", "Saved ", algorithm_to_string(algorithm()), " index with ", size(),
                       " vectors to ", path);
}

std::unique_ptr<VectorIndex> VectorIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PersistenceError("Cannot open index file", path);
    }

    try {
        uint64_t magic = 0;
        uint32_t version = 0;
        uint8_t algorithm = 0;
        uint8_t metric = 0;
        uint32_t dim = 0;
        uint64_t count = 0;
        index_io::read_pod(in, magic);
        if (magic != INDEX_FILE_MAGIC) {
            throw std::runtime_error("not an index file");
        }
        index_io::read_pod(in, version);
        if (version != INDEX_FILE_VERSION) {
            throw std::runtime_error("unsupported index file version " + std::to_string(version));
        }
        index_io::read_pod(in, algorithm);
        index_io::read_pod(in, metric);
        index_io::read_pod(in, dim);
        index_io::read_pod(in, count);
        if (algorithm > static_cast<uint8_t>(IndexAlgorithm::HNSW) ||
            metric > static_cast<uint8_t>(IndexMetric::L2) || dim == 0) {
            throw std::runtime_error("corrupt index header");
        }

        // Algorithm parameters are restored from the payload.
        auto index = make_index(static_cast<IndexAlgorithm>(algorithm), static_cast<IndexMetric>(metric), dim,
                                1, 1, 2, 2, 1);
        index->read_payload(in, count);
        return index;
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Failed to read index file: ") + e.what(), path);
    }
}

} // namespace rfpindex
