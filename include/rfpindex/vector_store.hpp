/**
 * @file vector_store.hpp
 * @brief Index engine: ANN index + position mapping + document store.
 *
 * Positions in the ANN index are append-only. Deleting or replacing a
 * document tombstones its position; only rebuild_index() reclaims space.
 *
 * Locking: one reader-writer lock per store. Mutations and the
 * persistence write they trigger hold it exclusively; search and lookups
 * hold it shared. Embeddings are computed before the exclusive lock is
 * taken.
 *
 * Persistence: the index file is written first, then the metadata
 * sidecar, each through a temporary file and a rename. A crash between
 * the two renames leaves a sidecar that does not describe the index; the
 * next load detects the mismatch and re-embeds from the sidecar.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "absl/container/flat_hash_map.h"

#include "config.hpp"
#include "document.hpp"
#include "embedding.hpp"
#include "vector_index.hpp"

namespace rfpindex {

enum class StoreState : uint8_t {
    UNINITIALIZED = 0,
    LOADING = 1,   // reading persisted state
    FRESH = 2,     // no usable persisted state, new empty index
    READY = 3,
    CLOSED = 4,
};

const char* store_state_to_string(StoreState state);

struct StoreStats {
    size_t total_documents = 0;
    size_t total_vectors = 0;       // including tombstoned positions
    size_t tombstoned_vectors = 0;
    size_t dimension = 0;
    std::string index_type;
    std::string metric;
    std::string embedding_model;
    bool is_initialized = false;

    nlohmann::json to_json() const;
};

class VectorStore {
public:
    /**
     * @param provider embedding provider to use; when null one is created
     *        from config during initialize()
     */
    explicit VectorStore(IndexConfig config, std::shared_ptr<EmbeddingProvider> provider = nullptr);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * Bring the store to READY: set up the embedding provider (falling back
     * to the default one on InitializationError), then load persisted state
     * or start fresh. config().dimension is replaced by the provider width.
     * @throws InitializationError if neither provider can be created
     */
    void initialize();

    StoreState state() const { return state_.load(std::memory_order_acquire); }
    bool is_ready() const { return state() == StoreState::READY; }

    const IndexConfig& config() const { return config_; }
    EmbeddingProvider& embedding_provider() const { return *provider_; }

    //=========================================================================
    // Mutations
    //=========================================================================

    /**
     * Add documents as one batch. Documents without an embedding are
     * embedded together before any state changes. Vectors are appended in
     * input order; a document whose id is already live replaces it.
     * @return the ids added, in input order
     * @throws EmbeddingError if embedding fails (nothing is added)
     * @throws std::invalid_argument for a vector of the wrong width
     * @throws PersistenceError if the write after the mutation fails
     */
    std::vector<std::string> add_documents(std::vector<VectorDocument> docs);

    std::string add_document(VectorDocument doc);

    /**
     * Soft delete. Returns false for unknown ids.
     */
    bool delete_document(const std::string& id);

    /**
     * Soft delete every live document matching filters (a non-empty
     * object). Returns the number removed.
     */
    size_t delete_documents(const Filters& filters);

    /**
     * Replace the document with the same id and refresh updated_at.
     * The new version is inserted even when the id was unknown.
     * @return true if a previous version existed
     */
    bool update_document(VectorDocument doc);

    /**
     * Rebuild the index from live documents, dropping tombstoned
     * positions. Vectors are recovered from the old index.
     */
    void rebuild_index();

    /**
     * Write index and sidecar now. No-op unless store_on_disk.
     */
    void save();

    /**
     * Persist and move to CLOSED. Further calls fail with logic_error.
     */
    void close();

    //=========================================================================
    // Reads
    //=========================================================================

    /**
     * Top documents for query by similarity, best first.
     *
     * With filters, min(top_k * over_fetch_factor, index size) candidates
     * are requested from the index and filtered in order. Tombstoned
     * positions and scores below min_similarity are skipped.
     * @throws EmbeddingError if the query cannot be embedded
     */
    std::vector<SearchResult> search(const std::string& query, size_t top_k = 10, const Filters& filters = {},
                                     float min_similarity = 0.0f) const;

    std::vector<SearchResult> search_by_vector(std::vector<float> query, size_t top_k = 10,
                                               const Filters& filters = {}, float min_similarity = 0.0f) const;

    std::optional<VectorDocument> get_document(const std::string& id) const;

    /**
     * Live documents in insertion order of their current version.
     */
    std::vector<VectorDocument> list_documents(size_t limit = 100, size_t offset = 0,
                                               const Filters& filters = {}) const;

    StoreStats get_stats() const;

private:
    struct PreparedBatch {
        std::vector<VectorDocument> docs;
        std::vector<float> vectors;  // docs.size() * dim, normalized when needed
    };

    void require_ready(const char* operation) const;

    /**
     * Embed missing vectors, validate widths and normalize. Runs without
     * the store lock.
     */
    PreparedBatch prepare(std::vector<VectorDocument> docs) const;

    // The following expect mutex_ to be held exclusively.
    void append_locked(PreparedBatch&& batch);
    bool tombstone_locked(const std::string& id);
    void persist_locked();
    void reset_index_locked();

    std::vector<SearchResult> search_locked(const std::vector<float>& query, size_t top_k, const Filters& filters,
                                            float min_similarity) const;

    void setup_provider();
    bool load_persisted();
    void reembed_all(std::vector<VectorDocument> docs);

    IndexConfig config_;
    std::shared_ptr<EmbeddingProvider> provider_;
    std::atomic<StoreState> state_{StoreState::UNINITIALIZED};

    mutable std::shared_mutex mutex_;
    std::unique_ptr<VectorIndex> index_;
    std::vector<std::optional<std::string>> position_to_id_;   // tombstone = nullopt
    absl::flat_hash_map<std::string, int64_t> id_to_position_;
    absl::flat_hash_map<std::string, VectorDocument> documents_;
};

} // namespace rfpindex
