/**
 * @file vector_store.cpp
 * @brief Index engine implementation.
 */

#include "vector_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include "distance.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace rfpindex {

namespace fs = std::filesystem;

namespace {

void ensure_parent_directory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw PersistenceError("Cannot create directory: " + ec.message(), parent.string());
    }
}

void rename_into_place(const std::string& tmp, const std::string& path) {
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw PersistenceError("Cannot replace file: " + ec.message(), path);
    }
}

bool has_filters(const Filters& filters) {
    return filters.is_object() && !filters.empty();
}

} // namespace

const char* store_state_to_string(StoreState state) {
    switch (state) {
        case StoreState::UNINITIALIZED: return "uninitialized";
        case StoreState::LOADING:       return "loading";
        case StoreState::FRESH:         return "fresh";
        case StoreState::READY:         return "ready";
        case StoreState::CLOSED:        return "closed";
        default: return "unknown";
    }
}

nlohmann::json StoreStats::to_json() const {
    return {
        {"total_documents", total_documents},
        {"total_vectors", total_vectors},
        {"tombstoned_vectors", tombstoned_vectors},
        {"dimension", dimension},
        {"index_type", index_type},
        {"metric", metric},
        {"embedding_model", embedding_model},
        {"is_initialized", is_initialized},
    };
}

//=============================================================================
// Construction and startup
//=============================================================================

VectorStore::VectorStore(IndexConfig config, std::shared_ptr<EmbeddingProvider> provider)
    : config_(std::move(config))
    , provider_(std::move(provider))
{
}

void VectorStore::initialize() {
    StoreState expected = StoreState::UNINITIALIZED;
    if (!state_.compare_exchange_strong(expected, StoreState::LOADING)) {
        throw std::logic_error(std::string("initialize() called in state ") + store_state_to_string(expected));
    }

    try {
        setup_provider();

        std::unique_lock lock(mutex_);
        bool loaded = config_.store_on_disk && load_persisted();
        if (!loaded) {
            state_.store(StoreState::FRESH, std::memory_order_release);
            reset_index_locked();
            RFPINDEX_LOG_INFO("VectorStore", "Created new ", algorithm_to_string(config_.algorithm),
                              " index (dim=", config_.dimension, ")");
        }
    } catch (...) {
        state_.store(StoreState::UNINITIALIZED, std::memory_order_release);
        throw;
    }
    state_.store(StoreState::READY, std::memory_order_release);
}

void VectorStore::setup_provider() {
    if (!provider_) {
        try {
            provider_ = create_embedding_provider(config_);
        } catch (const InitializationError& e) {
            RFPINDEX_LOG_WARN("VectorStore", "Embedding model ", config_.embedding_model, " unavailable: ",
                              e.what(), "; falling back to ", kFallbackEmbeddingModel);
            try {
                provider_ = create_default_embedding_provider();
            } catch (const std::exception& fallback_error) {
                throw InitializationError(std::string("Fallback embedding provider failed: ") +
                                          fallback_error.what());
            }
        }
    }

    if (provider_->dimension() != config_.dimension) {
        RFPINDEX_LOG_WARN("VectorStore", "Configured dimension ", config_.dimension, " differs from provider ",
                          provider_->model_name(), " width ", provider_->dimension(), "; using ",
                          provider_->dimension());
        config_.dimension = provider_->dimension();
    }
    config_.embedding_model = provider_->model_name();
}

bool VectorStore::load_persisted() {
    if (!fs::exists(config_.metadata_path) || !fs::exists(config_.index_path)) {
        return false;
    }

    try {
        nlohmann::json meta;
        {
            std::ifstream in(config_.metadata_path);
            if (!in) {
                throw PersistenceError("Cannot open metadata sidecar", config_.metadata_path);
            }
            meta = nlohmann::json::parse(in);
        }

        absl::flat_hash_map<std::string, VectorDocument> docs;
        for (const auto& j : meta.at("documents")) {
            VectorDocument doc = VectorDocument::from_json(j);
            std::string id = doc.id;
            docs.insert_or_assign(std::move(id), std::move(doc));
        }
        const auto& mapping = meta.at("id_mapping");
        const auto& saved = meta.at("config");
        const size_t saved_dim = saved.value("dimension", size_t{0});
        const std::string saved_model = saved.value("embedding_model", std::string());

        auto index = VectorIndex::load(config_.index_path);

        // Live documents in position order.
        std::vector<std::pair<int64_t, std::string>> live;
        for (size_t pos = 0; pos < mapping.size(); ++pos) {
            if (mapping[pos].is_string() && docs.contains(mapping[pos].get<std::string>())) {
                live.emplace_back(static_cast<int64_t>(pos), mapping[pos].get<std::string>());
            }
        }
        if (live.size() != docs.size()) {
            RFPINDEX_LOG_WARN("VectorStore", "Sidecar lists ", docs.size(), " documents but maps ", live.size(),
                              "; unmapped documents are re-embedded");
        }

        const IndexMetric wanted_metric = config_.uses_inner_product() ? IndexMetric::INNER_PRODUCT : IndexMetric::L2;
        const bool same_vectors = index->dimension() == config_.dimension && saved_dim == config_.dimension &&
                                  saved_model == config_.embedding_model && mapping.size() == index->size();
        const bool same_layout = index->algorithm() == config_.algorithm && index->metric() == wanted_metric;

        if (same_vectors && same_layout && live.size() == docs.size()) {
            index_ = std::move(index);
            position_to_id_.assign(index_->size(), std::nullopt);
            for (auto& [pos, id] : live) {
                VectorDocument doc = std::move(docs.at(id));
                doc.embedding = index_->reconstruct(pos);
                position_to_id_[pos] = id;
                id_to_position_[id] = pos;
                documents_.insert_or_assign(id, std::move(doc));
            }
            RFPINDEX_LOG_INFO("VectorStore", "Loaded ", documents_.size(), " documents (", index_->size(),
                              " vectors) from ", config_.index_path);
            return true;
        }

        // Migration: keep stored vectors when they came from the same model,
        // otherwise re-embed everything.
        std::vector<VectorDocument> ordered;
        ordered.reserve(docs.size());
        absl::flat_hash_map<std::string, bool> placed;
        for (auto& [pos, id] : live) {
            VectorDocument doc = std::move(docs.at(id));
            if (same_vectors) {
                doc.embedding = index->reconstruct(pos);
            } else {
                doc.embedding.reset();
            }
            placed[id] = true;
            ordered.push_back(std::move(doc));
        }
        for (auto& [id, doc] : docs) {
            if (!placed.contains(id)) {
                doc.embedding.reset();
                ordered.push_back(std::move(doc));
            }
        }

        RFPINDEX_LOG_WARN("VectorStore", "Persisted index (", algorithm_to_string(index->algorithm()), ", dim=",
                          index->dimension(), ", model=", saved_model, ") does not match active configuration (",
                          algorithm_to_string(config_.algorithm), ", dim=", config_.dimension, ", model=",
                          config_.embedding_model, "); migrating ", ordered.size(), " documents",
                          same_vectors ? "" : " by re-embedding");
        reembed_all(std::move(ordered));
        persist_locked();
        return true;
    } catch (const std::exception& e) {
        RFPINDEX_LOG_ERROR("VectorStore", "Failed to load persisted index: ", e.what(), "; starting fresh");
        index_.reset();
        position_to_id_.clear();
        id_to_position_.clear();
        documents_.clear();
        return false;
    }
}

void VectorStore::reembed_all(std::vector<VectorDocument> docs) {
    reset_index_locked();
    if (docs.empty()) {
        return;
    }
    const size_t batch = std::max<size_t>(config_.batch_size, 1);
    for (size_t begin = 0; begin < docs.size(); begin += batch) {
        size_t end = std::min(begin + batch, docs.size());
        std::vector<VectorDocument> slice(std::make_move_iterator(docs.begin() + begin),
                                          std::make_move_iterator(docs.begin() + end));
        append_locked(prepare(std::move(slice)));
    }
}

void VectorStore::reset_index_locked() {
    index_ = create_vector_index(config_);
    position_to_id_.clear();
    id_to_position_.clear();
    documents_.clear();
}

void VectorStore::require_ready(const char* operation) const {
    StoreState s = state();
    if (s != StoreState::READY) {
        throw std::logic_error(std::string(operation) + " requires a ready store (state=" +
                               store_state_to_string(s) + ")");
    }
}

//=============================================================================
// Mutations
//=============================================================================

VectorStore::PreparedBatch VectorStore::prepare(std::vector<VectorDocument> docs) const {
    const size_t dim = config_.dimension;

    std::vector<size_t> missing;
    std::vector<std::string> texts;
    for (size_t i = 0; i < docs.size(); ++i) {
        if (!docs[i].embedding) {
            missing.push_back(i);
            texts.push_back(docs[i].content);
        }
    }

    if (!texts.empty()) {
        std::vector<std::vector<float>> vectors;
        try {
            vectors = provider_->embed(texts);
        } catch (const EmbeddingError&) {
            throw;
        } catch (const std::exception& e) {
            throw EmbeddingError(std::string("Embedding failed: ") + e.what());
        }
        if (vectors.size() != texts.size()) {
            throw EmbeddingError("Provider returned " + std::to_string(vectors.size()) + " vectors for " +
                                 std::to_string(texts.size()) + " texts");
        }
        for (size_t i = 0; i < missing.size(); ++i) {
            docs[missing[i]].embedding = std::move(vectors[i]);
        }
    }

    PreparedBatch batch;
    batch.vectors.reserve(docs.size() * dim);
    const bool normalize = config_.uses_inner_product();
    for (auto& doc : docs) {
        if (doc.id.empty()) {
            throw std::invalid_argument("document id must not be empty");
        }
        auto& vec = *doc.embedding;
        if (vec.size() != dim) {
            throw std::invalid_argument("document " + doc.id + " has a " + std::to_string(vec.size()) +
                                        "-dimensional vector, index expects " + std::to_string(dim));
        }
        if (normalize) {
            distance::normalize(vec.data(), dim);
        }
        batch.vectors.insert(batch.vectors.end(), vec.begin(), vec.end());
    }
    batch.docs = std::move(docs);
    return batch;
}

bool VectorStore::tombstone_locked(const std::string& id) {
    auto it = id_to_position_.find(id);
    if (it == id_to_position_.end()) {
        return false;
    }
    position_to_id_[it->second].reset();
    id_to_position_.erase(it);
    documents_.erase(id);
    return true;
}

void VectorStore::append_locked(PreparedBatch&& batch) {
    if (batch.docs.empty()) {
        return;
    }
    const int64_t start = static_cast<int64_t>(index_->size());
    index_->add(batch.vectors.data(), batch.docs.size());

    for (size_t i = 0; i < batch.docs.size(); ++i) {
        VectorDocument& doc = batch.docs[i];
        const int64_t pos = start + static_cast<int64_t>(i);
        tombstone_locked(doc.id);
        position_to_id_.push_back(doc.id);
        id_to_position_[doc.id] = pos;
        std::string id = doc.id;
        documents_.insert_or_assign(std::move(id), std::move(doc));
    }
}

void VectorStore::persist_locked() {
    if (!config_.store_on_disk) {
        return;
    }
    try {
        ensure_parent_directory(config_.index_path);
        ensure_parent_directory(config_.metadata_path);

        const std::string index_tmp = config_.index_path + ".tmp";
        index_->save(index_tmp);
        rename_into_place(index_tmp, config_.index_path);

        nlohmann::json documents = nlohmann::json::array();
        nlohmann::json mapping = nlohmann::json::array();
        for (const auto& id : position_to_id_) {
            if (id) {
                mapping.push_back(*id);
                documents.push_back(documents_.at(*id).to_json());
            } else {
                mapping.push_back(nullptr);
            }
        }
        nlohmann::json meta = {
            {"config",
             {
                 {"dimension", config_.dimension},
                 {"index_type", algorithm_to_string(config_.algorithm)},
                 {"embedding_model", config_.embedding_model},
                 {"metric", metric_to_string(config_.metric)},
             }},
            {"documents", std::move(documents)},
            {"id_mapping", std::move(mapping)},
        };

        const std::string meta_tmp = config_.metadata_path + ".tmp";
        {
            std::ofstream out(meta_tmp, std::ios::trunc);
            if (!out) {
                throw PersistenceError("Cannot open metadata sidecar for writing", meta_tmp);
            }
            out << meta.dump(2);
            out.flush();
            if (!out) {
                throw PersistenceError("Failed writing metadata sidecar", meta_tmp);
            }
        }
        rename_into_place(meta_tmp, config_.metadata_path);
    } catch (const PersistenceError& e) {
        RFPINDEX_LOG_ERROR("VectorStore", "Persist failed, in-memory state kept: ", e.what());
        throw;
    }
}

std::vector<std::string> VectorStore::add_documents(std::vector<VectorDocument> docs) {
    require_ready("add_documents");
    if (docs.empty()) {
        return {};
    }

    PreparedBatch batch = prepare(std::move(docs));
    std::vector<std::string> ids;
    ids.reserve(batch.docs.size());
    for (const auto& doc : batch.docs) {
        ids.push_back(doc.id);
    }

    std::unique_lock lock(mutex_);
    append_locked(std::move(batch));
    persist_locked();
    RFPINDEX_LOG_DEBUG("VectorStore", "Added ", ids.size(), " documents; index size ", index_->size());
    return ids;
}

std::string VectorStore::add_document(VectorDocument doc) {
    std::vector<VectorDocument> docs;
    docs.push_back(std::move(doc));
    return add_documents(std::move(docs)).front();
}

bool VectorStore::delete_document(const std::string& id) {
    require_ready("delete_document");
    std::unique_lock lock(mutex_);
    if (!tombstone_locked(id)) {
        return false;
    }
    persist_locked();
    return true;
}

size_t VectorStore::delete_documents(const Filters& filters) {
    require_ready("delete_documents");
    if (!has_filters(filters)) {
        throw std::invalid_argument("delete_documents requires a non-empty filter object");
    }
    std::unique_lock lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, doc] : documents_) {
        if (matches_filters(doc, filters)) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        tombstone_locked(id);
    }
    if (!ids.empty()) {
        persist_locked();
    }
    return ids.size();
}

bool VectorStore::update_document(VectorDocument doc) {
    require_ready("update_document");
    doc.updated_at = now_timestamp();

    std::vector<VectorDocument> docs;
    docs.push_back(std::move(doc));
    PreparedBatch batch = prepare(std::move(docs));

    std::unique_lock lock(mutex_);
    VectorDocument& incoming = batch.docs.front();
    bool existed = false;
    auto it = documents_.find(incoming.id);
    if (it != documents_.end()) {
        existed = true;
        incoming.created_at = it->second.created_at;
        tombstone_locked(incoming.id);
    }
    append_locked(std::move(batch));
    persist_locked();
    return existed;
}

void VectorStore::rebuild_index() {
    require_ready("rebuild_index");
    std::unique_lock lock(mutex_);

    const size_t before = index_->size();
    std::vector<VectorDocument> live;
    live.reserve(documents_.size());
    for (size_t pos = 0; pos < position_to_id_.size(); ++pos) {
        if (!position_to_id_[pos]) {
            continue;
        }
        VectorDocument doc = documents_.at(*position_to_id_[pos]);
        doc.embedding = index_->reconstruct(static_cast<int64_t>(pos));
        live.push_back(std::move(doc));
    }

    // Vectors are already present, so prepare() does not call the provider.
    PreparedBatch batch = prepare(std::move(live));
    reset_index_locked();
    append_locked(std::move(batch));
    persist_locked();
    RFPINDEX_LOG_INFO("VectorStore", "Rebuilt index: ", before, " -> ", index_->size(), " vectors");
}

void VectorStore::save() {
    require_ready("save");
    std::unique_lock lock(mutex_);
    persist_locked();
}

void VectorStore::close() {
    if (state() == StoreState::CLOSED) {
        return;
    }
    require_ready("close");
    std::unique_lock lock(mutex_);
    persist_locked();
    state_.store(StoreState::CLOSED, std::memory_order_release);
    RFPINDEX_LOG_INFO("VectorStore", "Closed store with ", documents_.size(), " documents");
}

//=============================================================================
// Reads
//=============================================================================

std::vector<SearchResult> VectorStore::search(const std::string& query, size_t top_k, const Filters& filters,
                                              float min_similarity) const {
    require_ready("search");
    if (top_k == 0) {
        return {};
    }
    std::vector<float> vec;
    try {
        vec = provider_->embed_one(query);
    } catch (const EmbeddingError&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingError(std::string("Query embedding failed: ") + e.what());
    }
    return search_by_vector(std::move(vec), top_k, filters, min_similarity);
}

std::vector<SearchResult> VectorStore::search_by_vector(std::vector<float> query, size_t top_k,
                                                        const Filters& filters, float min_similarity) const {
    require_ready("search_by_vector");
    if (query.size() != config_.dimension) {
        throw std::invalid_argument("query vector has dimension " + std::to_string(query.size()) + ", expected " +
                                    std::to_string(config_.dimension));
    }
    if (top_k == 0) {
        return {};
    }
    if (config_.uses_inner_product()) {
        distance::normalize(query.data(), query.size());
    }

    std::shared_lock lock(mutex_);
    return search_locked(query, top_k, filters, min_similarity);
}

std::vector<SearchResult> VectorStore::search_locked(const std::vector<float>& query, size_t top_k,
                                                     const Filters& filters, float min_similarity) const {
    const size_t ntotal = index_->size();
    if (ntotal == 0) {
        return {};
    }

    const bool filtered = has_filters(filters);
    const size_t tombstones = ntotal - id_to_position_.size();
    size_t search_k = filtered ? std::min(top_k * config_.over_fetch_factor, ntotal) : top_k;
    search_k = std::min(search_k + tombstones, ntotal);

    auto hits = index_->search(query.data(), search_k);

    std::vector<SearchResult> results;
    for (const auto& [dist, pos] : hits) {
        if (pos < 0 || static_cast<size_t>(pos) >= position_to_id_.size() || !position_to_id_[pos]) {
            continue;
        }
        auto it = documents_.find(*position_to_id_[pos]);
        if (it == documents_.end()) {
            continue;
        }
        float score = index_->to_similarity(dist);
        if (score < min_similarity) {
            continue;
        }
        if (filtered && !matches_filters(it->second, filters)) {
            continue;
        }

        SearchResult result;
        result.document = it->second;
        result.similarity_score = score;
        result.rank = results.size() + 1;
        results.push_back(std::move(result));
        if (results.size() >= top_k) {
            break;
        }
    }
    return results;
}

std::optional<VectorDocument> VectorStore::get_document(const std::string& id) const {
    require_ready("get_document");
    std::shared_lock lock(mutex_);
    auto it = documents_.find(id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<VectorDocument> VectorStore::list_documents(size_t limit, size_t offset, const Filters& filters) const {
    require_ready("list_documents");
    std::shared_lock lock(mutex_);

    std::vector<VectorDocument> out;
    size_t skipped = 0;
    for (const auto& id : position_to_id_) {
        if (out.size() >= limit) {
            break;
        }
        if (!id) {
            continue;
        }
        const VectorDocument& doc = documents_.at(*id);
        if (!matches_filters(doc, filters)) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        out.push_back(doc);
    }
    return out;
}

StoreStats VectorStore::get_stats() const {
    StoreStats stats;
    stats.is_initialized = is_ready();
    stats.dimension = config_.dimension;
    stats.index_type = algorithm_to_string(config_.algorithm);
    stats.metric = metric_to_string(config_.metric);
    stats.embedding_model = config_.embedding_model;
    if (!stats.is_initialized) {
        return stats;
    }

    std::shared_lock lock(mutex_);
    stats.total_documents = documents_.size();
    stats.total_vectors = index_->size();
    stats.tombstoned_vectors = stats.total_vectors - id_to_position_.size();
    return stats;
}

} // namespace rfpindex
