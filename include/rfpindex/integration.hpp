/**
 * @file integration.hpp
 * @brief Maps business entities to vector documents and back.
 *
 * Document layout per entity:
 *
 *   opportunity      "opportunity_{id}"           type=opportunity, opportunity_id
 *   requirement      "requirement_{rid}"          type=requirement, requirement_id,
 *                                                 parent "opportunity_{id}"
 *   proposal         "proposal_{id}_chunk_{i}"    type=proposal, proposal_id
 *   won bid          "wonbid_{id}"                type=won_bid, won_bid_id
 *   project document "projectdoc_{id}_chunk_{i}"  type=project_documentation, doc_id
 *
 * Entity keys are stored in metadata as decimal strings.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "document.hpp"
#include "domain.hpp"
#include "repository.hpp"
#include "vector_store.hpp"

namespace rfpindex {

enum class EntityKind : uint8_t {
    OPPORTUNITY = 0,
    PROPOSAL = 1,
    WON_BID = 2,
    PROJECT_DOCUMENT = 3,
};

const char* entity_kind_to_string(EntityKind kind);

/**
 * Entity with the similarity of its best matching document.
 */
template <typename T>
using Scored = std::pair<T, float>;

struct Recommendations {
    int64_t opportunity_id = 0;
    size_t similar_won_bids = 0;
    nlohmann::json winning_patterns = nlohmann::json::array();
    nlohmann::json relevant_documentation = nlohmann::json::array();
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

struct ReindexCounts {
    size_t indexed = 0;
    size_t failed = 0;
    size_t documents = 0;
};

struct ReindexReport {
    ReindexCounts opportunities;
    ReindexCounts proposals;
    ReindexCounts won_bids;
    ReindexCounts project_documents;

    size_t total_failed() const {
        return opportunities.failed + proposals.failed + won_bids.failed + project_documents.failed;
    }

    nlohmann::json to_json() const;
};

class IntegrationService {
public:
    static constexpr size_t kProposalChunkSize = 1500;
    static constexpr size_t kProposalChunkOverlap = 150;
    static constexpr size_t kProjectDocChunkSize = 1200;
    static constexpr size_t kProjectDocChunkOverlap = 120;

    /**
     * @param store an initialized store
     * @param repositories entity lookups; a null repository disables the
     *        operations that need it
     */
    IntegrationService(std::shared_ptr<VectorStore> store, DomainRepositories repositories);

    VectorStore& store() const { return *store_; }

    //=========================================================================
    // Indexing
    //=========================================================================

    // Each index_* call adds the entity's current documents and then removes
    // any earlier ones it no longer produces (dropped chunks, requirements).

    std::vector<std::string> index_opportunity(const Opportunity& opportunity);
    std::vector<std::string> index_proposal(const Proposal& proposal);
    std::vector<std::string> index_won_bid(const WonBid& won_bid);
    std::vector<std::string> index_project_document(const ProjectDocument& doc);

    /**
     * Delete every document derived from one entity.
     * @return number of documents removed
     */
    size_t remove_entity(EntityKind kind, int64_t id);

    /**
     * Re-index all entities from the repositories, batch_size records per
     * page: opportunities, proposals, won bids, project documents. Failing
     * records are logged and counted.
     */
    ReindexReport bulk_reindex(size_t batch_size = 50);

    //=========================================================================
    // Typed search
    //=========================================================================

    /**
     * @param filters extra equality filters merged over {type: opportunity}
     */
    std::vector<Scored<Opportunity>> search_opportunities(const std::string& query, size_t top_k = 10,
                                                          const Filters& filters = {}) const;

    std::vector<Scored<WonBid>> find_similar_won_bids(const std::string& query, size_t top_k = 5) const;

    std::vector<Scored<ProjectDocument>> search_project_documents(
        const std::string& query, size_t top_k = 10, const std::optional<std::string>& doc_type = std::nullopt,
        const std::optional<std::string>& organization = std::nullopt) const;

    /**
     * Winning patterns and relevant documentation for an opportunity.
     * @return nullopt if the opportunity does not exist
     */
    std::optional<Recommendations> recommendations_for_opportunity(int64_t opportunity_id,
                                                                   size_t top_k = 5) const;

    //=========================================================================
    // Document builders
    //=========================================================================

    static std::vector<VectorDocument> opportunity_documents(const Opportunity& opportunity);
    static std::vector<VectorDocument> proposal_documents(const Proposal& proposal);
    static std::vector<VectorDocument> won_bid_documents(const WonBid& won_bid);
    static std::vector<VectorDocument> project_document_documents(const ProjectDocument& doc);

    static std::vector<std::string> generate_recommendations(const nlohmann::json& winning_patterns,
                                                             const nlohmann::json& relevant_documentation);

private:
    std::vector<std::string> replace_entity(EntityKind kind, int64_t id, std::vector<VectorDocument> docs);

    /**
     * Search documents of one entity type and resolve each distinct entity
     * key through lookup, best-scoring document first.
     */
    template <typename T, typename Lookup>
    std::vector<Scored<T>> search_entities(const std::string& query, size_t top_k, const Filters& filters,
                                           const char* key, bool chunked, Lookup lookup) const;

    template <typename T, typename Index>
    void reindex_all(const char* label, const std::shared_ptr<EntityRepository<T>>& repository, size_t batch_size,
                     ReindexCounts& counts, Index index);

    std::shared_ptr<VectorStore> store_;
    DomainRepositories repositories_;
};

} // namespace rfpindex
