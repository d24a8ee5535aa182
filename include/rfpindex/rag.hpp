/**
 * @file rag.hpp
 * @brief Retrieval facade for question answering over the store.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "integration.hpp"

namespace rfpindex {

struct RagHit {
    std::string id;
    nlohmann::json document;  // id, content, metadata, source, created_at, updated_at
    float score = 0.0f;

    nlohmann::json to_json() const;
};

class RagFacade {
public:
    static constexpr size_t kSnippetLength = 200;
    static constexpr size_t kMaxContextDocuments = 3;

    explicit RagFacade(std::shared_ptr<IntegrationService> service);

    /**
     * Add a batch of {id?, content, metadata?} objects. Missing ids become
     * "doc_{i}" after the position in the batch.
     * @return ids added
     */
    std::vector<std::string> build_index(const nlohmann::json& documents);

    std::string add_document(const std::string& id, const std::string& content,
                             const nlohmann::json& metadata = nlohmann::json::object());

    bool update_document(const std::string& id, const std::string& content,
                         const nlohmann::json& metadata = nlohmann::json::object());

    bool remove_document(const std::string& id);

    std::vector<RagHit> search(const std::string& query, size_t top_k = 5, const Filters& filters = {}) const;

    /**
     * Template answer quoting the first kSnippetLength characters of up to
     * kMaxContextDocuments context documents, with the quoted part cut to
     * max_length characters.
     */
    static std::string generate_response(const std::string& query, const std::vector<nlohmann::json>& context,
                                         size_t max_length = 500);

    /**
     * search() followed by generate_response(). Returns {query, response,
     * sources, search_results, context_documents}.
     */
    nlohmann::json query_with_response(const std::string& query, size_t top_k = 5,
                                       size_t max_response_length = 500) const;

    std::vector<Scored<Opportunity>> search_opportunities(const std::string& query, size_t top_k = 5) const;
    std::vector<Scored<WonBid>> search_won_bids(const std::string& query, size_t top_k = 5) const;
    std::vector<Scored<ProjectDocument>> search_project_documents(
        const std::string& query, size_t top_k = 5,
        const std::optional<std::string>& doc_type = std::nullopt) const;

    nlohmann::json get_stats() const;

private:
    std::shared_ptr<IntegrationService> service_;
};

} // namespace rfpindex
