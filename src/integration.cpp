/**
 * @file integration.cpp
 * @brief Entity indexing, typed search and recommendations.
 */

#include "integration.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "chunker.hpp"
#include "logging.hpp"

namespace rfpindex {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

std::string format_key_values(const KeyValueList& entries) {
    std::string out;
    for (const auto& [key, value] : entries) {
        if (!out.empty()) {
            out += '\n';
        }
        out += "- " + key + ": " + value;
    }
    return out;
}

std::vector<Filters> entity_filters(EntityKind kind, int64_t id) {
    const std::string key = std::to_string(id);
    switch (kind) {
        case EntityKind::OPPORTUNITY:
            return {
                Filters{{"type", "opportunity"}, {"opportunity_id", key}},
                Filters{{"type", "requirement"}, {"opportunity_id", key}},
            };
        case EntityKind::PROPOSAL:
            return {Filters{{"type", "proposal"}, {"proposal_id", key}}};
        case EntityKind::WON_BID:
            return {Filters{{"type", "won_bid"}, {"won_bid_id", key}}};
        case EntityKind::PROJECT_DOCUMENT:
            return {Filters{{"type", "project_documentation"}, {"doc_id", key}}};
        default:
            throw std::invalid_argument("unknown entity kind");
    }
}

std::optional<int64_t> parse_key(const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

template <typename T>
const EntityRepository<T>& require_repository(const std::shared_ptr<EntityRepository<T>>& repository,
                                              const char* name) {
    if (!repository) {
        throw std::logic_error(std::string("no ") + name + " repository configured");
    }
    return *repository;
}

} // namespace

const char* entity_kind_to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::OPPORTUNITY:      return "opportunity";
        case EntityKind::PROPOSAL:         return "proposal";
        case EntityKind::WON_BID:          return "won_bid";
        case EntityKind::PROJECT_DOCUMENT: return "project_documentation";
        default: return "unknown";
    }
}

nlohmann::json Recommendations::to_json() const {
    return {
        {"opportunity_id", opportunity_id},
        {"similar_won_bids", similar_won_bids},
        {"winning_patterns", winning_patterns},
        {"relevant_documentation", relevant_documentation},
        {"recommendations", recommendations},
    };
}

nlohmann::json ReindexReport::to_json() const {
    auto counts = [](const ReindexCounts& c) {
        return nlohmann::json{{"indexed", c.indexed}, {"failed", c.failed}, {"documents", c.documents}};
    };
    return {
        {"opportunities", counts(opportunities)},
        {"proposals", counts(proposals)},
        {"won_bids", counts(won_bids)},
        {"project_documents", counts(project_documents)},
    };
}

IntegrationService::IntegrationService(std::shared_ptr<VectorStore> store, DomainRepositories repositories)
    : store_(std::move(store))
    , repositories_(std::move(repositories))
{
    if (!store_) {
        throw std::invalid_argument("IntegrationService needs a vector store");
    }
}

//=============================================================================
// Document builders
//=============================================================================

std::vector<VectorDocument> IntegrationService::opportunity_documents(const Opportunity& opportunity) {
    std::vector<VectorDocument> docs;
    const std::string opportunity_key = std::to_string(opportunity.id);
    const std::string parent_id = "opportunity_" + opportunity_key;

    if (opportunity.description) {
        VectorDocument doc(parent_id, "Title: " + opportunity.title + "\n\nDescription: " + *opportunity.description,
                           {
                               {"type", "opportunity"},
                               {"opportunity_id", opportunity_key},
                               {"organization", opportunity.organization},
                               {"category", opportunity.category},
                               {"status", opportunity.status},
                               {"deadline", optional_json(opportunity.deadline)},
                               {"budget_min", optional_json(opportunity.budget_min)},
                               {"budget_max", optional_json(opportunity.budget_max)},
                               {"country", opportunity.country},
                               {"region", opportunity.region},
                           });
        doc.source = "opportunity";
        docs.push_back(std::move(doc));
    }

    for (const auto& req : opportunity.requirements) {
        if (!req.description) {
            continue;
        }
        VectorDocument doc("requirement_" + std::to_string(req.id),
                           "Requirement: " + req.text + "\n\nDescription: " + *req.description,
                           {
                               {"type", "requirement"},
                               {"requirement_id", std::to_string(req.id)},
                               {"opportunity_id", opportunity_key},
                               {"category", req.category},
                               {"priority", optional_json(req.priority)},
                               {"is_mandatory", req.is_mandatory},
                           });
        doc.source = "requirement";
        doc.parent_document_id = parent_id;
        docs.push_back(std::move(doc));
    }
    return docs;
}

std::vector<VectorDocument> IntegrationService::proposal_documents(const Proposal& proposal) {
    if (!proposal.content) {
        return {};
    }
    std::string text = "Proposal Title: " + proposal.title + "\n\n";
    if (proposal.executive_summary) {
        text += "Executive Summary: " + *proposal.executive_summary + "\n\n";
    }
    text += "Full Content: " + *proposal.content;

    nlohmann::json metadata = {
        {"type", "proposal"},
        {"proposal_id", std::to_string(proposal.id)},
        {"opportunity_id", std::to_string(proposal.opportunity_id)},
        {"status", proposal.status},
        {"submitted_at", optional_json(proposal.submitted_at)},
        {"score", optional_json(proposal.score)},
    };
    auto docs = create_document_chunks("proposal_" + std::to_string(proposal.id), text, metadata,
                                       kProposalChunkSize, kProposalChunkOverlap);
    for (auto& doc : docs) {
        doc.source = "proposal";
    }
    return docs;
}

std::vector<VectorDocument> IntegrationService::won_bid_documents(const WonBid& won_bid) {
    std::string text = "Won Bid - " + won_bid.title;
    if (won_bid.project_description) {
        text += "\n\nProject Description: " + *won_bid.project_description;
    }
    if (!won_bid.winning_factors.empty()) {
        text += "\n\nWinning Factors:\n" + format_key_values(won_bid.winning_factors);
    }
    if (!won_bid.lessons_learned.empty()) {
        text += "\n\nLessons Learned:\n" + format_key_values(won_bid.lessons_learned);
    }

    nlohmann::json opportunity_key = nullptr;
    if (won_bid.opportunity_id) {
        opportunity_key = std::to_string(*won_bid.opportunity_id);
    }

    VectorDocument doc("wonbid_" + std::to_string(won_bid.id), std::move(text),
                       {
                           {"type", "won_bid"},
                           {"won_bid_id", std::to_string(won_bid.id)},
                           {"opportunity_id", opportunity_key},
                           {"client_organization", won_bid.client_organization},
                           {"project_value", optional_json(won_bid.project_value)},
                           {"contract_duration", optional_json(won_bid.contract_duration)},
                           {"success_score", optional_json(won_bid.success_score)},
                           {"year", optional_json(won_bid.year)},
                           {"sector", won_bid.sector},
                       });
    doc.source = "won_bid";
    std::vector<VectorDocument> docs;
    docs.push_back(std::move(doc));
    return docs;
}

std::vector<VectorDocument> IntegrationService::project_document_documents(const ProjectDocument& doc) {
    if (!doc.content) {
        return {};
    }
    std::string text = "Document Title: " + doc.title + "\n\n";
    if (doc.summary) {
        text += "Summary: " + *doc.summary + "\n\n";
    }
    text += "Content: " + *doc.content;

    nlohmann::json metadata = {
        {"type", "project_documentation"},
        {"doc_id", std::to_string(doc.id)},
        {"doc_type", doc.doc_type},
        {"organization", doc.organization},
        {"region", doc.region},
        {"sector", doc.sector},
        {"tags", doc.tags},
        {"relevance_score", optional_json(doc.relevance_score)},
        {"document_date", optional_json(doc.document_date)},
    };
    auto docs = create_document_chunks("projectdoc_" + std::to_string(doc.id), text, metadata,
                                       kProjectDocChunkSize, kProjectDocChunkOverlap);
    for (auto& chunk : docs) {
        chunk.source = "project_documentation";
    }
    return docs;
}

//=============================================================================
// Indexing
//=============================================================================

std::vector<std::string> IntegrationService::replace_entity(EntityKind kind, int64_t id,
                                                            std::vector<VectorDocument> docs) {
    std::vector<std::string> ids;
    if (!docs.empty()) {
        ids = store_->add_documents(std::move(docs));
    }

    // Documents from a previous version that the new one no longer produces.
    absl::flat_hash_set<std::string> keep(ids.begin(), ids.end());
    size_t stale = 0;
    for (const auto& filter : entity_filters(kind, id)) {
        for (const auto& doc : store_->list_documents(std::numeric_limits<size_t>::max(), 0, filter)) {
            if (!keep.contains(doc.id) && store_->delete_document(doc.id)) {
                ++stale;
            }
        }
    }

    RFPINDEX_LOG_INFO("Integration", "Indexed ", entity_kind_to_string(kind), " ", id, " with ", ids.size(),
                      " documents", stale > 0 ? " (removed stale: " + std::to_string(stale) + ")" : "");
    return ids;
}

std::vector<std::string> IntegrationService::index_opportunity(const Opportunity& opportunity) {
    return replace_entity(EntityKind::OPPORTUNITY, opportunity.id, opportunity_documents(opportunity));
}

std::vector<std::string> IntegrationService::index_proposal(const Proposal& proposal) {
    return replace_entity(EntityKind::PROPOSAL, proposal.id, proposal_documents(proposal));
}

std::vector<std::string> IntegrationService::index_won_bid(const WonBid& won_bid) {
    return replace_entity(EntityKind::WON_BID, won_bid.id, won_bid_documents(won_bid));
}

std::vector<std::string> IntegrationService::index_project_document(const ProjectDocument& doc) {
    return replace_entity(EntityKind::PROJECT_DOCUMENT, doc.id, project_document_documents(doc));
}

size_t IntegrationService::remove_entity(EntityKind kind, int64_t id) {
    size_t removed = 0;
    for (const auto& filter : entity_filters(kind, id)) {
        removed += store_->delete_documents(filter);
    }
    RFPINDEX_LOG_INFO("Integration", "Removed ", removed, " documents for ", entity_kind_to_string(kind), " ", id);
    return removed;
}

template <typename T, typename Index>
void IntegrationService::reindex_all(const char* label, const std::shared_ptr<EntityRepository<T>>& repository,
                                     size_t batch_size, ReindexCounts& counts, Index index) {
    if (!repository) {
        RFPINDEX_LOG_WARN("Integration", "No repository for ", label, ", skipping");
        return;
    }
    const size_t total = repository->count();
    for (size_t offset = 0;; offset += batch_size) {
        std::vector<T> page = repository->list(batch_size, offset);
        if (page.empty()) {
            break;
        }
        for (const auto& entity : page) {
            try {
                counts.documents += index(entity).size();
                ++counts.indexed;
            } catch (const std::exception& e) {
                ++counts.failed;
                RFPINDEX_LOG_ERROR("Integration", "Failed to index ", label, " ", entity.id, ": ", e.what());
            }
        }
        RFPINDEX_LOG_INFO("Integration", "Indexed ", offset + page.size(), "/", total, " ", label);
        if (page.size() < batch_size) {
            break;
        }
    }
}

ReindexReport IntegrationService::bulk_reindex(size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
    RFPINDEX_LOG_INFO("Integration", "Starting bulk reindex");

    ReindexReport report;
    reindex_all("opportunities", repositories_.opportunities, batch_size, report.opportunities,
                [this](const Opportunity& o) { return index_opportunity(o); });
    reindex_all("proposals", repositories_.proposals, batch_size, report.proposals,
                [this](const Proposal& p) { return index_proposal(p); });
    reindex_all("won bids", repositories_.won_bids, batch_size, report.won_bids,
                [this](const WonBid& w) { return index_won_bid(w); });
    reindex_all("project documents", repositories_.project_documents, batch_size, report.project_documents,
                [this](const ProjectDocument& d) { return index_project_document(d); });

    if (report.total_failed() > 0) {
        RFPINDEX_LOG_WARN("Integration", "Bulk reindex finished with ", report.total_failed(), " failures");
    } else {
        RFPINDEX_LOG_INFO("Integration", "Bulk reindex completed");
    }
    return report;
}

//=============================================================================
// Typed search
//=============================================================================

template <typename T, typename Lookup>
std::vector<Scored<T>> IntegrationService::search_entities(const std::string& query, size_t top_k,
                                                           const Filters& filters, const char* key, bool chunked,
                                                           Lookup lookup) const {
    std::vector<Scored<T>> out;
    if (top_k == 0) {
        return out;
    }
    // Several chunks of one entity may rank together.
    const size_t fetch = chunked ? top_k * 3 : top_k;
    auto results = store_->search(query, fetch, filters);

    absl::flat_hash_set<int64_t> seen;
    for (const auto& result : results) {
        auto key_text = result.document.metadata_string(key);
        if (!key_text) {
            continue;
        }
        auto id = parse_key(*key_text);
        if (!id || !seen.insert(*id).second) {
            continue;
        }
        std::optional<T> entity = lookup(*id);
        if (!entity) {
            RFPINDEX_LOG_DEBUG("Integration", "Dropping stale hit ", result.document.id);
            continue;
        }
        out.emplace_back(std::move(*entity), result.similarity_score);
        if (out.size() >= top_k) {
            break;
        }
    }
    return out;
}

std::vector<Scored<Opportunity>> IntegrationService::search_opportunities(const std::string& query, size_t top_k,
                                                                          const Filters& filters) const {
    const auto& repo = require_repository(repositories_.opportunities, "opportunity");
    Filters merged = nlohmann::json::object();
    if (filters.is_object()) {
        merged.update(filters);
    }
    merged["type"] = "opportunity";
    return search_entities<Opportunity>(query, top_k, merged, "opportunity_id", false,
                                        [&repo](int64_t id) { return repo.find_by_id(id); });
}

std::vector<Scored<WonBid>> IntegrationService::find_similar_won_bids(const std::string& query,
                                                                      size_t top_k) const {
    const auto& repo = require_repository(repositories_.won_bids, "won bid");
    return search_entities<WonBid>(query, top_k, Filters{{"type", "won_bid"}}, "won_bid_id", false,
                                   [&repo](int64_t id) { return repo.find_by_id(id); });
}

std::vector<Scored<ProjectDocument>> IntegrationService::search_project_documents(
    const std::string& query, size_t top_k, const std::optional<std::string>& doc_type,
    const std::optional<std::string>& organization) const {
    const auto& repo = require_repository(repositories_.project_documents, "project document");
    Filters filters = {{"type", "project_documentation"}};
    if (doc_type) {
        filters["doc_type"] = *doc_type;
    }
    if (organization) {
        filters["organization"] = *organization;
    }
    return search_entities<ProjectDocument>(query, top_k, filters, "doc_id", true,
                                            [&repo](int64_t id) { return repo.find_by_id(id); });
}

//=============================================================================
// Recommendations
//=============================================================================

std::optional<Recommendations> IntegrationService::recommendations_for_opportunity(int64_t opportunity_id,
                                                                                   size_t top_k) const {
    const auto& repo = require_repository(repositories_.opportunities, "opportunity");
    auto opportunity = repo.find_by_id(opportunity_id);
    if (!opportunity) {
        RFPINDEX_LOG_WARN("Integration", "Opportunity ", opportunity_id, " not found");
        return std::nullopt;
    }

    const std::string query = opportunity->title + " " + opportunity->description.value_or("");
    auto won_bids = find_similar_won_bids(query, top_k);
    auto documents = search_project_documents(query, top_k);

    Recommendations rec;
    rec.opportunity_id = opportunity_id;
    rec.similar_won_bids = won_bids.size();

    for (const auto& [bid, score] : won_bids) {
        if (bid.winning_factors.empty()) {
            continue;
        }
        nlohmann::json factors = nlohmann::json::array();
        for (const auto& [name, description] : bid.winning_factors) {
            factors.push_back({{"factor", name}, {"description", description}});
        }
        rec.winning_patterns.push_back({
            {"project", bid.title},
            {"score", score},
            {"factors", std::move(factors)},
            {"project_value", optional_json(bid.project_value)},
            {"success_score", optional_json(bid.success_score)},
            {"sector", bid.sector},
            {"client_organization", bid.client_organization},
        });
    }

    for (const auto& [doc, score] : documents) {
        rec.relevant_documentation.push_back({
            {"title", doc.title},
            {"organization", doc.organization},
            {"score", score},
            {"doc_type", doc.doc_type},
            {"summary", optional_json(doc.summary)},
            {"sector", doc.sector},
        });
    }

    rec.recommendations = generate_recommendations(rec.winning_patterns, rec.relevant_documentation);
    return rec;
}

std::vector<std::string> IntegrationService::generate_recommendations(
    const nlohmann::json& winning_patterns, const nlohmann::json& relevant_documentation) {
    std::vector<std::string> out;

    // Each factor counts once per winning bid; order of first appearance
    // breaks ties.
    std::vector<std::pair<std::string, size_t>> frequency;
    absl::flat_hash_map<std::string, size_t> slot;
    for (const auto& pattern : winning_patterns) {
        if (!pattern.contains("factors") || !pattern["factors"].is_array()) {
            continue;
        }
        absl::flat_hash_set<std::string> in_pattern;
        for (const auto& factor : pattern["factors"]) {
            std::string name = factor.value("factor", std::string());
            if (name.empty() || !in_pattern.insert(name).second) {
                continue;
            }
            auto [it, inserted] = slot.try_emplace(name, frequency.size());
            if (inserted) {
                frequency.emplace_back(name, 0);
            }
            ++frequency[it->second].second;
        }
    }
    std::stable_sort(frequency.begin(), frequency.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t i = 0; i < frequency.size() && i < 3; ++i) {
        out.push_back("Focus on " + frequency[i].first + " - appeared in " + std::to_string(frequency[i].second) +
                      " similar winning bids");
    }

    std::vector<std::string> organizations;
    for (const auto& doc : relevant_documentation) {
        if (organizations.size() >= 3) {
            break;
        }
        if (!doc.contains("organization") || !doc["organization"].is_string()) {
            continue;
        }
        std::string org = doc["organization"].get<std::string>();
        if (!org.empty() && std::find(organizations.begin(), organizations.end(), org) == organizations.end()) {
            organizations.push_back(std::move(org));
        }
    }
    if (!organizations.empty()) {
        std::string line = "Consider experience with organizations like: ";
        for (size_t i = 0; i < organizations.size(); ++i) {
            if (i > 0) {
                line += ", ";
            }
            line += organizations[i];
        }
        out.push_back(std::move(line));
    }
    return out;
}

} // namespace rfpindex
