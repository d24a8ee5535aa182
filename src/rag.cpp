#include "rag.hpp"

#include <stdexcept>

#include "logging.hpp"

namespace rfpindex {

namespace {

nlohmann::json hit_document(const VectorDocument& doc) {
    return {
        {"id", doc.id},
        {"content", doc.content},
        {"metadata", doc.metadata},
        {"source", doc.source ? nlohmann::json(*doc.source) : nlohmann::json(nullptr)},
        {"created_at", format_timestamp(doc.created_at)},
        {"updated_at", format_timestamp(doc.updated_at)},
    };
}

nlohmann::json metadata_or_empty(const nlohmann::json& metadata) {
    return metadata.is_object() ? metadata : nlohmann::json::object();
}

} // namespace

nlohmann::json RagHit::to_json() const {
    return {{"id", id}, {"document", document}, {"score", score}};
}

RagFacade::RagFacade(std::shared_ptr<IntegrationService> service)
    : service_(std::move(service))
{
    if (!service_) {
        throw std::invalid_argument("RagFacade needs an integration service");
    }
}

std::vector<std::string> RagFacade::build_index(const nlohmann::json& documents) {
    if (!documents.is_array()) {
        throw std::invalid_argument("build_index expects an array of documents");
    }
    RFPINDEX_LOG_INFO("RAG", "Building index from ", documents.size(), " documents");

    std::vector<VectorDocument> docs;
    docs.reserve(documents.size());
    for (size_t i = 0; i < documents.size(); ++i) {
        const auto& item = documents[i];
        std::string id = item.contains("id") && item["id"].is_string() ? item["id"].get<std::string>()
                                                                        : "doc_" + std::to_string(i);
        VectorDocument doc(std::move(id), item.value("content", std::string()),
                           metadata_or_empty(item.value("metadata", nlohmann::json::object())));
        doc.source = "rag_build";
        docs.push_back(std::move(doc));
    }
    auto ids = service_->store().add_documents(std::move(docs));
    RFPINDEX_LOG_INFO("RAG", "Index built with ", ids.size(), " documents");
    return ids;
}

std::string RagFacade::add_document(const std::string& id, const std::string& content,
                                    const nlohmann::json& metadata) {
    VectorDocument doc(id, content, metadata_or_empty(metadata));
    doc.source = "rag_add";
    return service_->store().add_document(std::move(doc));
}

bool RagFacade::update_document(const std::string& id, const std::string& content, const nlohmann::json& metadata) {
    VectorDocument doc(id, content, metadata_or_empty(metadata));
    doc.source = "rag_update";
    return service_->store().update_document(std::move(doc));
}

bool RagFacade::remove_document(const std::string& id) {
    return service_->store().delete_document(id);
}

std::vector<RagHit> RagFacade::search(const std::string& query, size_t top_k, const Filters& filters) const {
    auto results = service_->store().search(query, top_k, filters);

    std::vector<RagHit> hits;
    hits.reserve(results.size());
    for (const auto& result : results) {
        RagHit hit;
        hit.id = result.document.id;
        hit.document = hit_document(result.document);
        hit.score = result.similarity_score;
        hits.push_back(std::move(hit));
    }
    RFPINDEX_LOG_DEBUG("RAG", "Search returned ", hits.size(), " results for: ", query.substr(0, 50));
    return hits;
}

std::string RagFacade::generate_response(const std::string& /*query*/, const std::vector<nlohmann::json>& context,
                                         size_t max_length) {
    if (context.empty()) {
        return "I don't have enough information to answer that question.";
    }

    std::string context_text;
    for (size_t i = 0; i < context.size() && i < kMaxContextDocuments; ++i) {
        if (i > 0) {
            context_text += "\n\n";
        }
        std::string content = context[i].value("content", std::string());
        context_text += content.substr(0, kSnippetLength);
    }

    return "Based on the available documents, here's what I found:\n\n" + context_text.substr(0, max_length) +
           "\n\nThis information comes from " + std::to_string(context.size()) +
           " relevant document(s) in our database.";
}

nlohmann::json RagFacade::query_with_response(const std::string& query, size_t top_k,
                                              size_t max_response_length) const {
    auto hits = search(query, top_k);

    std::vector<nlohmann::json> context;
    nlohmann::json results = nlohmann::json::array();
    for (const auto& hit : hits) {
        context.push_back(hit.document);
        results.push_back(hit.to_json());
    }

    return {
        {"query", query},
        {"response", generate_response(query, context, max_response_length)},
        {"sources", hits.size()},
        {"search_results", std::move(results)},
        {"context_documents", context},
    };
}

std::vector<Scored<Opportunity>> RagFacade::search_opportunities(const std::string& query, size_t top_k) const {
    return service_->search_opportunities(query, top_k);
}

std::vector<Scored<WonBid>> RagFacade::search_won_bids(const std::string& query, size_t top_k) const {
    return service_->find_similar_won_bids(query, top_k);
}

std::vector<Scored<ProjectDocument>> RagFacade::search_project_documents(
    const std::string& query, size_t top_k, const std::optional<std::string>& doc_type) const {
    return service_->search_project_documents(query, top_k, doc_type);
}

nlohmann::json RagFacade::get_stats() const {
    return service_->store().get_stats().to_json();
}

} // namespace rfpindex
