/**
 * @file domain.hpp
 * @brief Business entities mirrored into the vector store.
 *
 * These are read-only views of records owned by the relational store.
 * The integration layer turns them into VectorDocuments.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfpindex {

using KeyValueList = std::vector<std::pair<std::string, std::string>>;

struct Requirement {
    int64_t id = 0;
    std::string text;
    std::optional<std::string> description;
    std::string category;
    std::optional<std::string> priority;
    bool is_mandatory = false;
};

struct Opportunity {
    int64_t id = 0;
    std::string title;
    std::optional<std::string> description;
    std::string organization;
    std::string category;
    std::string status = "open";
    std::optional<std::string> deadline;      // ISO-8601
    std::optional<double> budget_min;
    std::optional<double> budget_max;
    std::string country;
    std::string region;
    std::vector<Requirement> requirements;
};

struct Proposal {
    int64_t id = 0;
    int64_t opportunity_id = 0;
    std::string title;
    std::optional<std::string> executive_summary;
    std::optional<std::string> content;
    std::string status = "draft";
    std::optional<std::string> submitted_at;  // ISO-8601
    std::optional<double> score;
};

struct WonBid {
    int64_t id = 0;
    std::optional<int64_t> opportunity_id;
    std::string title;
    std::optional<std::string> project_description;
    KeyValueList winning_factors;   // factor -> description, in entry order
    KeyValueList lessons_learned;
    std::string client_organization;
    std::optional<double> project_value;
    std::optional<std::string> contract_duration;
    std::optional<double> success_score;
    std::optional<int> year;
    std::string sector;
};

struct ProjectDocument {
    int64_t id = 0;
    std::string title;
    std::optional<std::string> summary;
    std::optional<std::string> content;
    std::string doc_type;
    std::string organization;
    std::string region;
    std::string sector;
    std::vector<std::string> tags;
    std::optional<double> relevance_score;
    std::optional<std::string> document_date;  // ISO-8601
};

} // namespace rfpindex
