/**
 * @file document.hpp
 * @brief Vector documents, search results and metadata filters.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rfpindex {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * ISO-8601 UTC with microseconds, e.g. "2024-03-01T12:00:00.123456Z".
 */
std::string format_timestamp(Timestamp ts);

/**
 * Parses the format written by format_timestamp. A missing fractional part
 * or a missing "Z" suffix is accepted.
 * @throws std::invalid_argument on malformed input
 */
Timestamp parse_timestamp(const std::string& text);

/**
 * Current time truncated to the microsecond precision that survives a
 * round trip through the metadata sidecar.
 */
Timestamp now_timestamp();

/**
 * A searchable unit of text.
 *
 * The embedding is filled lazily by the store when absent. Chunks of one
 * source share parent_document_id and carry increasing chunk_index values.
 */
struct VectorDocument {
    std::string id;
    std::string content;
    std::optional<std::vector<float>> embedding;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> source;
    std::optional<int64_t> chunk_index;
    std::optional<std::string> parent_document_id;
    Timestamp created_at = now_timestamp();
    Timestamp updated_at = created_at;

    VectorDocument() = default;
    VectorDocument(std::string doc_id, std::string text,
                   nlohmann::json meta = nlohmann::json::object());

    /**
     * String-typed metadata lookup; empty optional when the key is absent
     * or holds a non-string value.
     */
    std::optional<std::string> metadata_string(const std::string& key) const;

    /**
     * Serialized form used by the metadata sidecar. The embedding is
     * omitted unless requested; the index file holds the vectors.
     */
    nlohmann::json to_json(bool include_embedding = false) const;

    /**
     * @throws nlohmann::json::exception when required fields are missing
     */
    static VectorDocument from_json(const nlohmann::json& j);
};

struct SearchResult {
    VectorDocument document;
    float similarity_score = 0.0f;
    size_t rank = 0;  // 1-based, assigned after filtering

    nlohmann::json to_json() const;
};

//=============================================================================
// Filters
//=============================================================================

/**
 * Equality filter: a JSON object of key -> expected value. Null or an
 * empty object matches everything.
 */
using Filters = nlohmann::json;

/**
 * "source" and "parent_document_id" compare against the document fields;
 * every other key must be present in metadata with an equal value.
 */
bool matches_filters(const VectorDocument& doc, const Filters& filters);

} // namespace rfpindex
