/**
 * @file document.cpp
 * @brief VectorDocument serialization and filter evaluation.
 */

#include "document.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace rfpindex {

//=============================================================================
// Timestamps
//=============================================================================

std::string format_timestamp(Timestamp ts) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
    int64_t secs = micros / 1000000;
    int64_t frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<long long>(frac));
    return buf;
}

Timestamp parse_timestamp(const std::string& text) {
    std::tm tm_buf{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        throw std::invalid_argument("Malformed timestamp: " + text);
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    int64_t micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }

    std::time_t secs = timegm(&tm_buf);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

//=============================================================================
// VectorDocument
//=============================================================================

VectorDocument::VectorDocument(std::string doc_id, std::string text, nlohmann::json meta)
    : id(std::move(doc_id))
    , content(std::move(text))
    , metadata(meta.is_null() ? nlohmann::json::object() : std::move(meta))
{
}

std::optional<std::string> VectorDocument::metadata_string(const std::string& key) const {
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

nlohmann::json VectorDocument::to_json(bool include_embedding) const {
    nlohmann::json j = {
        {"id", id},
        {"content", content},
        {"metadata", metadata},
        {"source", source ? nlohmann::json(*source) : nlohmann::json()},
        {"chunk_index", chunk_index ? nlohmann::json(*chunk_index) : nlohmann::json()},
        {"parent_document_id", parent_document_id ? nlohmann::json(*parent_document_id) : nlohmann::json()},
        {"created_at", format_timestamp(created_at)},
        {"updated_at", format_timestamp(updated_at)},
    };
    if (include_embedding && embedding) {
        j["embedding"] = *embedding;
    }
    return j;
}

VectorDocument VectorDocument::from_json(const nlohmann::json& j) {
    VectorDocument doc;
    doc.id = j.at("id").get<std::string>();
    doc.content = j.at("content").get<std::string>();
    if (j.contains("metadata") && j["metadata"].is_object()) {
        doc.metadata = j["metadata"];
    }
    if (j.contains("source") && j["source"].is_string()) {
        doc.source = j["source"].get<std::string>();
    }
    if (j.contains("chunk_index") && j["chunk_index"].is_number_integer()) {
        doc.chunk_index = j["chunk_index"].get<int64_t>();
    }
    if (j.contains("parent_document_id") && j["parent_document_id"].is_string()) {
        doc.parent_document_id = j["parent_document_id"].get<std::string>();
    }
    if (j.contains("embedding") && j["embedding"].is_array()) {
        doc.embedding = j["embedding"].get<std::vector<float>>();
    }
    if (j.contains("created_at") && j["created_at"].is_string()) {
        doc.created_at = parse_timestamp(j["created_at"].get<std::string>());
    }
    if (j.contains("updated_at") && j["updated_at"].is_string()) {
        doc.updated_at = parse_timestamp(j["updated_at"].get<std::string>());
    } else {
        doc.updated_at = doc.created_at;
    }
    return doc;
}

nlohmann::json SearchResult::to_json() const {
    return {
        {"document", document.to_json()},
        {"similarity_score", similarity_score},
        {"rank", rank},
    };
}

//=============================================================================
// Filters
//=============================================================================

bool matches_filters(const VectorDocument& doc, const Filters& filters) {
    if (filters.is_null()) {
        return true;
    }
    if (!filters.is_object()) {
        throw std::invalid_argument("Filters must be a JSON object");
    }

    for (const auto& [key, expected] : filters.items()) {
        if (key == "source") {
            if (!doc.source || expected != nlohmann::json(*doc.source)) {
                return false;
            }
            continue;
        }
        if (key == "parent_document_id") {
            if (!doc.parent_document_id || expected != nlohmann::json(*doc.parent_document_id)) {
                return false;
            }
            continue;
        }
        auto it = doc.metadata.find(key);
        if (it == doc.metadata.end() || *it != expected) {
            return false;
        }
    }
    return true;
}

} // namespace rfpindex
