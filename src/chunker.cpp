/**
 * @file chunker.cpp
 * @brief Sliding-window chunker with sentence-boundary cuts.
 */

#include "chunker.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rfpindex {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> chunk_text(const std::string& text, size_t max_size, size_t overlap) {
    if (max_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (overlap >= max_size) {
        throw std::invalid_argument("chunk overlap (" + std::to_string(overlap) +
                                    ") must be smaller than chunk size (" + std::to_string(max_size) + ")");
    }

    std::vector<std::string> chunks;
    if (text.size() <= max_size) {
        std::string chunk = trim(text);
        if (!chunk.empty()) {
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

    const size_t n = text.size();
    size_t start = 0;
    while (start < n) {
        size_t end = std::min(start + max_size, n);

        if (end < n) {
            // Last boundary in the window; only used past the midpoint.
            size_t boundary = std::string::npos;
            for (size_t i = end; i > start; --i) {
                char c = text[i - 1];
                if (c == '.' || c == '!' || c == '?' || c == '\n') {
                    boundary = i - 1;
                    break;
                }
            }
            if (boundary != std::string::npos && boundary > start + max_size / 2) {
                end = boundary + 1;
            }
        }

        std::string chunk = trim(text.substr(start, end - start));
        if (!chunk.empty()) {
            chunks.push_back(std::move(chunk));
        }

        if (end >= n) {
            break;
        }
        size_t next = end > overlap ? end - overlap : 0;
        start = std::max(next, start + 1);
    }
    return chunks;
}

std::vector<VectorDocument> create_document_chunks(const std::string& parent_id,
                                                   const std::string& content,
                                                   const nlohmann::json& metadata,
                                                   size_t max_size,
                                                   size_t overlap) {
    std::vector<VectorDocument> documents;
    auto chunks = chunk_text(content, max_size, overlap);
    documents.reserve(chunks.size());

    std::optional<std::string> source;
    if (metadata.is_object() && metadata.contains("source") && metadata["source"].is_string()) {
        source = metadata["source"].get<std::string>();
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        VectorDocument doc(parent_id + "_chunk_" + std::to_string(i), std::move(chunks[i]), metadata);
        doc.source = source;
        doc.chunk_index = static_cast<int64_t>(i);
        doc.parent_document_id = parent_id;
        documents.push_back(std::move(doc));
    }
    return documents;
}

} // namespace rfpindex
