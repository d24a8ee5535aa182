/**
 * @file chunker.hpp
 * @brief Boundary-aware text chunking.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "document.hpp"

namespace rfpindex {

/**
 * Split text into overlapping windows of at most max_size characters.
 *
 * Text no longer than max_size yields a single trimmed chunk. Longer text
 * is cut at the last '.', '!', '?' or newline in the second half of each
 * window when one exists, otherwise at the window end; the next window
 * starts overlap characters before the cut. Chunks are trimmed and empty
 * chunks are dropped, so whitespace-only text yields no chunks.
 *
 * @throws std::invalid_argument if max_size is 0 or overlap >= max_size
 */
std::vector<std::string> chunk_text(const std::string& text, size_t max_size, size_t overlap);

/**
 * Chunk content into documents "{parent_id}_chunk_{i}" sharing
 * parent_document_id, with chunk_index i and a copy of metadata. The
 * source field is taken from metadata["source"] when it is a string.
 */
std::vector<VectorDocument> create_document_chunks(const std::string& parent_id,
                                                   const std::string& content,
                                                   const nlohmann::json& metadata,
                                                   size_t max_size,
                                                   size_t overlap);

/**
 * Strip leading and trailing whitespace.
 */
std::string trim(const std::string& text);

} // namespace rfpindex
