#include "semantic_chunker/chunk_validator.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/patterns.h"

#include <algorithm>

namespace semantic_chunker {

namespace {

std::string short_id(const std::string& id) {
    return id.empty() ? std::string("unknown") : id.substr(0, 8) + "...";
}

} // namespace

bool validate_chunk(const Chunk& chunk, std::string& reason) {
    if (chunk.id.empty() || chunk.text.empty()) {
        reason = "missing required fields";
        return false;
    }

    const auto& metadata = chunk.metadata;
    if (metadata.source.empty() || metadata.page_number < 0) {
        reason = "metadata incomplete";
        return false;
    }

    if (is_blank(chunk.content_only)) {
        reason = "empty content";
        return false;
    }

    return true;
}

bool exceeds_soft_limit(const Chunk& chunk, int max_size) {
    return static_cast<double>(chunk.metadata.char_count) > max_size * 1.5;
}

ChunkCollector::ChunkCollector(const ChunkOptions& options) : options_(options) {}

bool ChunkCollector::add(Chunk chunk) {
    std::string reason;
    if (!validate_chunk(chunk, reason)) {
        SEMANTIC_CHUNKER_WARN << "Chunk validation failed: " << short_id(chunk.id) << " - " << reason;
        counters_.validation_failures++;
        return false;
    }

    if (is_recent_duplicate(chunk.id)) {
        SEMANTIC_CHUNKER_DEBUG << "      Duplicate detected: " << short_id(chunk.id);
        counters_.duplicates_prevented++;
        return false;
    }

    if (exceeds_soft_limit(chunk, options_.max_size)) {
        SEMANTIC_CHUNKER_WARN << "Chunk exceeds max size: " << chunk.metadata.char_count
                              << " chars (" << to_string(chunk.metadata.type) << ", page "
                              << chunk.metadata.page_number << ")";
        counters_.oversized_blocks++;
    }

    chunks_.push_back(std::move(chunk));
    return true;
}

bool ChunkCollector::is_recent_duplicate(const std::string& id) const {
    auto window = static_cast<std::ptrdiff_t>(std::min(chunks_.size(), static_cast<size_t>(kDedupWindow)));
    return std::any_of(chunks_.end() - window, chunks_.end(),
                       [&id](const Chunk& existing) { return existing.id == id; });
}

} // namespace semantic_chunker
