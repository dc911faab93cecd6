#pragma once

#include "semantic_chunker/chunk_options.h"
#include "semantic_chunker/types.h"

#include <string>
#include <vector>

namespace semantic_chunker {

// Structural checks on a chunk draft. On failure `reason` names the first
// check that did not hold.
bool validate_chunk(const Chunk& chunk, std::string& reason);

// Soft limit: larger chunks are kept but reported
bool exceeds_soft_limit(const Chunk& chunk, int max_size);

// Gatekeeper for one page's chunk drafts: validates, warns on oversize and
// drops ids already seen among the last kDedupWindow accepted chunks.
class ChunkCollector {
public:
    explicit ChunkCollector(const ChunkOptions& options);

    // Returns true if the draft was accepted
    bool add(Chunk chunk);

    const std::vector<Chunk>& chunks() const { return chunks_; }
    std::vector<Chunk> take_chunks() { return std::move(chunks_); }

    ProcessingCounters& counters() { return counters_; }
    const ProcessingCounters& counters() const { return counters_; }

private:
    bool is_recent_duplicate(const std::string& id) const;

    ChunkOptions options_;
    std::vector<Chunk> chunks_;
    ProcessingCounters counters_;
};

} // namespace semantic_chunker
