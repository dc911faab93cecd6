#pragma once

#include "semantic_chunker/chunk_options.h"
#include "semantic_chunker/types.h"

#include <optional>
#include <string>
#include <vector>

namespace semantic_chunker {

// Heuristic evidence that a page break cut through a unit of content
struct ContinuationSignals {
    bool conjunction = false;     // tail ends with a conjunction or preposition
    bool no_punctuation = false;  // tail lacks . ! ? : or ---
    bool numbered_list = false;   // head starts with "N."
    bool bullet_list = false;     // head starts with - * +
    bool table = false;           // tail ends in a pipe row, head starts with one
    bool header = false;          // tail ends with a heading

    bool any() const;
    std::vector<std::string> names() const;
};

// Last / first kBoundaryWindow characters of a page, trimmed
std::string page_tail(const std::string& text);
std::string page_head(const std::string& text);

ContinuationSignals detect_continuation(const std::string& tail, const std::string& head);

// One page's completed chunk list plus the raw text its boundary is read from
struct PageChunks {
    PageInfo page;
    std::string text;
    std::vector<Chunk> chunks;
};

// Combines two boundary chunks into one merged Text chunk. Returns nullopt
// when either chunk is not Text or the result fails validation.
std::optional<Chunk> merge_boundary_chunks(const Chunk& last, const Chunk& first);

// Walks page boundaries in order and merges the adjoining chunks wherever a
// continuation signal fires. The merged chunk replaces the last chunk of the
// earlier page and the first chunk of the later page is retired.
void merge_across_pages(std::vector<PageChunks>& pages,
                        const ChunkOptions& options,
                        ProcessingCounters& counters);

} // namespace semantic_chunker
