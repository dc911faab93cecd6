#pragma once

#include "semantic_chunker/types.h"

#include <string>
#include <vector>

namespace semantic_chunker {

// Finds tables, image/figure blocks and fenced code in raw page text.
// The result is sorted by start offset and free of overlaps.
std::vector<ProtectedRegion> detect_protected_regions(const std::string& text);

// Sorts matches and folds every match that starts before the previous
// region's end into that region (overlaps extend it, nested matches are
// absorbed). raw_content is re-sliced from `text` when a region grows.
std::vector<ProtectedRegion> merge_regions(std::vector<ProtectedRegion> matches,
                                           const std::string& text);

// Individual pattern families, unmerged
std::vector<ProtectedRegion> find_image_blocks(const std::string& text);
std::vector<ProtectedRegion> find_tables(const std::string& text);
std::vector<ProtectedRegion> find_code_blocks(const std::string& text);

} // namespace semantic_chunker
