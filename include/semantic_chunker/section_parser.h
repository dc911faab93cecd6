#pragma once

#include "semantic_chunker/types.h"

#include <string>
#include <vector>

namespace semantic_chunker {

// Walks page text line by line, emitting protected regions whole and
// classifying every other line as a header, list run or text line.
// `regions` must be the merged output of detect_protected_regions(text).
// Blank lines, HTML comments and "Page N" headings are dropped.
std::vector<SemanticSection> parse_sections(const std::string& text,
                                            const std::vector<ProtectedRegion>& regions);

// Joins each run of consecutive Text sections into one paragraph group
// (contents separated by a blank line). Anything else ends the run.
std::vector<SemanticSection> consolidate_paragraphs(const std::vector<SemanticSection>& sections);

// Breadcrumb update for a heading at `level` (1-based)
void push_heading(Breadcrumbs& breadcrumbs, int level, const std::string& title);

} // namespace semantic_chunker
