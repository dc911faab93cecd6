#pragma once

#include "semantic_chunker/chunk_options.h"
#include "semantic_chunker/chunk_validator.h"
#include "semantic_chunker/types.h"

#include <optional>
#include <string>
#include <vector>

namespace semantic_chunker {

// "Context: a > b\n\n<content>", or the content alone without breadcrumbs
std::string render_chunk_text(const std::string& content, const Breadcrumbs& breadcrumbs);

HierarchicalContext build_hierarchical_context(const Breadcrumbs& breadcrumbs);
QualityMetrics compute_quality_metrics(const std::string& content);

// Builds a complete chunk (id, rendered text, metadata) for one piece of content
Chunk create_chunk(const std::string& content,
                   const Breadcrumbs& breadcrumbs,
                   const PageInfo& page,
                   ChunkType type);

// Splits at sentence boundaries. A piece is closed once adding the next
// sentence would pass target_size and it already holds min_size characters.
// Pieces are the sentences joined with a single space.
std::vector<std::string> smart_split(const std::string& text, const ChunkOptions& options);

// Greedy size-bounded accumulator over consolidated sections of one page.
// Drafts go straight to the collector.
class ChunkBuilder {
public:
    ChunkBuilder(const ChunkOptions& options, const PageInfo& page, ChunkCollector& collector);

    void add(const SemanticSection& section);

    // Flushes whatever is still buffered
    void finish();

private:
    void add_protected(const SemanticSection& section);
    void add_major_header(const SemanticSection& section);
    void add_minor_header(const SemanticSection& section);
    void append_text(const std::string& content);

    void flush();
    void adopt_pending();
    void emit(const std::string& content, const Breadcrumbs& breadcrumbs, ChunkType type);

    ChunkOptions options_;
    PageInfo page_;
    ChunkCollector& collector_;

    std::string buffer_;
    Breadcrumbs breadcrumbs_;
    // Set while a major header arrived before the buffer reached min_size
    std::optional<Breadcrumbs> pending_breadcrumbs_;
};

// Runs the builder over every section and returns the accepted chunks
std::vector<Chunk> build_chunks(const std::vector<SemanticSection>& sections,
                                const PageInfo& page,
                                const ChunkOptions& options,
                                ProcessingCounters& counters);

} // namespace semantic_chunker
