#pragma once

#include "semantic_chunker/chunk_options.h"
#include "semantic_chunker/document_loader.h"
#include "semantic_chunker/statistics.h"
#include "semantic_chunker/types.h"

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#define SEMANTIC_CHUNKER_VERSION "1.0.0"

namespace semantic_chunker {

// Result for one document
struct ChunkingResult {
    std::string document;
    int total_pages = 0;
    int total_chunks = 0;
    std::vector<Chunk> chunks;
    DocumentStatistics statistics;
    ChunkOptions options;
    double processing_time_ms = 0.0;
    std::string error;  // Empty if successful
};

// Main API class: turns an extracted document (metadata.json + pages/) into
// bounded, context-enriched chunks
class SemanticChunker {
public:
    // Throws std::invalid_argument for inconsistent sizes
    explicit SemanticChunker(const ChunkOptions& options = ChunkOptions{});
    ~SemanticChunker();

    // Detect -> parse -> consolidate -> accumulate -> validate for one page.
    // Counters are added to `counters`.
    std::vector<Chunk> chunk_page(const std::string& text,
                                  const PageInfo& page,
                                  ProcessingCounters& counters) const;

    // Chunks already loaded pages in parallel, then merges across boundaries
    ChunkingResult chunk_pages(const std::string& document, const std::vector<PageText>& pages);

    // Loads and chunks a document directory. Input errors are reported in
    // ChunkingResult::error rather than thrown.
    ChunkingResult chunk_document(const std::string& input_dir);

    // Chunks a document and writes the JSON output document
    bool process_document_to_json(const std::string& input_dir, const std::string& output_path);

    // Cumulative counters across every document processed by this instance
    nlohmann::json get_stats() const;

    ChunkOptions get_options() const;
    void set_options(const ChunkOptions& options);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace semantic_chunker
