#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace semantic_chunker {

// Kinds of content that must never be split across chunks
enum class RegionKind {
    Table,
    Image,
    Code
};

enum class SectionKind {
    MajorHeader,  // #, ## level headings
    MinorHeader,  // ###+ level headings
    Text,
    List,
    Table,
    Image,
    Code
};

enum class ChunkType {
    Text,
    Table,
    Image,
    Code
};

const char* to_string(RegionKind kind);
const char* to_string(SectionKind kind);
const char* to_string(ChunkType type);

SectionKind section_kind_for(RegionKind kind);
ChunkType chunk_type_for(SectionKind kind);
bool is_protected(SectionKind kind);

using Breadcrumbs = std::vector<std::string>;

// Span of raw page text that must appear whole in exactly one chunk
struct ProtectedRegion {
    size_t start = 0;
    size_t end = 0;
    RegionKind kind = RegionKind::Table;
    std::string raw_content;
};

// One classified unit of document structure
struct SemanticSection {
    SectionKind kind = SectionKind::Text;
    std::string content;
    Breadcrumbs breadcrumbs;
    size_t start = 0;
    size_t end = 0;
};

// A page as listed in metadata.json
struct PageInfo {
    int page_number = -1;
    std::string file_name;
};

struct QualityMetrics {
    int word_count = 0;
    int sentence_count = 0;
    double avg_sentence_length = 0.0;
    bool has_numerical_data = false;
    bool has_dates = false;
    bool has_named_entities = false;
    bool has_exhibits = false;
};

// level_1..level_n are the entries of `levels`
struct HierarchicalContext {
    std::vector<std::string> levels;
    std::string full_path;
    int depth = 0;
};

struct ChunkMetadata {
    std::string source;
    int page_number = -1;
    ChunkType type = ChunkType::Text;
    Breadcrumbs breadcrumbs;
    HierarchicalContext hierarchical_context;
    std::optional<std::string> image_path;
    std::optional<std::string> source_attribution;
    bool has_citations = false;
    int char_count = 0;
    QualityMetrics quality_metrics;
    std::optional<std::array<int, 2>> merged_from_pages;
    bool is_merged = false;
};

// The unit handed downstream for embedding
struct Chunk {
    std::string id;            // MD5 hex of `text`
    std::string text;          // context header + content
    std::string content_only;
    ChunkMetadata metadata;
};

// Counters accumulated while chunking; summed across pages
struct ProcessingCounters {
    int total_pages = 0;
    int total_chunks = 0;
    int duplicates_prevented = 0;
    int validation_failures = 0;
    int merged_boundaries = 0;
    int oversized_blocks = 0;
    int failed_pages = 0;
    std::map<std::string, int> protected_blocks;      // keyed by chunk type
    std::map<std::string, int> continuation_signals;  // keyed by signal name

    ProcessingCounters& operator+=(const ProcessingCounters& other);
};

} // namespace semantic_chunker
