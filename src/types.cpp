#include "semantic_chunker/types.h"

namespace semantic_chunker {

const char* to_string(RegionKind kind) {
    switch (kind) {
        case RegionKind::Table: return "table";
        case RegionKind::Image: return "image";
        case RegionKind::Code: return "code";
    }
    return "unknown";
}

const char* to_string(SectionKind kind) {
    switch (kind) {
        case SectionKind::MajorHeader: return "major_header";
        case SectionKind::MinorHeader: return "minor_header";
        case SectionKind::Text: return "text";
        case SectionKind::List: return "list";
        case SectionKind::Table: return "table";
        case SectionKind::Image: return "image";
        case SectionKind::Code: return "code";
    }
    return "unknown";
}

const char* to_string(ChunkType type) {
    switch (type) {
        case ChunkType::Text: return "text";
        case ChunkType::Table: return "table";
        case ChunkType::Image: return "image";
        case ChunkType::Code: return "code";
    }
    return "unknown";
}

SectionKind section_kind_for(RegionKind kind) {
    switch (kind) {
        case RegionKind::Table: return SectionKind::Table;
        case RegionKind::Image: return SectionKind::Image;
        case RegionKind::Code: return SectionKind::Code;
    }
    return SectionKind::Text;
}

ChunkType chunk_type_for(SectionKind kind) {
    switch (kind) {
        case SectionKind::Table: return ChunkType::Table;
        case SectionKind::Image: return ChunkType::Image;
        case SectionKind::Code: return ChunkType::Code;
        default: return ChunkType::Text;
    }
}

bool is_protected(SectionKind kind) {
    return kind == SectionKind::Table || kind == SectionKind::Image || kind == SectionKind::Code;
}

ProcessingCounters& ProcessingCounters::operator+=(const ProcessingCounters& other) {
    total_pages += other.total_pages;
    total_chunks += other.total_chunks;
    duplicates_prevented += other.duplicates_prevented;
    validation_failures += other.validation_failures;
    merged_boundaries += other.merged_boundaries;
    oversized_blocks += other.oversized_blocks;
    failed_pages += other.failed_pages;
    for (const auto& [type, count] : other.protected_blocks) {
        protected_blocks[type] += count;
    }
    for (const auto& [signal, count] : other.continuation_signals) {
        continuation_signals[signal] += count;
    }
    return *this;
}

} // namespace semantic_chunker
