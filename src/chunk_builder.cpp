#include "semantic_chunker/chunk_builder.h"
#include "semantic_chunker/content_hash.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/patterns.h"

#include <algorithm>
#include <cmath>

namespace semantic_chunker {

namespace {

std::string join_path(const Breadcrumbs& breadcrumbs) {
    std::string path;
    for (size_t i = 0; i < breadcrumbs.size(); ++i) {
        if (i > 0) path += " > ";
        path += breadcrumbs[i];
    }
    return path;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace

std::string render_chunk_text(const std::string& content, const Breadcrumbs& breadcrumbs) {
    if (breadcrumbs.empty()) {
        return content;
    }
    return "Context: " + join_path(breadcrumbs) + "\n\n" + content;
}

HierarchicalContext build_hierarchical_context(const Breadcrumbs& breadcrumbs) {
    HierarchicalContext context;
    context.levels = breadcrumbs;
    context.full_path = join_path(breadcrumbs);
    context.depth = static_cast<int>(breadcrumbs.size());
    return context;
}

QualityMetrics compute_quality_metrics(const std::string& content) {
    QualityMetrics metrics;
    metrics.word_count = count_words(content);
    metrics.sentence_count = count_sentences(content);
    metrics.avg_sentence_length =
        round_to(static_cast<double>(metrics.word_count) / std::max(metrics.sentence_count, 1), 1);
    metrics.has_numerical_data = has_numerical_data(content);
    metrics.has_dates = has_dates(content);
    metrics.has_named_entities = has_named_entities(content);
    metrics.has_exhibits = has_exhibits(content);
    return metrics;
}

Chunk create_chunk(const std::string& content,
                   const Breadcrumbs& breadcrumbs,
                   const PageInfo& page,
                   ChunkType type) {
    Chunk chunk;
    chunk.text = render_chunk_text(content, breadcrumbs);
    chunk.id = content_hash(chunk.text);
    chunk.content_only = content;

    auto& metadata = chunk.metadata;
    metadata.source = page.file_name;
    metadata.page_number = page.page_number;
    metadata.type = type;
    metadata.breadcrumbs = breadcrumbs;
    metadata.hierarchical_context = build_hierarchical_context(breadcrumbs);
    metadata.image_path = find_image_path(content);
    metadata.source_attribution = find_source_attribution(content);
    metadata.has_citations = metadata.source_attribution.has_value();
    metadata.char_count = static_cast<int>(content.size());
    metadata.quality_metrics = compute_quality_metrics(content);

    SEMANTIC_CHUNKER_DEBUG << "      Created " << to_string(type) << " chunk "
                           << chunk.id.substr(0, 8) << "... (" << content.size() << " chars)";
    return chunk;
}

std::vector<std::string> smart_split(const std::string& text, const ChunkOptions& options) {
    std::vector<std::string> pieces;
    std::string current;

    for (const auto& sentence : split_sentences(text)) {
        size_t added = current.empty() ? sentence.size() : sentence.size() + 1;
        if (!current.empty() &&
            current.size() + added > static_cast<size_t>(options.target_size) &&
            current.size() >= static_cast<size_t>(options.min_size)) {
            pieces.push_back(std::move(current));
            current.clear();
        }
        if (!current.empty()) current += ' ';
        current += sentence;
    }

    if (!current.empty()) {
        pieces.push_back(std::move(current));
    }

    SEMANTIC_CHUNKER_DEBUG << "      Smart split: " << text.size() << " chars -> "
                           << pieces.size() << " chunks";
    return pieces;
}

ChunkBuilder::ChunkBuilder(const ChunkOptions& options, const PageInfo& page, ChunkCollector& collector)
    : options_(options), page_(page), collector_(collector) {}

void ChunkBuilder::add(const SemanticSection& section) {
    switch (section.kind) {
        case SectionKind::Table:
        case SectionKind::Image:
        case SectionKind::Code:
            add_protected(section);
            break;
        case SectionKind::MajorHeader:
            add_major_header(section);
            break;
        case SectionKind::MinorHeader:
            add_minor_header(section);
            break;
        case SectionKind::List:
            // A list starts a new chunk when the buffer already stands on its own
            if (buffer_.size() >= static_cast<size_t>(options_.min_size)) {
                flush();
                adopt_pending();
            }
            append_text(section.content);
            break;
        case SectionKind::Text:
            append_text(section.content);
            break;
    }
}

void ChunkBuilder::finish() {
    flush();
    adopt_pending();
}

void ChunkBuilder::add_protected(const SemanticSection& section) {
    flush();
    adopt_pending();

    ChunkType type = chunk_type_for(section.kind);
    if (section.content.size() > static_cast<size_t>(options_.max_size)) {
        SEMANTIC_CHUNKER_DEBUG << "      Keeping oversized " << to_string(type) << " block whole ("
                               << section.content.size() << " chars)";
    }
    emit(section.content, section.breadcrumbs, type);
}

void ChunkBuilder::add_major_header(const SemanticSection& section) {
    if (buffer_.empty()) {
        breadcrumbs_ = section.breadcrumbs;
        pending_breadcrumbs_.reset();
    } else if (buffer_.size() >= static_cast<size_t>(options_.min_size)) {
        flush();
        breadcrumbs_ = section.breadcrumbs;
        pending_breadcrumbs_.reset();
    } else {
        // Short content carries forward under the old path until min_size
        pending_breadcrumbs_ = section.breadcrumbs;
    }
}

void ChunkBuilder::add_minor_header(const SemanticSection& section) {
    if (pending_breadcrumbs_) {
        pending_breadcrumbs_ = section.breadcrumbs;
    } else {
        breadcrumbs_ = section.breadcrumbs;
    }
}

void ChunkBuilder::append_text(const std::string& content) {
    if (!buffer_.empty()) buffer_ += "\n\n";
    buffer_ += content;

    bool reached_target = buffer_.size() >= static_cast<size_t>(options_.target_size);
    bool deferred_ready = pending_breadcrumbs_ && buffer_.size() >= static_cast<size_t>(options_.min_size);
    if (reached_target || deferred_ready) {
        flush();
        adopt_pending();
    }
}

void ChunkBuilder::flush() {
    std::string text = trim(buffer_);
    buffer_.clear();
    if (text.empty()) {
        return;
    }

    SEMANTIC_CHUNKER_DEBUG << "    Flushing buffer: " << text.size() << " chars";

    if (text.size() <= static_cast<size_t>(options_.max_size)) {
        emit(text, breadcrumbs_, ChunkType::Text);
        return;
    }

    auto pieces = smart_split(text, options_);
    for (const auto& piece : pieces) {
        emit(piece, breadcrumbs_, ChunkType::Text);
    }
    SEMANTIC_CHUNKER_DEBUG << "    Split into " << pieces.size() << " sub-chunks";
}

void ChunkBuilder::adopt_pending() {
    if (pending_breadcrumbs_) {
        breadcrumbs_ = std::move(*pending_breadcrumbs_);
        pending_breadcrumbs_.reset();
    }
}

void ChunkBuilder::emit(const std::string& content, const Breadcrumbs& breadcrumbs, ChunkType type) {
    bool accepted = collector_.add(create_chunk(content, breadcrumbs, page_, type));
    if (accepted && type != ChunkType::Text) {
        collector_.counters().protected_blocks[to_string(type)]++;
    }
}

std::vector<Chunk> build_chunks(const std::vector<SemanticSection>& sections,
                                const PageInfo& page,
                                const ChunkOptions& options,
                                ProcessingCounters& counters) {
    ChunkCollector collector(options);
    ChunkBuilder builder(options, page, collector);

    for (const auto& section : sections) {
        builder.add(section);
    }
    builder.finish();

    SEMANTIC_CHUNKER_DEBUG << "    Created " << collector.chunks().size() << " chunks";

    counters += collector.counters();
    return collector.take_chunks();
}

} // namespace semantic_chunker
