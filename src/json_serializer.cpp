#include "semantic_chunker/json_serializer.h"
#include "semantic_chunker/json_types.h"

#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace semantic_chunker {

namespace {

template<typename Map>
JsonValue count_map(JsonBuilder& builder, const Map& counts) {
    JsonValue object(rapidjson::kObjectType);
    for (const auto& [key, count] : counts) {
        std::string name;
        if constexpr (std::is_same_v<typename Map::key_type, std::string>) {
            name = key;
        } else {
            name = std::to_string(key);
        }
        JsonValue json_key = builder.string(name);
        JsonValue json_count(count);
        object.AddMember(json_key, json_count, builder.allocator());
    }
    return object;
}

JsonValue chunking_config(JsonBuilder& builder, const ChunkOptions& options) {
    auto& alloc = builder.allocator();
    JsonValue config(rapidjson::kObjectType);
    config.AddMember("target_size", options.target_size, alloc);
    config.AddMember("min_size", options.min_size, alloc);
    config.AddMember("max_size", options.max_size, alloc);
    config.AddMember("merging_enabled", options.enable_merging, alloc);
    return config;
}

JsonValue processing_stats(JsonBuilder& builder, const ProcessingCounters& counters) {
    auto& alloc = builder.allocator();
    JsonValue stats(rapidjson::kObjectType);
    stats.AddMember("total_pages", counters.total_pages, alloc);
    stats.AddMember("total_chunks", counters.total_chunks, alloc);
    stats.AddMember("duplicates_prevented", counters.duplicates_prevented, alloc);
    stats.AddMember("validation_failures", counters.validation_failures, alloc);
    stats.AddMember("merged_boundaries", counters.merged_boundaries, alloc);
    stats.AddMember("protected_blocks", count_map(builder, counters.protected_blocks), alloc);
    stats.AddMember("oversized_blocks", counters.oversized_blocks, alloc);
    stats.AddMember("failed_pages", counters.failed_pages, alloc);
    stats.AddMember("continuation_signals", count_map(builder, counters.continuation_signals), alloc);
    return stats;
}

JsonValue detailed_statistics(JsonBuilder& builder, const DocumentStatistics& stats) {
    auto& alloc = builder.allocator();
    JsonValue detailed(rapidjson::kObjectType);

    if (stats.chunk_count > 0) {
        const auto& sizes = stats.size_distribution;
        JsonValue size_distribution(rapidjson::kObjectType);
        size_distribution.AddMember("min", sizes.min, alloc);
        size_distribution.AddMember("max", sizes.max, alloc);
        size_distribution.AddMember("mean", sizes.mean, alloc);
        size_distribution.AddMember("median", sizes.median, alloc);
        size_distribution.AddMember("std_dev", sizes.std_dev, alloc);
        size_distribution.AddMember("percentile_25", sizes.percentile_25, alloc);
        size_distribution.AddMember("percentile_75", sizes.percentile_75, alloc);
        detailed.AddMember("size_distribution", size_distribution, alloc);

        detailed.AddMember("type_distribution", count_map(builder, stats.type_distribution), alloc);
        detailed.AddMember("chunks_per_page", count_map(builder, stats.chunks_per_page), alloc);
        detailed.AddMember("avg_chunks_per_page", stats.avg_chunks_per_page, alloc);

        const auto& content = stats.content_analysis;
        JsonValue analysis(rapidjson::kObjectType);
        analysis.AddMember("total_words", content.total_words, alloc);
        analysis.AddMember("total_sentences", content.total_sentences, alloc);
        analysis.AddMember("avg_words_per_chunk", content.avg_words_per_chunk, alloc);
        analysis.AddMember("chunks_with_numerical_data", content.chunks_with_numerical_data, alloc);
        analysis.AddMember("chunks_with_dates", content.chunks_with_dates, alloc);
        analysis.AddMember("chunks_with_entities", content.chunks_with_entities, alloc);
        analysis.AddMember("chunks_with_exhibits", content.chunks_with_exhibits, alloc);
        analysis.AddMember("chunks_with_citations", content.chunks_with_citations, alloc);
        detailed.AddMember("content_analysis", analysis, alloc);
    }

    detailed.AddMember("processing_stats", processing_stats(builder, stats.processing_stats), alloc);
    return detailed;
}

JsonValue hierarchical_context(JsonBuilder& builder, const HierarchicalContext& context) {
    auto& alloc = builder.allocator();
    JsonValue object(rapidjson::kObjectType);
    for (size_t i = 0; i < context.levels.size(); ++i) {
        JsonValue key = builder.string("level_" + std::to_string(i + 1));
        JsonValue level = builder.string(context.levels[i]);
        object.AddMember(key, level, alloc);
    }
    object.AddMember("full_path", builder.string(context.full_path), alloc);
    object.AddMember("depth", context.depth, alloc);
    return object;
}

JsonValue quality_metrics(JsonBuilder& builder, const QualityMetrics& metrics) {
    auto& alloc = builder.allocator();
    JsonValue object(rapidjson::kObjectType);
    object.AddMember("word_count", metrics.word_count, alloc);
    object.AddMember("sentence_count", metrics.sentence_count, alloc);
    object.AddMember("avg_sentence_length", metrics.avg_sentence_length, alloc);
    object.AddMember("has_numerical_data", metrics.has_numerical_data, alloc);
    object.AddMember("has_dates", metrics.has_dates, alloc);
    object.AddMember("has_named_entities", metrics.has_named_entities, alloc);
    object.AddMember("has_exhibits", metrics.has_exhibits, alloc);
    return object;
}

JsonValue chunk_json(JsonBuilder& builder, const Chunk& chunk) {
    auto& alloc = builder.allocator();
    const auto& metadata = chunk.metadata;

    JsonValue meta(rapidjson::kObjectType);
    meta.AddMember("source", builder.string(metadata.source), alloc);
    meta.AddMember("page_number", metadata.page_number, alloc);
    meta.AddMember("type", JsonValue(rapidjson::StringRef(to_string(metadata.type))), alloc);
    meta.AddMember("breadcrumbs", builder.string_array(metadata.breadcrumbs), alloc);
    meta.AddMember("hierarchical_context", hierarchical_context(builder, metadata.hierarchical_context), alloc);
    meta.AddMember("image_path", builder.optional_string(metadata.image_path), alloc);
    meta.AddMember("source_attribution", builder.optional_string(metadata.source_attribution), alloc);
    meta.AddMember("has_citations", metadata.has_citations, alloc);
    meta.AddMember("char_count", metadata.char_count, alloc);
    meta.AddMember("quality_metrics", quality_metrics(builder, metadata.quality_metrics), alloc);

    if (metadata.merged_from_pages) {
        JsonValue pages(rapidjson::kArrayType);
        pages.PushBack((*metadata.merged_from_pages)[0], alloc);
        pages.PushBack((*metadata.merged_from_pages)[1], alloc);
        meta.AddMember("merged_from_pages", pages, alloc);
    } else {
        meta.AddMember("merged_from_pages", JsonValue(rapidjson::kNullType), alloc);
    }
    meta.AddMember("is_merged", metadata.is_merged, alloc);

    JsonValue object(rapidjson::kObjectType);
    object.AddMember("id", builder.string(chunk.id), alloc);
    object.AddMember("text", builder.string(chunk.text), alloc);
    object.AddMember("content_only", builder.string(chunk.content_only), alloc);
    object.AddMember("metadata", meta, alloc);
    return object;
}

} // namespace

std::string JsonSerializer::serialize_result(const ChunkingResult& result, bool pretty) {
    JsonBuilder builder;
    auto& doc = builder.document();
    auto& alloc = builder.allocator();

    doc.AddMember("document", builder.string(result.document), alloc);
    doc.AddMember("total_pages", result.total_pages, alloc);
    doc.AddMember("total_chunks", result.total_chunks, alloc);
    doc.AddMember("chunking_config", chunking_config(builder, result.options), alloc);
    doc.AddMember("detailed_statistics", detailed_statistics(builder, result.statistics), alloc);

    JsonValue chunks(rapidjson::kArrayType);
    chunks.Reserve(static_cast<rapidjson::SizeType>(result.chunks.size()), alloc);
    for (const auto& chunk : result.chunks) {
        chunks.PushBack(chunk_json(builder, chunk), alloc);
    }
    doc.AddMember("chunks", chunks, alloc);

    return builder.serialize(pretty);
}

void JsonSerializer::write_result(const ChunkingResult& result, const std::string& output_path,
                                  bool pretty) {
    std::ofstream outfile(output_path, std::ios::binary);
    if (!outfile) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }
    outfile << serialize_result(result, pretty) << '\n';
    if (!outfile) {
        throw std::runtime_error("Failed writing output file: " + output_path);
    }
}

} // namespace semantic_chunker
