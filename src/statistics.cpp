#include "semantic_chunker/statistics.h"
#include "semantic_chunker/logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace semantic_chunker {

namespace {

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

SizeDistribution size_distribution(std::vector<int> sizes) {
    SizeDistribution dist;
    std::sort(sizes.begin(), sizes.end());

    size_t n = sizes.size();
    double mean = std::accumulate(sizes.begin(), sizes.end(), 0.0) / n;
    double variance = 0.0;
    for (int size : sizes) {
        variance += (size - mean) * (size - mean);
    }
    variance /= n;

    dist.min = sizes.front();
    dist.max = sizes.back();
    dist.mean = round_to(mean, 1);
    dist.median = sizes[n / 2];
    dist.std_dev = round_to(std::sqrt(variance), 1);
    dist.percentile_25 = sizes[n / 4];
    dist.percentile_75 = sizes[3 * n / 4];
    return dist;
}

} // namespace

DocumentStatistics calculate_statistics(const std::vector<Chunk>& chunks,
                                        const ProcessingCounters& counters) {
    DocumentStatistics stats;
    stats.processing_stats = counters;
    stats.chunk_count = static_cast<int>(chunks.size());

    if (chunks.empty()) {
        return stats;
    }

    SEMANTIC_CHUNKER_DEBUG << "  Calculating statistics...";

    std::vector<int> sizes;
    sizes.reserve(chunks.size());
    auto& content = stats.content_analysis;

    for (const auto& chunk : chunks) {
        const auto& metadata = chunk.metadata;
        const auto& metrics = metadata.quality_metrics;

        sizes.push_back(static_cast<int>(chunk.content_only.size()));
        stats.type_distribution[to_string(metadata.type)]++;
        stats.chunks_per_page[metadata.page_number]++;

        content.total_words += metrics.word_count;
        content.total_sentences += metrics.sentence_count;
        if (metrics.has_numerical_data) content.chunks_with_numerical_data++;
        if (metrics.has_dates) content.chunks_with_dates++;
        if (metrics.has_named_entities) content.chunks_with_entities++;
        if (metrics.has_exhibits) content.chunks_with_exhibits++;
        if (metadata.has_citations) content.chunks_with_citations++;
    }

    stats.size_distribution = size_distribution(std::move(sizes));
    stats.avg_chunks_per_page =
        round_to(static_cast<double>(chunks.size()) / stats.chunks_per_page.size(), 2);
    content.avg_words_per_chunk =
        round_to(static_cast<double>(content.total_words) / chunks.size(), 1);

    SEMANTIC_CHUNKER_DEBUG << "  Statistics calculated for " << chunks.size() << " chunks";
    return stats;
}

} // namespace semantic_chunker
