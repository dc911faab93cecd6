#pragma once

#include "semantic_chunker/types.h"

#include <map>
#include <string>
#include <vector>

namespace semantic_chunker {

// Chunk sizes are content_only lengths in characters
struct SizeDistribution {
    int min = 0;
    int max = 0;
    double mean = 0.0;
    int median = 0;
    double std_dev = 0.0;  // population
    int percentile_25 = 0;
    int percentile_75 = 0;
};

struct ContentAnalysis {
    int total_words = 0;
    int total_sentences = 0;
    double avg_words_per_chunk = 0.0;
    int chunks_with_numerical_data = 0;
    int chunks_with_dates = 0;
    int chunks_with_entities = 0;
    int chunks_with_exhibits = 0;
    int chunks_with_citations = 0;
};

struct DocumentStatistics {
    int chunk_count = 0;  // distributions below are only meaningful when > 0
    SizeDistribution size_distribution;
    std::map<std::string, int> type_distribution;
    std::map<int, int> chunks_per_page;
    double avg_chunks_per_page = 0.0;
    ContentAnalysis content_analysis;
    ProcessingCounters processing_stats;
};

DocumentStatistics calculate_statistics(const std::vector<Chunk>& chunks,
                                        const ProcessingCounters& counters);

} // namespace semantic_chunker
