#pragma once

namespace semantic_chunker {

// Configuration for semantic chunking (sizes are in characters)
struct ChunkOptions {
    int target_size = 1500;
    int min_size = 800;
    int max_size = 2500;
    bool enable_merging = true;
    int thread_count = 0;  // 0 = use hardware concurrency; does not affect output
};

// Size of the trailing window searched for duplicate chunk ids
constexpr int kDedupWindow = 5;

// Characters inspected on each side of a page boundary
constexpr int kBoundaryWindow = 200;

// Throws std::invalid_argument unless 0 < min_size <= target_size <= max_size
void validate_options(const ChunkOptions& options);

} // namespace semantic_chunker
