#include <gtest/gtest.h>
#include <semantic_chunker/chunk_builder.h>
#include <semantic_chunker/statistics.h>

using namespace semantic_chunker;

class StatisticsTest : public ::testing::Test {
protected:
    Chunk Make(int size, int page_number, ChunkType type) {
        PageInfo page;
        page.page_number = page_number;
        page.file_name = "page_" + std::to_string(page_number) + ".md";
        return create_chunk(std::string(static_cast<size_t>(size), 'a'), {}, page, type);
    }
};

TEST_F(StatisticsTest, SizeDistribution) {
    std::vector<Chunk> chunks = {
        Make(10, 1, ChunkType::Text),
        Make(20, 1, ChunkType::Text),
        Make(30, 2, ChunkType::Table),
        Make(40, 2, ChunkType::Text),
    };

    auto stats = calculate_statistics(chunks, ProcessingCounters{});
    EXPECT_EQ(stats.chunk_count, 4);

    const auto& sizes = stats.size_distribution;
    EXPECT_EQ(sizes.min, 10);
    EXPECT_EQ(sizes.max, 40);
    EXPECT_DOUBLE_EQ(sizes.mean, 25.0);
    EXPECT_EQ(sizes.median, 30);
    EXPECT_DOUBLE_EQ(sizes.std_dev, 11.2);
    EXPECT_EQ(sizes.percentile_25, 20);
    EXPECT_EQ(sizes.percentile_75, 40);
}

TEST_F(StatisticsTest, TypeAndPageDistribution) {
    std::vector<Chunk> chunks = {
        Make(10, 1, ChunkType::Text),
        Make(20, 1, ChunkType::Text),
        Make(30, 2, ChunkType::Table),
        Make(40, 3, ChunkType::Text),
    };

    auto stats = calculate_statistics(chunks, ProcessingCounters{});
    EXPECT_EQ(stats.type_distribution["text"], 3);
    EXPECT_EQ(stats.type_distribution["table"], 1);
    EXPECT_EQ(stats.type_distribution.count("image"), 0u);

    EXPECT_EQ(stats.chunks_per_page[1], 2);
    EXPECT_EQ(stats.chunks_per_page[2], 1);
    EXPECT_EQ(stats.chunks_per_page[3], 1);
    EXPECT_DOUBLE_EQ(stats.avg_chunks_per_page, 1.33);
}

TEST_F(StatisticsTest, ContentAnalysis) {
    PageInfo page{1, "page_001.md"};
    std::vector<Chunk> chunks = {
        create_chunk("Sales rose 12% in 2021. Jane Doe led it.", {}, page, ChunkType::Text),
        create_chunk("Plain words only here", {}, page, ChunkType::Text),
        create_chunk("see figure 2.\nSource: annual report", {}, page, ChunkType::Image),
    };

    auto stats = calculate_statistics(chunks, ProcessingCounters{});
    const auto& content = stats.content_analysis;
    EXPECT_EQ(content.total_words, 9 + 4 + 6);
    EXPECT_EQ(content.chunks_with_numerical_data, 2);
    EXPECT_EQ(content.chunks_with_dates, 1);
    EXPECT_EQ(content.chunks_with_entities, 1);
    EXPECT_EQ(content.chunks_with_exhibits, 1);
    EXPECT_EQ(content.chunks_with_citations, 1);
    EXPECT_DOUBLE_EQ(content.avg_words_per_chunk, 6.3);
}

TEST_F(StatisticsTest, ProcessingCountersPassThrough) {
    ProcessingCounters counters;
    counters.total_pages = 3;
    counters.merged_boundaries = 2;
    counters.protected_blocks["table"] = 4;

    auto stats = calculate_statistics({Make(10, 1, ChunkType::Text)}, counters);
    EXPECT_EQ(stats.processing_stats.total_pages, 3);
    EXPECT_EQ(stats.processing_stats.merged_boundaries, 2);
    EXPECT_EQ(stats.processing_stats.protected_blocks.at("table"), 4);
}

TEST_F(StatisticsTest, EmptyDocument) {
    ProcessingCounters counters;
    counters.total_pages = 1;

    auto stats = calculate_statistics({}, counters);
    EXPECT_EQ(stats.chunk_count, 0);
    EXPECT_TRUE(stats.type_distribution.empty());
    EXPECT_TRUE(stats.chunks_per_page.empty());
    EXPECT_EQ(stats.processing_stats.total_pages, 1);
}

TEST(ProcessingCountersTest, SumIncludesHistograms) {
    ProcessingCounters a;
    a.duplicates_prevented = 1;
    a.protected_blocks["table"] = 1;
    a.continuation_signals["conjunction"] = 2;

    ProcessingCounters b;
    b.duplicates_prevented = 2;
    b.failed_pages = 1;
    b.protected_blocks["table"] = 2;
    b.protected_blocks["code"] = 1;

    a += b;
    EXPECT_EQ(a.duplicates_prevented, 3);
    EXPECT_EQ(a.failed_pages, 1);
    EXPECT_EQ(a.protected_blocks["table"], 3);
    EXPECT_EQ(a.protected_blocks["code"], 1);
    EXPECT_EQ(a.continuation_signals["conjunction"], 2);
}
