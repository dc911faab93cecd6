#include <gtest/gtest.h>
#include <semantic_chunker/chunk_builder.h>
#include <semantic_chunker/protected_regions.h>
#include <semantic_chunker/section_parser.h>

using namespace semantic_chunker;

class ChunkBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        page_.page_number = 1;
        page_.file_name = "page_001.md";
    }

    std::vector<Chunk> ChunkText(const std::string& text, const ChunkOptions& options) {
        auto regions = detect_protected_regions(text);
        auto sections = consolidate_paragraphs(parse_sections(text, regions));
        return build_chunks(sections, page_, options, counters_);
    }

    SemanticSection Header(SectionKind kind, const Breadcrumbs& breadcrumbs) {
        SemanticSection section;
        section.kind = kind;
        section.content = breadcrumbs.back();
        section.breadcrumbs = breadcrumbs;
        return section;
    }

    SemanticSection Text(const std::string& content, const Breadcrumbs& breadcrumbs) {
        SemanticSection section;
        section.kind = SectionKind::Text;
        section.content = content;
        section.breadcrumbs = breadcrumbs;
        return section;
    }

    static ChunkOptions Options(int target, int min, int max) {
        ChunkOptions options;
        options.target_size = target;
        options.min_size = min;
        options.max_size = max;
        return options;
    }

    static std::string Sentences(int count) {
        std::string text;
        for (int i = 0; i < count; ++i) {
            if (i > 0) text += ' ';
            text += "Sentence number " + std::to_string(i) + " ends right here.";
        }
        return text;
    }

    PageInfo page_;
    ProcessingCounters counters_;
};

TEST_F(ChunkBuilderTest, HeaderParagraphsListAndTable) {
    std::string text =
        "# Title\n\nPara A.\n\nPara B.\n\n- item1\n- item2\n\n| A | B |\n|---|---|\n|1|2|";

    auto chunks = ChunkText(text, Options(30, 10, 60));
    ASSERT_EQ(chunks.size(), 3u);

    EXPECT_EQ(chunks[0].metadata.type, ChunkType::Text);
    EXPECT_EQ(chunks[0].metadata.breadcrumbs, (Breadcrumbs{"Title"}));
    EXPECT_EQ(chunks[0].content_only, "Para A.\n\nPara B.");
    EXPECT_EQ(chunks[0].text, "Context: Title\n\nPara A.\n\nPara B.");

    EXPECT_EQ(chunks[1].metadata.type, ChunkType::Text);
    EXPECT_EQ(chunks[1].content_only, "- item1\n- item2");

    EXPECT_EQ(chunks[2].metadata.type, ChunkType::Table);
    EXPECT_EQ(chunks[2].content_only, "| A | B |\n|---|---|\n|1|2|");

    EXPECT_EQ(counters_.protected_blocks["table"], 1);
    EXPECT_EQ(counters_.duplicates_prevented, 0);
}

TEST_F(ChunkBuilderTest, ChunksStayWithinBounds) {
    std::string text;
    for (int i = 0; i < 12; ++i) {
        text += "Paragraph " + std::to_string(i) + " carries a short sentence. Then another one.\n\n";
    }

    ChunkOptions options = Options(100, 50, 200);
    auto chunks = ChunkText(text, options);
    ASSERT_GT(chunks.size(), 1u);

    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_GE(chunks[i].metadata.char_count, options.min_size) << "chunk " << i;
        EXPECT_LE(chunks[i].metadata.char_count, options.max_size) << "chunk " << i;
    }
}

TEST_F(ChunkBuilderTest, SmartSplitKeepsEverySentence) {
    std::string text = Sentences(10);
    auto pieces = smart_split(text, Options(80, 40, 120));
    ASSERT_GT(pieces.size(), 1u);

    std::string rejoined;
    for (const auto& piece : pieces) {
        if (!rejoined.empty()) rejoined += ' ';
        rejoined += piece;
        EXPECT_FALSE(piece.empty());
    }
    EXPECT_EQ(rejoined, text);
}

TEST_F(ChunkBuilderTest, OversizedParagraphIsSplitAtSentences) {
    std::string text = Sentences(12);
    auto chunks = ChunkText("## Section\n\n" + text, Options(100, 50, 150));
    ASSERT_GT(chunks.size(), 1u);

    std::string rejoined;
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.metadata.type, ChunkType::Text);
        EXPECT_EQ(chunk.metadata.breadcrumbs, (Breadcrumbs{"Section"}));
        if (!rejoined.empty()) rejoined += ' ';
        rejoined += chunk.content_only;
    }
    EXPECT_EQ(rejoined, text);
}

TEST_F(ChunkBuilderTest, ProtectedBlockIsNeverSplit) {
    std::string table = "| Year | Value |\n|---|---|";
    for (int i = 0; i < 20; ++i) {
        table += "\n| " + std::to_string(2000 + i) + " | " + std::to_string(i * 10) + " |";
    }

    auto chunks = ChunkText("Before.\n\n" + table + "\n\nAfter.", Options(30, 10, 60));
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[1].metadata.type, ChunkType::Table);
    EXPECT_EQ(chunks[1].content_only, table);
    EXPECT_EQ(counters_.oversized_blocks, 1);
}

TEST_F(ChunkBuilderTest, ShortSectionCarriesIntoNextHeader) {
    ChunkCollector collector(Options(100, 20, 200));
    ChunkBuilder builder(Options(100, 20, 200), page_, collector);

    builder.add(Header(SectionKind::MajorHeader, {"A"}));
    builder.add(Text("Short intro.", {"A"}));
    builder.add(Header(SectionKind::MajorHeader, {"B"}));
    builder.add(Text("This text belongs to section B.", {"B"}));
    builder.add(Text("More B content here.", {"B"}));
    builder.finish();

    const auto& chunks = collector.chunks();
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].metadata.breadcrumbs, (Breadcrumbs{"A"}));
    EXPECT_EQ(chunks[0].content_only, "Short intro.\n\nThis text belongs to section B.");
    EXPECT_EQ(chunks[1].metadata.breadcrumbs, (Breadcrumbs{"B"}));
    EXPECT_EQ(chunks[1].content_only, "More B content here.");
}

TEST_F(ChunkBuilderTest, MajorHeaderFlushesSubstantialBuffer) {
    ChunkCollector collector(Options(100, 20, 200));
    ChunkBuilder builder(Options(100, 20, 200), page_, collector);

    builder.add(Header(SectionKind::MajorHeader, {"A"}));
    builder.add(Text("Thirty characters of content..", {"A"}));
    builder.add(Header(SectionKind::MajorHeader, {"B"}));
    builder.add(Text("Under B.", {"B"}));
    builder.finish();

    const auto& chunks = collector.chunks();
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].metadata.breadcrumbs, (Breadcrumbs{"A"}));
    EXPECT_EQ(chunks[0].content_only, "Thirty characters of content..");
    EXPECT_EQ(chunks[1].metadata.breadcrumbs, (Breadcrumbs{"B"}));
}

TEST_F(ChunkBuilderTest, RepeatedParagraphIsDeduplicated) {
    std::string text = "Repeated para.\n\n| A | B |\n|---|---|\n|1|2|\n\nRepeated para.";
    auto chunks = ChunkText(text, Options(30, 10, 60));

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content_only, "Repeated para.");
    EXPECT_EQ(chunks[1].metadata.type, ChunkType::Table);
    EXPECT_EQ(counters_.duplicates_prevented, 1);
}

TEST_F(ChunkBuilderTest, CreateChunkFillsMetadata) {
    std::string content =
        "Revenue grew 15% in 2023. John Smith said so.\n![chart](figures/chart_1.png)\nSource: Company filings";
    auto chunk = create_chunk(content, {"Report", "Results"}, page_, ChunkType::Text);

    EXPECT_EQ(chunk.text, "Context: Report > Results\n\n" + content);
    EXPECT_EQ(chunk.content_only, content);
    EXPECT_EQ(chunk.id.size(), 32u);

    const auto& metadata = chunk.metadata;
    EXPECT_EQ(metadata.source, "page_001.md");
    EXPECT_EQ(metadata.page_number, 1);
    EXPECT_EQ(metadata.hierarchical_context.full_path, "Report > Results");
    EXPECT_EQ(metadata.hierarchical_context.depth, 2);
    ASSERT_TRUE(metadata.image_path.has_value());
    EXPECT_EQ(*metadata.image_path, "figures/chart_1.png");
    ASSERT_TRUE(metadata.source_attribution.has_value());
    EXPECT_EQ(*metadata.source_attribution, "Company filings");
    EXPECT_TRUE(metadata.has_citations);
    EXPECT_EQ(metadata.char_count, static_cast<int>(content.size()));
    EXPECT_FALSE(metadata.is_merged);
    EXPECT_FALSE(metadata.merged_from_pages.has_value());
}

TEST_F(ChunkBuilderTest, ChunkWithoutBreadcrumbsIsContentOnly) {
    auto chunk = create_chunk("Plain text.", {}, page_, ChunkType::Text);
    EXPECT_EQ(chunk.text, "Plain text.");
    EXPECT_EQ(chunk.metadata.hierarchical_context.depth, 0);
    EXPECT_FALSE(chunk.metadata.image_path.has_value());
    EXPECT_FALSE(chunk.metadata.has_citations);

    auto again = create_chunk("Plain text.", {}, page_, ChunkType::Text);
    EXPECT_EQ(chunk.id, again.id);
}

TEST_F(ChunkBuilderTest, QualityMetrics) {
    auto metrics = compute_quality_metrics("Revenue grew 15% in 2023. John Smith said so.");
    EXPECT_EQ(metrics.word_count, 9);
    EXPECT_EQ(metrics.sentence_count, 2);
    EXPECT_DOUBLE_EQ(metrics.avg_sentence_length, 4.5);
    EXPECT_TRUE(metrics.has_numerical_data);
    EXPECT_TRUE(metrics.has_dates);
    EXPECT_TRUE(metrics.has_named_entities);
    EXPECT_FALSE(metrics.has_exhibits);

    EXPECT_TRUE(compute_quality_metrics("See Exhibit 4 for details.").has_exhibits);
}
