#include <gtest/gtest.h>
#include <semantic_chunker/document_loader.h>
#include <semantic_chunker/semantic_chunker.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace semantic_chunker;
namespace fs = std::filesystem;

class SemanticChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        input_dir_ = fs::temp_directory_path() / ("semantic_chunker_" + name + "_" + std::to_string(stamp));
        fs::create_directories(input_dir_ / "pages");

        options_.target_size = 60;
        options_.min_size = 20;
        options_.max_size = 120;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(input_dir_, ec);
    }

    void WriteFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    void WriteSampleDocument() {
        WriteFile(input_dir_ / "metadata.json", R"({
            "file": "annual_report.pdf",
            "pages": [
                {"page": 2, "file": "page_002.md"},
                {"page_number": 1, "file_name": "page_001.md"}
            ]
        })");
        WriteFile(input_dir_ / "pages" / "page_001.md",
                  "# Page 1\n\n# Annual Report\n\n## Results\n\n"
                  "Revenue increased in every region during the year, driven by")
        ;
        WriteFile(input_dir_ / "pages" / "page_002.md",
                  "strong demand for core products.\n\n"
                  "| Region | Revenue |\n|---|---|\n| North | 10 |\n| South | 12 |\n\n"
                  "## Outlook\n\nGrowth is expected to continue next year.");
    }

    fs::path input_dir_;
    ChunkOptions options_;
};

TEST_F(SemanticChunkerTest, ChunksDocumentDirectory) {
    WriteSampleDocument();

    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document(input_dir_.string());

    ASSERT_TRUE(result.error.empty()) << result.error;
    EXPECT_EQ(result.document, "annual_report");
    EXPECT_EQ(result.total_pages, 2);
    EXPECT_EQ(result.total_chunks, static_cast<int>(result.chunks.size()));
    ASSERT_EQ(result.chunks.size(), 3u);

    const Chunk& merged = result.chunks[0];
    EXPECT_TRUE(merged.metadata.is_merged);
    EXPECT_EQ(merged.metadata.page_number, 1);
    EXPECT_EQ(merged.metadata.breadcrumbs, (Breadcrumbs{"Annual Report", "Results"}));
    EXPECT_NE(merged.content_only.find("driven by\n\nstrong demand"), std::string::npos);

    EXPECT_EQ(result.chunks[1].metadata.type, ChunkType::Table);
    EXPECT_EQ(result.chunks[1].metadata.page_number, 2);

    EXPECT_EQ(result.chunks[2].metadata.breadcrumbs, (Breadcrumbs{"Outlook"}));
    EXPECT_EQ(result.chunks[2].content_only, "Growth is expected to continue next year.");

    const auto& counters = result.statistics.processing_stats;
    EXPECT_EQ(counters.total_pages, 2);
    EXPECT_EQ(counters.total_chunks, 3);
    EXPECT_EQ(counters.merged_boundaries, 1);
    EXPECT_EQ(counters.protected_blocks.at("table"), 1);
    EXPECT_EQ(counters.failed_pages, 0);
}

TEST_F(SemanticChunkerTest, OutputIsIndependentOfThreadCount) {
    WriteSampleDocument();

    options_.thread_count = 1;
    auto serial = SemanticChunker(options_).chunk_document(input_dir_.string());
    options_.thread_count = 4;
    auto parallel = SemanticChunker(options_).chunk_document(input_dir_.string());

    ASSERT_EQ(serial.chunks.size(), parallel.chunks.size());
    for (size_t i = 0; i < serial.chunks.size(); ++i) {
        EXPECT_EQ(serial.chunks[i].id, parallel.chunks[i].id);
    }
    EXPECT_EQ(serial.statistics.processing_stats.continuation_signals,
              parallel.statistics.processing_stats.continuation_signals);
}

TEST_F(SemanticChunkerTest, WritesJsonOutput) {
    WriteSampleDocument();
    fs::path output = input_dir_ / "annual_report_chunks.json";

    SemanticChunker chunker(options_);
    ASSERT_TRUE(chunker.process_document_to_json(input_dir_.string(), output.string()));
    ASSERT_TRUE(fs::exists(output));

    std::ifstream in(output);
    nlohmann::json doc;
    in >> doc;
    EXPECT_EQ(doc["document"], "annual_report");
    EXPECT_EQ(doc["total_chunks"], 3);
    EXPECT_EQ(doc["chunks"].size(), 3u);

    auto stats = chunker.get_stats();
    EXPECT_EQ(stats["documents_processed"], 1);
    EXPECT_EQ(stats["pages_processed"], 2);
    EXPECT_EQ(stats["chunks_created"], 3);
    EXPECT_EQ(stats["merged_boundaries"], 1);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
}

TEST_F(SemanticChunkerTest, MissingMetadataIsReported) {
    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document(input_dir_.string());

    EXPECT_FALSE(result.error.empty());
    EXPECT_NE(result.error.find("metadata.json"), std::string::npos);
    EXPECT_TRUE(result.chunks.empty());
    EXPECT_EQ(chunker.get_stats()["documents_failed"], 1);
}

TEST_F(SemanticChunkerTest, MissingDirectoryIsReported) {
    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document((input_dir_ / "does_not_exist").string());
    EXPECT_FALSE(result.error.empty());
}

TEST_F(SemanticChunkerTest, MalformedMetadataIsReported) {
    WriteFile(input_dir_ / "metadata.json", "{ \"pages\": [ ");

    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document(input_dir_.string());
    EXPECT_FALSE(result.error.empty());
}

TEST_F(SemanticChunkerTest, MissingPageFileIsReported) {
    WriteFile(input_dir_ / "metadata.json",
              R"({"pages": [{"page_number": 1, "file_name": "page_001.md"}]})");

    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document(input_dir_.string());
    EXPECT_NE(result.error.find("page_001.md"), std::string::npos);
    EXPECT_FALSE(chunker.process_document_to_json(input_dir_.string(),
                                                  (input_dir_ / "out.json").string()));
}

TEST_F(SemanticChunkerTest, DocumentNameFallsBackToDirectory) {
    WriteFile(input_dir_ / "metadata.json",
              R"({"pages": [{"page_number": 1, "file_name": "page_001.md"}]})");
    WriteFile(input_dir_ / "pages" / "page_001.md", "Only page.");

    auto manifest = load_manifest(input_dir_);
    EXPECT_EQ(manifest.name, input_dir_.filename().string());
    ASSERT_EQ(manifest.pages.size(), 1u);
    EXPECT_EQ(manifest.pages[0].file_name, "page_001.md");
}

TEST_F(SemanticChunkerTest, EmptyPageProducesNoChunks) {
    WriteFile(input_dir_ / "metadata.json",
              R"({"pages": [{"page_number": 1, "file_name": "page_001.md"}]})");
    WriteFile(input_dir_ / "pages" / "page_001.md", "");

    SemanticChunker chunker(options_);
    auto result = chunker.chunk_document(input_dir_.string());
    ASSERT_TRUE(result.error.empty()) << result.error;
    EXPECT_EQ(result.total_pages, 1);
    EXPECT_EQ(result.total_chunks, 0);
}

TEST(SemanticChunkerOptionsTest, RejectsInconsistentSizes) {
    ChunkOptions options;
    options.min_size = 2000;
    options.target_size = 1500;
    EXPECT_THROW(SemanticChunker chunker(options), std::invalid_argument);

    options = ChunkOptions{};
    options.max_size = 1000;
    EXPECT_THROW(SemanticChunker chunker(options), std::invalid_argument);

    options = ChunkOptions{};
    options.min_size = 0;
    EXPECT_THROW(validate_options(options), std::invalid_argument);

    options = ChunkOptions{};
    options.thread_count = -1;
    EXPECT_THROW(validate_options(options), std::invalid_argument);

    EXPECT_NO_THROW(validate_options(ChunkOptions{}));
}

TEST(SemanticChunkerOptionsTest, SetOptionsValidates) {
    SemanticChunker chunker;
    ChunkOptions options;
    options.target_size = 500;
    options.min_size = 200;
    options.max_size = 900;
    chunker.set_options(options);
    EXPECT_EQ(chunker.get_options().target_size, 500);

    options.min_size = 600;
    EXPECT_THROW(chunker.set_options(options), std::invalid_argument);
    EXPECT_EQ(chunker.get_options().min_size, 200);
}

TEST(SemanticChunkerPageTest, FigureCaptionDoesNotSwallowSubsection) {
    ChunkOptions options;
    options.target_size = 80;
    options.min_size = 30;
    options.max_size = 400;
    SemanticChunker chunker(options);

    std::string text =
        "## Results\n\n> **Figure 1** Revenue by region\n\n"
        "Revenue grew 12% across all regions this year.\n\n"
        "Margins also improved on lower input costs.\n\n"
        "### Outlook\n\nWe expect continued growth next year.";
    PageInfo page{1, "page_001.md"};
    ProcessingCounters counters;

    auto chunks = chunker.chunk_page(text, page, counters);
    ASSERT_EQ(chunks.size(), 3u);

    EXPECT_EQ(chunks[0].metadata.type, ChunkType::Image);
    EXPECT_EQ(chunks[0].content_only, "> **Figure 1** Revenue by region");
    EXPECT_EQ(chunks[0].metadata.breadcrumbs, (Breadcrumbs{"Results"}));

    EXPECT_EQ(chunks[1].metadata.type, ChunkType::Text);
    EXPECT_EQ(chunks[1].metadata.breadcrumbs, (Breadcrumbs{"Results"}));

    EXPECT_EQ(chunks[2].content_only, "We expect continued growth next year.");
    EXPECT_EQ(chunks[2].metadata.breadcrumbs, (Breadcrumbs{"Results", "Outlook"}));
    EXPECT_EQ(counters.protected_blocks.at("image"), 1);
}
