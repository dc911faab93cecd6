#include <benchmark/benchmark.h>
#include <semantic_chunker/json_serializer.h>
#include <semantic_chunker/logger.h>
#include <semantic_chunker/protected_regions.h>
#include <semantic_chunker/semantic_chunker.h>

using namespace semantic_chunker;

namespace {

// Synthetic extractor output: headings, paragraphs, a list and a table per
// page. Odd pages end mid-sentence so boundary merging has work to do.
std::string generate_page(int page) {
    std::string content = "# Chapter " + std::to_string(page) + "\n\n";
    content += "This is the introduction to chapter " + std::to_string(page) + ".\n\n";

    for (int j = 1; j <= 3; ++j) {
        content += "## Section " + std::to_string(page) + "." + std::to_string(j) + "\n\n";

        for (int k = 1; k <= 5; ++k) {
            content += "This is paragraph " + std::to_string(k) + " of section " + std::to_string(j) + ". ";
            content += "It contains some sample text to demonstrate the chunking algorithm. ";
            content += "Revenue grew 12% in 2023 according to Acme Corporation.\n\n";
        }

        content += "- first point\n- second point\n- third point\n\n";
        content += "| Metric | Value |\n|---|---|\n| Revenue | 120 |\n| Margin | 14% |\n\n";
        content += "Table " + std::to_string(j) + ": Key metrics\n\n";
    }

    if (page % 2 == 1) {
        content += "The final figures will be reported together with";
    } else {
        content += "End of chapter.";
    }
    return content;
}

std::vector<PageText> generate_pages(int num_pages) {
    std::vector<PageText> pages;
    pages.reserve(num_pages);
    for (int i = 1; i <= num_pages; ++i) {
        PageText page;
        page.info.page_number = i;
        page.info.file_name = "page_" + std::to_string(i) + ".md";
        page.text = generate_page(i);
        pages.push_back(std::move(page));
    }
    return pages;
}

void quiet_logging() {
    LogOptions options;
    options.console_level = LogLevel::Error;
    Logger::configure(options);
}

} // namespace

static void BM_DetectProtectedRegions(benchmark::State& state) {
    std::string text = generate_page(1);

    for (auto _ : state) {
        auto regions = detect_protected_regions(text);
        benchmark::DoNotOptimize(regions);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_DetectProtectedRegions);

static void BM_ChunkPage(benchmark::State& state) {
    quiet_logging();

    ChunkOptions options;
    options.target_size = static_cast<int>(state.range(0));
    options.min_size = options.target_size / 2;
    options.max_size = options.target_size * 2;
    SemanticChunker chunker(options);

    std::string text = generate_page(1);
    PageInfo page{1, "page_1.md"};

    for (auto _ : state) {
        ProcessingCounters counters;
        auto chunks = chunker.chunk_page(text, page, counters);
        benchmark::DoNotOptimize(chunks);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ChunkPage)->Arg(500)->Arg(1500)->Arg(4000);

static void BM_ChunkDocument(benchmark::State& state) {
    quiet_logging();

    ChunkOptions options;
    options.thread_count = static_cast<int>(state.range(0));
    SemanticChunker chunker(options);

    auto pages = generate_pages(static_cast<int>(state.range(1)));

    for (auto _ : state) {
        auto result = chunker.chunk_pages("benchmark", pages);
        benchmark::DoNotOptimize(result);
    }

    auto stats = chunker.get_stats();
    state.counters["pages_per_second"] = stats.value("pages_per_second", 0.0);
    state.counters["chunks"] = benchmark::Counter(stats["chunks_created"].get<double>(),
                                                  benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_ChunkDocument)->Ranges({{1, 8}, {10, 500}});

static void BM_SerializeResult(benchmark::State& state) {
    quiet_logging();

    SemanticChunker chunker;
    auto result = chunker.chunk_pages("benchmark", generate_pages(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        auto json = JsonSerializer::serialize_result(result);
        benchmark::DoNotOptimize(json);
    }
    state.counters["chunks"] = result.total_chunks;
}
BENCHMARK(BM_SerializeResult)->Range(10, 500);

BENCHMARK_MAIN();
