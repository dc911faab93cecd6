#include "semantic_chunker/semantic_chunker.h"
#include "semantic_chunker/chunk_builder.h"
#include "semantic_chunker/continuation.h"
#include "semantic_chunker/json_serializer.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/protected_regions.h"
#include "semantic_chunker/section_parser.h"
#include "semantic_chunker/thread_pool.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>

namespace semantic_chunker {

void validate_options(const ChunkOptions& options) {
    if (options.target_size <= 0 || options.min_size <= 0 || options.max_size <= 0) {
        throw std::invalid_argument("chunk sizes must be positive");
    }
    if (options.min_size > options.target_size) {
        throw std::invalid_argument("min_size (" + std::to_string(options.min_size) +
                                    ") must not exceed target_size (" +
                                    std::to_string(options.target_size) + ")");
    }
    if (options.target_size > options.max_size) {
        throw std::invalid_argument("target_size (" + std::to_string(options.target_size) +
                                    ") must not exceed max_size (" +
                                    std::to_string(options.max_size) + ")");
    }
    if (options.thread_count < 0) {
        throw std::invalid_argument("thread_count must not be negative");
    }
}

class SemanticChunker::Impl {
public:
    explicit Impl(const ChunkOptions& options) : options_(options) {
        stats_["documents_processed"] = 0;
        stats_["documents_failed"] = 0;
        stats_["pages_processed"] = 0;
        stats_["chunks_created"] = 0;
        stats_["duplicates_prevented"] = 0;
        stats_["validation_failures"] = 0;
        stats_["merged_boundaries"] = 0;
        stats_["failed_pages"] = 0;
        stats_["total_processing_time_ms"] = 0.0;
    }

    std::vector<Chunk> chunk_page(const std::string& text,
                                  const PageInfo& page,
                                  ProcessingCounters& counters) const {
        SEMANTIC_CHUNKER_DEBUG << "Processing page " << page.page_number << " (" << page.file_name
                               << ", " << text.size() << " chars)";

        // Pass 1: Protected regions
        auto regions = detect_protected_regions(text);

        // Pass 2: Semantic sections
        auto sections = parse_sections(text, regions);

        // Pass 3: Paragraph groups
        auto consolidated = consolidate_paragraphs(sections);

        // Pass 4: Size-bounded chunks, validated and deduplicated
        return build_chunks(consolidated, page, options_, counters);
    }

    ChunkingResult chunk_pages(const std::string& document, const std::vector<PageText>& pages) {
        auto start_time = std::chrono::high_resolution_clock::now();

        ChunkingResult result;
        result.document = document;
        result.options = options_;
        result.total_pages = static_cast<int>(pages.size());

        std::vector<PageChunks> page_chunks(pages.size());
        std::vector<ProcessingCounters> page_counters(pages.size());
        for (size_t i = 0; i < pages.size(); ++i) {
            page_chunks[i].page = pages[i].info;
            page_chunks[i].text = pages[i].text;
        }

        if (!pages.empty()) {
            size_t threads = std::min(ThreadPool::resolve_thread_count(options_.thread_count), pages.size());
            ThreadPool pool(threads);
            std::vector<std::future<void>> futures;
            futures.reserve(pages.size());

            for (size_t i = 0; i < pages.size(); ++i) {
                futures.push_back(pool.enqueue([this, &page_chunks, &page_counters, i]() {
                    auto& page = page_chunks[i];
                    try {
                        page.chunks = chunk_page(page.text, page.page, page_counters[i]);
                    } catch (const std::exception& e) {
                        SEMANTIC_CHUNKER_ERROR << "Failed to process page " << page.page.page_number
                                               << ": " << e.what();
                        page.chunks.clear();
                        page_counters[i].failed_pages++;
                    }
                }));
            }
            for (auto& future : futures) {
                future.get();
            }
        }

        // Summed in page order so the histogram is independent of scheduling
        ProcessingCounters counters;
        counters.total_pages = result.total_pages;
        for (const auto& page_counter : page_counters) {
            counters += page_counter;
        }
        for (const auto& page : page_chunks) {
            SEMANTIC_CHUNKER_INFO << "Page " << page.page.page_number << ": " << page.chunks.size()
                                  << " chunks";
        }

        merge_across_pages(page_chunks, options_, counters);

        for (auto& page : page_chunks) {
            std::move(page.chunks.begin(), page.chunks.end(), std::back_inserter(result.chunks));
        }
        result.total_chunks = static_cast<int>(result.chunks.size());
        counters.total_chunks = result.total_chunks;
        result.statistics = calculate_statistics(result.chunks, counters);

        auto end_time = std::chrono::high_resolution_clock::now();
        result.processing_time_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();

        log_summary(result);
        record(result);
        return result;
    }

    ChunkingResult chunk_document(const std::string& input_dir) {
        auto start_time = std::chrono::high_resolution_clock::now();

        try {
            validate_options(options_);

            SEMANTIC_CHUNKER_INFO << "Loading document from " << input_dir;
            auto manifest = load_manifest(input_dir);
            auto pages = load_pages(manifest);
            SEMANTIC_CHUNKER_INFO << "Document '" << manifest.name << "': " << pages.size() << " pages";

            auto result = chunk_pages(manifest.name, pages);

            auto end_time = std::chrono::high_resolution_clock::now();
            result.processing_time_ms =
                std::chrono::duration<double, std::milli>(end_time - start_time).count();
            return result;
        } catch (const std::exception& e) {
            SEMANTIC_CHUNKER_ERROR << "Error chunking document: " << e.what();

            ChunkingResult result;
            result.options = options_;
            result.error = std::string("Error chunking document: ") + e.what();
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_["documents_failed"] = stats_["documents_failed"].get<int>() + 1;
            }
            return result;
        }
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        int documents = stats["documents_processed"].get<int>();
        if (documents > 0) {
            double total_ms = stats["total_processing_time_ms"].get<double>();
            stats["average_processing_time_ms"] = total_ms / documents;
            stats["average_chunks_per_document"] =
                static_cast<double>(stats["chunks_created"].get<int>()) / documents;
            if (total_ms > 0.0) {
                stats["pages_per_second"] = stats["pages_processed"].get<int>() / (total_ms / 1000.0);
            }
        }
        return stats;
    }

    ChunkOptions options_;

private:
    void log_summary(const ChunkingResult& result) const {
        const auto& counters = result.statistics.processing_stats;

        SEMANTIC_CHUNKER_INFO << "==================== PROCESSING SUMMARY ====================";
        SEMANTIC_CHUNKER_INFO << "Total Pages: " << counters.total_pages;
        SEMANTIC_CHUNKER_INFO << "Total Chunks: " << counters.total_chunks;
        SEMANTIC_CHUNKER_INFO << "Merged Boundaries: " << counters.merged_boundaries;
        SEMANTIC_CHUNKER_INFO << "Duplicates Prevented: " << counters.duplicates_prevented;
        SEMANTIC_CHUNKER_INFO << "Validation Failures: " << counters.validation_failures;
        if (counters.failed_pages > 0) {
            SEMANTIC_CHUNKER_WARN << "Failed Pages: " << counters.failed_pages;
        }
        if (!counters.protected_blocks.empty()) {
            SEMANTIC_CHUNKER_INFO << "Protected Blocks:";
            for (const auto& [type, count] : counters.protected_blocks) {
                SEMANTIC_CHUNKER_INFO << "  " << type << ": " << count;
            }
        }
        if (!counters.continuation_signals.empty()) {
            SEMANTIC_CHUNKER_INFO << "Continuation Signals:";
            for (const auto& [signal, count] : counters.continuation_signals) {
                SEMANTIC_CHUNKER_INFO << "  " << signal << ": " << count;
            }
        }
    }

    void record(const ChunkingResult& result) {
        const auto& counters = result.statistics.processing_stats;
        auto add = [this](const char* key, int value) {
            stats_[key] = stats_[key].get<int>() + value;
        };

        std::lock_guard<std::mutex> lock(stats_mutex_);
        add("documents_processed", 1);
        add("pages_processed", result.total_pages);
        add("chunks_created", result.total_chunks);
        add("duplicates_prevented", counters.duplicates_prevented);
        add("validation_failures", counters.validation_failures);
        add("merged_boundaries", counters.merged_boundaries);
        add("failed_pages", counters.failed_pages);
        stats_["total_processing_time_ms"] =
            stats_["total_processing_time_ms"].get<double>() + result.processing_time_ms;
    }

    mutable std::mutex stats_mutex_;
    nlohmann::json stats_;
};

SemanticChunker::SemanticChunker(const ChunkOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {
    validate_options(options);
}

SemanticChunker::~SemanticChunker() = default;

std::vector<Chunk> SemanticChunker::chunk_page(const std::string& text,
                                               const PageInfo& page,
                                               ProcessingCounters& counters) const {
    return pImpl->chunk_page(text, page, counters);
}

ChunkingResult SemanticChunker::chunk_pages(const std::string& document,
                                            const std::vector<PageText>& pages) {
    return pImpl->chunk_pages(document, pages);
}

ChunkingResult SemanticChunker::chunk_document(const std::string& input_dir) {
    return pImpl->chunk_document(input_dir);
}

bool SemanticChunker::process_document_to_json(const std::string& input_dir,
                                               const std::string& output_path) {
    auto result = chunk_document(input_dir);
    if (!result.error.empty()) {
        return false;
    }

    try {
        JsonSerializer::write_result(result, output_path);
    } catch (const std::exception& e) {
        SEMANTIC_CHUNKER_ERROR << e.what();
        return false;
    }

    SEMANTIC_CHUNKER_INFO << "Wrote " << result.total_chunks << " chunks to " << output_path;
    return true;
}

nlohmann::json SemanticChunker::get_stats() const {
    return pImpl->get_stats();
}

ChunkOptions SemanticChunker::get_options() const {
    return pImpl->options_;
}

void SemanticChunker::set_options(const ChunkOptions& options) {
    validate_options(options);
    pImpl->options_ = options;
}

} // namespace semantic_chunker
