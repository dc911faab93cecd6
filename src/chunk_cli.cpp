#include <semantic_chunker/json_serializer.h>
#include <semantic_chunker/logger.h>
#include <semantic_chunker/semantic_chunker.h>
#include <semantic_chunker/thread_pool.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace semantic_chunker;

struct CLIOptions {
    std::string input_dir;
    std::string output_file;
    std::string log_dir;
    int target_size = 1500;
    int min_size = 800;
    int max_size = 2500;
    int thread_count = 0;  // 0 = auto
    bool enable_merging = true;
    bool log_file = true;
    bool verbose = false;
    bool quiet = false;
    bool analyze = true;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input-dir DIR        Directory containing metadata.json and pages/\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Output JSON file (default: <input-dir>/<document>_chunks.json)\n";
    std::cout << "  --target-size N            Target chunk size in characters (default: 1500)\n";
    std::cout << "  --min-size N               Minimum chunk size in characters (default: 800)\n";
    std::cout << "  --max-size N               Maximum chunk size in characters (default: 2500)\n";
    std::cout << "  --no-merging               Disable cross-page boundary merging\n";
    std::cout << "  --threads N                Number of worker threads (default: auto-detect)\n";
    std::cout << "  --log-dir DIR              Log file directory (default: <input-dir>/logs)\n";
    std::cout << "  --no-log-file              Log to the console only\n";
    std::cout << "  -v, --verbose              Debug output on the console\n";
    std::cout << "  -q, --quiet                Quiet mode (warnings and a one-line result)\n";
    std::cout << "  --no-analyze               Skip chunk distribution analysis\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i extracted_docs\n";
    std::cout << "  " << program_name << " -i extracted_docs --target-size 2000 --min-size 1000 --max-size 3000\n";
    std::cout << "  " << program_name << " --input-dir extracted_docs --no-merging --quiet\n";
}

void print_version() {
    std::cout << "semantic-chunker chunk-cli version " << SEMANTIC_CHUNKER_VERSION << "\n";
    std::cout << "Built with C++17, nlohmann/json, RapidJSON and OpenSSL\n";
}

int parse_int(const char* value, const char* name) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(name);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input-dir", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"target-size", required_argument, nullptr, 1001},
        {"min-size", required_argument, nullptr, 1002},
        {"max-size", required_argument, nullptr, 1003},
        {"no-merging", no_argument, nullptr, 1004},
        {"threads", required_argument, nullptr, 1005},
        {"log-dir", required_argument, nullptr, 1006},
        {"no-log-file", no_argument, nullptr, 1007},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"no-analyze", no_argument, nullptr, 1008},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1009},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_dir = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1001:  // target-size
                options.target_size = parse_int(optarg, "target-size");
                break;
            case 1002:  // min-size
                options.min_size = parse_int(optarg, "min-size");
                break;
            case 1003:  // max-size
                options.max_size = parse_int(optarg, "max-size");
                break;
            case 1004:  // no-merging
                options.enable_merging = false;
                break;
            case 1005:  // threads
                options.thread_count = parse_int(optarg, "threads");
                if (options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1006:  // log-dir
                options.log_dir = optarg;
                break;
            case 1007:  // no-log-file
                options.log_file = false;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 1008:  // no-analyze
                options.analyze = false;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1009:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_dir.empty()) {
        throw std::invalid_argument("Input directory is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

std::string timestamped_log_name() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream name;
    name << "chunking_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";
    return name.str();
}

void configure_logging(const CLIOptions& options) {
    LogOptions log_options;
    if (options.verbose) {
        log_options.console_level = LogLevel::Debug;
    } else if (options.quiet) {
        log_options.console_level = LogLevel::Warning;
    }

    if (options.log_file) {
        fs::path log_dir = options.log_dir.empty() ? fs::path(options.input_dir) / "logs"
                                                   : fs::path(options.log_dir);
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "Warning: cannot create log directory " << log_dir << ": " << ec.message() << "\n";
        } else {
            log_options.log_file = (log_dir / timestamped_log_name()).string();
        }
    }

    Logger::configure(log_options);
}

void analyze_chunk_distribution(const ChunkingResult& result) {
    const auto& chunks = result.chunks;
    if (chunks.empty()) {
        std::cout << "\nNo chunks created\n";
        return;
    }

    std::vector<int> sizes;
    for (const auto& chunk : chunks) {
        sizes.push_back(chunk.metadata.char_count);
    }
    std::sort(sizes.begin(), sizes.end());

    double avg_size = std::accumulate(sizes.begin(), sizes.end(), 0.0) / sizes.size();
    const auto& options = result.options;

    std::cout << "\n=== Chunk Distribution Analysis ===\n";
    std::cout << "Total chunks: " << chunks.size() << "\n";
    std::cout << "Min chars: " << sizes.front() << "\n";
    std::cout << "Max chars: " << sizes.back() << "\n";
    std::cout << "Average chars: " << static_cast<int>(avg_size) << "\n";

    std::cout << "\nQuintiles:\n";
    for (int p = 20; p <= 80; p += 20) {
        size_t idx = (sizes.size() - 1) * p / 100;
        std::cout << "  " << p << "th percentile: " << sizes[idx] << " chars\n";
    }

    // Bands follow the configured bounds rather than fixed ranges
    int below_min = 0, in_range = 0, above_max = 0;
    for (int size : sizes) {
        if (size < options.min_size) below_min++;
        else if (size <= options.max_size) in_range++;
        else above_max++;
    }

    auto print_band = [&](const std::string& label, int count) {
        double percentage = (count * 100.0) / chunks.size();
        std::cout << "  " << std::setw(18) << label << ": " << std::setw(5) << count << " chunks ("
                  << std::fixed << std::setprecision(1) << percentage << "%)\n";
    };

    std::cout << "\nSize Bands:\n";
    print_band("< " + std::to_string(options.min_size), below_min);
    print_band(std::to_string(options.min_size) + "-" + std::to_string(options.max_size), in_range);
    print_band("> " + std::to_string(options.max_size), above_max);

    std::cout << "\nChunk Types:\n";
    for (const auto& [type, count] : result.statistics.type_distribution) {
        std::cout << "  " << std::setw(6) << type << ": " << count << "\n";
    }

    const auto& signals = result.statistics.processing_stats.continuation_signals;
    if (!signals.empty()) {
        std::cout << "\nContinuation Signals:\n";
        for (const auto& [signal, count] : signals) {
            std::cout << "  " << std::setw(14) << signal << ": " << count << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::is_directory(options.input_dir)) {
            throw std::runtime_error("Input directory not found: " + options.input_dir);
        }
        if (!fs::exists(fs::path(options.input_dir) / "metadata.json")) {
            throw std::runtime_error("metadata.json not found in " + options.input_dir);
        }

        configure_logging(options);

        ChunkOptions chunk_opts;
        chunk_opts.target_size = options.target_size;
        chunk_opts.min_size = options.min_size;
        chunk_opts.max_size = options.max_size;
        chunk_opts.enable_merging = options.enable_merging;
        chunk_opts.thread_count = options.thread_count;

        SemanticChunker chunker(chunk_opts);

        if (!options.quiet) {
            std::cout << "Processing: " << options.input_dir << "\n";
            std::cout << "Configuration:\n";
            std::cout << "  Target size: " << options.target_size << " chars\n";
            std::cout << "  Min size: " << options.min_size << " chars\n";
            std::cout << "  Max size: " << options.max_size << " chars\n";
            std::cout << "  Cross-page merging: " << (options.enable_merging ? "enabled" : "disabled") << "\n";
            std::cout << "  Threads: " << (options.thread_count > 0 ?
                std::to_string(options.thread_count) : "auto (" +
                std::to_string(ThreadPool::resolve_thread_count(0)) + ")") << "\n";
            if (!Logger::log_file_path().empty()) {
                std::cout << "  Log file: " << Logger::log_file_path() << "\n";
            }
            std::cout << "\n";
        }

        auto start = std::chrono::high_resolution_clock::now();

        auto result = chunker.chunk_document(options.input_dir);
        if (!result.error.empty()) {
            throw std::runtime_error("Chunking failed: " + result.error);
        }

        auto processing_end = std::chrono::high_resolution_clock::now();

        if (options.analyze && !options.quiet) {
            analyze_chunk_distribution(result);
        }

        std::string output_file = options.output_file;
        if (output_file.empty()) {
            output_file = (fs::path(options.input_dir) / (result.document + "_chunks.json")).string();
        }

        fs::path output_dir = fs::path(output_file).parent_path();
        if (!output_dir.empty() && !fs::exists(output_dir)) {
            SEMANTIC_CHUNKER_DEBUG << "Creating output directory: " << output_dir.string();
            fs::create_directories(output_dir);
        }

        JsonSerializer::write_result(result, output_file);

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        auto processing_duration = std::chrono::duration_cast<std::chrono::milliseconds>(processing_end - start);

        if (!options.quiet) {
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Document: " << result.document << "\n";
            std::cout << "Pages processed: " << result.total_pages << "\n";
            std::cout << "Chunks created: " << result.total_chunks << "\n";
            std::cout << "Processing time: " << processing_duration.count() << "ms\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
            if (processing_duration.count() > 0) {
                std::cout << "Performance: " << std::fixed << std::setprecision(1)
                          << (result.total_pages * 1000.0) / processing_duration.count()
                          << " pages/second\n";
            }
            std::cout << "Output saved to: " << output_file << "\n";
        } else {
            // In quiet mode, just output essential info in parseable format
            std::cout << "SUCCESS|" << result.document << "|"
                      << result.total_pages << "|"
                      << result.total_chunks << "|"
                      << total_duration.count() << "\n";
        }

        Logger::shutdown();
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::shutdown();
        return 1;
    }
}
