#pragma once

#include <sstream>
#include <string>

namespace semantic_chunker {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

struct LogOptions {
    LogLevel console_level = LogLevel::Info;
    std::string log_file;  // empty = console only; file always receives Debug
};

class Logger {
public:
    static void configure(const LogOptions& options);
    static void shutdown();

    // True if a message at `level` reaches at least one sink
    static bool enabled(LogLevel level);

    static void write(LogLevel level, const std::string& message);

    static std::string log_file_path();
};

// Buffers one message and hands it to Logger when destroyed
class LogLine {
public:
    explicit LogLine(LogLevel level) : level_(level) {}
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    std::ostream& stream() { return buffer_; }

private:
    LogLevel level_;
    std::ostringstream buffer_;
};

} // namespace semantic_chunker

#define SEMANTIC_CHUNKER_LOG(level) \
    if (!::semantic_chunker::Logger::enabled(level)) {} \
    else ::semantic_chunker::LogLine(level).stream()

#define SEMANTIC_CHUNKER_DEBUG SEMANTIC_CHUNKER_LOG(::semantic_chunker::LogLevel::Debug)
#define SEMANTIC_CHUNKER_INFO SEMANTIC_CHUNKER_LOG(::semantic_chunker::LogLevel::Info)
#define SEMANTIC_CHUNKER_WARN SEMANTIC_CHUNKER_LOG(::semantic_chunker::LogLevel::Warning)
#define SEMANTIC_CHUNKER_ERROR SEMANTIC_CHUNKER_LOG(::semantic_chunker::LogLevel::Error)
