#include "semantic_chunker/logger.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>

namespace semantic_chunker {

namespace {

struct LoggerState {
    std::mutex mutex;
    LogLevel console_level = LogLevel::Info;
    std::unique_ptr<std::ofstream> file;
    std::string file_path;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

void Logger::configure(const LogOptions& options) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.console_level = options.console_level;
    s.file.reset();
    s.file_path.clear();

    if (!options.log_file.empty()) {
        auto file = std::make_unique<std::ofstream>(options.log_file, std::ios::out | std::ios::app);
        if (!file->is_open()) {
            std::cerr << "[Logger::configure] Cannot open log file " << options.log_file
                      << ", logging to console only" << std::endl;
            return;
        }
        s.file = std::move(file);
        s.file_path = options.log_file;
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) {
        s.file->flush();
    }
    s.file.reset();
    s.file_path.clear();
}

bool Logger::enabled(LogLevel level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.file != nullptr || level >= s.console_level;
}

void Logger::write(LogLevel level, const std::string& message) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (level >= s.console_level) {
        auto& out = level >= LogLevel::Warning ? std::cerr : std::cout;
        if (level >= LogLevel::Warning) {
            out << level_name(level) << ": ";
        }
        out << message << "\n";
    }

    if (s.file) {
        *s.file << timestamp() << " | " << std::left << std::setw(8) << level_name(level)
                << " | " << message << "\n";
    }
}

std::string Logger::log_file_path() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.file_path;
}

LogLine::~LogLine() {
    Logger::write(level_, buffer_.str());
}

} // namespace semantic_chunker
