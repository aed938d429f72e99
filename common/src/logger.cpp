#include "logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace mailfwd {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string level(name);
    std::transform(level.begin(), level.end(), level.begin(), ::tolower);

    if (level == "trace") return LogLevel::Trace;
    if (level == "debug") return LogLevel::Debug;
    if (level == "info") return LogLevel::Info;
    if (level == "warning" || level == "warn") return LogLevel::Warning;
    if (level == "error") return LogLevel::Error;
    if (level == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(max_files, 1);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    log_file_ = file;
    current_size_ = 0;
    if (file.empty()) {
        return;
    }

    if (auto parent = file.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent << ": " << ec.message() << "\n";
            return;
        }
    }

    file_stream_.open(file, std::ios::app);
    if (file_stream_.is_open()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        current_size_ = ec ? 0 : static_cast<size_t>(size);
    }
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string filename = std::filesystem::path(loc.file_name()).filename().string();
    std::string formatted = std::format("[{}] [{}] [{}:{}] {}",
                                        timestamp(), level_tag(level),
                                        filename, loc.line(), message);

    if (console_) {
        std::cerr << level_color(level) << formatted << "\033[0m\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << formatted << "\n";
        file_stream_.flush();
        current_size_ += formatted.length() + 1;
    }
}

void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_) return;

    file_stream_.close();

    // log.N is dropped, log.(N-1) -> log.N, ..., log -> log.1
    std::error_code ec;
    for (size_t i = max_files_; i > 0; --i) {
        std::filesystem::path older = log_file_;
        older += "." + std::to_string(i);
        if (i == max_files_) {
            std::filesystem::remove(older, ec);
            continue;
        }
        std::filesystem::path newer = log_file_;
        newer += "." + std::to_string(i + 1);
        if (std::filesystem::exists(older, ec)) {
            std::filesystem::rename(older, newer, ec);
        }
    }

    std::filesystem::path rotated = log_file_;
    rotated += ".1";
    std::filesystem::rename(log_file_, rotated, ec);

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

const char* Logger::level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "\033[90m";
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
        case LogLevel::Fatal:   return "\033[35m";
    }
    return "";
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace mailfwd
