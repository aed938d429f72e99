#pragma once

#include <string>
#include <string_view>
#include <mutex>
#include <fstream>
#include <format>
#include <optional>
#include <source_location>
#include <filesystem>

namespace mailfwd {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5
};

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "fatal" in any case.
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void init(LogLevel level = LogLevel::Info,
              bool console = true,
              const std::filesystem::path& file = "",
              size_t max_file_size = 10 * 1024 * 1024,
              size_t max_files = 5);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_; }

    template<typename... Args>
    void log(LogLevel level, const std::source_location& loc,
             std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) return;
        write(level, loc, std::format(fmt, std::forward<Args>(args)...));
    }

    void log(LogLevel level, std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
        if (!enabled(level)) return;
        write(level, loc, std::string(msg));
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::source_location& loc, const std::string& message);
    void rotate_if_needed();
    static const char* level_tag(LogLevel level);
    static const char* level_color(LogLevel level);
    static std::string timestamp();

    LogLevel level_ = LogLevel::Info;
    bool console_ = true;
    std::filesystem::path log_file_;
    std::ofstream file_stream_;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    size_t current_size_ = 0;
    std::mutex mutex_;
};

#define LOG_TRACE(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Debug, msg)
#define LOG_INFO(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Info, msg)
#define LOG_WARNING(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Warning, msg)
#define LOG_ERROR(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Error, msg)
#define LOG_FATAL(msg) mailfwd::Logger::instance().log(mailfwd::LogLevel::Fatal, msg)

#define LOG_TRACE_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Trace, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_DEBUG_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Debug, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Info, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_WARNING_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Warning, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Error, std::source_location::current(), fmt, __VA_ARGS__)
#define LOG_FATAL_FMT(fmt, ...) \
    mailfwd::Logger::instance().log(mailfwd::LogLevel::Fatal, std::source_location::current(), fmt, __VA_ARGS__)

}  // namespace mailfwd
