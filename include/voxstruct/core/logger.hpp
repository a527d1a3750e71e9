// VoxStruct Core
// logger.hpp - Category-based logging on top of spdlog

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace voxstruct::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;  // Empty = console only
    std::string log_filename = "voxstruct.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Static logging interface
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Default for categories without their own level
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* STRUCTURE = "structure";
    inline constexpr const char* PALETTE = "palette";
    inline constexpr const char* CODEC = "codec";
    inline constexpr const char* ROTATION = "rotation";
    inline constexpr const char* CATALOG = "catalog";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* IO = "io";
}  // namespace log_category

}  // namespace voxstruct::core

// Level is checked before the message is formatted
#define VOXSTRUCT_LOG_TRACE(category, ...) \
    ::voxstruct::core::Logger::trace(category, __VA_ARGS__)

#define VOXSTRUCT_LOG_DEBUG(category, ...) \
    ::voxstruct::core::Logger::debug(category, __VA_ARGS__)

#define VOXSTRUCT_LOG_INFO(category, ...) \
    ::voxstruct::core::Logger::info(category, __VA_ARGS__)

#define VOXSTRUCT_LOG_WARN(category, ...) \
    ::voxstruct::core::Logger::warn(category, __VA_ARGS__)

#define VOXSTRUCT_LOG_ERROR(category, ...) \
    ::voxstruct::core::Logger::error(category, __VA_ARGS__)

#define VOXSTRUCT_LOG_CRITICAL(category, ...) \
    ::voxstruct::core::Logger::critical(category, __VA_ARGS__)
