// VoxStruct Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <unordered_map>
#include <voxstruct/core/logger.hpp>

namespace voxstruct::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> console_logger;
    std::shared_ptr<spdlog::logger> file_logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace") {
        return LogLevel::Trace;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "critical") {
        return LogLevel::Critical;
    }
    if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(config.console_level));

            if (config.include_timestamps) {
                console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
            } else {
                console_sink->set_pattern("[%^%l%$] %v");
            }

            state.console_logger = std::make_shared<spdlog::logger>("voxstruct", console_sink);
            state.console_logger->set_level(spdlog::level::trace);  // Let sink filter
            state.console_logger->flush_on(spdlog::level::warn);

            if (!config.log_directory.empty()) {
                std::filesystem::create_directories(config.log_directory);

                log_path = config.log_directory / config.log_filename;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

                state.file_logger = std::make_shared<spdlog::logger>("voxstruct_file", file_sink);
                state.file_logger->set_level(spdlog::level::trace);
                state.file_logger->flush_on(spdlog::level::info);
            }

            state.global_level = config.console_level;
            state.initialized = true;

        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::error("Logger initialization failed: {}", ex.what());

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            state.console_logger = std::make_shared<spdlog::logger>("voxstruct", console_sink);
            state.file_logger.reset();
            log_path.clear();
            state.global_level = config.console_level;
            state.initialized = true;
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::error("Cannot create log directory: {}", ex.what());

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            state.console_logger = std::make_shared<spdlog::logger>("voxstruct", console_sink);
            log_path.clear();
            state.global_level = config.console_level;
            state.initialized = true;
        }
    }

    // Logged after the lock is released, log_message takes it again
    debug(log_category::CONFIG, "Logger initialized");
    if (!log_path.empty()) {
        debug(log_category::CONFIG, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }

    state.console_logger.reset();
    state.file_logger.reset();
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        return it->second;
    }
    return state.global_level;
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;

    if (state.console_logger) {
        for (auto& sink : state.console_logger->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();

    LogLevel category_level;
    {
        std::lock_guard lock(state.mutex);
        if (!state.initialized) {
            // spdlog's default logger applies its own level
            return true;
        }
        auto it = state.category_levels.find(std::string(category));
        if (it != state.category_levels.end()) {
            category_level = it->second;
        } else {
            category_level = state.global_level;
        }
    }

    return static_cast<int>(level) >= static_cast<int>(category_level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    auto spdlog_level = to_spdlog_level(level);

    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        spdlog::log(spdlog_level, "[{}] {}", category, message);
        return;
    }

    std::string formatted_message = fmt::format("[{}] {}", category, message);

    if (state.console_logger) {
        state.console_logger->log(spdlog_level, "{}", formatted_message);
    }
    if (state.file_logger) {
        state.file_logger->log(spdlog_level, "{}", formatted_message);
    }
}

}  // namespace voxstruct::core
