#pragma once

#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/dist_sink.h>

#include "../prelude/option.hpp"
#include "../containers/hash.hpp"

namespace dr::rt {

enum class LogLevel : uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    off,
};

enum class Logger : size_t;

struct LoggerManager final {
    LoggerManager();

    auto register_logger(std::string_view name, LogLevel level = LogLevel::info) -> Logger;

    auto set_level(std::string_view name, LogLevel level) -> void;
    auto get_level(std::string_view name) -> Option<LogLevel>;
    // Additionally write every registered logger to `path`. A path already attached is skipped.
    auto add_file_sink(std::string_view path) -> void;
    auto flush() -> void;

#define DEFINE_LOG_METHOD(level) \
    template <typename... Args> \
    auto level(Logger logger, spdlog::format_string_t<Args...> fmt, Args&&... args) -> void { \
        get_logger(logger)->level(fmt, std::forward<Args>(args)...); \
    } \
    template <typename... Args> \
    auto level(std::string_view logger, spdlog::format_string_t<Args...> fmt, Args&&... args) -> void { \
        if (auto spd_logger = find_logger(logger); spd_logger) { \
            spd_logger->level(fmt, std::forward<Args>(args)...); \
        } \
    }

    DEFINE_LOG_METHOD(trace)
    DEFINE_LOG_METHOD(debug)
    DEFINE_LOG_METHOD(info)
    DEFINE_LOG_METHOD(warn)
    DEFINE_LOG_METHOD(error)
    DEFINE_LOG_METHOD(critical)

#undef DEFINE_LOG_METHOD

private:
    auto get_logger(Logger logger) -> std::shared_ptr<spdlog::logger>;
    auto find_logger(std::string_view name) -> std::shared_ptr<spdlog::logger>;

    std::mutex mutex_;
    // Every logger writes to this one sink; it locks its own child list.
    std::shared_ptr<spdlog::sinks::dist_sink_mt> sink_;
    StringHashSet file_paths_;
    std::vector<std::shared_ptr<spdlog::logger>> loggers_;
    std::unordered_map<std::string_view, Logger> logger_map_;
};

// Process-wide manager with the `general` and `mapper` loggers registered.
auto logger_manager() -> LoggerManager&;

}
