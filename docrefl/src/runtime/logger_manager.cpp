#include <docrefl/runtime/logger_manager.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace dr::rt {

namespace {

constexpr char const* log_pattern = "%^[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [thread %t] %v%$";

auto to_spd_log_level(LogLevel log_level) -> spdlog::level::level_enum {
    return static_cast<spdlog::level::level_enum>(static_cast<uint8_t>(log_level));
}

}

LoggerManager::LoggerManager() {
    auto sink_console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink_console->set_pattern(log_pattern);
    sink_ = std::make_shared<spdlog::sinks::dist_sink_mt>();
    sink_->add_sink(sink_console);

    register_logger("general", LogLevel::info);
    register_logger("mapper", LogLevel::info);
}

auto LoggerManager::register_logger(std::string_view name, LogLevel level) -> Logger {
    std::lock_guard lock{mutex_};
    if (auto it = logger_map_.find(name); it != logger_map_.end()) {
        return it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink_);
    logger->set_level(to_spd_log_level(level));
    loggers_.emplace_back(logger);

    auto logger_handle = static_cast<Logger>(loggers_.size() - 1);
    logger_map_.insert({logger->name(), logger_handle});
    return logger_handle;
}

auto LoggerManager::set_level(std::string_view name, LogLevel level) -> void {
    if (auto logger = find_logger(name); logger) {
        logger->set_level(to_spd_log_level(level));
    }
}

auto LoggerManager::get_level(std::string_view name) -> Option<LogLevel> {
    if (auto logger = find_logger(name); logger) {
        return static_cast<LogLevel>(static_cast<uint8_t>(logger->level()));
    }
    return {};
}

auto LoggerManager::add_file_sink(std::string_view path) -> void {
    std::lock_guard lock{mutex_};
    if (!file_paths_.insert(std::string{path}).second) {
        return;
    }
    auto sink_file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{path}, true);
    sink_file->set_pattern(log_pattern);
    sink_->add_sink(sink_file);
}

auto LoggerManager::flush() -> void {
    sink_->flush();
}

auto LoggerManager::get_logger(Logger logger) -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock{mutex_};
    return loggers_[static_cast<size_t>(logger)];
}

auto LoggerManager::find_logger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock{mutex_};
    if (auto it = logger_map_.find(name); it != logger_map_.end()) {
        return loggers_[static_cast<size_t>(it->second)];
    }
    return nullptr;
}

auto logger_manager() -> LoggerManager& {
    static LoggerManager manager{};
    return manager;
}

}
