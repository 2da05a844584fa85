#pragma once

#include "logger_manager.hpp"

namespace dr::log {

#define DEFINE_LOG_METHOD(level) \
    template <typename... Args> \
    auto level(std::string_view logger, spdlog::format_string_t<Args...> fmt, Args&&... args) -> void { \
        ::dr::rt::logger_manager().level(logger, fmt, std::forward<Args>(args)...); \
    }

DEFINE_LOG_METHOD(trace)
DEFINE_LOG_METHOD(debug)
DEFINE_LOG_METHOD(info)
DEFINE_LOG_METHOD(warn)
DEFINE_LOG_METHOD(error)
DEFINE_LOG_METHOD(critical)

#undef DEFINE_LOG_METHOD

}
