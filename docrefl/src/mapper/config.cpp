#include <docrefl/mapper/config.hpp>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <docrefl/mapper/errors.hpp>
#include <docrefl/runtime/logger.hpp>
#include <docrefl/utils/file.hpp>

namespace dr::mapper {

namespace {

auto parse_log_level(std::string_view level) -> rt::LogLevel {
    auto log_level = magic_enum::enum_cast<rt::LogLevel>(level);
    if (!log_level.has_value()) {
        throw ConfigError{fmt::format("Invalid log level '{}'", level)};
    }
    return *log_level;
}

}

auto MapperConfig::from_toml(std::string_view toml_str) -> MapperConfig {
    serde::Value value{};
    try {
        value = serde::Value::from_toml(toml_str);
    } catch (serde::ParseError const& e) {
        log::error("mapper", "{}", e.what());
        throw ConfigError{fmt::format("Failed to parse config: {}", e.what())};
    }

    MapperConfig config{};
    try {
        auto& registry = drefl::global_registry();
        config = instance_cast<MapperConfig>(
            materialize(registry.descriptor<MapperConfig>(), value, registry)
        );
    } catch (FieldBuildError const& e) {
        log::error("mapper", "{}", e.what());
        throw ConfigError{fmt::format("Invalid config: {}", e.what())};
    }
    parse_log_level(config.log_level);
    return config;
}

auto MapperConfig::extract_options() const -> ExtractOptions {
    return ExtractOptions{
        .optional_value_suffix = optional_value_suffix,
    };
}

auto MapperConfig::materialize_options() const -> MaterializeOptions {
    return MaterializeOptions{
        .enum_code_fallback = enum_code_fallback,
        .allow_integer_widening = allow_integer_widening,
    };
}

auto MapperConfig::name_overrides() const -> drefl::NameOverrides {
    return drefl::NameOverrides(renames.begin(), renames.end());
}

auto MapperConfig::apply_logging() const -> void {
    rt::logger_manager().set_level("mapper", parse_log_level(log_level));
    if (!log_file.empty()) {
        rt::logger_manager().add_file_sink(log_file);
    }
}

auto load_config(std::filesystem::path const& path) -> MapperConfig {
    auto text = read_text_file(path);
    if (!text.has_value()) {
        log::error("mapper", "Failed to open config file '{}'", path.string());
        throw ConfigError{fmt::format("Failed to open config file '{}'", path.string())};
    }
    return MapperConfig::from_toml(text.value());
}

}
