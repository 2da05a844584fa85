#include <docrefl/mapper/errors.hpp>

#include <fmt/format.h>

namespace dr::mapper {

namespace {

auto display_path(std::string const& field_path) -> std::string_view {
    return field_path.empty() ? std::string_view{"<root>"} : std::string_view{field_path};
}

}

UnknownFieldError::UnknownFieldError(std::string type_name, std::string field, std::string resolved_prefix)
    : PathError(fmt::format(
        "Unknown field '{}' in type {} (after '{}')", field, type_name, resolved_prefix
    ))
    , type_name_(std::move(type_name))
    , field_(std::move(field))
    , resolved_prefix_(std::move(resolved_prefix))
{}

InvalidPathError::InvalidPathError(std::string field, std::string field_type, std::string next_hop)
    : PathError(fmt::format(
        "Cannot resolve '{}' inside field '{}' of type {}", next_hop, field, field_type
    ))
    , field_(std::move(field))
{}

InvalidPathError::InvalidPathError(std::string_view expression)
    : PathError(fmt::format("Malformed field path '{}'", expression))
{}

EmptyPathError::EmptyPathError() : PathError("Empty field path") {}

FieldBuildError::FieldBuildError(std::string field_path, std::string reason)
    : Exception(reason)
    , field_path_(std::move(field_path))
    , reason_(std::move(reason))
{}

MissingFieldError::MissingFieldError(std::string field_path)
    : FieldBuildError(field_path, fmt::format("Missing field: {}", display_path(field_path)))
{}

EnumDecodeError::EnumDecodeError(std::string field_path, std::string value)
    : FieldBuildError(field_path, fmt::format(
        "Error decoding enum field {}. No case matches value {}", display_path(field_path), value
    ))
    , value_(std::move(value))
{}

NestedTypeError::NestedTypeError(std::string field_path, std::string actual)
    : FieldBuildError(field_path, fmt::format(
        "Error building nested field {}. Expected: document, Actual: {}", display_path(field_path), actual
    ))
{}

TypeCastError::TypeCastError(std::string field_path, std::string expected, std::string actual)
    : FieldBuildError(field_path, fmt::format(
        "Error casting field {}. Expected: {}, Actual: {}", display_path(field_path), expected, actual
    ))
    , expected_(std::move(expected))
    , actual_(std::move(actual))
{}

UnsupportedTypeError::UnsupportedTypeError(std::string field_path, std::string type_name)
    : FieldBuildError(field_path, fmt::format(
        "Unsupported type {} for field {}", type_name, display_path(field_path)
    ))
{}

}
