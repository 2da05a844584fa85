#pragma once

#include "../utils/serde.hpp"

namespace dr::mapper {

// A field path that cannot be resolved against a record type.
struct PathError : Exception {
    using Exception::Exception;
};

struct UnknownFieldError final : PathError {
    UnknownFieldError(std::string type_name, std::string field, std::string resolved_prefix);

    auto type_name() const -> std::string const& { return type_name_; }
    auto field() const -> std::string const& { return field_; }
    // External path resolved before the failing hop.
    auto resolved_prefix() const -> std::string const& { return resolved_prefix_; }

private:
    std::string type_name_;
    std::string field_;
    std::string resolved_prefix_;
};

// A hop continues past a field that has no nested fields.
struct InvalidPathError final : PathError {
    InvalidPathError(std::string field, std::string field_type, std::string next_hop);
    // Malformed expression text.
    explicit InvalidPathError(std::string_view expression);

    auto field() const -> std::string const& { return field_; }

private:
    std::string field_;
};

struct EmptyPathError final : PathError {
    EmptyPathError();
};

// Construction of a record from a document failed at `field_path` (dotted logical names).
struct FieldBuildError : Exception {
    FieldBuildError(std::string field_path, std::string reason);

    auto field_path() const -> std::string const& { return field_path_; }
    auto reason() const -> std::string const& { return reason_; }

private:
    std::string field_path_;
    std::string reason_;
};

struct MissingFieldError final : FieldBuildError {
    explicit MissingFieldError(std::string field_path);
};

struct EnumDecodeError final : FieldBuildError {
    EnumDecodeError(std::string field_path, std::string value);

    auto value() const -> std::string const& { return value_; }

private:
    std::string value_;
};

struct NestedTypeError final : FieldBuildError {
    NestedTypeError(std::string field_path, std::string actual);
};

struct TypeCastError final : FieldBuildError {
    TypeCastError(std::string field_path, std::string expected, std::string actual);

    auto expected() const -> std::string const& { return expected_; }
    auto actual() const -> std::string const& { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

struct UnsupportedTypeError final : FieldBuildError {
    UnsupportedTypeError(std::string field_path, std::string type_name);
};

}
