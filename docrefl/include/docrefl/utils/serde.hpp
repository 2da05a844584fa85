#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../containers/hash.hpp"

namespace dr {

struct Exception : std::exception {
    Exception() noexcept = default;
    Exception(std::string const& str) noexcept : error_(str) {}
    Exception(std::string&& str) noexcept : error_(std::move(str)) {}

    auto what() const noexcept -> char const* override { return error_.c_str(); }

private:
    std::string error_;
};

}

namespace dr::serde {

// Malformed JSON or TOML input.
struct ParseError final : Exception {
    using Exception::Exception;
};

// Untyped document value. A `Table` value is the raw key/value map records are decoded from.
// int32 and int64 are distinct runtime types, as they are in a BSON document.
struct Value final {
    using Null = std::monostate;
    using Bool = bool;
    using Int32 = int32_t;
    using Int64 = int64_t;
    using Float = double;
    using String = std::string;
    using Array = std::vector<Value>;
    using Table = StringHashMap<Value>;

    enum class Type : uint8_t {
        null,
        boolean,
        int32,
        int64,
        float64,
        string,
        array,
        table,
    };

    Value() noexcept = default;
    Value(Null) noexcept {}
    Value(std::nullptr_t) noexcept {}
    Value(Bool v) noexcept : value_(v) {}
    Value(Int32 v) noexcept : value_(v) {}
    Value(Int64 v) noexcept : value_(v) {}
    Value(Float v) noexcept : value_(v) {}
    Value(char const* v) : value_(String{v}) {}
    Value(std::string_view v) : value_(String{v}) {}
    Value(String const& v) : value_(v) {}
    Value(String&& v) noexcept : value_(std::move(v)) {}
    Value(Array const& v) : value_(v) {}
    Value(Array&& v) noexcept : value_(std::move(v)) {}
    Value(Table const& v) : value_(v) {}
    Value(Table&& v) noexcept : value_(std::move(v)) {}

    Value(Value const& v) = default;
    Value(Value&& v) noexcept = default;
    auto operator=(Value const& v) -> Value& = default;
    auto operator=(Value&& v) noexcept -> Value& = default;

    auto operator==(Value const& rhs) const -> bool;

    auto type() const noexcept -> Type { return static_cast<Type>(value_.index()); }
    // Name of the runtime type, as reported in diagnostics.
    auto type_name() const noexcept -> std::string_view;
    static auto type_name(Type type) noexcept -> std::string_view;

    auto is_null() const noexcept -> bool { return type() == Type::null; }
    auto is_bool() const noexcept -> bool { return type() == Type::boolean; }
    auto is_int32() const noexcept -> bool { return type() == Type::int32; }
    auto is_int64() const noexcept -> bool { return type() == Type::int64; }
    auto is_integer() const noexcept -> bool { return is_int32() || is_int64(); }
    auto is_float() const noexcept -> bool { return type() == Type::float64; }
    auto is_string() const noexcept -> bool { return type() == Type::string; }
    auto is_array() const noexcept -> bool { return type() == Type::array; }
    auto is_table() const noexcept -> bool { return type() == Type::table; }

    // Integer value of an int32 or int64.
    auto as_integer() const -> Int64;

    template <typename T>
    auto get_ref() const -> T const& {
        return std::get<T>(value_);
    }
    template <typename T>
    auto try_get_ref() const -> T const* {
        return std::get_if<T>(&value_);
    }

    auto operator[](std::string_view key) -> Value&;

    auto try_at(std::string_view key) const -> Value const*;
    auto contains(std::string_view key) const -> bool;
    auto size() const -> size_t;

    auto push_back(Value v) -> void;

    auto variant() const -> auto const& { return value_; }

    auto to_json(int indent = -1) const -> std::string;

    static auto from_json(std::string_view json_str) -> Value;
    static auto from_toml(std::string_view toml_str) -> Value;

private:
    std::variant<Null, Bool, Int32, Int64, Float, String, Array, Table> value_;
};

}
