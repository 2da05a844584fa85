#include <docrefl/utils/serde.hpp>

#include <limits>

#include <docrefl/prelude/misc.hpp>
#include <nlohmann/json.hpp>
#include <toml++/toml.h>

namespace dr::serde {

auto Value::operator==(Value const& rhs) const -> bool {
    return value_ == rhs.value_;
}

auto Value::type_name() const noexcept -> std::string_view {
    return type_name(type());
}
auto Value::type_name(Type type) noexcept -> std::string_view {
    switch (type) {
        case Type::null: return "null";
        case Type::boolean: return "bool";
        case Type::int32: return "int32";
        case Type::int64: return "int64";
        case Type::float64: return "double";
        case Type::string: return "string";
        case Type::array: return "array";
        case Type::table: return "document";
    }
    return "unknown";
}

auto Value::as_integer() const -> Int64 {
    if (auto v = std::get_if<Int32>(&value_); v) {
        return *v;
    }
    return std::get<Int64>(value_);
}

auto Value::operator[](std::string_view key) -> Value& {
    if (value_.index() == 0) { value_ = Table{}; }
    return std::get<Table>(value_).try_emplace(std::string{key}).first->second;
}

auto Value::try_at(std::string_view key) const -> Value const* {
    if (auto table = std::get_if<Table>(&value_); table) {
        if (auto it = table->find(key); it != table->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto Value::contains(std::string_view key) const -> bool {
    return try_at(key) != nullptr;
}

auto Value::size() const -> size_t {
    if (auto arr = std::get_if<Array>(&value_); arr) {
        return arr->size();
    } else if (auto table = std::get_if<Table>(&value_); table) {
        return table->size();
    } else {
        return is_null() ? 0 : 1;
    }
}

auto Value::push_back(Value v) -> void {
    if (value_.index() == 0) { value_ = Array{}; }
    std::get<Array>(value_).push_back(std::move(v));
}

namespace {

auto integer_value(int64_t v) -> Value {
    if (v >= std::numeric_limits<Value::Int32>::min() && v <= std::numeric_limits<Value::Int32>::max()) {
        return static_cast<Value::Int32>(v);
    }
    return static_cast<Value::Int64>(v);
}

auto value_to_json(Value const& v) -> nlohmann::json {
    nlohmann::json j{};
    std::visit(
        FunctorsHelper{
            [](Value::Null) {},
            [&j](Value::Bool v) { j = v; },
            [&j](Value::Int32 v) { j = v; },
            [&j](Value::Int64 v) { j = v; },
            [&j](Value::Float v) { j = v; },
            [&j](Value::String const& v) { j = v; },
            [&j](Value::Array const& v) {
                j = nlohmann::json::array();
                for (auto& elem : v) {
                    j.push_back(value_to_json(elem));
                }
            },
            [&j](Value::Table const& v) {
                j = nlohmann::json::object();
                for (auto& [key, elem] : v) {
                    j[key] = value_to_json(elem);
                }
            },
        },
        v.variant()
    );
    return j;
}

auto value_from_json(nlohmann::json const& j) -> Value {
    Value v{};
    switch (j.type()) {
        case nlohmann::json::value_t::boolean:
            v = j.get<Value::Bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            v = integer_value(j.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw ParseError{"integer " + std::to_string(u) + " does not fit in int64"};
            }
            v = integer_value(static_cast<int64_t>(u));
            break;
        }
        case nlohmann::json::value_t::number_float:
            v = j.get<Value::Float>();
            break;
        case nlohmann::json::value_t::string:
            v = j.get<Value::String>();
            break;
        case nlohmann::json::value_t::array:
            v = Value::Array{};
            for (auto& elem : j) {
                v.push_back(value_from_json(elem));
            }
            break;
        case nlohmann::json::value_t::object:
            v = Value::Table{};
            for (auto& [key, elem] : j.items()) {
                v[key] = value_from_json(elem);
            }
            break;
        default: break;
    }
    return v;
}

auto value_from_toml(toml::node const& t) -> Value {
    Value v{};
    switch (t.type()) {
        case toml::node_type::boolean:
            v = t.as_boolean()->get();
            break;
        case toml::node_type::integer:
            v = integer_value(t.as_integer()->get());
            break;
        case toml::node_type::floating_point:
            v = t.as_floating_point()->get();
            break;
        case toml::node_type::string:
            v = t.as_string()->get();
            break;
        case toml::node_type::array:
            v = Value::Array{};
            for (auto& elem : *t.as_array()) {
                v.push_back(value_from_toml(elem));
            }
            break;
        case toml::node_type::table:
            v = Value::Table{};
            for (auto& [key, elem] : *t.as_table()) {
                v[key.str()] = value_from_toml(elem);
            }
            break;
        default: break;
    }
    return v;
}

} // namespace

auto Value::to_json(int indent) const -> std::string {
    auto json = value_to_json(*this);
    return json.dump(indent);
}

auto Value::from_json(std::string_view json_str) -> Value {
    try {
        return value_from_json(nlohmann::json::parse(json_str));
    } catch (nlohmann::json::exception const& e) {
        throw ParseError{std::string{"invalid JSON: "} + e.what()};
    }
}
auto Value::from_toml(std::string_view toml_str) -> Value {
    try {
        auto t = toml::parse(toml_str);
        Value v = Table{};
        for (auto& [key, node] : t) {
            v[key.str()] = value_from_toml(node);
        }
        return v;
    } catch (toml::parse_error const& e) {
        throw ParseError{std::string{"invalid TOML: "} + std::string{e.description()}};
    }
}

}
