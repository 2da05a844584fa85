#include <docrefl/drefl/field_descriptor.hpp>

#include <algorithm>

namespace dr::drefl {

auto scalar_type_name(ScalarType type) -> std::string_view {
    switch (type) {
        case ScalarType::boolean: return "bool";
        case ScalarType::int32: return "int32";
        case ScalarType::int64: return "int64";
        case ScalarType::float64: return "double";
        case ScalarType::string: return "string";
    }
    return "<unknown>";
}

auto scalar_value_type(ScalarType type) -> serde::Value::Type {
    switch (type) {
        case ScalarType::boolean: return serde::Value::Type::boolean;
        case ScalarType::int32: return serde::Value::Type::int32;
        case ScalarType::int64: return serde::Value::Type::int64;
        case ScalarType::float64: return serde::Value::Type::float64;
        case ScalarType::string: return serde::Value::Type::string;
    }
    return serde::Value::Type::null;
}

auto RecordTypeDescriptor::find_field(std::string_view logical_name) const -> FieldDescriptor const* {
    auto it = std::find_if(fields.begin(), fields.end(), [logical_name](FieldDescriptor const& field) {
        return field.logical_name == logical_name;
    });
    return it == fields.end() ? nullptr : &*it;
}

auto RecordTypeDescriptor::find_external(std::string_view external_name) const -> FieldDescriptor const* {
    auto it = std::find_if(fields.begin(), fields.end(), [external_name](FieldDescriptor const& field) {
        return field.external_name == external_name;
    });
    return it == fields.end() ? nullptr : &*it;
}

}
