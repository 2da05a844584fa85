#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include <anyany/anyany.hpp>

#include "../utils/serde.hpp"

namespace dr::drefl {

// Owned record value whose type is known through its descriptor.
using Instance = aa::any_with<aa::type_info, aa::copy, aa::move>;

enum class FieldKind : uint8_t {
    scalar,
    enumeration,
    record,
    sequence,
    map,
};

enum class ScalarType : uint8_t {
    boolean,
    int32,
    int64,
    float64,
    string,
};

auto scalar_type_name(ScalarType type) -> std::string_view;
auto scalar_value_type(ScalarType type) -> serde::Value::Type;

struct RecordTypeDescriptor;
struct TypeRegistry;

using NestedResolver = auto(TypeRegistry&) -> RecordTypeDescriptor const&;
using ElementVisitor = auto(std::string_view key, void const* element) -> void;

// Type-erased access to one field. `object` always points to the record owning the field;
// setters receive values that have already been checked against the descriptor.
struct FieldAccessor final {
    // Scalars and collections of scalars.
    std::function<auto(void* object, serde::Value const& value) -> void> set_value;
    std::function<auto(void* object, size_t ordinal) -> void> set_enum;
    std::function<auto(void* object, Instance&& nested) -> void> set_record;
    // Empties an optional field, value-initializes any other.
    std::function<auto(void* object) -> void> set_null;

    std::function<auto(void const* object) -> bool> is_empty;
    // Enums are read as their case name, or their code when no case matches.
    std::function<auto(void const* object) -> serde::Value> get_value;
    std::function<auto(void const* object) -> void const*> get_record;
    // Collections of records. Sequence elements are visited with an empty key.
    std::function<auto(void const* object, std::function<ElementVisitor> const& func) -> void> for_each_element;
};

struct FieldDescriptor final {
    std::string logical_name;
    std::string external_name;
    // Declared type, e.g. `int32`, `Option<Address>`, `vector<string>`.
    std::string type_name;
    FieldKind kind = FieldKind::scalar;
    bool optional = false;
    bool has_default = false;
    // Type of a scalar field, or element type of a collection of scalars.
    ScalarType scalar_type = ScalarType::string;
    bool element_is_record = false;
    std::vector<std::string> enum_cases;
    std::vector<int64_t> enum_codes;
    // Set for record fields and collections of records.
    std::function<NestedResolver> nested;
    FieldAccessor accessor;

    auto is_collection() const -> bool { return kind == FieldKind::sequence || kind == FieldKind::map; }
    auto is_record() const -> bool { return kind == FieldKind::record; }
    auto is_record_collection() const -> bool { return is_collection() && element_is_record; }
};

struct RecordTypeDescriptor final {
    std::type_index type = typeid(void);
    std::string name;
    // In declaration order.
    std::vector<FieldDescriptor> fields;
    // Default-constructed instance, holding the declared defaults.
    std::function<auto() -> Instance> construct;
    std::function<auto(Instance&) -> void*> address;

    auto find_field(std::string_view logical_name) const -> FieldDescriptor const*;
    auto find_external(std::string_view external_name) const -> FieldDescriptor const*;
};

// Supplies the descriptor of one type; consulted once, the first time the type is requested.
struct MetadataProvider final {
    std::type_index type = typeid(void);
    std::function<auto() -> RecordTypeDescriptor> describe;
};

}
