#include <docrefl/mapper/document_writer.hpp>

namespace dr::mapper {

namespace {

struct DocumentWriter final {
    drefl::TypeRegistry& registry;
    NoneHandling none_handling;

    auto write(drefl::RecordTypeDescriptor const& descriptor, void const* object) const -> serde::Value {
        serde::Value::Table table{};
        for (auto const& field : descriptor.fields) {
            if (field.accessor.is_empty(object)) {
                if (none_handling == NoneHandling::encode) {
                    table.insert_or_assign(field.external_name, serde::Value{});
                }
                continue;
            }
            table.insert_or_assign(field.external_name, write_field(field, object));
        }
        return table;
    }

    auto write_field(drefl::FieldDescriptor const& field, void const* object) const -> serde::Value {
        if (field.is_record()) {
            return write(field.nested(registry), field.accessor.get_record(object));
        }
        if (field.is_record_collection()) {
            auto const& element_desc = field.nested(registry);
            if (field.kind == drefl::FieldKind::sequence) {
                serde::Value::Array array{};
                field.accessor.for_each_element(object, [&](std::string_view, void const* element) {
                    array.push_back(write(element_desc, element));
                });
                return array;
            }
            serde::Value::Table table{};
            field.accessor.for_each_element(object, [&](std::string_view key, void const* element) {
                table.insert_or_assign(std::string{key}, write(element_desc, element));
            });
            return table;
        }
        return field.accessor.get_value(object);
    }
};

}

auto to_document(
    drefl::RecordTypeDescriptor const& descriptor,
    void const* object,
    drefl::TypeRegistry& registry,
    NoneHandling none_handling
) -> serde::Value {
    DocumentWriter writer{registry, none_handling};
    return writer.write(descriptor, object);
}

}
