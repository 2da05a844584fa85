#include <gtest/gtest.h>

#include <thread>

#include "models.hpp"

using namespace dr::drefl;

TEST(Registry, DescribesReflectedTypeInDeclarationOrder) {
    TypeRegistry registry{};
    auto const& desc = registry.descriptor<models::Person>();

    EXPECT_EQ(desc.name, "Person");
    EXPECT_EQ(desc.type, std::type_index{typeid(models::Person)});
    ASSERT_EQ(desc.fields.size(), 7u);
    std::vector<std::string> names{};
    for (auto const& field : desc.fields) {
        names.push_back(field.logical_name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"name", "age", "email", "color", "address", "tags", "skills"}));
}

TEST(Registry, FieldKindsAndFlags) {
    TypeRegistry registry{};
    auto const& desc = registry.descriptor<models::Person>();

    auto age = desc.find_field("age");
    ASSERT_NE(age, nullptr);
    EXPECT_EQ(age->kind, FieldKind::scalar);
    EXPECT_EQ(age->scalar_type, ScalarType::int32);
    EXPECT_EQ(age->type_name, "int32");
    EXPECT_FALSE(age->optional);

    auto email = desc.find_field("email");
    EXPECT_TRUE(email->optional);
    EXPECT_EQ(email->type_name, "Option<string>");

    auto color = desc.find_field("color");
    EXPECT_EQ(color->kind, FieldKind::enumeration);
    EXPECT_EQ(color->enum_cases, (std::vector<std::string>{"red", "green", "blue"}));
    EXPECT_EQ(color->enum_codes, (std::vector<int64_t>{0, 1, 2}));

    auto address = desc.find_field("address");
    EXPECT_TRUE(address->is_record());
    EXPECT_TRUE(address->optional);
    EXPECT_EQ(address->type_name, "Option<Address>");
    EXPECT_EQ(address->nested(registry).name, "Address");

    auto tags = desc.find_field("tags");
    EXPECT_EQ(tags->kind, FieldKind::sequence);
    EXPECT_FALSE(tags->element_is_record);
    EXPECT_EQ(tags->type_name, "vector<string>");

    auto skills = desc.find_field("skills");
    EXPECT_TRUE(skills->is_record_collection());
    EXPECT_TRUE(skills->has_default);
    EXPECT_EQ(skills->type_name, "vector<Skill>");
}

TEST(Registry, EnumCasesInValueOrder) {
    TypeRegistry registry{};
    auto const& desc = registry.descriptor<models::Response>();

    auto status = desc.find_field("status");
    EXPECT_EQ(status->enum_cases, (std::vector<std::string>{"ok", "not_found"}));
    EXPECT_EQ(status->enum_codes, (std::vector<int64_t>{200, 404}));

    auto shape = desc.find_field("shape");
    EXPECT_EQ(shape->enum_cases, (std::vector<std::string>{"circle", "triangle", "square"}));
    EXPECT_EQ(shape->enum_codes, (std::vector<int64_t>{1, 3, 5}));
}

TEST(Registry, RenameAttribute) {
    TypeRegistry registry{};
    auto const& desc = registry.descriptor<models::Address>();
    EXPECT_EQ(desc.find_field("city")->external_name, "c");
    EXPECT_EQ(desc.find_external("zip")->logical_name, "zip_code");
    EXPECT_EQ(desc.find_external("zip_code"), nullptr);
}

TEST(Registry, OverridesTakePrecedenceOverRename) {
    TypeRegistry registry{NameOverrides{{"Address.city", "town"}, {"Person.name", "full_name"}}};
    EXPECT_EQ(registry.descriptor<models::Address>().find_field("city")->external_name, "town");
    EXPECT_EQ(registry.descriptor<models::Address>().find_field("zip_code")->external_name, "zip");
    EXPECT_EQ(registry.descriptor<models::Person>().find_field("name")->external_name, "full_name");
}

TEST(Registry, DescriptorIsCachedByIdentity) {
    TypeRegistry registry{};
    EXPECT_EQ(registry.try_get(typeid(models::Skill)), nullptr);
    auto first = &registry.descriptor<models::Skill>();
    auto second = &registry.descriptor<models::Skill>();
    EXPECT_EQ(first, second);
    EXPECT_EQ(registry.try_get(typeid(models::Skill)), first);
    EXPECT_EQ(registry.find("Skill"), first);
    EXPECT_EQ(registry.find("Unknown"), nullptr);
}

TEST(Registry, ConcurrentRequestsShareOneDescriptor) {
    TypeRegistry registry{};
    std::vector<RecordTypeDescriptor const*> seen(8, nullptr);
    std::vector<std::thread> threads{};
    for (size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&registry, &seen, i]() {
            seen[i] = &registry.descriptor<models::Account>();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (auto desc : seen) {
        EXPECT_EQ(desc, seen.front());
    }
}

TEST(Registry, HandWrittenProvider) {
    TypeRegistry registry{};
    EXPECT_THROW(registry.descriptor<models::Point>(), UnknownTypeError);

    registry.register_provider(models::point_provider());
    auto const& desc = registry.descriptor<models::Point>();
    EXPECT_EQ(desc.name, "Point");
    EXPECT_EQ(desc.find_field("x")->external_name, "px");
    EXPECT_EQ(desc.find_field("y")->external_name, "py");
}

TEST(Registry, DuplicateExternalNamesAreRejected) {
    TypeRegistry registry{};
    EXPECT_THROW(registry.descriptor<models::Clash>(), InvalidDescriptorError);
    EXPECT_EQ(registry.try_get(typeid(models::Clash)), nullptr);
}

TEST(Registry, ConstructedInstanceHoldsDefaults) {
    TypeRegistry registry{};
    auto const& desc = registry.descriptor<models::Task>();
    auto instance = desc.construct();
    auto task = static_cast<models::Task const*>(desc.address(instance));
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->retries, 3);
    EXPECT_EQ(task->priority, models::Priority::low);
}
