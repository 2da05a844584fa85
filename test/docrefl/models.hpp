#pragma once

#include <map>

#include <docrefl/mapper/mapper.hpp>

namespace models {

enum class Color : uint8_t {
    red,
    green,
    blue,
};

enum class Priority : int32_t {
    low = 10,
    medium = 20,
    high = 30,
};

enum class Status : int32_t {
    ok = 200,
    not_found = 404,
};

// Declared out of value order.
enum class Shape : int32_t {
    square = 5,
    circle = 1,
    triangle = 3,
};

struct Address final {
    std::string city;
    int32_t zip_code = 0;

    auto operator==(Address const&) const -> bool = default;
};
DR_SREFL(type(Address), field(city, dr::Rename{"c"}), field(zip_code, dr::Rename{"zip"}))

struct Skill final {
    std::string name;
    int32_t level = 0;

    auto operator==(Skill const&) const -> bool = default;
};
DR_SREFL(type(Skill), field(name), field(level))

struct Person final {
    std::string name;
    int32_t age = 0;
    dr::Option<std::string> email;
    Color color = Color::red;
    dr::Option<Address> address;
    std::vector<std::string> tags;
    std::vector<Skill> skills;

    auto operator==(Person const&) const -> bool = default;
};
DR_SREFL(
    type(Person),
    field(name),
    field(age),
    field(email),
    field(color),
    field(address),
    field(tags),
    field(skills, dr::Defaulted{})
)

// Scalars and nested records only.
struct Account final {
    std::string owner;
    int64_t balance = 0;
    double rate = 0.0;
    bool active = false;
    Address billing;

    auto operator==(Account const&) const -> bool = default;
};
DR_SREFL(type(Account), field(owner), field(balance), field(rate), field(active), field(billing))

struct Task final {
    std::string title;
    Priority priority = Priority::low;
    dr::Option<Color> label;
    int32_t retries = 3;
    std::map<std::string, int32_t> counters;

    auto operator==(Task const&) const -> bool = default;
};
DR_SREFL(
    type(Task),
    field(title),
    field(priority),
    field(label),
    field(retries, dr::Defaulted{}),
    field(counters, dr::Defaulted{})
)

struct Team final {
    std::string name;
    dr::Option<Person> lead;
    std::map<std::string, Skill> skill_matrix;
};
DR_SREFL(type(Team), field(name), field(lead), field(skill_matrix, dr::Defaulted{}))

struct Response final {
    Status status = Status::ok;
    dr::Option<Status> fallback;
    Shape shape = Shape::square;

    auto operator==(Response const&) const -> bool = default;
};
DR_SREFL(type(Response), field(status), field(fallback), field(shape, dr::Defaulted{}))

// Described by hand rather than through DR_SREFL.
struct Point final {
    int32_t x = 0;
    int32_t y = 0;
};

inline auto point_provider() -> dr::drefl::MetadataProvider {
    return dr::drefl::MetadataProvider{
        .type = typeid(Point),
        .describe = []() {
            return dr::drefl::DescriptorBuilder<Point>{"Point"}
                .field("x", &Point::x, dr::Rename{"px"})
                .field("y", &Point::y, dr::Rename{"py"})
                .build();
        },
    };
}

struct Clash final {
    int32_t first = 0;
    int32_t second = 0;
};
DR_SREFL(type(Clash), field(first, dr::Rename{"same"}), field(second, dr::Rename{"same"}))

}
