#pragma once

#include <cstddef>
#include <new>
#include <utility>
#include <concepts>

namespace dr {

// Optional wrapper used by record fields. A field of type `Option<T>` is "optional-wrapped":
// it may be absent from a document, and an optional record is a transparent hop in field paths.
template <typename T>
struct Option final {
    using value_type = T;

    Option() noexcept = default;
    ~Option() { reset(); }

    Option(T const& value) : has_value_(true) { new (memory_) T(value); }
    Option(T&& value) noexcept : has_value_(true) { new (memory_) T(std::move(value)); }

    Option(Option const& rhs) : has_value_(rhs.has_value_) {
        if (has_value_) {
            new (memory_) T(rhs.value());
        }
    }
    Option(Option&& rhs) noexcept : has_value_(rhs.has_value_) {
        if (has_value_) {
            new (memory_) T(std::move(rhs.value()));
            rhs.reset();
        }
    }

    auto operator=(T const& value) -> Option& {
        emplace(value);
        return *this;
    }
    auto operator=(T&& value) noexcept -> Option& {
        emplace(std::move(value));
        return *this;
    }

    auto operator=(Option const& rhs) -> Option& {
        if (this != &rhs) {
            reset();
            if (rhs.has_value_) {
                emplace(rhs.value());
            }
        }
        return *this;
    }
    auto operator=(Option&& rhs) noexcept -> Option& {
        if (this != &rhs) {
            reset();
            if (rhs.has_value_) {
                emplace(std::move(rhs.value()));
                rhs.reset();
            }
        }
        return *this;
    }

    auto operator==(Option const& rhs) const -> bool {
        return has_value_ ? (rhs.has_value() && value() == rhs.value()) : !rhs.has_value();
    }

    auto value() & -> T& { return *std::launder(reinterpret_cast<T*>(memory_)); }
    auto value() const& -> T const& { return *std::launder(reinterpret_cast<T const*>(memory_)); }
    auto value() && -> T&& { return std::move(*std::launder(reinterpret_cast<T*>(memory_))); }

    auto value_or(T const& fallback) const -> T const& {
        return has_value_ ? value() : fallback;
    }

    auto has_value() const -> bool { return has_value_; }
    explicit operator bool() const { return has_value_; }

    auto operator->() -> T* { return &value(); }
    auto operator->() const -> T const* { return &value(); }

    template <typename... Args> requires std::constructible_from<T, Args...>
    auto emplace(Args&&... args) -> T& {
        reset();
        new (memory_) T(std::forward<Args>(args)...);
        has_value_ = true;
        return value();
    }

    auto reset() -> void {
        if (has_value_) {
            value().~T();
            has_value_ = false;
        }
    }

private:
    alignas(T) std::byte memory_[sizeof(T)];
    bool has_value_ = false;
};

namespace traits {

template <typename T>
struct OptionHelper final {
    static constexpr bool value = false;
    using inner_type = T;
};
template <typename T>
struct OptionHelper<Option<T>> final {
    static constexpr bool value = true;
    using inner_type = T;
};
template <typename T>
concept Optional = OptionHelper<T>::value;

}

}
