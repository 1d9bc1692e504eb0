#pragma once

#include "kernel/debug/assert.h"

namespace stl {

struct nullopt_t {
    explicit constexpr nullopt_t(int) noexcept {}
};

inline constexpr nullopt_t nullopt {0};

/**
 * @brief An optional value.
 *
 * @warning
 * The stored type must be a default-constructible value type.
 * An empty optional still holds a default-constructed object.
 */
template <typename T>
class optional {
public:
    constexpr optional() noexcept = default;

    constexpr optional(nullopt_t) noexcept {}

    constexpr optional(const T& val) noexcept : val_ {val}, has_val_ {true} {}

    constexpr bool has_value() const noexcept {
        return has_val_;
    }

    constexpr explicit operator bool() const noexcept {
        return has_val_;
    }

    const T& value() const noexcept {
        dbg::Assert(has_val_, "The optional value is empty");
        return val_;
    }

    constexpr T value_or(const T& def) const noexcept {
        return has_val_ ? val_ : def;
    }

    const T& operator*() const noexcept {
        return value();
    }

    const T* operator->() const noexcept {
        return &value();
    }

    constexpr optional& reset() noexcept {
        has_val_ = false;
        return *this;
    }

private:
    T val_ {};
    bool has_val_ {false};
};

template <typename T>
bool operator==(const optional<T>& lhs, const optional<T>& rhs) noexcept {
    if (lhs.has_value() != rhs.has_value()) {
        return false;
    }

    return !lhs.has_value() || *lhs == *rhs;
}

template <typename T>
constexpr bool operator==(const optional<T>& lhs, const nullopt_t) noexcept {
    return !lhs.has_value();
}

}  // namespace stl
