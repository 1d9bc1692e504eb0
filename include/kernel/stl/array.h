#pragma once

#include "kernel/stl/cstdint.h"

namespace stl {

template <typename T, size_t n>
class array {
    static_assert(n > 0);

public:
    using value_type = T;
    using size_type = size_t;
    using difference_type = ptrdiff_t;
    using reference = value_type&;
    using const_reference = const value_type&;
    using pointer = value_type*;
    using const_pointer = const value_type*;
    using iterator = value_type*;
    using const_iterator = const value_type*;

    constexpr array() noexcept = default;

    constexpr size_type size() const noexcept {
        return n;
    }

    constexpr const_reference operator[](const size_type idx) const noexcept {
        return vals_[idx];
    }

    constexpr reference operator[](const size_type idx) noexcept {
        return vals_[idx];
    }

    constexpr pointer data() noexcept {
        return vals_;
    }

    constexpr const_pointer data() const noexcept {
        return vals_;
    }

    constexpr const_reference front() const noexcept {
        return vals_[0];
    }

    constexpr const_reference back() const noexcept {
        return vals_[n - 1];
    }

    constexpr iterator begin() noexcept {
        return vals_;
    }

    constexpr const_iterator begin() const noexcept {
        return vals_;
    }

    constexpr iterator end() noexcept {
        return vals_ + n;
    }

    constexpr const_iterator end() const noexcept {
        return vals_ + n;
    }

    constexpr void fill(const_reference val) noexcept {
        for (auto& v : vals_) {
            v = val;
        }
    }

private:
    value_type vals_[n] {};
};

}  // namespace stl
