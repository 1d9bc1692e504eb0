#pragma once

#include "kernel/stl/array.h"

namespace stl {

template <typename T>
class span {
public:
    using value_type = T;
    using size_type = size_t;
    using difference_type = ptrdiff_t;
    using reference = value_type&;
    using pointer = value_type*;
    using iterator = value_type*;

    constexpr span() noexcept = default;

    constexpr span(const pointer vals, const size_type size) noexcept : vals_ {vals}, size_ {size} {}

    template <size_type n>
    constexpr span(value_type (&vals)[n]) noexcept : vals_ {vals}, size_ {n} {}

    template <typename U, size_type n>
    constexpr span(array<U, n>& vals) noexcept : vals_ {vals.data()}, size_ {n} {}

    template <typename U, size_type n>
    constexpr span(const array<U, n>& vals) noexcept : vals_ {vals.data()}, size_ {n} {}

    constexpr bool empty() const noexcept {
        return size_ == 0;
    }

    constexpr size_type size() const noexcept {
        return size_;
    }

    constexpr reference operator[](const size_type idx) const noexcept {
        return vals_[idx];
    }

    constexpr pointer data() const noexcept {
        return vals_;
    }

    constexpr reference front() const noexcept {
        return vals_[0];
    }

    constexpr reference back() const noexcept {
        return vals_[size_ - 1];
    }

    constexpr iterator begin() const noexcept {
        return vals_;
    }

    constexpr iterator end() const noexcept {
        return vals_ + size_;
    }

private:
    pointer vals_ {nullptr};
    size_type size_ {0};
};

}  // namespace stl
