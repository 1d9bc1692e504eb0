/**
 * @file algorithm.h
 * @brief Comparison helpers.
 */

#pragma once

namespace stl {

//! Get the smaller value. The left one is returned if they are equal.
template <typename T>
constexpr const T& min(const T& lhs, const T& rhs) noexcept {
    return rhs < lhs ? rhs : lhs;
}

//! Get the larger value. The left one is returned if they are equal.
template <typename T>
constexpr const T& max(const T& lhs, const T& rhs) noexcept {
    return lhs < rhs ? rhs : lhs;
}

}  // namespace stl
