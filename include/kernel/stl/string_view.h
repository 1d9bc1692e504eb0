#pragma once

#include "kernel/stl/algorithm.h"
#include "kernel/stl/cstring.h"

namespace stl {

class string_view {
public:
    using value_type = char;
    using size_type = size_t;
    using const_reference = const value_type&;
    using const_pointer = const value_type*;
    using const_iterator = const value_type*;

    static constexpr size_type npos {static_cast<size_type>(-1)};

    constexpr string_view(const const_pointer str = nullptr) noexcept :
        str_ {str}, len_ {strlen(str)} {}

    constexpr string_view(const const_pointer str, const size_type len) noexcept :
        str_ {str}, len_ {len} {}

    constexpr const_pointer data() const noexcept {
        return str_;
    }

    constexpr bool empty() const noexcept {
        return len_ == 0;
    }

    constexpr size_type size() const noexcept {
        return len_;
    }

    constexpr const_reference operator[](const size_type idx) const noexcept {
        return str_[idx];
    }

    constexpr const_iterator begin() const noexcept {
        return str_;
    }

    constexpr const_iterator end() const noexcept {
        return str_ + len_;
    }

    constexpr size_type find(const value_type ch) const noexcept {
        for (size_type i {0}; i != len_; ++i) {
            if (str_[i] == ch) {
                return i;
            }
        }

        return npos;
    }

    constexpr string_view substr(const size_type idx = 0,
                                 const size_type count = npos) const noexcept {
        if (idx >= len_) {
            return {};
        }

        return {str_ + idx, min(count, len_ - idx)};
    }

private:
    const_pointer str_;
    size_type len_;
};

constexpr bool operator==(const string_view lhs, const string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (string_view::size_type i {0}; i != lhs.size(); ++i) {
        if (lhs[i] != rhs[i]) {
            return false;
        }
    }

    return true;
}

constexpr bool operator!=(const string_view lhs, const string_view rhs) noexcept {
    return !(lhs == rhs);
}

}  // namespace stl
