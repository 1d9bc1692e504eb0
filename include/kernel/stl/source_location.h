#pragma once

#include "kernel/stl/cstdint.h"

namespace stl {

class source_location {
public:
    static constexpr source_location current(const char* const file = __builtin_FILE(),
                                             const char* const func = __builtin_FUNCTION(),
                                             const uint_least32_t line = __builtin_LINE()) noexcept {
        return {file, func, line};
    }

    constexpr const char* file_name() const noexcept {
        return file_;
    }

    constexpr const char* function_name() const noexcept {
        return func_;
    }

    constexpr uint_least32_t line() const noexcept {
        return line_;
    }

private:
    constexpr source_location(const char* const file, const char* const func,
                              const uint_least32_t line) noexcept :
        file_ {file}, func_ {func}, line_ {line} {}

    const char* file_;
    const char* func_;
    uint_least32_t line_;
};

}  // namespace stl
