#pragma once

namespace stl {

using int8_t = __INT8_TYPE__;
using int16_t = __INT16_TYPE__;
using int32_t = __INT32_TYPE__;
using int64_t = __INT64_TYPE__;

using uint8_t = __UINT8_TYPE__;
using uint16_t = __UINT16_TYPE__;
using uint32_t = __UINT32_TYPE__;
using uint64_t = __UINT64_TYPE__;

using uint_least32_t = __UINT_LEAST32_TYPE__;

using intptr_t = __INTPTR_TYPE__;
using uintptr_t = __UINTPTR_TYPE__;

using size_t = __SIZE_TYPE__;
using ptrdiff_t = __PTRDIFF_TYPE__;

using nullptr_t = decltype(nullptr);

//! A raw byte. It is an integer type so that it can be used in arithmetic and port I/O.
using byte = uint8_t;

static_assert(sizeof(uintptr_t) == sizeof(uint64_t), "The kernel only supports 64-bit targets.");

}  // namespace stl
