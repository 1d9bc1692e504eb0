#pragma once

#include "kernel/stl/cstdint.h"

namespace stl {

enum class memory_order : int {
    relaxed = __ATOMIC_RELAXED,
    acquire = __ATOMIC_ACQUIRE,
    release = __ATOMIC_RELEASE,
    acq_rel = __ATOMIC_ACQ_REL,
    seq_cst = __ATOMIC_SEQ_CST
};

/**
 * @brief An atomic integer or pointer based on compiler built-ins.
 *
 * @details
 * On a single core, atomicity is only needed against interrupt handlers.
 * The built-ins also act as compiler barriers so that accesses are not reordered across them.
 */
template <typename T>
class atomic {
public:
    constexpr atomic(const T val = T {}) noexcept : val_ {val} {}

    atomic(const atomic&) = delete;

    atomic& operator=(const atomic&) = delete;

    T load(const memory_order order = memory_order::seq_cst) const noexcept {
        return __atomic_load_n(&val_, static_cast<int>(order));
    }

    void store(const T val, const memory_order order = memory_order::seq_cst) noexcept {
        __atomic_store_n(&val_, val, static_cast<int>(order));
    }

    T exchange(const T val, const memory_order order = memory_order::seq_cst) noexcept {
        return __atomic_exchange_n(&val_, val, static_cast<int>(order));
    }

    T fetch_add(const T val, const memory_order order = memory_order::seq_cst) noexcept {
        return __atomic_fetch_add(&val_, val, static_cast<int>(order));
    }

private:
    T val_;
};

}  // namespace stl
