/**
 * @file example.h
 * @brief The example task.
 *
 * @par GitHub
 * https://github.com/Zhuagenborn
 */

#pragma once

#include "kernel/stl/optional.h"
#include "kernel/task/task.h"

namespace task {

//! A number that is ready immediately.
class ReadyNumber {
public:
    explicit constexpr ReadyNumber(const stl::uint64_t num) noexcept : num_ {num} {}

    //! Get the number if it is ready.
    stl::optional<stl::uint64_t> Poll(const Waker&) const noexcept {
        return num_;
    }

private:
    stl::uint64_t num_;
};

//! The task waiting for a number and printing it in decimal.
class ExampleTask : public Task {
public:
    static constexpr stl::uint64_t number {42};

    PollResult Poll(const Waker&) noexcept override;

    //! Get the received number.
    stl::optional<stl::uint64_t> GetNumber() const noexcept {
        return received_;
    }

private:
    ReadyNumber pending_ {number};
    stl::optional<stl::uint64_t> received_;
};

}  // namespace task
