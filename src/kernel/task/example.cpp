#include "kernel/task/example.h"
#include "kernel/io/video/print.h"
#include "kernel/util/format.h"

namespace task {

PollResult ExampleTask::Poll(const Waker& waker) noexcept {
    received_ = pending_.Poll(waker);
    if (!received_) {
        return PollResult::Pending;
    }

    char num[max_uint_str_len + 1] {};
    const auto len {ConvertUIntToString(num, *received_)};
    io::Printf("async number: {}\n", stl::string_view {num, len});
    return PollResult::Complete;
}

}  // namespace task
