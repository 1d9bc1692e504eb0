#include "kernel/io/io.h"

namespace io {

namespace {

extern "C" {

//! Get the value of @p RFLAGS.
stl::uint64_t GetRFlags() noexcept;
}

}  // namespace

RFlags RFlags::Get() noexcept {
    return GetRFlags();
}

}  // namespace io
