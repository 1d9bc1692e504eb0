#include "kernel/boot/boot_info.h"

namespace boot {

bool MemMap::IsValid() const noexcept {
    if (!regions || count == 0) {
        return false;
    }

    for (const auto& region : GetRegions()) {
        if (!region.IsValid()) {
            return false;
        }
    }

    return true;
}

}  // namespace boot
