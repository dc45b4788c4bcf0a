// =============================================================================
// remio - Common Type Utilities
// =============================================================================

#include "remio/common/types.h"

#include <array>
#include <limits>

#include <fmt/format.h>

namespace remio {

std::string humanSize(std::uint64_t bytes) {
    static constexpr std::array<std::string_view, 7> kUnits = {
        "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};

    if (bytes < kKiB) {
        return fmt::format("{} B", bytes);
    }

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

std::int64_t seekTarget(std::uint64_t base, std::int64_t delta) noexcept {
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    const std::int64_t origin =
        base > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<std::int64_t>(base);
    if (delta > 0 && origin > kMax - delta) {
        return kMax;
    }
    // origin >= 0, so adding a negative delta cannot underflow
    return origin + delta;
}

}  // namespace remio
