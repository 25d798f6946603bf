#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

namespace orb {

/// Length of a base bar in seconds. Bars are stamped at their open.
constexpr std::int64_t BAR_SECONDS = 60;

/// Single OHLCV bar keyed by its UTC open time.
struct Bar {
    std::int64_t ts_utc{0};  // epoch seconds, minute aligned
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

/// Index of the first bar with ts_utc >= ts (bars must be ascending).
inline std::size_t firstBarAtOrAfter(const std::vector<Bar>& bars, std::int64_t ts) {
    auto it = std::lower_bound(bars.begin(), bars.end(), ts,
                               [](const Bar& b, std::int64_t t) { return b.ts_utc < t; });
    return static_cast<std::size_t>(it - bars.begin());
}

} // namespace orb
