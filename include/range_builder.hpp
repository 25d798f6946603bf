#pragma once

#include "bar.hpp"
#include "session_clock.hpp"
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// High/low of the bars inside one window of one trading day.
/// Invariant: high >= low, bar_count > 0 (no bars -> no OpeningRange at all).
struct OpeningRange {
    absl::CivilDay day;
    std::string window_name;
    double high{0};
    double low{0};
    double size_ticks{0};
    double midpoint{0};
    int bar_count{0};
    UtcSpan span;  // [window start, window end) in UTC

    double size() const { return high - low; }
};

/// Aggregates the bars with span.start <= ts < span.end. `bars` must be ascending.
/// Returns nullopt when no bar falls inside. Throws ComputationIntegrityError
/// if the result has high < low or a non-finite price.
std::optional<OpeningRange> buildRange(absl::CivilDay day,
                                       const SessionWindow& window,
                                       const UtcSpan& span,
                                       const std::vector<Bar>& bars,
                                       double tick_size);

} // namespace orb
