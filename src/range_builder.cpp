#include "range_builder.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace orb {

std::optional<OpeningRange> buildRange(absl::CivilDay day,
                                       const SessionWindow& window,
                                       const UtcSpan& span,
                                       const std::vector<Bar>& bars,
                                       double tick_size) {
    const std::size_t first = firstBarAtOrAfter(bars, span.start);
    const std::size_t last = firstBarAtOrAfter(bars, span.end);
    if (first >= last) return std::nullopt;

    OpeningRange r;
    r.day = day;
    r.window_name = window.name;
    r.span = span;
    r.high = bars[first].high;
    r.low = bars[first].low;
    for (std::size_t i = first; i < last; ++i) {
        r.high = std::max(r.high, bars[i].high);
        r.low = std::min(r.low, bars[i].low);
    }
    r.bar_count = static_cast<int>(last - first);

    if (!std::isfinite(r.high) || !std::isfinite(r.low) || r.high < r.low)
        throw ComputationIntegrityError("invalid opening range high=" + std::to_string(r.high)
                                        + " low=" + std::to_string(r.low),
                                        formatDay(day), window.name);
    r.size_ticks = (r.high - r.low) / tick_size;
    r.midpoint = (r.high + r.low) / 2.0;
    return r;
}

} // namespace orb
