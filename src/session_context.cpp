#include "session_context.hpp"
#include "bar_store.hpp"
#include "range_builder.hpp"
#include <algorithm>
#include <numeric>

namespace orb {

std::vector<SessionLevel> buildSessionLevels(absl::CivilDay day,
                                             const std::vector<SessionWindow>& windows,
                                             const SessionClock& clock,
                                             const std::vector<Bar>& bars,
                                             double tick_size) {
    std::vector<SessionLevel> out;
    for (const SessionWindow& w : windows) {
        const UtcSpan span = clock.windowSpan(day, w);
        auto r = buildRange(day, w, span, bars, tick_size);
        if (!r) continue;
        SessionLevel lvl;
        lvl.name = w.name;
        lvl.high = r->high;
        lvl.low = r->low;
        lvl.range_ticks = r->size_ticks;
        lvl.bar_count = r->bar_count;
        lvl.end_time = span.end;
        out.push_back(lvl);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const SessionLevel& a, const SessionLevel& b) { return a.end_time < b.end_time; });
    return out;
}

std::vector<SessionLevel> sessionsAsOf(const std::vector<SessionLevel>& levels, std::int64_t cutoff) {
    std::vector<SessionLevel> out;
    for (const auto& lvl : levels) {
        if (lvl.end_time <= cutoff) out.push_back(lvl);
    }
    return out;
}

const SessionLevel* findSession(const std::vector<SessionLevel>& levels, const std::string& name) {
    auto it = std::find_if(levels.begin(), levels.end(),
                           [&](const SessionLevel& l) { return l.name == name; });
    return it == levels.end() ? nullptr : &*it;
}

std::optional<double> averageRange(const std::vector<double>& ranges) {
    if (ranges.size() < static_cast<std::size_t>(ATR_DAYS)) return std::nullopt;
    return std::accumulate(ranges.begin(), ranges.begin() + ATR_DAYS, 0.0) / ATR_DAYS;
}

//-----------------------------------------------------------------------------
// Type codes
//-----------------------------------------------------------------------------
std::string asiaTypeCode(const SessionLevel* asia, std::optional<double> atr_ticks) {
    if (!asia || !atr_ticks || *atr_ticks <= 0) return "";
    const double ratio = asia->range_ticks / *atr_ticks;
    if (ratio < 0.3) return "A1_TIGHT";
    if (ratio > 0.8) return "A2_EXPANDED";
    return "A0_NORMAL";
}

std::string londonTypeCode(const SessionLevel* london, const SessionLevel* asia) {
    if (!london || !asia) return "";
    const bool took_high = london->high > asia->high;
    const bool took_low = london->low < asia->low;
    if (took_high && took_low) return "L3_EXPANSION";
    if (took_high) return "L1_SWEEP_HIGH";
    if (took_low) return "L2_SWEEP_LOW";
    return "L4_CONSOLIDATION";
}

std::string preNyTypeCode(const SessionLevel* pre_ny,
                          const SessionLevel* london,
                          const SessionLevel* asia,
                          std::optional<double> atr_ticks) {
    if (!pre_ny || !london || !asia) return "";
    const double ref_high = std::max(london->high, asia->high);
    const double ref_low = std::min(london->low, asia->low);
    if (pre_ny->high > ref_high && pre_ny->low >= ref_low) return "N1_SWEEP_HIGH";
    if (pre_ny->low < ref_low && pre_ny->high <= ref_high) return "N2_SWEEP_LOW";
    if (atr_ticks && *atr_ticks > 0) {
        const double ratio = pre_ny->range_ticks / *atr_ticks;
        if (ratio < 0.25) return "N3_CONSOLIDATION";
        if (ratio > 0.8) return "N4_EXPANSION";
    }
    return "N0_NORMAL";
}

//-----------------------------------------------------------------------------
// RSI
//-----------------------------------------------------------------------------
std::optional<double> rsiAt(const std::vector<Bar>& bars, std::int64_t at_utc) {
    const std::vector<Bar> before(bars.begin(), bars.begin() + firstBarAtOrAfter(bars, at_utc));
    std::vector<Bar> buckets = aggregateBars(before, RSI_BAR_MINUTES);
    // A bucket still forming at at_utc is not a close yet.
    if (!buckets.empty() && buckets.back().ts_utc + RSI_BAR_MINUTES * BAR_SECONDS > at_utc)
        buckets.pop_back();
    if (buckets.size() < static_cast<std::size_t>(RSI_LENGTH + 1)) return std::nullopt;

    double avg_gain = 0, avg_loss = 0;
    const std::size_t first = buckets.size() - RSI_LENGTH - 1;
    for (std::size_t i = first + 1; i < buckets.size(); ++i) {
        const double change = buckets[i].close - buckets[i - 1].close;
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= RSI_LENGTH;
    avg_loss /= RSI_LENGTH;
    if (avg_loss == 0) return 100.0;
    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

} // namespace orb
