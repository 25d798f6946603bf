#include "simulator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace orb {

namespace {

// Slack for float comparisons against tick-rounded prices.
constexpr double PRICE_EPS = 1e-9;

bool closesBeyond(const Bar& b, const OpeningRange& r, Direction dir) {
    return dir == Direction::Up ? b.close > r.high : b.close < r.low;
}

} // namespace

const char* toString(ExitKind e) {
    switch (e) {
        case ExitKind::Target: return "TARGET";
        case ExitKind::Stop: return "STOP";
        case ExitKind::Unresolved: return "UNRESOLVED";
    }
    return "UNRESOLVED";
}

const char* toString(NoTradeReason r) {
    switch (r) {
        case NoTradeReason::None: return "";
        case NoTradeReason::NoRange: return "NO_RANGE";
        case NoTradeReason::RangeFilter: return "RANGE_FILTER";
        case NoTradeReason::NoBreak: return "NO_BREAK";
        case NoTradeReason::OppositeBreak: return "OPPOSITE_BREAK";
        case NoTradeReason::StopTooWide: return "STOP_TOO_WIDE";
        case NoTradeReason::ZeroRisk: return "ZERO_RISK";
        case NoTradeReason::NoFill: return "NO_FILL";
        case NoTradeReason::Unresolved: return "UNRESOLVED";
    }
    return "";
}

BreakoutSimulator::BreakoutSimulator(const RiskConfig& risk, double tick_size)
    : risk_(risk)
    , tick_size_(tick_size)
{
}

bool BreakoutSimulator::rangeAllowed(const OpeningRange& range) const {
    if (risk_.min_range_ticks && range.size_ticks < *risk_.min_range_ticks - PRICE_EPS) return false;
    if (risk_.max_range_ticks && range.size_ticks > *risk_.max_range_ticks + PRICE_EPS) return false;
    return true;
}

std::optional<std::size_t> BreakoutSimulator::findConfirmation(const OpeningRange& range,
                                                               Direction dir,
                                                               const std::vector<Bar>& bars,
                                                               std::int64_t session_end) const {
    // First bar strictly after the window end.
    std::size_t i = firstBarAtOrAfter(bars, range.span.end + 1);
    int consecutive = 0;
    for (; i < bars.size() && bars[i].ts_utc < session_end; ++i) {
        if (closesBeyond(bars[i], range, dir)) {
            if (++consecutive >= risk_.confirmation_closes) return i;
        } else {
            consecutive = 0;
        }
    }
    return std::nullopt;
}

BreakoutDecision BreakoutSimulator::detectBreakout(const OpeningRange& range,
                                                   Direction dir,
                                                   const std::vector<Bar>& bars,
                                                   std::int64_t session_end) const {
    BreakoutDecision d;
    if (!rangeAllowed(range)) {
        d.reason = NoTradeReason::RangeFilter;
        return d;
    }

    auto k = findConfirmation(range, dir, bars, session_end);
    if (risk_.direction_policy == DirectionPolicy::FirstBreak) {
        auto other = findConfirmation(range, opposite(dir), bars, session_end);
        if (other && (!k || *other < *k)) {
            d.reason = NoTradeReason::OppositeBreak;
            return d;
        }
    }
    if (!k) {
        d.reason = NoTradeReason::NoBreak;
        return d;
    }
    return buildTrade(range, dir, *k, bars, session_end);
}

BreakoutDecision BreakoutSimulator::buildTrade(const OpeningRange& range,
                                               Direction dir,
                                               std::size_t k,
                                               const std::vector<Bar>& bars,
                                               std::int64_t session_end) const {
    const std::string day = formatDay(range.day);
    const Bar& confirm = bars[k];
    if (confirm.ts_utc <= range.span.end || confirm.ts_utc >= session_end)
        throw ComputationIntegrityError("breakout confirmed at " + formatUtc(confirm.ts_utc)
                                        + " outside the post-window span",
                                        day, range.window_name, toString(dir));

    BreakoutDecision d;
    SimulatedTrade t;
    t.direction = dir;
    t.confirm_time = confirm.ts_utc;
    t.rr = risk_.primaryRr();
    const std::size_t first_post = firstBarAtOrAfter(bars, range.span.end + 1);
    t.bars_to_entry = static_cast<int>(k - first_post) + 1;

    const double sign = dir == Direction::Up ? 1.0 : -1.0;
    const double buffer = risk_.entry_buffer_ticks * tick_size_;
    if (risk_.entry_mode == EntryMode::Close) {
        t.entry_price = confirm.close + sign * buffer;
        t.entry_time = confirm.ts_utc + BAR_SECONDS;
    } else {
        const std::size_t n = k + 1;
        if (n >= bars.size() || bars[n].ts_utc >= session_end) {
            d.reason = NoTradeReason::NoFill;
            return d;
        }
        t.entry_price = bars[n].open + sign * buffer;
        t.entry_time = bars[n].ts_utc;
        ++t.bars_to_entry;
    }
    t.scan_index = k + 1;

    const double edge = dir == Direction::Up ? range.high : range.low;
    if (risk_.stop_mode == StopMode::Full)
        t.stop_price = dir == Direction::Up ? range.low : range.high;
    else
        t.stop_price = range.midpoint;

    if (risk_.max_stop_ticks) {
        const double stop_ticks = std::abs(t.entry_price - t.stop_price) / tick_size_;
        if (stop_ticks > *risk_.max_stop_ticks + PRICE_EPS) {
            d.reason = NoTradeReason::StopTooWide;
            return d;
        }
    }

    t.anchor_price = risk_.risk_anchor == RiskAnchor::OrbEdge ? edge : t.entry_price;
    const double risk = std::abs(t.anchor_price - t.stop_price);
    if (risk <= PRICE_EPS) {
        d.reason = NoTradeReason::ZeroRisk;
        return d;
    }
    t.risk_ticks = risk / tick_size_;
    t.target_price = t.anchor_price + sign * t.rr * risk;

    if (!std::isfinite(t.entry_price) || !std::isfinite(t.target_price) || !std::isfinite(t.risk_ticks))
        throw ComputationIntegrityError("non-finite trade levels", day, range.window_name, toString(dir));

    d.trade = t;
    return d;
}

TradePath BreakoutSimulator::resolve(const SimulatedTrade& trade,
                                     const std::vector<Bar>& bars,
                                     std::int64_t session_end) const {
    TradePath path;
    const bool up = trade.direction == Direction::Up;
    for (std::size_t i = trade.scan_index; i < bars.size() && bars[i].ts_utc < session_end; ++i) {
        const Bar& b = bars[i];
        const double fav = up ? (b.high - trade.entry_price) : (trade.entry_price - b.low);
        const double adv = up ? (trade.entry_price - b.low) : (b.high - trade.entry_price);
        path.mfe_ticks = std::max(path.mfe_ticks, fav / tick_size_);
        path.mae_ticks = std::max(path.mae_ticks, adv / tick_size_);

        const bool stop_hit = up ? b.low <= trade.stop_price : b.high >= trade.stop_price;
        const bool target_hit = up ? b.high >= trade.target_price : b.low <= trade.target_price;
        if (stop_hit) {
            path.exit = ExitKind::Stop;
            path.exit_time = b.ts_utc;
            return path;
        }
        if (target_hit) {
            path.exit = ExitKind::Target;
            path.exit_time = b.ts_utc;
            return path;
        }
    }
    return path;
}

SimulatedTrade BreakoutSimulator::retarget(const SimulatedTrade& trade, double rr) const {
    SimulatedTrade t = trade;
    const double sign = trade.direction == Direction::Up ? 1.0 : -1.0;
    t.rr = rr;
    t.target_price = trade.anchor_price + sign * rr * std::abs(trade.anchor_price - trade.stop_price);
    return t;
}

} // namespace orb
