#pragma once

#include "config.hpp"
#include "feature_row.hpp"
#include "outcome.hpp"
#include "range_builder.hpp"
#include "session_context.hpp"
#include "simulator.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Outcome of (window, direction) on the previous trading day, UNKNOWN when
/// that day is missing or was not built cleanly.
using PriorDayLookup = std::function<ContextOutcome(const std::string& window, Direction dir)>;

/// Everything computed for one (window, direction) slot of a day.
struct SlotResult {
    std::optional<OpeningRange> range;
    NoTradeReason reason{NoTradeReason::NoRange};
    std::optional<std::int64_t> break_time;
    std::optional<SimulatedTrade> trade;
    std::optional<TradePath> path;
    Classification primary;
    std::vector<TargetResult> targets;
};

/// Backward-looking inputs for the rows of one day. Session levels and the
/// RSI carry the instant they become known; each row sees only what is known
/// by its own window end.
struct DayContext {
    std::vector<FeatureRow> rows;                 // rows of earlier windows, in window order
    std::vector<SessionLevel> sessions;           // full day, ordered by end time
    std::optional<double> atr_20_ticks;           // from earlier days
    std::optional<double> rsi_0030;
    std::int64_t rsi_time{0};
    PriorDayLookup prior_day;                     // may be empty: prior day UNKNOWN
};

/// Runs range, breakout, resolution and classification for one slot.
/// Pure function of its inputs. Integrity errors carry day, window and direction.
SlotResult simulateSlot(const PipelineConfig& cfg,
                        const WindowConfig& wc,
                        absl::CivilDay day,
                        const std::optional<OpeningRange>& range,
                        Direction dir,
                        const std::vector<Bar>& bars,
                        std::int64_t session_end);

/// Break direction of the rows of one earlier window, as known at `cutoff`.
/// UNKNOWN when the window has no rows or no defined range.
BreakState breakAsOf(const std::vector<FeatureRow>& window_rows, std::int64_t cutoff);
/// Trade state of the rows of one earlier window, as known at `cutoff`.
/// UNKNOWN when the window has no rows or no defined range.
ContextOutcome outcomeAsOf(const std::vector<FeatureRow>& window_rows, std::int64_t cutoff);

/// Builds the immutable row for one slot. `window_end` is the UTC end of the
/// slot's window: context never looks past it.
FeatureRow assembleRow(const PipelineConfig& cfg,
                       absl::CivilDay day,
                       const WindowConfig& wc,
                       int window_seq,
                       Direction dir,
                       std::int64_t window_end,
                       const SlotResult& slot,
                       const DayContext& ctx);

} // namespace orb
