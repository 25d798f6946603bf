#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "order.hpp"
#include "range_builder.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace orb {

/// A confirmed breakout turned into a bracket: entry, stop and target.
struct SimulatedTrade {
    Direction direction{Direction::Up};
    std::int64_t confirm_time{0};   // open time of the confirming bar
    std::int64_t entry_time{0};     // instant the fill is known
    double entry_price{0};
    double stop_price{0};
    double target_price{0};
    double anchor_price{0};         // price risk and target are measured from
    double risk_ticks{0};
    double rr{0};
    int bars_to_entry{0};           // post-window bars up to and including the fill bar
    std::size_t scan_index{0};      // first bar of the resolution scan
};

enum class ExitKind { Target, Stop, Unresolved };

const char* toString(ExitKind e);

/// How a trade played out against forward bars.
struct TradePath {
    ExitKind exit{ExitKind::Unresolved};
    std::optional<std::int64_t> exit_time;
    double mae_ticks{0};
    double mfe_ticks{0};
};

/// Why a (day, window, direction) slot has no trade.
enum class NoTradeReason {
    None,
    NoRange,        // no bars inside the window
    RangeFilter,    // range outside min/max_range_ticks
    NoBreak,        // no confirmed breakout before session end
    OppositeBreak,  // FIRST_BREAK and the other side confirmed first
    StopTooWide,    // entry-to-stop distance above max_stop_ticks
    ZeroRisk,       // stop equals the risk anchor
    NoFill,         // NEXT_OPEN and no bar left to fill on
    Unresolved      // neither stop nor target before session end
};

/// Row note text; empty for None.
const char* toString(NoTradeReason r);

struct BreakoutDecision {
    std::optional<SimulatedTrade> trade;
    NoTradeReason reason{NoTradeReason::None};
};

/// Finds confirmed breakouts of an opening range and walks the resulting
/// trade forward one bar at a time.
///
/// Only bars with window_end < ts < session_end take part, where window_end
/// is the range span's (exclusive) end. A confirmation counts consecutive
/// closes beyond the boundary; any close that is not beyond it resets the
/// count. Bars are never read past the decision point: the breakout for a
/// CLOSE entry depends only on bars up to the confirming bar.
class BreakoutSimulator {
public:
    BreakoutSimulator(const RiskConfig& risk, double tick_size);

    /// False when min/max_range_ticks exclude the range.
    bool rangeAllowed(const OpeningRange& range) const;

    /// Index into `bars` of the bar completing the confirmation in `dir`.
    std::optional<std::size_t> findConfirmation(const OpeningRange& range,
                                                Direction dir,
                                                const std::vector<Bar>& bars,
                                                std::int64_t session_end) const;

    /// Trade for `dir` under the configured direction policy, or the reason
    /// there is none. rr is the primary target. Throws ComputationIntegrityError
    /// when the confirming bar lies outside the post-window span.
    BreakoutDecision detectBreakout(const OpeningRange& range,
                                    Direction dir,
                                    const std::vector<Bar>& bars,
                                    std::int64_t session_end) const;

    /// Scan from trade.scan_index until session end. Stop is checked before
    /// target on every bar, so a bar touching both counts as STOP.
    TradePath resolve(const SimulatedTrade& trade,
                      const std::vector<Bar>& bars,
                      std::int64_t session_end) const;

    /// Same entry and stop, target moved to `rr`.
    SimulatedTrade retarget(const SimulatedTrade& trade, double rr) const;

    const RiskConfig& risk() const { return risk_; }

private:
    BreakoutDecision buildTrade(const OpeningRange& range,
                                Direction dir,
                                std::size_t confirm_index,
                                const std::vector<Bar>& bars,
                                std::int64_t session_end) const;

    RiskConfig risk_;
    double tick_size_;
};

} // namespace orb
