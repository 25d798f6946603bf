#pragma once

#include "order.hpp"
#include "outcome.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Which way the previous window had broken by the time the current one closed.
enum class BreakState { Up, Down, None, Unknown };

/// State of the previous window's trade (or of yesterday's row) seen from now.
enum class ContextOutcome { Win, Loss, Open, NoTrade, Unknown };

const char* toString(BreakState b);
const char* toString(ContextOutcome c);
BreakState parseBreakState(const std::string& s);
ContextOutcome parseContextOutcome(const std::string& s);
ContextOutcome toContextOutcome(Outcome o);

/// Result for one of the secondary RR targets of a slot.
struct TargetResult {
    double rr{0};
    Outcome outcome{Outcome::NoTrade};
    double r_multiple{0};
    double r_multiple_gross{0};

    bool operator==(const TargetResult& o) const {
        return rr == o.rr && outcome == o.outcome && r_multiple == o.r_multiple
            && r_multiple_gross == o.r_multiple_gross;
    }
    bool operator!=(const TargetResult& o) const { return !(*this == o); }
};

/// High/low of one context session (PRE_ASIA, ASIA, LONDON, ...) of a day.
struct SessionLevel {
    std::string name;
    double high{0};
    double low{0};
    double range_ticks{0};
    int bar_count{0};
    std::int64_t end_time{0};   // UTC end of the session window; visible from then on

    bool operator==(const SessionLevel& o) const {
        return name == o.name && high == o.high && low == o.low && range_ticks == o.range_ticks
            && bar_count == o.bar_count && end_time == o.end_time;
    }
    bool operator!=(const SessionLevel& o) const { return !(*this == o); }
};

/// One persisted row per (instrument, day, window, direction).
/// Optional fields are NULL in the table.
struct FeatureRow {
    std::string instrument;
    std::string day;             // trading day, YYYY-MM-DD
    std::string window_name;
    Direction direction{Direction::Up};
    int window_seq{0};           // chronological position of the window within the day
    std::string config_version;

    bool range_defined{false};
    std::optional<double> orb_high;
    std::optional<double> orb_low;
    std::optional<double> orb_size_ticks;
    int orb_bar_count{0};

    Outcome outcome{Outcome::NoTrade};
    double r_multiple{0};
    double r_multiple_gross{0};
    double rr{0};

    std::optional<std::int64_t> break_time;   // confirming bar in this direction, policy aside
    std::optional<double> risk_ticks;
    std::optional<double> mae_ticks;
    std::optional<double> mfe_ticks;
    std::optional<std::int64_t> entry_time;
    std::optional<double> entry_price;
    std::optional<double> stop_price;
    std::optional<double> target_price;
    std::optional<std::int64_t> exit_time;
    std::optional<int> entry_delay_bars;      // post-window bars up to and including the fill bar
    std::string note;

    std::string prior_window_name;
    BreakState prior_window_break{BreakState::Unknown};
    ContextOutcome prior_window_outcome{ContextOutcome::Unknown};
    ContextOutcome prior_day_outcome{ContextOutcome::Unknown};

    // Session context, restricted to what had closed by the window end.
    std::string pre_session_name;                // configured for the window; may be empty
    std::optional<double> pre_session_range_ticks;
    std::optional<double> atr_20_ticks;          // earlier days only
    std::string asia_type_code;
    std::string london_type_code;
    std::string pre_ny_type_code;
    std::optional<double> rsi_0030;
    std::vector<SessionLevel> sessions;          // in end_time order

    std::vector<TargetResult> targets;  // rr_targets[1..]

    bool operator==(const FeatureRow& o) const;
    bool operator!=(const FeatureRow& o) const { return !(*this == o); }
};

enum class DayStatus { Ok, Skip, Fail };

const char* toString(DayStatus s);
DayStatus parseDayStatus(const std::string& s);

/// Per-day bookkeeping stored beside the rows. Tells a closed market apart
/// from a day that could not be built.
struct DayRecord {
    std::string instrument;
    std::string day;
    std::string config_version;
    DayStatus status{DayStatus::Ok};
    std::string reason;
    bool market_closed{false};            // skipped because no ORB window had bars
    std::optional<double> atr_basis_ticks;  // full ASIA range, input to later days' ATR
};

} // namespace orb
