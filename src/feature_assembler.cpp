#include "feature_assembler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace orb {

//-----------------------------------------------------------------------------
// Row types
//-----------------------------------------------------------------------------
const char* toString(BreakState b) {
    switch (b) {
        case BreakState::Up: return "UP";
        case BreakState::Down: return "DOWN";
        case BreakState::None: return "NONE";
        case BreakState::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(ContextOutcome c) {
    switch (c) {
        case ContextOutcome::Win: return "WIN";
        case ContextOutcome::Loss: return "LOSS";
        case ContextOutcome::Open: return "OPEN";
        case ContextOutcome::NoTrade: return "NO_TRADE";
        case ContextOutcome::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

BreakState parseBreakState(const std::string& s) {
    if (s == "UP") return BreakState::Up;
    if (s == "DOWN") return BreakState::Down;
    if (s == "NONE") return BreakState::None;
    if (s == "UNKNOWN") return BreakState::Unknown;
    throw InputValidationError("unknown break state \"" + s + "\"");
}

ContextOutcome parseContextOutcome(const std::string& s) {
    if (s == "WIN") return ContextOutcome::Win;
    if (s == "LOSS") return ContextOutcome::Loss;
    if (s == "OPEN") return ContextOutcome::Open;
    if (s == "NO_TRADE") return ContextOutcome::NoTrade;
    if (s == "UNKNOWN") return ContextOutcome::Unknown;
    throw InputValidationError("unknown context outcome \"" + s + "\"");
}

ContextOutcome toContextOutcome(Outcome o) {
    switch (o) {
        case Outcome::Win: return ContextOutcome::Win;
        case Outcome::Loss: return ContextOutcome::Loss;
        case Outcome::NoTrade: return ContextOutcome::NoTrade;
    }
    return ContextOutcome::Unknown;
}

const char* toString(DayStatus s) {
    switch (s) {
        case DayStatus::Ok: return "ok";
        case DayStatus::Skip: return "skip";
        case DayStatus::Fail: return "fail";
    }
    return "fail";
}

DayStatus parseDayStatus(const std::string& s) {
    if (s == "ok") return DayStatus::Ok;
    if (s == "skip") return DayStatus::Skip;
    if (s == "fail") return DayStatus::Fail;
    throw InputValidationError("unknown day status \"" + s + "\"");
}

bool FeatureRow::operator==(const FeatureRow& o) const {
    return instrument == o.instrument && day == o.day && window_name == o.window_name
        && direction == o.direction && window_seq == o.window_seq && config_version == o.config_version
        && range_defined == o.range_defined && orb_high == o.orb_high && orb_low == o.orb_low
        && orb_size_ticks == o.orb_size_ticks && orb_bar_count == o.orb_bar_count
        && outcome == o.outcome && r_multiple == o.r_multiple && r_multiple_gross == o.r_multiple_gross
        && rr == o.rr && break_time == o.break_time && risk_ticks == o.risk_ticks
        && mae_ticks == o.mae_ticks && mfe_ticks == o.mfe_ticks && entry_time == o.entry_time
        && entry_price == o.entry_price && stop_price == o.stop_price && target_price == o.target_price
        && exit_time == o.exit_time && entry_delay_bars == o.entry_delay_bars && note == o.note
        && prior_window_name == o.prior_window_name && prior_window_break == o.prior_window_break
        && prior_window_outcome == o.prior_window_outcome && prior_day_outcome == o.prior_day_outcome
        && pre_session_name == o.pre_session_name && pre_session_range_ticks == o.pre_session_range_ticks
        && atr_20_ticks == o.atr_20_ticks && asia_type_code == o.asia_type_code
        && london_type_code == o.london_type_code && pre_ny_type_code == o.pre_ny_type_code
        && rsi_0030 == o.rsi_0030 && sessions == o.sessions && targets == o.targets;
}

//-----------------------------------------------------------------------------
// Slot simulation
//-----------------------------------------------------------------------------
SlotResult simulateSlot(const PipelineConfig& cfg,
                        const WindowConfig& wc,
                        absl::CivilDay day,
                        const std::optional<OpeningRange>& range,
                        Direction dir,
                        const std::vector<Bar>& bars,
                        std::int64_t session_end) {
    SlotResult s;
    s.range = range;
    const auto& rr_targets = wc.risk.rr_targets;

    auto noTradeTargets = [&]() {
        for (std::size_t i = 1; i < rr_targets.size(); ++i) {
            TargetResult tr;
            tr.rr = rr_targets[i];
            s.targets.push_back(tr);
        }
    };

    if (!range) {
        s.reason = NoTradeReason::NoRange;
        noTradeTargets();
        return s;
    }

    try {
        BreakoutSimulator sim(wc.risk, cfg.instrument.tick_size);
        if (auto k = sim.findConfirmation(*range, dir, bars, session_end))
            s.break_time = bars[*k].ts_utc;

        BreakoutDecision d = sim.detectBreakout(*range, dir, bars, session_end);
        s.reason = d.reason;
        s.trade = d.trade;
        if (!s.trade) {
            noTradeTargets();
            return s;
        }

        s.path = sim.resolve(*s.trade, bars, session_end);
        s.primary = classifyOutcome(s.trade, s.path, s.trade->rr, cfg.instrument.cost);
        if (s.path->exit == ExitKind::Unresolved) s.reason = NoTradeReason::Unresolved;

        for (std::size_t i = 1; i < rr_targets.size(); ++i) {
            std::optional<SimulatedTrade> t = sim.retarget(*s.trade, rr_targets[i]);
            std::optional<TradePath> p = sim.resolve(*t, bars, session_end);
            Classification c = classifyOutcome(t, p, rr_targets[i], cfg.instrument.cost);
            TargetResult tr;
            tr.rr = rr_targets[i];
            tr.outcome = c.outcome;
            tr.r_multiple = c.r_multiple;
            tr.r_multiple_gross = c.r_gross;
            s.targets.push_back(tr);
        }
    } catch (const ComputationIntegrityError& e) {
        if (!e.day().empty() && !e.window().empty()) throw;
        throw ComputationIntegrityError(e.what(), formatDay(day), wc.window.name, toString(dir));
    }
    return s;
}

//-----------------------------------------------------------------------------
// Context
//-----------------------------------------------------------------------------
namespace {

bool anyRange(const std::vector<FeatureRow>& rows) {
    return std::any_of(rows.begin(), rows.end(), [](const FeatureRow& r) { return r.range_defined; });
}

} // namespace

BreakState breakAsOf(const std::vector<FeatureRow>& window_rows, std::int64_t cutoff) {
    if (!anyRange(window_rows)) return BreakState::Unknown;
    const FeatureRow* first = nullptr;
    for (const auto& r : window_rows) {
        // A break is known once its confirming bar has closed.
        if (!r.break_time || *r.break_time + BAR_SECONDS > cutoff) continue;
        if (!first || *r.break_time < *first->break_time) first = &r;
    }
    if (!first) return BreakState::None;
    return first->direction == Direction::Up ? BreakState::Up : BreakState::Down;
}

ContextOutcome outcomeAsOf(const std::vector<FeatureRow>& window_rows, std::int64_t cutoff) {
    if (!anyRange(window_rows)) return ContextOutcome::Unknown;
    const FeatureRow* entered = nullptr;
    for (const auto& r : window_rows) {
        if (!r.entry_time || *r.entry_time > cutoff) continue;
        if (!entered || *r.entry_time < *entered->entry_time) entered = &r;
    }
    if (!entered) return ContextOutcome::NoTrade;
    if (entered->exit_time && *entered->exit_time + BAR_SECONDS <= cutoff)
        return toContextOutcome(entered->outcome);
    return ContextOutcome::Open;
}

FeatureRow assembleRow(const PipelineConfig& cfg,
                       absl::CivilDay day,
                       const WindowConfig& wc,
                       int window_seq,
                       Direction dir,
                       std::int64_t window_end,
                       const SlotResult& slot,
                       const DayContext& ctx) {
    FeatureRow row;
    row.instrument = cfg.instrument.symbol;
    row.day = formatDay(day);
    row.window_name = wc.window.name;
    row.direction = dir;
    row.window_seq = window_seq;
    row.config_version = cfg.version;

    if (slot.range) {
        row.range_defined = true;
        row.orb_high = slot.range->high;
        row.orb_low = slot.range->low;
        row.orb_size_ticks = slot.range->size_ticks;
        row.orb_bar_count = slot.range->bar_count;
    }

    row.outcome = slot.primary.outcome;
    row.r_multiple = slot.primary.r_multiple;
    row.r_multiple_gross = slot.primary.r_gross;
    row.rr = wc.risk.primaryRr();
    row.break_time = slot.break_time;
    if (slot.trade) {
        row.risk_ticks = slot.trade->risk_ticks;
        row.entry_time = slot.trade->entry_time;
        row.entry_price = slot.trade->entry_price;
        row.stop_price = slot.trade->stop_price;
        row.target_price = slot.trade->target_price;
    }
    if (slot.path) {
        row.mae_ticks = slot.path->mae_ticks;
        row.mfe_ticks = slot.path->mfe_ticks;
        row.exit_time = slot.path->exit_time;
    }
    if (slot.trade) row.entry_delay_bars = slot.trade->bars_to_entry;
    row.note = toString(slot.reason);
    row.targets = slot.targets;

    if (!ctx.rows.empty()) {
        row.prior_window_name = ctx.rows.back().window_name;
        std::vector<FeatureRow> prior;
        std::copy_if(ctx.rows.begin(), ctx.rows.end(), std::back_inserter(prior),
                     [&](const FeatureRow& r) { return r.window_name == row.prior_window_name; });
        row.prior_window_break = breakAsOf(prior, window_end);
        row.prior_window_outcome = outcomeAsOf(prior, window_end);
    }

    if (ctx.prior_day) row.prior_day_outcome = ctx.prior_day(row.window_name, dir);

    row.sessions = sessionsAsOf(ctx.sessions, window_end);
    row.pre_session_name = wc.pre_session;
    if (const SessionLevel* pre = findSession(row.sessions, wc.pre_session))
        row.pre_session_range_ticks = pre->range_ticks;
    row.atr_20_ticks = ctx.atr_20_ticks;
    const SessionLevel* asia = findSession(row.sessions, "ASIA");
    const SessionLevel* london = findSession(row.sessions, "LONDON");
    row.asia_type_code = asiaTypeCode(asia, row.atr_20_ticks);
    row.london_type_code = londonTypeCode(london, asia);
    row.pre_ny_type_code = preNyTypeCode(findSession(row.sessions, "PRE_NY"), london, asia, row.atr_20_ticks);
    if (ctx.rsi_0030 && ctx.rsi_time <= window_end) row.rsi_0030 = ctx.rsi_0030;
    return row;
}

} // namespace orb
