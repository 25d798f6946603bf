#include "pipeline.hpp"
#include "errors.hpp"
#include "feature_assembler.hpp"
#include "range_builder.hpp"
#include "session_context.hpp"
#include <algorithm>
#include <cmath>

namespace orb {

namespace {

// Calendar days searched for the previous trading day across closed markets.
constexpr int PRIOR_DAY_LOOKBACK = 7;

} // namespace

FeaturePipeline::FeaturePipeline(const PipelineConfig& cfg,
                                 const IBarStore& store,
                                 FeatureTable& table,
                                 std::ostream& log,
                                 std::ostream& err)
    : cfg_(cfg)
    , clock_(cfg.reference_zone, cfg.day_open_minute)
    , store_(store)
    , table_(table)
    , log_(log)
    , err_(err)
{
    if (cfg_.version.empty())
        throw InputValidationError("pipeline configuration has not been validated");
}

std::vector<Bar> FeaturePipeline::loadDayBars(absl::CivilDay day) const {
    const UtcSpan span = clock_.loadSpan(day, cfg_.allWindows());
    std::vector<Bar> bars = store_.getBars(cfg_.instrument.symbol, span.start, span.end, "1m");

    std::int64_t prev = span.start - 1;
    for (const Bar& b : bars) {
        if (b.ts_utc <= prev)
            throw InputValidationError("bars out of order or duplicated at " + formatUtc(b.ts_utc));
        if (b.ts_utc % BAR_SECONDS != 0 || b.ts_utc >= span.end)
            throw InputValidationError("bar timestamp " + std::to_string(b.ts_utc) + " outside the requested minutes");
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low)
            || !std::isfinite(b.close) || b.high < b.low)
            throw InputValidationError("malformed bar at " + formatUtc(b.ts_utc));
        prev = b.ts_utc;
    }
    return bars;
}

std::vector<FeatureRow> FeaturePipeline::computeDay(absl::CivilDay day) {
    DayRecord record;
    return buildDay(day, record);
}

std::vector<FeatureRow> FeaturePipeline::buildDay(absl::CivilDay day, DayRecord& record) {
    const std::vector<Bar> bars = loadDayBars(day);
    const std::int64_t session_end = clock_.sessionEnd(day);
    const double tick = cfg_.instrument.tick_size;
    const std::string day_text = formatDay(day);

    DayContext ctx;
    ctx.prior_day = [this, day](const std::string& window, Direction dir) {
        return priorDayOutcome(window, dir, day);
    };
    ctx.sessions = buildSessionLevels(day, cfg_.instrument.context_windows, clock_, bars, tick);
    ctx.atr_20_ticks = averageRange(
        table_.recentAtrBasis(cfg_.instrument.symbol, day_text, cfg_.version, ATR_DAYS));
    ctx.rsi_time = clock_.instantOf(day, RSI_MINUTE_OF_DAY);
    ctx.rsi_0030 = rsiAt(bars, ctx.rsi_time);
    if (const SessionLevel* basis = findSession(ctx.sessions, ATR_SESSION))
        record.atr_basis_ticks = basis->range_ticks;

    std::vector<FeatureRow> rows;
    int seq = 0;
    for (const WindowConfig& wc : cfg_.instrument.orb_windows) {
        const UtcSpan span = clock_.windowSpan(day, wc.window);
        const auto range = buildRange(day, wc.window, span, bars, tick);

        std::vector<FeatureRow> window_rows;
        for (Direction dir : {Direction::Up, Direction::Down}) {
            SlotResult slot = simulateSlot(cfg_, wc, day, range, dir, bars, session_end);
            window_rows.push_back(assembleRow(cfg_, day, wc, seq, dir, span.end, slot, ctx));
        }
        // Later windows of the day see this one as context.
        ctx.rows.insert(ctx.rows.end(), window_rows.begin(), window_rows.end());
        rows.insert(rows.end(), window_rows.begin(), window_rows.end());
        ++seq;
    }
    return rows;
}

ContextOutcome FeaturePipeline::priorDayOutcome(const std::string& window,
                                                Direction dir,
                                                absl::CivilDay day) const {
    const std::string& symbol = cfg_.instrument.symbol;
    for (int back = 1; back <= PRIOR_DAY_LOOKBACK; ++back) {
        const std::string prev = formatDay(day - back);
        const std::optional<DayRecord> rec = table_.readDay(symbol, prev);
        if (!rec || rec->config_version != cfg_.version) return ContextOutcome::Unknown;
        if (rec->status == DayStatus::Fail) return ContextOutcome::Unknown;
        if (rec->status == DayStatus::Skip) {
            if (rec->market_closed) continue;
            return ContextOutcome::Unknown;
        }
        const std::optional<FeatureRow> row = table_.readRow(symbol, prev, window, dir);
        if (!row) return ContextOutcome::Unknown;
        if (row->range_defined) return toContextOutcome(row->outcome);
    }
    return ContextOutcome::Unknown;
}

BatchSummary FeaturePipeline::run(absl::CivilDay from, absl::CivilDay to) {
    if (to < from)
        throw InputValidationError("date range ends before it starts: " + formatDay(from) + " > " + formatDay(to));

    BatchSummary summary;
    summary.from_day = formatDay(from);
    summary.to_day = formatDay(to);

    log_ << "Building " << cfg_.instrument.symbol << " features " << summary.from_day << " .. "
         << summary.to_day << " (" << cfg_.version << ")\n";

    for (absl::CivilDay day = from; day <= to; ++day) {
        DayReport rep;
        rep.day = formatDay(day);
        DayRecord record;
        record.instrument = cfg_.instrument.symbol;
        record.day = rep.day;
        record.config_version = cfg_.version;
        std::vector<FeatureRow> rows;

        try {
            rows = buildDay(day, record);
            const bool any_range = std::any_of(rows.begin(), rows.end(),
                                               [](const FeatureRow& r) { return r.range_defined; });
            if (!any_range) {
                rep.status = DayStatus::Skip;
                rep.reason = "no bars in any ORB window";
                record.market_closed = true;
                rows.clear();
            }
        } catch (const DataGapError& e) {
            rep.status = DayStatus::Skip;
            rep.reason = e.what();
            rows.clear();
        } catch (const InputValidationError& e) {
            rep.status = DayStatus::Fail;
            rep.reason = e.what();
            rows.clear();
        }
        record.status = rep.status;
        record.reason = rep.reason;
        if (rep.status != DayStatus::Ok) record.atr_basis_ticks.reset();

        // Skipped and failed days are written without rows so stale ones go away.
        table_.write(cfg_.instrument.symbol, rows, rep.day, rep.day, { record });

        rep.rows = rows.size();
        for (const auto& r : rows) {
            if (r.direction == Direction::Up && !r.range_defined) ++rep.undefined_ranges;
            if (r.entry_time) ++rep.trades;
            if (r.outcome == Outcome::Win) ++rep.wins;
            if (r.outcome == Outcome::Loss) ++rep.losses;
        }

        switch (rep.status) {
            case DayStatus::Ok: ++summary.days_ok; break;
            case DayStatus::Skip: ++summary.days_skipped; break;
            case DayStatus::Fail: ++summary.days_failed; break;
        }
        summary.rows_written += rep.rows;
        summary.undefined_ranges += rep.undefined_ranges;

        log_ << rep.day << " " << toString(rep.status);
        if (rep.status == DayStatus::Ok) {
            log_ << " rows=" << rep.rows << " trades=" << rep.trades
                 << " W/L=" << rep.wins << "/" << rep.losses;
            if (rep.undefined_ranges > 0) log_ << " undefined_ranges=" << rep.undefined_ranges;
        } else {
            log_ << " " << rep.reason;
        }
        log_ << "\n";
        if (rep.status == DayStatus::Fail)
            err_ << "Day " << rep.day << " failed: " << rep.reason << "\n";

        summary.days.push_back(rep);
    }
    return summary;
}

} // namespace orb
