/**
 * Test suite for the ORB feature pipeline (no external test framework).
 * Run: build/test_runner (or ctest from the build directory).
 */
#include "bar.hpp"
#include "bar_store.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "feature_assembler.hpp"
#include "feature_table.hpp"
#include "outcome.hpp"
#include "pipeline.hpp"
#include "range_builder.hpp"
#include "report.hpp"
#include "session_clock.hpp"
#include "session_context.hpp"
#include "simulator.hpp"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#define ASSERT_EQ(a, b) do { \
    auto _a = (a); auto _b = (b); \
    if (_a != _b) { \
        std::cerr << "FAIL: " << #a << " == " << #b << " => " << _a << " != " << _b << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tol) do { \
    auto _a = (double)(a); auto _b = (double)(b); \
    if (std::abs(_a - _b) > (tol)) { \
        std::cerr << "FAIL: " << #a << " ~= " << #b << " => " << _a << " vs " << _b << " (tol " << (tol) << ") at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

#define ASSERT_THROWS(expr, ExType) do { \
    bool _thrown = false; \
    try { expr; } catch (const ExType&) { _thrown = true; } \
    if (!_thrown) { \
        std::cerr << "FAIL: " << #expr << " did not throw " << #ExType << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
        std::exit(1); \
    } \
} while(0)

namespace orb {

std::ostream& operator<<(std::ostream& os, Outcome o) { return os << toString(o); }
std::ostream& operator<<(std::ostream& os, BreakState b) { return os << toString(b); }
std::ostream& operator<<(std::ostream& os, ContextOutcome c) { return os << toString(c); }
std::ostream& operator<<(std::ostream& os, StopMode m) { return os << toString(m); }
std::ostream& operator<<(std::ostream& os, DayStatus d) { return os << toString(d); }

} // namespace orb

namespace {

using namespace orb;

const absl::CivilDay THU(2025, 1, 9);
const absl::CivilDay FRI(2025, 1, 10);
const absl::CivilDay SAT(2025, 1, 11);
const absl::CivilDay MON(2025, 1, 13);

const SessionClock& brisbane() {
    static const SessionClock clock("Australia/Brisbane", 9 * 60);
    return clock;
}

/// UTC epoch of hh:mm Brisbane time on calendar day `day`.
std::int64_t at(absl::CivilDay day, int hh, int mm) {
    return brisbane().toUtc(absl::CivilMinute(day) + (hh * 60 + mm));
}

Bar bar(std::int64_t ts, double o, double h, double l, double c) {
    Bar b;
    b.ts_utc = ts;
    b.open = o;
    b.high = h;
    b.low = l;
    b.close = c;
    b.volume = 10;
    return b;
}

std::string str(const char* s) { return s; }

//-----------------------------------------------------------------------------
// Fixtures
//-----------------------------------------------------------------------------

// MGC with a single one-minute 10:00 window, gross R.
PipelineConfig singleWindowConfig(double rr) {
    PipelineConfig cfg;
    cfg.instrument = builtinInstrument("MGC");
    cfg.instrument.cost.reset();
    cfg.instrument.context_windows.clear();
    WindowConfig wc;
    wc.window = makeOrbWindow("10:00", 1);
    wc.risk.rr_targets = { rr };
    cfg.instrument.orb_windows = { wc };
    return validateConfig(cfg);
}

// Range 2648-2650 at 10:00, UP confirmed by the 10:02 close at 2650.5.
// `last` decides the outcome.
std::vector<Bar> breakoutBars(const Bar& last) {
    return {
        bar(at(FRI, 10, 0), 2649, 2650, 2648, 2649),
        bar(at(FRI, 10, 2), 2649.5, 2650.6, 2649.4, 2650.5),
        bar(at(FRI, 10, 3), 2650.5, 2652, 2649, 2651.5),
        last,
    };
}

Bar winningBar() { return bar(at(FRI, 10, 4), 2651.5, 2654, 2651, 2653.8); }
Bar losingBar() { return bar(at(FRI, 10, 4), 2650, 2651, 2648, 2648.5); }

OpeningRange rangeOf(double high, double low) {
    OpeningRange r;
    r.day = FRI;
    r.window_name = "1000";
    r.high = high;
    r.low = low;
    r.size_ticks = (high - low) / 0.1;
    r.midpoint = (high + low) / 2;
    r.bar_count = 1;
    r.span = { at(FRI, 10, 0), at(FRI, 10, 1) };
    return r;
}

// MGC 0900 and 1000 five-minute windows with PRE_ASIA context, gross R.
PipelineConfig twoWindowConfig(const std::vector<double>& rr) {
    PipelineConfig cfg;
    cfg.instrument = builtinInstrument("MGC");
    cfg.instrument.cost.reset();
    cfg.instrument.orb_windows = selectWindows(cfg.instrument.orb_windows, { "0900", "1000" });
    for (auto& wc : cfg.instrument.orb_windows) wc.risk.rr_targets = rr;
    return validateConfig(cfg);
}

std::vector<Bar> twoDayBars();

// 0900 on `day` breaks UP at 09:06 and reaches the 1R target at 10:00.
std::vector<Bar> winningDayBars(absl::CivilDay day) {
    return {
        bar(at(day, 7, 0), 2600, 2602, 2599, 2601),
        bar(at(day, 8, 59), 2601, 2603, 2600, 2602),
        bar(at(day, 9, 0), 2601, 2605, 2600, 2604),
        bar(at(day, 9, 4), 2604, 2605, 2601, 2602),
        bar(at(day, 9, 6), 2603, 2606, 2603, 2605.5),
        bar(at(day, 9, 7), 2605.5, 2610.2, 2605, 2610),
        bar(at(day, 10, 0), 2610, 2612, 2609, 2611),
        bar(at(day, 10, 4), 2611, 2611.5, 2609.5, 2610),
    };
}

// Thursday as Friday in twoDayBars: 0900 UP wins.
std::vector<Bar> threeDayBars() {
    std::vector<Bar> bars = winningDayBars(THU);
    for (const Bar& b : twoDayBars()) bars.push_back(b);
    return bars;
}

// Friday: 0900 breaks UP and wins before the 1000 window. Monday: 0900 breaks
// UP and loses. Nothing trades over the weekend.
std::vector<Bar> twoDayBars() {
    return {
        bar(at(FRI, 7, 0), 2600, 2602, 2599, 2601),
        bar(at(FRI, 8, 59), 2601, 2603, 2600, 2602),
        bar(at(FRI, 9, 0), 2601, 2605, 2600, 2604),
        bar(at(FRI, 9, 4), 2604, 2605, 2601, 2602),
        bar(at(FRI, 9, 6), 2603, 2606, 2603, 2605.5),
        bar(at(FRI, 9, 7), 2605.5, 2610.2, 2605, 2610),
        bar(at(FRI, 10, 0), 2610, 2612, 2609, 2611),
        bar(at(FRI, 10, 4), 2611, 2611.5, 2609.5, 2610),

        bar(at(MON, 7, 0), 2600, 2601, 2599, 2600),
        bar(at(MON, 8, 59), 2600, 2601, 2599.5, 2600.5),
        bar(at(MON, 9, 0), 2601, 2605, 2600, 2604),
        bar(at(MON, 9, 4), 2604, 2605, 2601, 2602),
        bar(at(MON, 9, 6), 2603, 2606, 2603, 2605.5),
        bar(at(MON, 9, 7), 2605.5, 2606, 2599.5, 2600),
        bar(at(MON, 10, 0), 2600, 2602, 2599, 2601),
        bar(at(MON, 10, 4), 2601, 2601.5, 2599.5, 2600),
    };
}

/// Fails the span of one day's load, passes everything else through.
class GapStore : public IBarStore {
public:
    GapStore(const IBarStore& inner, std::int64_t fail_start) : inner_(inner), fail_start_(fail_start) {}

    std::vector<Bar> getBars(const std::string& instrument,
                             std::int64_t start_utc,
                             std::int64_t end_utc,
                             const std::string& resolution) const override {
        if (start_utc == fail_start_) throw DataGapError("bar archive unavailable");
        return inner_.getBars(instrument, start_utc, end_utc, resolution);
    }

private:
    const IBarStore& inner_;
    std::int64_t fail_start_;
};

//--- SessionClock: trading day boundaries and the after-midnight window
void run_session_clock_trading_day() {
    const SessionClock& clock = brisbane();
    ASSERT_EQ(formatDay(clock.toTradingDay(at(FRI, 9, 0))), str("2025-01-10"));
    ASSERT_EQ(formatDay(clock.toTradingDay(at(FRI, 8, 59))), str("2025-01-09"));
    ASSERT_EQ(formatDay(clock.toTradingDay(at(SAT, 0, 30))), str("2025-01-10"));
    ASSERT_EQ(formatDay(clock.toTradingDay(at(SAT, 8, 59))), str("2025-01-10"));

    const UtcSpan day = clock.daySpan(FRI);
    ASSERT_EQ(day.start, at(FRI, 9, 0));
    ASSERT_EQ(day.end - day.start, 86400);
    ASSERT_EQ(clock.sessionEnd(FRI), at(SAT, 9, 0));

    // 00:30 Brisbane on Saturday is 14:30 UTC on Friday.
    const UtcSpan late = clock.windowSpan(FRI, makeOrbWindow("00:30"));
    ASSERT_EQ(late.start, *parseUtcTimestamp("2025-01-10T14:30:00Z"));
    ASSERT_EQ(late.end - late.start, 300);

    const SessionWindow pre = defaultContextWindows()[0];
    ASSERT_EQ(pre.name, str("PRE_ASIA"));
    const UtcSpan pre_span = clock.windowSpan(FRI, pre);
    ASSERT_EQ(pre_span.start, at(FRI, 7, 0));
    ASSERT_EQ(pre_span.end, at(FRI, 9, 0));

    std::vector<SessionWindow> windows = { makeOrbWindow("09:00"), makeOrbWindow("00:30"), pre };
    ASSERT_EQ(*clock.classify(at(SAT, 0, 33), windows, FRI), str("0030"));
    ASSERT_EQ(*clock.classify(at(FRI, 7, 15), windows, FRI), str("PRE_ASIA"));
    ASSERT_TRUE(!clock.classify(at(FRI, 9, 5), windows, FRI));

    const UtcSpan load = clock.loadSpan(FRI, windows);
    ASSERT_EQ(load.start, at(FRI, 7, 0));
    ASSERT_EQ(load.end, at(SAT, 9, 0));
    ASSERT_EQ(clock.formatLocal(at(FRI, 10, 5)), str("2025-01-10 10:05"));

    // Sessions before the open belong to the next calendar day; PRE_NY wraps midnight.
    const std::vector<SessionWindow> ctx = defaultContextWindows();
    ASSERT_EQ(clock.windowSpan(FRI, ctx[4]).start, at(FRI, 23, 0));
    ASSERT_EQ(clock.windowSpan(FRI, ctx[4]).end, at(SAT, 0, 30));
    ASSERT_EQ(clock.windowSpan(FRI, ctx[5]).start, at(SAT, 0, 30));
    ASSERT_EQ(clock.windowSpan(FRI, ctx[5]).end, at(SAT, 2, 0));
    ASSERT_EQ(clock.instantOf(FRI, 30), at(SAT, 0, 30));
    ASSERT_EQ(clock.instantOf(FRI, 18 * 60), at(FRI, 18, 0));
}

//--- SessionClock: US daylight-saving changes do not move Brisbane windows
void run_session_clock_dst_invariance() {
    const SessionClock& clock = brisbane();
    const SessionWindow w2300 = makeOrbWindow("23:00");
    const SessionWindow w0030 = makeOrbWindow("00:30");
    for (absl::CivilDay first : { absl::CivilDay(2025, 3, 7), absl::CivilDay(2025, 10, 31) }) {
        for (int i = 0; i < 5; ++i) {
            const absl::CivilDay day = first + i;
            const std::int64_t civil_as_utc =
                absl::ToUnixSeconds(absl::FromCivil(absl::CivilMinute(day), absl::UTCTimeZone()));
            ASSERT_EQ(clock.daySpan(day).start, civil_as_utc + 9 * 3600 - 10 * 3600);
            ASSERT_EQ(clock.windowSpan(day, w2300).start, civil_as_utc + 23 * 3600 - 10 * 3600);
            ASSERT_EQ(clock.windowSpan(day, w0030).start, civil_as_utc + 86400 + 1800 - 10 * 3600);
            ASSERT_EQ(clock.daySpan(day).end - clock.daySpan(day).start, 86400);
            ASSERT_EQ(clock.utcOffsetSeconds(clock.daySpan(day).start), 36000);
        }
    }

    // The same dates do move New York.
    SessionClock ny("America/New_York", 9 * 60);
    ASSERT_EQ(ny.utcOffsetSeconds(*parseUtcTimestamp("2025-03-08T12:00:00Z")), -18000);
    ASSERT_EQ(ny.utcOffsetSeconds(*parseUtcTimestamp("2025-03-10T12:00:00Z")), -14400);
}

void run_session_clock_rejects_bad_input() {
    ASSERT_THROWS(SessionClock("Not/AZone"), InputValidationError);
    ASSERT_THROWS(parseClockTime("25:00"), InputValidationError);
    ASSERT_THROWS(parseClockTime("9am"), InputValidationError);
    ASSERT_THROWS(parseDay("2025-13-01"), InputValidationError);
    ASSERT_THROWS(brisbane().toTradingDay(at(FRI, 10, 0) + 30), InputValidationError);
    ASSERT_EQ(parseClockTime("0030"), 30);
    ASSERT_EQ(formatClockTime(parseClockTime("23:00")), str("23:00"));
}

//--- DataSource: timestamp forms and CSV load
void run_data_source_timestamps() {
    const std::int64_t expected = 1736467500;  // 2025-01-10 00:05:00 UTC
    ASSERT_EQ(*parseUtcTimestamp("2025-01-10T00:05:00Z"), expected);
    ASSERT_EQ(*parseUtcTimestamp("2025-01-10 00:05:00"), expected);
    ASSERT_EQ(*parseUtcTimestamp("2025-01-10T10:05:00+10:00"), expected);
    ASSERT_EQ(*parseUtcTimestamp("2025-01-10T00:05:00.000000000Z"), expected);
    ASSERT_EQ(*parseUtcTimestamp("2025-01-10T00_05_00.000000000Z"), expected);
    ASSERT_EQ(*parseUtcTimestamp("1736467500"), expected);
    ASSERT_TRUE(!parseUtcTimestamp("yesterday"));
    ASSERT_TRUE(!parseUtcTimestamp(""));
    ASSERT_EQ(formatUtc(expected), str("2025-01-10T00:05:00Z"));
}

void run_data_source_csv_load() {
    std::string csv = "ts_utc,open,high,low,close,volume,symbol\n"
                      "2025-01-10T00:01:00Z,2649.5,2650.6,2649.4,2650.5,12,MGCG5\n"
                      "2025-01-10T00:00:00Z,2649,2650,2648,2649,30,MGCG5\n"
                      "2025-01-10T00:00:00Z,1,1,1,1,1,MGCJ5\n"
                      "2025-01-10T00:02:00Z,abc,2652,2649,2651.5,7,MGCG5\n";
    std::string path = "test_sample_bars.csv";
    {
        std::ofstream f(path);
        f << csv;
    }
    DataSource ds(path);
    bool ok = ds.load("mgcg5");
    ASSERT_EQ(ok, true);
    ASSERT_EQ(ds.size(), 2u);
    ASSERT_EQ(ds.skippedRows(), 1u);
    ASSERT_EQ(ds.at(0).ts_utc, *parseUtcTimestamp("2025-01-10T00:00:00Z"));
    ASSERT_NEAR(ds.at(0).open, 2649, 1e-9);
    ASSERT_NEAR(ds.at(1).close, 2650.5, 1e-9);
    ASSERT_NEAR(ds.at(1).volume, 12, 1e-9);

    // Both contracts together collide on the same minute.
    DataSource both(path);
    ASSERT_THROWS(both.load(), InputValidationError);
    std::remove(path.c_str());

    DataSource missing("no_such_file.csv");
    ASSERT_EQ(missing.load(), false);
    ASSERT_TRUE(!missing.lastError().empty());
}

void run_data_source_bad_timestamp() {
    std::string path = "test_bad_ts.csv";
    {
        std::ofstream f(path);
        f << "timestamp,open,high,low,close\n"
             "2025-01-10T00:00:00Z,1,2,0.5,1.5\n"
             "not-a-time,1,2,0.5,1.5\n";
    }
    DataSource ds(path);
    ASSERT_THROWS(ds.load(), InputValidationError);
    std::remove(path.c_str());
}

//--- Bar stores
void run_bar_store_memory() {
    MemoryBarStore store;
    std::vector<Bar> bars = breakoutBars(winningBar());
    std::swap(bars[0], bars[3]);
    store.setBars("mgc", bars);
    ASSERT_EQ(store.size("MGC"), 4u);

    std::vector<Bar> got = store.getBars("MGC", at(FRI, 10, 0), at(FRI, 10, 4));
    ASSERT_EQ(got.size(), 3u);
    ASSERT_EQ(got[0].ts_utc, at(FRI, 10, 0));
    ASSERT_EQ(got[2].ts_utc, at(FRI, 10, 3));
    ASSERT_TRUE(store.getBars("NQ", at(FRI, 10, 0), at(FRI, 11, 0)).empty());

    // 10:00-10:04 land in one five-minute bucket.
    std::vector<Bar> five = store.getBars("MGC", at(FRI, 10, 0), at(FRI, 10, 5), "5m");
    ASSERT_EQ(five.size(), 1u);
    ASSERT_NEAR(five[0].open, 2649, 1e-9);
    ASSERT_NEAR(five[0].high, 2654, 1e-9);
    ASSERT_NEAR(five[0].low, 2648, 1e-9);
    ASSERT_NEAR(five[0].close, 2653.8, 1e-9);
    ASSERT_NEAR(five[0].volume, 40, 1e-9);

    std::vector<Bar> dup = { bar(at(FRI, 10, 0), 1, 1, 1, 1), bar(at(FRI, 10, 0), 2, 2, 2, 2) };
    ASSERT_THROWS(store.setBars("MGC", dup), InputValidationError);
    ASSERT_THROWS(resolutionMinutes("7x"), InputValidationError);
    ASSERT_EQ(resolutionMinutes("1h"), 60);
}

void run_bar_store_sqlite() {
    SqliteBarStore store(":memory:");
    std::vector<Bar> bars = breakoutBars(winningBar());
    store.insertBars("MGC", bars);
    store.insertBars("MGC", { bar(at(FRI, 10, 3), 1, 3, 0.5, 2) });  // replaces 10:03

    std::vector<Bar> got = store.getBars("MGC", at(FRI, 10, 0), at(FRI, 11, 0));
    ASSERT_EQ(got.size(), 4u);
    ASSERT_EQ(got[1].ts_utc, at(FRI, 10, 2));
    ASSERT_NEAR(got[1].close, 2650.5, 1e-12);
    ASSERT_NEAR(got[2].high, 3, 1e-12);
    ASSERT_EQ(got[3].ts_utc, at(FRI, 10, 4));
    ASSERT_TRUE(store.getBars("NQ", at(FRI, 10, 0), at(FRI, 11, 0)).empty());
}

//--- Range builder
void run_range_builder() {
    const SessionWindow w = makeOrbWindow("10:00", 5);
    const UtcSpan span = brisbane().windowSpan(FRI, w);
    std::vector<Bar> bars = {
        bar(at(FRI, 9, 59), 2600, 2700, 2500, 2600),  // before the window
        bar(at(FRI, 10, 0), 2649, 2650, 2648.5, 2649),
        bar(at(FRI, 10, 4), 2649, 2649.5, 2648, 2649),
        bar(at(FRI, 10, 5), 2600, 2700, 2500, 2600),  // window end is exclusive
    };
    auto r = buildRange(FRI, w, span, bars, 0.1);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->window_name, str("1000"));
    ASSERT_NEAR(r->high, 2650, 1e-9);
    ASSERT_NEAR(r->low, 2648, 1e-9);
    ASSERT_NEAR(r->size_ticks, 20, 1e-6);
    ASSERT_NEAR(r->midpoint, 2649, 1e-9);
    ASSERT_EQ(r->bar_count, 2);

    std::vector<Bar> outside = { bars[0], bars[3] };
    ASSERT_TRUE(!buildRange(FRI, w, span, outside, 0.1));

    std::vector<Bar> inverted = { bar(at(FRI, 10, 1), 2649, 2648, 2650, 2649) };
    ASSERT_THROWS(buildRange(FRI, w, span, inverted, 0.1), ComputationIntegrityError);
}

//--- Breakout confirmation
void run_confirmation_closes() {
    const OpeningRange r = rangeOf(2650, 2648);
    std::vector<Bar> bars = {
        bar(at(FRI, 10, 0), 2649, 2650, 2648, 2649),
        bar(at(FRI, 10, 2), 2649.5, 2650.6, 2649.4, 2650.5),  // beyond
        bar(at(FRI, 10, 3), 2650.5, 2650.6, 2649.8, 2649.9),  // back inside, resets
        bar(at(FRI, 10, 4), 2649.9, 2650.3, 2649.8, 2650.2),  // beyond
        bar(at(FRI, 10, 5), 2650.2, 2650.4, 2650.1, 2650.3),  // beyond
        bar(at(FRI, 10, 6), 2650.3, 2650.5, 2650.2, 2650.4),  // beyond
    };
    const std::int64_t end = brisbane().sessionEnd(FRI);
    RiskConfig risk;
    for (int n = 1; n <= 3; ++n) {
        risk.confirmation_closes = n;
        BreakoutSimulator sim(risk, 0.1);
        auto k = sim.findConfirmation(r, Direction::Up, bars, end);
        ASSERT_TRUE(k.has_value());
        ASSERT_EQ(*k, n == 1 ? 1u : (n == 2 ? 4u : 5u));
        ASSERT_TRUE(!sim.findConfirmation(r, Direction::Down, bars, end));
    }

    // A close equal to the boundary is not beyond it.
    std::vector<Bar> touch = { bars[0], bar(at(FRI, 10, 2), 2649.5, 2650.6, 2649.4, 2650) };
    risk.confirmation_closes = 1;
    ASSERT_TRUE(!BreakoutSimulator(risk, 0.1).findConfirmation(r, Direction::Up, touch, end));

    // Bars at or after session end never confirm.
    ASSERT_TRUE(!BreakoutSimulator(risk, 0.1).findConfirmation(r, Direction::Up, bars, at(FRI, 10, 2)));
}

//--- The bar opening at the window end is not post-window
void run_window_end_bar_does_not_confirm() {
    const OpeningRange r = rangeOf(2650, 2648);
    ASSERT_EQ(r.span.end, at(FRI, 10, 1));
    std::vector<Bar> bars = {
        bar(at(FRI, 10, 0), 2649, 2650, 2648, 2649),
        bar(at(FRI, 10, 1), 2649.5, 2651, 2649.4, 2650.8),  // beyond, at span.end
        bar(at(FRI, 10, 2), 2650.8, 2651, 2650.3, 2650.5),  // beyond
        bar(at(FRI, 10, 3), 2650.5, 2650.9, 2650.2, 2650.6),  // beyond
    };
    const std::int64_t end = brisbane().sessionEnd(FRI);
    RiskConfig risk;
    BreakoutSimulator one(risk, 0.1);
    ASSERT_EQ(*one.findConfirmation(r, Direction::Up, bars, end), 2u);
    const BreakoutDecision d = one.detectBreakout(r, Direction::Up, bars, end);
    ASSERT_TRUE(d.trade.has_value());
    ASSERT_EQ(d.trade->confirm_time, at(FRI, 10, 2));
    ASSERT_NEAR(d.trade->entry_price, 2650.5, 1e-9);
    ASSERT_EQ(d.trade->bars_to_entry, 1);

    // Two closes are needed after the window; 10:01 does not count toward them.
    risk.confirmation_closes = 2;
    ASSERT_EQ(*BreakoutSimulator(risk, 0.1).findConfirmation(r, Direction::Up, bars, end), 3u);
    risk.confirmation_closes = 3;
    ASSERT_TRUE(!BreakoutSimulator(risk, 0.1).findConfirmation(r, Direction::Up, bars, end));

    // Through the pipeline the stored break time is the 10:02 close.
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", bars);
    FeatureTable table;
    FeaturePipeline p(singleWindowConfig(2.0), store, table, log, err);
    const FeatureRow up = p.computeDay(FRI)[0];
    ASSERT_EQ(*up.break_time, at(FRI, 10, 2));
    ASSERT_EQ(*up.entry_time, at(FRI, 10, 3));
    ASSERT_EQ(*up.entry_delay_bars, 1);
}

//--- Worked example: 2650/2648 range, entry 2650.5, RR 2
void run_worked_example() {
    std::ostringstream log, err;
    FeatureTable table;
    const PipelineConfig cfg = singleWindowConfig(2.0);

    MemoryBarStore win_store;
    win_store.setBars("MGC", breakoutBars(winningBar()));
    FeaturePipeline win(cfg, win_store, table, log, err);
    std::vector<FeatureRow> rows = win.computeDay(FRI);
    ASSERT_EQ(rows.size(), 2u);
    const FeatureRow& up = rows[0];
    ASSERT_EQ(str(toString(up.direction)), str("UP"));
    ASSERT_TRUE(up.range_defined);
    ASSERT_NEAR(*up.orb_high, 2650, 1e-9);
    ASSERT_NEAR(*up.orb_low, 2648, 1e-9);
    ASSERT_EQ(str(toString(up.outcome)), str("WIN"));
    ASSERT_NEAR(up.r_multiple, 2.0, 1e-9);
    ASSERT_NEAR(up.r_multiple_gross, 2.0, 1e-9);
    ASSERT_NEAR(*up.entry_price, 2650.5, 1e-9);
    ASSERT_NEAR(*up.stop_price, 2648, 1e-9);
    ASSERT_NEAR(*up.target_price, 2654, 1e-9);
    ASSERT_NEAR(*up.risk_ticks, 20, 1e-6);
    ASSERT_EQ(*up.break_time, at(FRI, 10, 2));
    ASSERT_EQ(*up.entry_time, at(FRI, 10, 3));
    ASSERT_EQ(*up.exit_time, at(FRI, 10, 4));
    ASSERT_NEAR(*up.mae_ticks, 15, 1e-6);
    ASSERT_NEAR(*up.mfe_ticks, 35, 1e-6);
    ASSERT_EQ(up.note, str(""));
    ASSERT_EQ(up.config_version, cfg.version);
    ASSERT_EQ(*up.entry_delay_bars, 1);

    const FeatureRow& down = rows[1];
    ASSERT_EQ(str(toString(down.outcome)), str("NO_TRADE"));
    ASSERT_NEAR(down.r_multiple, 0, 1e-12);
    ASSERT_EQ(down.note, str("OPPOSITE_BREAK"));
    ASSERT_TRUE(!down.entry_time);
    ASSERT_TRUE(!down.entry_delay_bars);

    MemoryBarStore loss_store;
    loss_store.setBars("MGC", breakoutBars(losingBar()));
    FeaturePipeline loss(cfg, loss_store, table, log, err);
    const FeatureRow lost = loss.computeDay(FRI)[0];
    ASSERT_EQ(str(toString(lost.outcome)), str("LOSS"));
    ASSERT_NEAR(lost.r_multiple, -1.0, 1e-9);
    ASSERT_NEAR(*lost.mae_ticks, 25, 1e-6);

    // No bars in the window: both rows undefined, nothing traded.
    std::vector<Bar> no_range = breakoutBars(winningBar());
    no_range.erase(no_range.begin());
    MemoryBarStore empty_store;
    empty_store.setBars("MGC", no_range);
    FeaturePipeline none(cfg, empty_store, table, log, err);
    for (const FeatureRow& r : none.computeDay(FRI)) {
        ASSERT_TRUE(!r.range_defined);
        ASSERT_TRUE(!r.orb_high);
        ASSERT_EQ(str(toString(r.outcome)), str("NO_TRADE"));
        ASSERT_NEAR(r.r_multiple, 0, 1e-12);
        ASSERT_EQ(r.note, str("NO_RANGE"));
    }
}

//--- Same bar touches stop and target: stop wins
void run_same_bar_stop_first() {
    std::ostringstream log, err;
    FeatureTable table;
    MemoryBarStore store;
    store.setBars("MGC", breakoutBars(bar(at(FRI, 10, 4), 2651.5, 2654.2, 2647.9, 2650)));
    FeaturePipeline p(singleWindowConfig(2.0), store, table, log, err);
    const FeatureRow up = p.computeDay(FRI)[0];
    ASSERT_EQ(str(toString(up.outcome)), str("LOSS"));
    ASSERT_NEAR(up.r_multiple, -1.0, 1e-9);
    ASSERT_EQ(*up.exit_time, at(FRI, 10, 4));
}

//--- Trade never resolves before session end
void run_unresolved_trade() {
    std::ostringstream log, err;
    FeatureTable table;
    MemoryBarStore store;
    store.setBars("MGC", breakoutBars(bar(at(FRI, 10, 4), 2651.5, 2652, 2650, 2651)));
    FeaturePipeline p(singleWindowConfig(2.0), store, table, log, err);
    const FeatureRow up = p.computeDay(FRI)[0];
    ASSERT_EQ(str(toString(up.outcome)), str("NO_TRADE"));
    ASSERT_EQ(up.note, str("UNRESOLVED"));
    ASSERT_NEAR(up.r_multiple, 0, 1e-12);
    ASSERT_TRUE(up.entry_time.has_value());
    ASSERT_TRUE(!up.exit_time);
}

//--- Entry modes, stop modes, anchors and filters
void run_trade_construction() {
    const OpeningRange r = rangeOf(2650, 2648);
    std::vector<Bar> bars = breakoutBars(winningBar());
    const std::int64_t end = brisbane().sessionEnd(FRI);

    RiskConfig risk;
    risk.entry_mode = EntryMode::NextOpen;
    BreakoutDecision d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_TRUE(d.trade.has_value());
    ASSERT_NEAR(d.trade->entry_price, 2650.5, 1e-9);  // 10:03 open
    ASSERT_EQ(d.trade->entry_time, at(FRI, 10, 3));
    ASSERT_EQ(d.trade->scan_index, 2u);
    ASSERT_EQ(d.trade->bars_to_entry, 2);  // 10:02 confirms, 10:03 fills

    std::vector<Bar> cut(bars.begin(), bars.begin() + 2);
    d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, cut, end);
    ASSERT_TRUE(!d.trade);
    ASSERT_EQ(str(toString(d.reason)), str("NO_FILL"));

    risk = RiskConfig();
    risk.stop_mode = StopMode::Half;
    d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_NEAR(d.trade->stop_price, 2649, 1e-9);
    ASSERT_NEAR(d.trade->risk_ticks, 10, 1e-6);
    ASSERT_NEAR(d.trade->target_price, 2651, 1e-9);

    risk = RiskConfig();
    risk.risk_anchor = RiskAnchor::Entry;
    risk.entry_buffer_ticks = 2;
    d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_NEAR(d.trade->entry_price, 2650.7, 1e-9);
    ASSERT_NEAR(d.trade->risk_ticks, 27, 1e-6);
    ASSERT_NEAR(d.trade->target_price, 2653.4, 1e-9);

    risk = RiskConfig();
    risk.max_stop_ticks = 10;
    d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_EQ(str(toString(d.reason)), str("STOP_TOO_WIDE"));

    risk = RiskConfig();
    risk.min_range_ticks = 30;
    d = BreakoutSimulator(risk, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_EQ(str(toString(d.reason)), str("RANGE_FILTER"));

    // Flat range: stop sits on the broken edge.
    d = BreakoutSimulator(RiskConfig(), 0.1).detectBreakout(rangeOf(2650, 2650), Direction::Up, bars, end);
    ASSERT_EQ(str(toString(d.reason)), str("ZERO_RISK"));
}

//--- Direction policies
void run_direction_policy() {
    const OpeningRange r = rangeOf(2650, 2648);
    std::vector<Bar> bars = {
        bar(at(FRI, 10, 0), 2649, 2650, 2648, 2649),
        bar(at(FRI, 10, 2), 2648.5, 2648.6, 2647.5, 2647.8),  // DOWN first
        bar(at(FRI, 10, 3), 2647.8, 2651, 2647.7, 2650.8),    // then UP
    };
    const std::int64_t end = brisbane().sessionEnd(FRI);

    RiskConfig first;
    BreakoutSimulator sim(first, 0.1);
    ASSERT_EQ(str(toString(sim.detectBreakout(r, Direction::Up, bars, end).reason)), str("OPPOSITE_BREAK"));
    BreakoutDecision down = sim.detectBreakout(r, Direction::Down, bars, end);
    ASSERT_TRUE(down.trade.has_value());
    ASSERT_NEAR(down.trade->stop_price, 2650, 1e-9);
    ASSERT_NEAR(down.trade->target_price, 2646, 1e-9);

    RiskConfig independent;
    independent.direction_policy = DirectionPolicy::Independent;
    BreakoutDecision up = BreakoutSimulator(independent, 0.1).detectBreakout(r, Direction::Up, bars, end);
    ASSERT_TRUE(up.trade.has_value());
    ASSERT_EQ(up.trade->confirm_time, at(FRI, 10, 3));
}

//--- No bar at or after the fill can change the trade
void run_zero_lookahead() {
    const OpeningRange r = rangeOf(2650, 2648);
    const std::int64_t end = brisbane().sessionEnd(FRI);
    const std::vector<Bar> bars = breakoutBars(winningBar());

    for (EntryMode mode : { EntryMode::Close, EntryMode::NextOpen }) {
        RiskConfig risk;
        risk.entry_mode = mode;
        risk.rr_targets = { 2.0 };
        BreakoutSimulator sim(risk, 0.1);
        const SimulatedTrade base = *sim.detectBreakout(r, Direction::Up, bars, end).trade;

        // The fill bar's open is known at entry under NEXT_OPEN; later bars never are.
        std::vector<Bar> mutated;
        for (const Bar& b : bars) {
            const bool known = mode == EntryMode::Close ? b.ts_utc < base.entry_time : b.ts_utc <= base.entry_time;
            if (known) {
                mutated.push_back(b);
            } else {
                Bar m = b;
                m.high = 9000;
                m.low = 1;
                m.close = 1;
                m.open = 4000;
                mutated.push_back(m);
            }
        }
        mutated.push_back(bar(at(FRI, 11, 0), 1, 9000, 1, 1));

        const BreakoutDecision again = sim.detectBreakout(r, Direction::Up, mutated, end);
        ASSERT_TRUE(again.trade.has_value());
        const SimulatedTrade& t = *again.trade;
        ASSERT_EQ(t.confirm_time, base.confirm_time);
        ASSERT_EQ(t.entry_time, base.entry_time);
        ASSERT_EQ(t.entry_price, base.entry_price);
        ASSERT_EQ(t.stop_price, base.stop_price);
        ASSERT_EQ(t.target_price, base.target_price);
        ASSERT_EQ(t.risk_ticks, base.risk_ticks);
        ASSERT_EQ(t.scan_index, base.scan_index);
    }
}

//--- Costs in R
void run_cost_model() {
    const CostModel mgc = *builtinInstrument("MGC").cost;
    ASSERT_NEAR(mgc.costDollars(), 2.5, 1e-12);
    ASSERT_NEAR(costInR(mgc, 20), 0.125, 1e-12);
    ASSERT_NEAR(costInR(mgc, 0), 0, 1e-12);
    const CostModel nq = *builtinInstrument("NQ").cost;
    ASSERT_NEAR(costInR(nq, 10), (4.0 + 2.5) / 50.0, 1e-12);

    SimulatedTrade t;
    t.risk_ticks = 20;
    TradePath win;
    win.exit = ExitKind::Target;
    Classification c = classifyOutcome(t, win, 2.0, mgc);
    ASSERT_EQ(str(toString(c.outcome)), str("WIN"));
    ASSERT_NEAR(c.r_gross, 2.0, 1e-12);
    ASSERT_NEAR(c.r_multiple, 1.875, 1e-12);

    TradePath stop;
    stop.exit = ExitKind::Stop;
    c = classifyOutcome(t, stop, 2.0, mgc);
    ASSERT_NEAR(c.r_multiple, -1.125, 1e-12);

    TradePath open;
    c = classifyOutcome(t, open, 2.0, mgc);
    ASSERT_EQ(str(toString(c.outcome)), str("NO_TRADE"));
    ASSERT_NEAR(c.r_multiple, 0, 1e-12);
    c = classifyOutcome(std::nullopt, std::nullopt, 2.0, mgc);
    ASSERT_EQ(str(toString(c.outcome)), str("NO_TRADE"));

    ASSERT_THROWS(classifyOutcome(t, win, std::numeric_limits<double>::quiet_NaN(), mgc),
                  ComputationIntegrityError);
    ASSERT_EQ(parseOutcome("loss"), Outcome::Loss);
    ASSERT_THROWS(parseOutcome("DRAW"), InputValidationError);
}

//--- Context as known at the end of the current window
void run_context_as_of() {
    FeatureRow up;
    up.direction = Direction::Up;
    up.range_defined = true;
    up.break_time = 480;
    up.entry_time = 540;
    up.exit_time = 1200;
    up.outcome = Outcome::Win;
    FeatureRow down;
    down.direction = Direction::Down;
    down.range_defined = true;
    std::vector<FeatureRow> rows = { up, down };

    ASSERT_EQ(breakAsOf({}, 10000), BreakState::Unknown);
    ASSERT_EQ(breakAsOf(rows, 500), BreakState::None);
    ASSERT_EQ(breakAsOf(rows, 540), BreakState::Up);
    ASSERT_EQ(outcomeAsOf({}, 10000), ContextOutcome::Unknown);
    ASSERT_EQ(outcomeAsOf(rows, 500), ContextOutcome::NoTrade);
    ASSERT_EQ(outcomeAsOf(rows, 1200), ContextOutcome::Open);
    ASSERT_EQ(outcomeAsOf(rows, 1260), ContextOutcome::Win);

    // Earliest break wins.
    rows[1].break_time = 420;
    ASSERT_EQ(breakAsOf(rows, 540), BreakState::Down);

    // An earlier window without bars has no range to break.
    FeatureRow empty_up;
    empty_up.direction = Direction::Up;
    empty_up.note = "NO_RANGE";
    FeatureRow empty_down = empty_up;
    empty_down.direction = Direction::Down;
    const std::vector<FeatureRow> no_range = { empty_up, empty_down };
    ASSERT_EQ(breakAsOf(no_range, 10000), BreakState::Unknown);
    ASSERT_EQ(outcomeAsOf(no_range, 10000), ContextOutcome::Unknown);
}

void run_context_fields() {
    std::ostringstream log, err;
    FeatureTable table;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    FeaturePipeline p(twoWindowConfig({ 1.0 }), store, table, log, err);
    BatchSummary s = p.run(FRI, MON);
    ASSERT_EQ(s.days_ok, 2);
    ASSERT_EQ(s.days_skipped, 2);
    ASSERT_EQ(s.rows_written, 8u);

    std::vector<FeatureRow> fri = table.readRange("MGC", "2025-01-10", "2025-01-10");
    ASSERT_EQ(fri.size(), 4u);
    ASSERT_EQ(fri[0].window_name, str("0900"));
    ASSERT_EQ(str(toString(fri[0].outcome)), str("WIN"));
    ASSERT_NEAR(fri[0].r_multiple, 1.0, 1e-9);
    ASSERT_EQ(fri[0].prior_window_name, str(""));
    ASSERT_EQ(fri[0].prior_window_break, BreakState::Unknown);
    ASSERT_EQ(fri[0].prior_window_outcome, ContextOutcome::Unknown);
    ASSERT_EQ(fri[0].prior_day_outcome, ContextOutcome::Unknown);
    ASSERT_NEAR(*fri[0].pre_session_range_ticks, 40, 1e-6);
    ASSERT_EQ(fri[1].note, str("OPPOSITE_BREAK"));
    for (int i = 2; i < 4; ++i) {
        ASSERT_EQ(fri[i].window_name, str("1000"));
        ASSERT_EQ(fri[i].window_seq, 1);
        ASSERT_EQ(fri[i].note, str("NO_BREAK"));
        ASSERT_EQ(fri[i].prior_window_name, str("0900"));
        ASSERT_EQ(fri[i].prior_window_break, BreakState::Up);
        ASSERT_EQ(fri[i].prior_window_outcome, ContextOutcome::Win);
    }

    std::vector<FeatureRow> mon = table.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon.size(), 4u);
    ASSERT_EQ(str(toString(mon[0].outcome)), str("LOSS"));
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Win);
    ASSERT_EQ(mon[1].prior_day_outcome, ContextOutcome::NoTrade);
    ASSERT_EQ(mon[2].prior_day_outcome, ContextOutcome::NoTrade);
    ASSERT_EQ(mon[2].prior_window_outcome, ContextOutcome::Loss);
    ASSERT_NEAR(*mon[0].pre_session_range_ticks, 20, 1e-6);

    ASSERT_TRUE(log.str().find("2025-01-11 skip") != std::string::npos);
    ASSERT_TRUE(log.str().find("2025-01-13 ok rows=4 trades=1 W/L=0/1") != std::string::npos);
    ASSERT_TRUE(err.str().empty());
}

//--- Secondary RR targets share entry and stop
void run_secondary_targets() {
    std::ostringstream log, err;
    FeatureTable table;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    FeaturePipeline p(twoWindowConfig({ 1.0, 2.0 }), store, table, log, err);
    std::vector<FeatureRow> rows = p.computeDay(FRI);
    ASSERT_EQ(rows[0].targets.size(), 1u);
    ASSERT_NEAR(rows[0].targets[0].rr, 2.0, 1e-12);
    ASSERT_EQ(str(toString(rows[0].targets[0].outcome)), str("NO_TRADE"));  // 2615 never reached
    ASSERT_EQ(rows[1].targets.size(), 1u);

    table.write("MGC", rows, "2025-01-10", "2025-01-10");
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == rows);
}

//--- Same inputs, same rows; rebuilding a sub-range leaves the rest alone
void run_pipeline_determinism() {
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    const PipelineConfig cfg = twoWindowConfig({ 1.0 });

    FeatureTable a, b;
    FeaturePipeline pa(cfg, store, a, log, err);
    FeaturePipeline pb(cfg, store, b, log, err);
    pa.run(FRI, MON);
    pb.run(FRI, MON);
    const std::vector<FeatureRow> all = a.readRange("MGC", "2025-01-01", "2025-01-31");
    ASSERT_EQ(all.size(), 8u);
    ASSERT_TRUE(all == b.readRange("MGC", "2025-01-01", "2025-01-31"));

    // Stored rows are exactly what was computed.
    FeatureTable scratch;
    FeaturePipeline pc(cfg, store, scratch, log, err);
    ASSERT_TRUE(pc.computeDay(FRI) == a.readRange("MGC", "2025-01-10", "2025-01-10"));

    // Monday alone reads Friday from the table instead of the in-run cache.
    FeaturePipeline again(cfg, store, a, log, err);
    again.run(MON, MON);
    ASSERT_TRUE(a.readRange("MGC", "2025-01-01", "2025-01-31") == all);
    again.run(FRI, FRI);
    ASSERT_TRUE(a.readRange("MGC", "2025-01-01", "2025-01-31") == all);
    ASSERT_EQ(a.count("MGC"), 8u);
}

//--- Data gaps skip the day and clear its old rows
void run_pipeline_data_gap() {
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    const PipelineConfig cfg = twoWindowConfig({ 1.0 });
    FeatureTable table;
    FeaturePipeline(cfg, store, table, log, err).run(FRI, MON);
    const std::vector<FeatureRow> fri = table.readRange("MGC", "2025-01-10", "2025-01-10");

    const std::int64_t mon_load = brisbane().loadSpan(MON, cfg.allWindows()).start;
    GapStore gaps(store, mon_load);
    FeaturePipeline p(cfg, gaps, table, log, err);
    BatchSummary s = p.run(FRI, MON);
    ASSERT_EQ(s.days_ok, 1);
    ASSERT_EQ(s.days_skipped, 3);
    ASSERT_EQ(toString(s.days.back().status), str("skip"));
    ASSERT_EQ(s.days.back().reason, str("bar archive unavailable"));
    ASSERT_TRUE(table.readRange("MGC", "2025-01-13", "2025-01-13").empty());
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == fri);
}

//--- A malformed bar fails its day only
void run_pipeline_bad_day() {
    std::ostringstream log, err;
    std::vector<Bar> bars = twoDayBars();
    bars.push_back(bar(at(FRI, 12, 0), 2610, 2609, 2611, 2610));  // high < low
    MemoryBarStore store;
    store.setBars("MGC", bars);
    FeatureTable table;
    FeaturePipeline p(twoWindowConfig({ 1.0 }), store, table, log, err);
    BatchSummary s = p.run(FRI, MON);
    ASSERT_EQ(s.days_failed, 1);
    ASSERT_EQ(s.days_ok, 1);
    ASSERT_EQ(toString(s.days.front().status), str("fail"));
    ASSERT_TRUE(err.str().find("Day 2025-01-10 failed") != std::string::npos);
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10").empty());

    std::vector<FeatureRow> mon = table.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon.size(), 4u);
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Unknown);

    ASSERT_THROWS(p.run(MON, FRI), InputValidationError);
}

//--- Integrity errors halt the run with their location
void run_pipeline_integrity_halt() {
    std::ostringstream log, err;
    PipelineConfig cfg = singleWindowConfig(2.0);
    cfg.instrument.orb_windows[0].risk.rr_targets = { std::numeric_limits<double>::quiet_NaN() };
    MemoryBarStore store;
    store.setBars("MGC", breakoutBars(winningBar()));
    FeatureTable table;
    FeaturePipeline p(cfg, store, table, log, err);

    bool thrown = false;
    try {
        p.run(FRI, SAT);
    } catch (const ComputationIntegrityError& e) {
        thrown = true;
        ASSERT_EQ(e.day(), str("2025-01-10"));
        ASSERT_EQ(e.window(), str("1000"));
        ASSERT_EQ(e.direction(), str("UP"));
        ASSERT_TRUE(e.describe().find("day=2025-01-10 window=1000 direction=UP") == 0);
    }
    ASSERT_TRUE(thrown);
    ASSERT_EQ(table.count("MGC"), 0u);

    PipelineConfig unvalidated;
    unvalidated.instrument = builtinInstrument("MGC");
    ASSERT_THROWS(FeaturePipeline(unvalidated, store, table, log, err), InputValidationError);
}

//--- A failed write leaves the table as it was
void run_persistence_rollback() {
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    FeatureTable scratch;
    const std::vector<FeatureRow> rows =
        FeaturePipeline(twoWindowConfig({ 1.0 }), store, scratch, log, err).computeDay(FRI);

    FeatureTable table;
    table.write("MGC", rows, "2025-01-10", "2025-01-10");

    std::vector<FeatureRow> dup = rows;
    dup.push_back(rows[0]);
    ASSERT_THROWS(table.write("MGC", dup, "2025-01-10", "2025-01-10"), PersistenceError);
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == rows);

    ASSERT_THROWS(table.write("MGC", rows, "2025-01-11", "2025-01-11"), PersistenceError);
    ASSERT_THROWS(table.write("NQ", rows, "2025-01-10", "2025-01-10"), PersistenceError);
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == rows);

    auto one = table.readRow("MGC", "2025-01-10", "0900", Direction::Up);
    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(*one == rows[0]);

    // Day records replace with their day and roll back with the rows.
    DayRecord rec;
    rec.instrument = "MGC";
    rec.day = "2025-01-10";
    rec.config_version = rows[0].config_version;
    rec.atr_basis_ticks = 80;
    table.write("MGC", rows, "2025-01-10", "2025-01-10", { rec });
    DayRecord stray = rec;
    stray.day = "2025-01-11";
    ASSERT_THROWS(table.write("MGC", {}, "2025-01-10", "2025-01-10", { stray }), PersistenceError);
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == rows);
    auto day = table.readDay("MGC", "2025-01-10");
    ASSERT_TRUE(day.has_value());
    ASSERT_EQ(day->status, DayStatus::Ok);
    ASSERT_EQ(day->config_version, rows[0].config_version);
    ASSERT_NEAR(*day->atr_basis_ticks, 80, 1e-12);
    ASSERT_TRUE(!table.readDay("MGC", "2025-01-13"));

    ASSERT_EQ(table.recentAtrBasis("MGC", "2025-01-13", rows[0].config_version, 20).size(), 1u);
    ASSERT_TRUE(table.recentAtrBasis("MGC", "2025-01-10", rows[0].config_version, 20).empty());
    ASSERT_TRUE(table.recentAtrBasis("MGC", "2025-01-13", "orb1-other", 20).empty());
}

//--- Prior-day outcome comes only from the previous trading day
void run_prior_day_after_failed_day() {
    std::ostringstream log, err;
    std::vector<Bar> bars = threeDayBars();
    bars.push_back(bar(at(FRI, 12, 0), 2610, 2609, 2611, 2610));  // high < low fails Friday
    MemoryBarStore store;
    store.setBars("MGC", bars);
    FeatureTable table;
    FeaturePipeline p(twoWindowConfig({ 1.0 }), store, table, log, err);
    BatchSummary s = p.run(THU, MON);
    ASSERT_EQ(s.days_ok, 2);
    ASSERT_EQ(s.days_failed, 1);
    ASSERT_EQ(s.days_skipped, 2);

    const std::vector<FeatureRow> thu = table.readRange("MGC", "2025-01-09", "2025-01-09");
    ASSERT_EQ(thu.size(), 4u);
    ASSERT_EQ(thu[0].outcome, Outcome::Win);

    auto fri = table.readDay("MGC", "2025-01-10");
    ASSERT_TRUE(fri.has_value());
    ASSERT_EQ(fri->status, DayStatus::Fail);
    ASSERT_TRUE(!fri->market_closed);
    ASSERT_TRUE(!fri->atr_basis_ticks);
    auto sat = table.readDay("MGC", "2025-01-11");
    ASSERT_TRUE(sat.has_value());
    ASSERT_EQ(sat->status, DayStatus::Skip);
    ASSERT_TRUE(sat->market_closed);

    // Thursday's win must not stand in for the failed Friday.
    const std::vector<FeatureRow> mon = table.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon.size(), 4u);
    for (const FeatureRow& r : mon) ASSERT_EQ(r.prior_day_outcome, ContextOutcome::Unknown);
}

void run_prior_day_gaps_and_missing_days() {
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", threeDayBars());
    const PipelineConfig cfg = twoWindowConfig({ 1.0 });

    // Friday never built: Monday does not reach back to Thursday.
    FeatureTable partial;
    FeaturePipeline(cfg, store, partial, log, err).run(THU, THU);
    FeaturePipeline(cfg, store, partial, log, err).run(SAT, MON);
    std::vector<FeatureRow> mon = partial.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Unknown);

    // Building Friday and then Monday again restores the chain.
    FeatureTable full;
    FeaturePipeline(cfg, store, full, log, err).run(THU, MON);
    mon = full.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Win);
    const std::vector<FeatureRow> fri = full.readRange("MGC", "2025-01-10", "2025-01-10");
    ASSERT_EQ(fri[0].prior_day_outcome, ContextOutcome::Win);

    // A data gap on Friday is not a closed market.
    const std::int64_t fri_load = brisbane().loadSpan(FRI, cfg.allWindows()).start;
    GapStore gaps(store, fri_load);
    FeatureTable gapped;
    BatchSummary s = FeaturePipeline(cfg, gaps, gapped, log, err).run(THU, MON);
    ASSERT_EQ(s.days_skipped, 3);
    ASSERT_TRUE(!gapped.readDay("MGC", "2025-01-10")->market_closed);
    mon = gapped.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Unknown);

    // Rows built under another configuration are not read as context.
    FeatureTable mixed;
    FeaturePipeline(twoWindowConfig({ 2.0 }), store, mixed, log, err).run(THU, FRI);
    FeaturePipeline(cfg, store, mixed, log, err).run(SAT, MON);
    mon = mixed.readRange("MGC", "2025-01-13", "2025-01-13");
    ASSERT_EQ(mon[0].prior_day_outcome, ContextOutcome::Unknown);
}

//--- Session levels, ATR, type codes and RSI as known at each window's end
std::vector<Bar> sessionDayBars() {
    std::vector<Bar> bars = {
        bar(at(FRI, 7, 0), 2600, 2602, 2599, 2601),        // PRE_ASIA
        bar(at(FRI, 9, 0), 2601, 2605, 2600, 2603),        // 0900, ASIA
        bar(at(FRI, 12, 0), 2603, 2606, 2598, 2603),       // ASIA
        bar(at(FRI, 17, 30), 2602, 2604, 2601, 2602),      // PRE_LONDON
        bar(at(FRI, 18, 0), 2603, 2605, 2602, 2603),       // 1800, LONDON
        bar(at(FRI, 20, 0), 2604, 2608, 2603, 2604),       // LONDON takes the ASIA high
    };
    // Fifteen LONDON five-minute closes for the RSI.
    double close = 2604;
    for (int i = 0; i < 15; ++i) {
        if (i > 0) close += (i % 2 == 1) ? 0.2 : -0.1;
        bars.push_back(bar(at(FRI, 21, 0) + i * 300, close, close, close, close));
    }
    bars.push_back(bar(at(FRI, 23, 0), 2605, 2607, 2604, 2604.5));  // 2300, PRE_NY
    bars.push_back(bar(at(SAT, 0, 10), 2605, 2609, 2605, 2605));    // PRE_NY sweeps the high
    bars.push_back(bar(at(SAT, 0, 30), 2605, 2606, 2604, 2605));    // 0030, NY
    return bars;
}

PipelineConfig sessionConfig() {
    PipelineConfig cfg;
    cfg.instrument = builtinInstrument("MGC");
    cfg.instrument.cost.reset();
    cfg.instrument.orb_windows = selectWindows(cfg.instrument.orb_windows, { "0900", "1800", "2300", "0030" });
    return validateConfig(cfg);
}

void run_session_context_as_of() {
    std::ostringstream log, err;
    const PipelineConfig cfg = sessionConfig();
    const std::vector<Bar> bars = sessionDayBars();
    MemoryBarStore store;
    store.setBars("MGC", bars);
    FeatureTable table;

    // Nineteen earlier ASIA ranges are not enough for an ATR.
    for (int back = 1; back <= 20; ++back) {
        DayRecord rec;
        rec.instrument = "MGC";
        rec.day = formatDay(FRI - back);
        rec.config_version = back == 20 ? "orb1-other" : cfg.version;
        rec.atr_basis_ticks = 50;
        table.write("MGC", {}, rec.day, rec.day, { rec });
    }
    FeaturePipeline p(cfg, store, table, log, err);
    std::vector<FeatureRow> rows = p.computeDay(FRI);
    ASSERT_EQ(rows.size(), 8u);
    for (const FeatureRow& r : rows) {
        ASSERT_TRUE(!r.atr_20_ticks);
        ASSERT_EQ(r.asia_type_code, str(""));
    }

    DayRecord twentieth;
    twentieth.instrument = "MGC";
    twentieth.day = formatDay(FRI - 20);
    twentieth.config_version = cfg.version;
    twentieth.atr_basis_ticks = 50;
    table.write("MGC", {}, twentieth.day, twentieth.day, { twentieth });
    rows = p.computeDay(FRI);

    const FeatureRow& w0900 = rows[0];
    ASSERT_EQ(w0900.window_name, str("0900"));
    ASSERT_EQ(w0900.pre_session_name, str("PRE_ASIA"));
    ASSERT_NEAR(*w0900.pre_session_range_ticks, 30, 1e-6);
    ASSERT_NEAR(*w0900.atr_20_ticks, 50, 1e-9);
    ASSERT_EQ(w0900.sessions.size(), 1u);
    ASSERT_EQ(w0900.sessions[0].name, str("PRE_ASIA"));
    ASSERT_EQ(w0900.asia_type_code, str(""));  // ASIA still open at 09:05

    const FeatureRow& w1800 = rows[2];
    ASSERT_EQ(w1800.window_name, str("1800"));
    ASSERT_EQ(w1800.pre_session_name, str("PRE_LONDON"));
    ASSERT_NEAR(*w1800.pre_session_range_ticks, 30, 1e-6);
    ASSERT_EQ(w1800.sessions.size(), 3u);
    const SessionLevel* asia = findSession(w1800.sessions, "ASIA");
    ASSERT_TRUE(asia != nullptr);
    ASSERT_NEAR(asia->high, 2606, 1e-9);
    ASSERT_NEAR(asia->low, 2598, 1e-9);
    ASSERT_NEAR(asia->range_ticks, 80, 1e-6);
    ASSERT_EQ(asia->end_time, at(FRI, 17, 0));
    ASSERT_EQ(w1800.asia_type_code, str("A2_EXPANDED"));
    ASSERT_EQ(w1800.london_type_code, str(""));
    ASSERT_TRUE(!findSession(w1800.sessions, "LONDON"));

    const FeatureRow& w2300 = rows[4];
    ASSERT_EQ(w2300.window_name, str("2300"));
    ASSERT_EQ(w2300.pre_session_name, str(""));
    ASSERT_TRUE(!w2300.pre_session_range_ticks);
    ASSERT_EQ(w2300.sessions.size(), 4u);
    ASSERT_EQ(w2300.london_type_code, str("L1_SWEEP_HIGH"));
    ASSERT_EQ(w2300.pre_ny_type_code, str(""));
    ASSERT_TRUE(!w2300.rsi_0030);

    const FeatureRow& w0030 = rows[6];
    ASSERT_EQ(w0030.window_name, str("0030"));
    ASSERT_EQ(w0030.pre_session_name, str("PRE_NY"));
    ASSERT_NEAR(*w0030.pre_session_range_ticks, 50, 1e-6);
    ASSERT_EQ(w0030.sessions.size(), 5u);
    ASSERT_TRUE(!findSession(w0030.sessions, "NY"));  // NY runs to 02:00
    ASSERT_EQ(w0030.pre_ny_type_code, str("N1_SWEEP_HIGH"));
    ASSERT_TRUE(w0030.rsi_0030.has_value());
    ASSERT_NEAR(*w0030.rsi_0030, *rsiAt(bars, at(SAT, 0, 30)), 1e-12);

    // UP and DOWN rows of a window share the same context.
    ASSERT_TRUE(rows[7].sessions == w0030.sessions);
    ASSERT_EQ(rows[7].pre_ny_type_code, w0030.pre_ny_type_code);

    // Persisted and read back unchanged; Friday's ASIA range feeds later ATRs.
    table.write("MGC", rows, "2025-01-10", "2025-01-10");
    ASSERT_TRUE(table.readRange("MGC", "2025-01-10", "2025-01-10") == rows);
    BatchSummary s = p.run(FRI, FRI);
    ASSERT_EQ(s.days_ok, 1);
    ASSERT_NEAR(*table.readDay("MGC", "2025-01-10")->atr_basis_ticks, 80, 1e-6);
    const std::vector<double> history = table.recentAtrBasis("MGC", "2025-01-11", cfg.version, ATR_DAYS);
    ASSERT_EQ(history.size(), 20u);
    ASSERT_NEAR(history[0], 80, 1e-6);
    ASSERT_NEAR(*averageRange(history), (80.0 + 19 * 50.0) / 20, 1e-9);
}

void run_session_type_codes() {
    SessionLevel asia;
    asia.name = "ASIA";
    asia.high = 2610;
    asia.low = 2600;
    asia.range_ticks = 100;
    ASSERT_EQ(asiaTypeCode(&asia, 500.0), str("A1_TIGHT"));
    ASSERT_EQ(asiaTypeCode(&asia, 200.0), str("A0_NORMAL"));
    ASSERT_EQ(asiaTypeCode(&asia, 100.0), str("A2_EXPANDED"));
    ASSERT_EQ(asiaTypeCode(&asia, std::nullopt), str(""));
    ASSERT_EQ(asiaTypeCode(nullptr, 100.0), str(""));

    SessionLevel london = asia;
    london.name = "LONDON";
    london.high = 2612;
    ASSERT_EQ(londonTypeCode(&london, &asia), str("L1_SWEEP_HIGH"));
    london.low = 2599;
    ASSERT_EQ(londonTypeCode(&london, &asia), str("L3_EXPANSION"));
    london.high = 2609;
    ASSERT_EQ(londonTypeCode(&london, &asia), str("L2_SWEEP_LOW"));
    london.low = 2601;
    ASSERT_EQ(londonTypeCode(&london, &asia), str("L4_CONSOLIDATION"));
    ASSERT_EQ(londonTypeCode(&london, nullptr), str(""));

    // Reference range is ASIA and LONDON combined: 2600-2610.
    SessionLevel pre_ny = asia;
    pre_ny.name = "PRE_NY";
    pre_ny.high = 2611;
    pre_ny.low = 2605;
    pre_ny.range_ticks = 60;
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, 100.0), str("N1_SWEEP_HIGH"));
    pre_ny.high = 2608;
    pre_ny.low = 2599;
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, 100.0), str("N2_SWEEP_LOW"));
    pre_ny.low = 2604;
    pre_ny.range_ticks = 20;
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, 100.0), str("N3_CONSOLIDATION"));
    pre_ny.range_ticks = 90;
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, 100.0), str("N4_EXPANSION"));
    pre_ny.range_ticks = 50;
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, 100.0), str("N0_NORMAL"));
    ASSERT_EQ(preNyTypeCode(&pre_ny, &london, &asia, std::nullopt), str("N0_NORMAL"));
    ASSERT_EQ(preNyTypeCode(&pre_ny, nullptr, &asia, 100.0), str(""));
}

void run_rsi_and_atr() {
    // Alternating +0.2 / -0.1 closes: average gain twice the average loss.
    std::vector<Bar> bars;
    double close = 2600;
    for (int i = 0; i < 15; ++i) {
        if (i > 0) close += (i % 2 == 1) ? 0.2 : -0.1;
        bars.push_back(bar(at(FRI, 22, 0) + i * 300, close, close, close, close));
    }
    const std::int64_t after_last = at(FRI, 22, 0) + 15 * 300;
    ASSERT_NEAR(*rsiAt(bars, after_last), 100.0 - 100.0 / 3.0, 1e-6);
    // The last bucket is still forming a minute earlier.
    ASSERT_TRUE(!rsiAt(bars, after_last - 60));

    std::vector<Bar> rising;
    for (int i = 0; i < 16; ++i) rising.push_back(bar(at(FRI, 22, 0) + i * 300, 2600 + i, 2600 + i, 2600 + i, 2600 + i));
    ASSERT_NEAR(*rsiAt(rising, at(FRI, 22, 0) + 16 * 300), 100.0, 1e-12);
    ASSERT_TRUE(!rsiAt(rising, at(FRI, 22, 0)));

    std::vector<double> ranges(19, 40.0);
    ASSERT_TRUE(!averageRange(ranges));
    ranges.push_back(60.0);
    ASSERT_NEAR(*averageRange(ranges), 41.0, 1e-12);
    ranges.insert(ranges.end(), 5, 1000.0);  // beyond the 20 most recent
    ASSERT_NEAR(*averageRange(ranges), 41.0, 1e-12);
}

//--- Databento folder listing
void run_data_source_list_contracts() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "orb_list_contracts_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const char* names[] = {
        "2025-01-10T00_01_00.000000000Z,1,2,3,2649.5,2650.6,2649.4,2650.5,12,mgcg5",
        "2025-01-10T00_00_00.000000000Z,1,2,3,2649,2650,2648,2649,30,MGCG5",
        "2025-01-10T00_00_00.000000000Z,1,2,3,2700,2701,2699,2700,5,MGCJ5",
        "not-a-time,1,2,3,1,1,1,1,1,MGCM5",
        "readme.txt",
    };
    for (const char* n : names) std::ofstream(dir / n);

    const std::vector<ContractSummary> got = DataSource::listContractsInDatabentoDir(dir.string());
    ASSERT_EQ(got.size(), 2u);
    ASSERT_EQ(got[0].symbol, str("MGCG5"));
    ASSERT_EQ(got[0].bars, 2u);
    ASSERT_EQ(got[0].first_ts, *parseUtcTimestamp("2025-01-10T00:00:00Z"));
    ASSERT_EQ(got[0].last_ts, *parseUtcTimestamp("2025-01-10T00:01:00Z"));
    ASSERT_EQ(got[1].symbol, str("MGCJ5"));
    ASSERT_EQ(got[1].bars, 1u);

    fs::remove_all(dir);
    ASSERT_TRUE(DataSource::listContractsInDatabentoDir(dir.string()).empty());
}

//--- Configuration validation and versioning
void run_config_validation() {
    const PipelineConfig base = singleWindowConfig(2.0);
    ASSERT_EQ(base.version, singleWindowConfig(2.0).version);
    ASSERT_TRUE(base.version != singleWindowConfig(3.0).version);
    ASSERT_EQ(base.version.substr(0, 5), str("orb1-"));
    ASSERT_EQ(base.version.size(), 21u);

    PipelineConfig c = base;
    c.instrument.orb_windows[0].risk.confirmation_closes = 4;
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.orb_windows[0].risk.rr_targets = { 0.0 };
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.orb_windows[0].risk.rr_targets.clear();
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.tick_size = 0;
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.reference_zone = "Mars/Olympus";
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.orb_windows.push_back(c.instrument.orb_windows[0]);
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.orb_windows[0].window = makeOrbWindow("08:58", 5);  // crosses the next open
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.context_windows = defaultContextWindows();
    c.instrument.context_windows[0].end_minute = 9 * 60 + 30;  // PRE_ASIA past the open
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.context_windows = defaultContextWindows();
    c.instrument.context_windows.push_back(c.instrument.context_windows[1]);
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c = base;
    c.instrument.orb_windows[0].pre_session = "PRE_ASIA";  // no context windows in this config
    ASSERT_THROWS(validateConfig(c), InputValidationError);
    c.instrument.context_windows = defaultContextWindows();
    ASSERT_TRUE(validateConfig(c).version != base.version);
    ASSERT_THROWS(builtinInstrument("ES"), InputValidationError);
    ASSERT_THROWS(selectWindows(base.instrument.orb_windows, { "1200" }), InputValidationError);

    // Windows are ordered from the day open, 00:30 last.
    PipelineConfig order;
    order.instrument = builtinInstrument("mgc");
    order.instrument.orb_windows = selectWindows(order.instrument.orb_windows, { "0030", "2300", "0900" });
    order = validateConfig(order);
    ASSERT_EQ(order.instrument.orb_windows[0].window.name, str("0900"));
    ASSERT_EQ(order.instrument.orb_windows[1].window.name, str("2300"));
    ASSERT_EQ(order.instrument.orb_windows[2].window.name, str("0030"));

    const PipelineConfig nq = validateConfig(PipelineConfig{ builtinInstrument("NQ") });
    ASSERT_NEAR(nq.instrument.tick_size, 0.25, 1e-12);
    ASSERT_EQ(nq.instrument.orb_windows.size(), 6u);
    ASSERT_TRUE(nq.version != validateConfig(PipelineConfig{ builtinInstrument("MPL") }).version);
    ASSERT_EQ(parseStopMode("half"), StopMode::Half);
    ASSERT_THROWS(parseEntryMode("market"), InputValidationError);
}

//--- Report aggregates and CSV export
void run_report() {
    std::ostringstream log, err;
    MemoryBarStore store;
    store.setBars("MGC", twoDayBars());
    const PipelineConfig cfg = twoWindowConfig({ 1.0 });
    FeatureTable table;
    FeaturePipeline p(cfg, store, table, log, err);
    const BatchSummary s = p.run(FRI, MON);

    Report report(cfg, s, table.readRange("MGC", s.from_day, s.to_day));
    std::vector<WindowStats> stats = report.computeWindowStats();
    ASSERT_EQ(stats.size(), 4u);
    ASSERT_EQ(stats[0].window_name, str("0900"));
    ASSERT_EQ(stats[0].days, 2);
    ASSERT_EQ(stats[0].trades, 2);
    ASSERT_EQ(stats[0].wins, 1);
    ASSERT_EQ(stats[0].losses, 1);
    ASSERT_NEAR(stats[0].total_r, 0.0, 1e-9);
    ASSERT_NEAR(stats[0].win_rate_pct, 50.0, 1e-9);
    ASSERT_EQ(stats[1].trades, 0);

    std::ostringstream out;
    report.printSummary(out);
    ASSERT_TRUE(out.str().find(cfg.version) != std::string::npos);

    const std::string path = "test_features.csv";
    ASSERT_EQ(report.writeFeatureCsv(path), true);
    std::ifstream f(path);
    std::string header, line;
    std::getline(f, header);
    int lines = 0;
    while (std::getline(f, line)) ++lines;
    ASSERT_EQ(lines, 8);
    ASSERT_TRUE(header.find("prior_day_outcome") != std::string::npos);
    f.close();
    std::remove(path.c_str());
}

void run_all_tests() {
    std::cerr << "  session_clock_trading_day ... "; run_session_clock_trading_day(); std::cerr << "ok\n";
    std::cerr << "  session_clock_dst_invariance ... "; run_session_clock_dst_invariance(); std::cerr << "ok\n";
    std::cerr << "  session_clock_rejects_bad_input ... "; run_session_clock_rejects_bad_input(); std::cerr << "ok\n";
    std::cerr << "  data_source_timestamps ... "; run_data_source_timestamps(); std::cerr << "ok\n";
    std::cerr << "  data_source_csv_load ... "; run_data_source_csv_load(); std::cerr << "ok\n";
    std::cerr << "  data_source_bad_timestamp ... "; run_data_source_bad_timestamp(); std::cerr << "ok\n";
    std::cerr << "  data_source_list_contracts ... "; run_data_source_list_contracts(); std::cerr << "ok\n";
    std::cerr << "  bar_store_memory ... "; run_bar_store_memory(); std::cerr << "ok\n";
    std::cerr << "  bar_store_sqlite ... "; run_bar_store_sqlite(); std::cerr << "ok\n";
    std::cerr << "  range_builder ... "; run_range_builder(); std::cerr << "ok\n";
    std::cerr << "  confirmation_closes ... "; run_confirmation_closes(); std::cerr << "ok\n";
    std::cerr << "  window_end_bar_does_not_confirm ... "; run_window_end_bar_does_not_confirm(); std::cerr << "ok\n";
    std::cerr << "  worked_example ... "; run_worked_example(); std::cerr << "ok\n";
    std::cerr << "  same_bar_stop_first ... "; run_same_bar_stop_first(); std::cerr << "ok\n";
    std::cerr << "  unresolved_trade ... "; run_unresolved_trade(); std::cerr << "ok\n";
    std::cerr << "  trade_construction ... "; run_trade_construction(); std::cerr << "ok\n";
    std::cerr << "  direction_policy ... "; run_direction_policy(); std::cerr << "ok\n";
    std::cerr << "  zero_lookahead ... "; run_zero_lookahead(); std::cerr << "ok\n";
    std::cerr << "  cost_model ... "; run_cost_model(); std::cerr << "ok\n";
    std::cerr << "  context_as_of ... "; run_context_as_of(); std::cerr << "ok\n";
    std::cerr << "  context_fields ... "; run_context_fields(); std::cerr << "ok\n";
    std::cerr << "  secondary_targets ... "; run_secondary_targets(); std::cerr << "ok\n";
    std::cerr << "  pipeline_determinism ... "; run_pipeline_determinism(); std::cerr << "ok\n";
    std::cerr << "  pipeline_data_gap ... "; run_pipeline_data_gap(); std::cerr << "ok\n";
    std::cerr << "  pipeline_bad_day ... "; run_pipeline_bad_day(); std::cerr << "ok\n";
    std::cerr << "  pipeline_integrity_halt ... "; run_pipeline_integrity_halt(); std::cerr << "ok\n";
    std::cerr << "  persistence_rollback ... "; run_persistence_rollback(); std::cerr << "ok\n";
    std::cerr << "  prior_day_after_failed_day ... "; run_prior_day_after_failed_day(); std::cerr << "ok\n";
    std::cerr << "  prior_day_gaps_and_missing_days ... "; run_prior_day_gaps_and_missing_days(); std::cerr << "ok\n";
    std::cerr << "  session_context_as_of ... "; run_session_context_as_of(); std::cerr << "ok\n";
    std::cerr << "  session_type_codes ... "; run_session_type_codes(); std::cerr << "ok\n";
    std::cerr << "  rsi_and_atr ... "; run_rsi_and_atr(); std::cerr << "ok\n";
    std::cerr << "  config_validation ... "; run_config_validation(); std::cerr << "ok\n";
    std::cerr << "  report ... "; run_report(); std::cerr << "ok\n";
}

} // namespace

int main() {
    std::cerr << "Running tests...\n";
    run_all_tests();
    std::cerr << "All tests passed.\n";
    return 0;
}
