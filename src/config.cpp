#include "config.hpp"
#include "errors.hpp"
#include "absl/time/time.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <set>
#include <sstream>
#include <utility>

namespace orb {

namespace {

constexpr int MINUTES_PER_DAY = 24 * 60;
constexpr int ORB_MINUTES = 5;

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Minutes from the trading-day open to `minute_of_day`, in [0, 1440).
int minutesAfterOpen(int minute_of_day, int day_open_minute) {
    return ((minute_of_day - day_open_minute) % MINUTES_PER_DAY + MINUTES_PER_DAY) % MINUTES_PER_DAY;
}

std::string num(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

std::string optNum(const std::optional<double>& v) {
    return v ? num(*v) : "none";
}

void requireFinite(double v, const std::string& what) {
    if (!std::isfinite(v)) throw InputValidationError(what + " must be a finite number");
}

void validateRisk(const RiskConfig& r, const std::string& window) {
    const std::string where = "window " + window + ": ";
    if (r.confirmation_closes < 1 || r.confirmation_closes > 3)
        throw InputValidationError(where + "confirmation_closes must be 1, 2 or 3");
    if (r.rr_targets.empty())
        throw InputValidationError(where + "at least one rr target is required");
    for (double rr : r.rr_targets) {
        requireFinite(rr, where + "rr target");
        if (rr <= 0) throw InputValidationError(where + "rr targets must be > 0");
    }
    if (r.min_range_ticks) {
        requireFinite(*r.min_range_ticks, where + "min_range_ticks");
        if (*r.min_range_ticks < 0) throw InputValidationError(where + "min_range_ticks must be >= 0");
    }
    if (r.max_range_ticks) {
        requireFinite(*r.max_range_ticks, where + "max_range_ticks");
        if (*r.max_range_ticks <= 0) throw InputValidationError(where + "max_range_ticks must be > 0");
    }
    if (r.min_range_ticks && r.max_range_ticks && *r.min_range_ticks > *r.max_range_ticks)
        throw InputValidationError(where + "min_range_ticks exceeds max_range_ticks");
    requireFinite(r.entry_buffer_ticks, where + "entry_buffer_ticks");
    if (r.entry_buffer_ticks < 0)
        throw InputValidationError(where + "entry_buffer_ticks must be >= 0");
    if (r.max_stop_ticks) {
        requireFinite(*r.max_stop_ticks, where + "max_stop_ticks");
        if (*r.max_stop_ticks <= 0) throw InputValidationError(where + "max_stop_ticks must be > 0");
    }
}

void validateWindowShape(const SessionWindow& w) {
    if (w.name.empty()) throw InputValidationError("window name must not be empty");
    if (w.start_minute < 0 || w.start_minute >= MINUTES_PER_DAY
        || w.end_minute < 0 || w.end_minute >= MINUTES_PER_DAY)
        throw InputValidationError("window " + w.name + ": times must be within 00:00-23:59");
    if (w.start_minute == w.end_minute)
        throw InputValidationError("window " + w.name + ": start and end must differ");
}

} // namespace

//-----------------------------------------------------------------------------
// Enum names
//-----------------------------------------------------------------------------
const char* toString(Direction d) { return d == Direction::Up ? "UP" : "DOWN"; }
const char* toString(StopMode m) { return m == StopMode::Full ? "FULL" : "HALF"; }
const char* toString(EntryMode m) { return m == EntryMode::Close ? "CLOSE" : "NEXT_OPEN"; }
const char* toString(RiskAnchor a) { return a == RiskAnchor::OrbEdge ? "ORB_EDGE" : "ENTRY"; }
const char* toString(DirectionPolicy p) { return p == DirectionPolicy::FirstBreak ? "FIRST_BREAK" : "INDEPENDENT"; }

Direction parseDirection(const std::string& s) {
    std::string u = upper(s);
    if (u == "UP" || u == "LONG") return Direction::Up;
    if (u == "DOWN" || u == "SHORT") return Direction::Down;
    throw InputValidationError("unknown direction \"" + s + "\" (UP or DOWN)");
}

StopMode parseStopMode(const std::string& s) {
    std::string u = upper(s);
    if (u == "FULL") return StopMode::Full;
    if (u == "HALF") return StopMode::Half;
    throw InputValidationError("unknown stop mode \"" + s + "\" (FULL or HALF)");
}

EntryMode parseEntryMode(const std::string& s) {
    std::string u = upper(s);
    if (u == "CLOSE") return EntryMode::Close;
    if (u == "NEXT_OPEN" || u == "NEXT-OPEN") return EntryMode::NextOpen;
    throw InputValidationError("unknown entry mode \"" + s + "\" (CLOSE or NEXT_OPEN)");
}

RiskAnchor parseRiskAnchor(const std::string& s) {
    std::string u = upper(s);
    if (u == "ORB_EDGE" || u == "ORB-EDGE" || u == "EDGE") return RiskAnchor::OrbEdge;
    if (u == "ENTRY") return RiskAnchor::Entry;
    throw InputValidationError("unknown risk anchor \"" + s + "\" (ORB_EDGE or ENTRY)");
}

DirectionPolicy parseDirectionPolicy(const std::string& s) {
    std::string u = upper(s);
    if (u == "FIRST_BREAK" || u == "FIRST-BREAK") return DirectionPolicy::FirstBreak;
    if (u == "INDEPENDENT") return DirectionPolicy::Independent;
    throw InputValidationError("unknown direction policy \"" + s + "\" (FIRST_BREAK or INDEPENDENT)");
}

//-----------------------------------------------------------------------------
// Profiles
//-----------------------------------------------------------------------------
std::vector<SessionWindow> PipelineConfig::allWindows() const {
    std::vector<SessionWindow> out;
    for (const auto& w : instrument.orb_windows) out.push_back(w.window);
    out.insert(out.end(), instrument.context_windows.begin(), instrument.context_windows.end());
    return out;
}

SessionWindow makeOrbWindow(const std::string& hhmm, int minutes) {
    SessionWindow w;
    w.start_minute = parseClockTime(hhmm);
    w.end_minute = (w.start_minute + minutes) % MINUTES_PER_DAY;
    w.kind = WindowKind::Orb;
    char name[8];
    std::snprintf(name, sizeof(name), "%02d%02d", w.start_minute / 60, w.start_minute % 60);
    w.name = name;
    return w;
}

namespace {

SessionWindow contextWindow(const char* name, const char* from, const char* to, WindowKind kind) {
    SessionWindow w;
    w.name = name;
    w.start_minute = parseClockTime(from);
    w.end_minute = parseClockTime(to);
    w.kind = kind;
    return w;
}

// Asia 0900/1000/1100, London 1800, NY 2300 and 0030 (next calendar day).
// PRE_NY overlaps the 2300 window itself, so 2300 has no lead-in.
std::vector<WindowConfig> defaultOrbWindows() {
    const std::pair<const char*, const char*> windows[] = {
        { "09:00", "PRE_ASIA" }, { "10:00", "PRE_ASIA" }, { "11:00", "PRE_ASIA" },
        { "18:00", "PRE_LONDON" }, { "23:00", "" }, { "00:30", "PRE_NY" },
    };
    std::vector<WindowConfig> out;
    for (const auto& [t, pre] : windows) {
        WindowConfig wc;
        wc.window = makeOrbWindow(t, ORB_MINUTES);
        wc.pre_session = pre;
        out.push_back(wc);
    }
    return out;
}

} // namespace

std::vector<SessionWindow> defaultContextWindows() {
    return {
        contextWindow("PRE_ASIA", "07:00", "09:00", WindowKind::PreSession),
        contextWindow("ASIA", "09:00", "17:00", WindowKind::Session),
        contextWindow("PRE_LONDON", "17:00", "18:00", WindowKind::Session),
        contextWindow("LONDON", "18:00", "23:00", WindowKind::Session),
        contextWindow("PRE_NY", "23:00", "00:30", WindowKind::Session),
        contextWindow("NY", "00:30", "02:00", WindowKind::Session),
    };
}

InstrumentConfig builtinInstrument(const std::string& symbol) {
    const std::string sym = upper(symbol);
    InstrumentConfig ic;
    ic.symbol = sym;
    ic.context_windows = defaultContextWindows();
    ic.orb_windows = defaultOrbWindows();

    if (sym == "MGC") {
        // Micro gold: $10 per point, 0.1 tick.
        ic.tick_size = 0.1;
        ic.tick_value = 1.0;
        ic.cost = CostModel{2.0, 0.5, 1.0};
    } else if (sym == "NQ") {
        ic.tick_size = 0.25;
        ic.tick_value = 5.0;
        ic.cost = CostModel{4.0, 0.5, 5.0};
    } else if (sym == "MPL") {
        ic.tick_size = 0.1;
        ic.tick_value = 1.0;
        ic.cost = CostModel{2.0, 0.5, 1.0};
    } else {
        throw InputValidationError("unknown instrument \"" + symbol + "\" (available: MGC, NQ, MPL)");
    }
    return ic;
}

std::vector<std::string> builtinInstrumentNames() {
    return { "MGC", "NQ", "MPL" };
}

std::vector<WindowConfig> selectWindows(const std::vector<WindowConfig>& windows,
                                        const std::vector<std::string>& names) {
    std::vector<WindowConfig> out;
    for (const auto& name : names) {
        auto it = std::find_if(windows.begin(), windows.end(),
                               [&](const WindowConfig& w) { return w.window.name == name; });
        if (it == windows.end())
            throw InputValidationError("unsupported window \"" + name + "\"");
        out.push_back(*it);
    }
    return out;
}

//-----------------------------------------------------------------------------
// Validation
//-----------------------------------------------------------------------------
PipelineConfig validateConfig(PipelineConfig cfg) {
    absl::TimeZone tz;
    if (!absl::LoadTimeZone(cfg.reference_zone, &tz))
        throw InputValidationError("unknown timezone \"" + cfg.reference_zone + "\"");
    if (cfg.day_open_minute < 0 || cfg.day_open_minute >= MINUTES_PER_DAY)
        throw InputValidationError("trading-day open must be within 00:00-23:59");

    InstrumentConfig& ic = cfg.instrument;
    if (ic.symbol.empty()) throw InputValidationError("instrument symbol must not be empty");
    requireFinite(ic.tick_size, "tick_size");
    requireFinite(ic.tick_value, "tick_value");
    if (ic.tick_size <= 0) throw InputValidationError("tick_size must be > 0");
    if (ic.tick_value <= 0) throw InputValidationError("tick_value must be > 0");
    if (ic.cost) {
        requireFinite(ic.cost->commission_round_trip, "commission_round_trip");
        requireFinite(ic.cost->slippage_ticks, "slippage_ticks");
        requireFinite(ic.cost->tick_value, "cost tick_value");
        if (ic.cost->commission_round_trip < 0 || ic.cost->slippage_ticks < 0 || ic.cost->tick_value <= 0)
            throw InputValidationError("cost model values must be >= 0 (tick_value > 0)");
    }
    if (ic.orb_windows.empty()) throw InputValidationError("no ORB windows configured");

    std::set<std::string> names;
    for (const auto& wc : ic.orb_windows) {
        const SessionWindow& w = wc.window;
        validateWindowShape(w);
        if (w.kind != WindowKind::Orb)
            throw InputValidationError("window " + w.name + ": expected an ORB window");
        if (!names.insert(w.name).second)
            throw InputValidationError("duplicate window name " + w.name);
        // An ORB window must close by the next trading-day open.
        if (minutesAfterOpen(w.start_minute, cfg.day_open_minute) + w.lengthMinutes() > MINUTES_PER_DAY)
            throw InputValidationError("window " + w.name + " runs past the trading-day end");
        validateRisk(wc.risk, w.name);
    }
    for (const auto& w : ic.context_windows) {
        validateWindowShape(w);
        if (!names.insert(w.name).second)
            throw InputValidationError("duplicate window name " + w.name);
        if (w.kind == WindowKind::PreSession) {
            int lead = minutesAfterOpen(cfg.day_open_minute, w.start_minute);
            if (lead == 0 || w.lengthMinutes() > lead)
                throw InputValidationError("pre-session window " + w.name + " must end by the trading-day open");
        } else if (w.kind == WindowKind::Session) {
            if (minutesAfterOpen(w.start_minute, cfg.day_open_minute) + w.lengthMinutes() > MINUTES_PER_DAY)
                throw InputValidationError("session window " + w.name + " runs past the trading-day end");
        } else {
            throw InputValidationError("window " + w.name + ": expected a SESSION or PRE_SESSION window");
        }
    }
    for (const auto& wc : ic.orb_windows) {
        if (wc.pre_session.empty()) continue;
        auto it = std::find_if(ic.context_windows.begin(), ic.context_windows.end(),
                               [&](const SessionWindow& w) { return w.name == wc.pre_session; });
        if (it == ic.context_windows.end())
            throw InputValidationError("window " + wc.window.name + ": unknown pre-session window "
                                       + wc.pre_session);
    }

    const int open = cfg.day_open_minute;
    std::stable_sort(ic.orb_windows.begin(), ic.orb_windows.end(),
                     [open](const WindowConfig& a, const WindowConfig& b) {
                         return minutesAfterOpen(a.window.start_minute, open)
                              < minutesAfterOpen(b.window.start_minute, open);
                     });

    cfg.version = configVersion(cfg);
    return cfg;
}

std::string canonicalConfigText(const PipelineConfig& cfg) {
    const InstrumentConfig& ic = cfg.instrument;
    std::ostringstream os;
    os << "zone=" << cfg.reference_zone << "\n";
    os << "day_open=" << formatClockTime(cfg.day_open_minute) << "\n";
    os << "symbol=" << ic.symbol << "\n";
    os << "tick_size=" << num(ic.tick_size) << "\n";
    os << "tick_value=" << num(ic.tick_value) << "\n";
    if (ic.cost)
        os << "cost=" << num(ic.cost->commission_round_trip) << "," << num(ic.cost->slippage_ticks)
           << "," << num(ic.cost->tick_value) << "\n";
    else
        os << "cost=none\n";
    for (const auto& w : ic.context_windows)
        os << "context=" << w.name << " " << formatClockTime(w.start_minute) << "-"
           << formatClockTime(w.end_minute) << (w.kind == WindowKind::PreSession ? " pre_open" : "") << "\n";
    for (const auto& wc : ic.orb_windows) {
        const RiskConfig& r = wc.risk;
        os << "window=" << wc.window.name << " " << formatClockTime(wc.window.start_minute) << "-"
           << formatClockTime(wc.window.end_minute)
           << " closes=" << r.confirmation_closes
           << " stop=" << toString(r.stop_mode)
           << " rr=";
        for (std::size_t i = 0; i < r.rr_targets.size(); ++i)
            os << (i ? "," : "") << num(r.rr_targets[i]);
        os << " min_range=" << optNum(r.min_range_ticks)
           << " max_range=" << optNum(r.max_range_ticks)
           << " entry=" << toString(r.entry_mode)
           << " anchor=" << toString(r.risk_anchor)
           << " policy=" << toString(r.direction_policy)
           << " buffer=" << num(r.entry_buffer_ticks)
           << " max_stop=" << optNum(r.max_stop_ticks)
           << " pre_session=" << (wc.pre_session.empty() ? "none" : wc.pre_session) << "\n";
    }
    return os.str();
}

std::string configVersion(const PipelineConfig& cfg) {
    const std::string text = canonicalConfigText(cfg);
    std::uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[24];
    std::snprintf(buf, sizeof(buf), "orb1-%016llx", static_cast<unsigned long long>(h));
    return buf;
}

} // namespace orb
