#pragma once

#include "order.hpp"
#include "session_clock.hpp"
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Round-trip trading costs. tick_value is the instrument's dollar value per tick.
struct CostModel {
    double commission_round_trip{0};
    double slippage_ticks{0};
    double tick_value{0};

    double costDollars() const { return commission_round_trip + slippage_ticks * tick_value; }
};

/// Per-window trade construction rules.
struct RiskConfig {
    int confirmation_closes{1};                 // 1, 2 or 3 consecutive closes beyond the boundary
    StopMode stop_mode{StopMode::Full};
    std::vector<double> rr_targets{1.0};        // [0] is the row's primary target
    std::optional<double> min_range_ticks;      // ranges narrower than this are not traded
    std::optional<double> max_range_ticks;
    EntryMode entry_mode{EntryMode::Close};
    RiskAnchor risk_anchor{RiskAnchor::OrbEdge};
    DirectionPolicy direction_policy{DirectionPolicy::FirstBreak};
    double entry_buffer_ticks{0};
    std::optional<double> max_stop_ticks;

    double primaryRr() const { return rr_targets.front(); }
};

struct WindowConfig {
    SessionWindow window;
    RiskConfig risk;
    std::string pre_session;   // context window reported as this window's lead-in; may be empty
};

struct InstrumentConfig {
    std::string symbol;
    double tick_size{0.1};
    double tick_value{1.0};
    std::optional<CostModel> cost;              // absent -> gross R
    std::vector<SessionWindow> context_windows; // SESSION / PRE_SESSION, never traded
    std::vector<WindowConfig> orb_windows;
};

/// Everything a run depends on. Built once, validated once, then only read.
struct PipelineConfig {
    InstrumentConfig instrument;
    std::string reference_zone{"Australia/Brisbane"};
    int day_open_minute{9 * 60};
    std::string version;  // set by validateConfig

    /// ORB windows first, then the context windows.
    std::vector<SessionWindow> allWindows() const;
};

/// ORB window named after its start ("0900") lasting `minutes`.
SessionWindow makeOrbWindow(const std::string& hhmm, int minutes = 5);

/// PRE_ASIA 07:00-09:00 (before the open), ASIA 09:00-17:00, PRE_LONDON
/// 17:00-18:00, LONDON 18:00-23:00, PRE_NY 23:00-00:30, NY 00:30-02:00.
std::vector<SessionWindow> defaultContextWindows();

/// Compiled-in profiles: MGC, NQ, MPL. Throws InputValidationError for other symbols.
InstrumentConfig builtinInstrument(const std::string& symbol);
std::vector<std::string> builtinInstrumentNames();

/// Keeps only the named ORB windows, in their configured order.
/// Throws InputValidationError for a name the instrument does not define.
std::vector<WindowConfig> selectWindows(const std::vector<WindowConfig>& windows,
                                        const std::vector<std::string>& names);

/// Checks every value, orders ORB windows chronologically from the day open
/// and stamps the config version. Throws InputValidationError.
PipelineConfig validateConfig(PipelineConfig cfg);

/// Stable "key=value" text of everything that affects row content.
std::string canonicalConfigText(const PipelineConfig& cfg);
/// "orb1-" + 16 hex digits of FNV-1a 64 over canonicalConfigText.
std::string configVersion(const PipelineConfig& cfg);

} // namespace orb
