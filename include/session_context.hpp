#pragma once

#include "bar.hpp"
#include "feature_row.hpp"
#include "session_clock.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Days averaged by ATR_20 and the session whose range it averages.
constexpr int ATR_DAYS = 20;
constexpr const char* ATR_SESSION = "ASIA";

/// RSI over 5-minute closes, read at 00:30 reference time.
constexpr int RSI_LENGTH = 14;
constexpr int RSI_BAR_MINUTES = 5;
constexpr int RSI_MINUTE_OF_DAY = 30;

/// High/low of every context window of `day` that has bars, ordered by end time.
std::vector<SessionLevel> buildSessionLevels(absl::CivilDay day,
                                             const std::vector<SessionWindow>& windows,
                                             const SessionClock& clock,
                                             const std::vector<Bar>& bars,
                                             double tick_size);

/// Levels whose window had ended by `cutoff`.
std::vector<SessionLevel> sessionsAsOf(const std::vector<SessionLevel>& levels, std::int64_t cutoff);

const SessionLevel* findSession(const std::vector<SessionLevel>& levels, const std::string& name);

/// Mean of `ranges` when at least ATR_DAYS are given, else nullopt.
std::optional<double> averageRange(const std::vector<double>& ranges);

/// A1_TIGHT / A0_NORMAL / A2_EXPANDED by ASIA range over ATR; empty if unknown.
std::string asiaTypeCode(const SessionLevel* asia, std::optional<double> atr_ticks);
/// Which side of the ASIA range LONDON took: L1_SWEEP_HIGH, L2_SWEEP_LOW,
/// L3_EXPANSION, L4_CONSOLIDATION; empty if unknown.
std::string londonTypeCode(const SessionLevel* london, const SessionLevel* asia);
/// PRE_NY against the combined ASIA/LONDON range: N1_SWEEP_HIGH, N2_SWEEP_LOW,
/// then N3_CONSOLIDATION / N4_EXPANSION / N0_NORMAL by size over ATR.
std::string preNyTypeCode(const SessionLevel* pre_ny,
                          const SessionLevel* london,
                          const SessionLevel* asia,
                          std::optional<double> atr_ticks);

/// RSI of the last RSI_LENGTH + 1 five-minute closes that had closed by
/// `at_utc`. nullopt when fewer are available.
std::optional<double> rsiAt(const std::vector<Bar>& bars, std::int64_t at_utc);

} // namespace orb
