#pragma once

#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// ORB windows are traded. SESSION and PRE_SESSION windows only feed context:
/// a SESSION window falls inside the trading day like an ORB window, a
/// PRE_SESSION window sits immediately before the trading-day open.
enum class WindowKind { Orb, Session, PreSession };

/// Named window in reference-timezone wall-clock time. end <= start crosses midnight.
struct SessionWindow {
    std::string name;
    int start_minute{0};  // minutes after local midnight
    int end_minute{0};
    WindowKind kind{WindowKind::Orb};

    int lengthMinutes() const {
        int len = end_minute - start_minute;
        return len > 0 ? len : len + 24 * 60;
    }
};

/// Half-open UTC interval [start, end).
struct UtcSpan {
    std::int64_t start{0};
    std::int64_t end{0};

    bool contains(std::int64_t ts) const { return ts >= start && ts < end; }
};

/// "HH:MM" -> minutes after midnight. Throws InputValidationError.
int parseClockTime(const std::string& hhmm);
std::string formatClockTime(int minute_of_day);

/// Parses "YYYY-MM-DD". Throws InputValidationError.
absl::CivilDay parseDay(const std::string& s);
std::string formatDay(absl::CivilDay day);

/// "2025-01-10T00:05:00Z"
std::string formatUtc(std::int64_t ts_utc);

/// Maps UTC instants onto trading days and session windows of a fixed
/// reference timezone. Offsets come from the tz database, so windows stay put
/// in reference time whatever other markets do with daylight saving.
///
/// Trading day D spans [D day_open, D+1 day_open) in reference time.
/// ORB and SESSION windows of D are the first occurrence of their start at or
/// after D's open (an 00:30 window therefore falls on calendar day D+1).
/// PRE_SESSION windows of D are the occurrence that precedes D's open.
class SessionClock {
public:
    /// Throws InputValidationError if the zone is not in the tz database.
    explicit SessionClock(const std::string& zone_name = "Australia/Brisbane",
                          int day_open_minute = 9 * 60);

    absl::CivilDay toTradingDay(std::int64_t ts_utc) const;

    UtcSpan daySpan(absl::CivilDay day) const;
    std::int64_t sessionEnd(absl::CivilDay day) const { return daySpan(day).end; }
    UtcSpan windowSpan(absl::CivilDay day, const SessionWindow& window) const;
    /// First occurrence of local `minute_of_day` at or after D's open.
    std::int64_t instantOf(absl::CivilDay day, int minute_of_day) const;

    /// Smallest span covering the day and every window of it: the single
    /// bar load for that day.
    UtcSpan loadSpan(absl::CivilDay day, const std::vector<SessionWindow>& windows) const;

    /// Name of the first window of `day` containing ts_utc, if any.
    std::optional<std::string> classify(std::int64_t ts_utc,
                                        const std::vector<SessionWindow>& windows,
                                        absl::CivilDay day) const;

    std::int64_t toUtc(absl::CivilMinute local) const;
    absl::CivilMinute toLocal(std::int64_t ts_utc) const;
    /// "2025-01-10 10:05" in reference time.
    std::string formatLocal(std::int64_t ts_utc) const;
    /// Offset of the reference zone from UTC at ts_utc, in seconds.
    int utcOffsetSeconds(std::int64_t ts_utc) const;

    const std::string& zoneName() const { return zone_name_; }
    int dayOpenMinute() const { return day_open_minute_; }

private:
    absl::TimeZone tz_;
    std::string zone_name_;
    int day_open_minute_;
};

} // namespace orb
