#include "session_clock.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace orb {

namespace {

constexpr int MINUTES_PER_DAY = 24 * 60;

// 1970-01-01 .. 2200-01-01; anything outside is corrupt input, not market data.
constexpr std::int64_t MIN_TS = 0;
constexpr std::int64_t MAX_TS = 7258118400LL;

void checkTimestamp(std::int64_t ts_utc) {
    if (ts_utc < MIN_TS || ts_utc >= MAX_TS)
        throw InputValidationError("timestamp out of range: " + std::to_string(ts_utc));
    if (ts_utc % 60 != 0)
        throw InputValidationError("timestamp not minute aligned: " + std::to_string(ts_utc));
}

} // namespace

int parseClockTime(const std::string& hhmm) {
    int h = -1, m = -1;
    char tail = 0;
    // Accept "HH:MM" and the compact "HHMM" used for window names.
    bool ok = false;
    if (hhmm.size() == 5 && hhmm[2] == ':')
        ok = std::sscanf(hhmm.c_str(), "%2d:%2d%c", &h, &m, &tail) == 2;
    else if (hhmm.size() == 4 && std::all_of(hhmm.begin(), hhmm.end(),
                                             [](unsigned char c) { return std::isdigit(c); }))
        ok = std::sscanf(hhmm.c_str(), "%2d%2d", &h, &m) == 2;
    if (!ok || h < 0 || h > 23 || m < 0 || m > 59)
        throw InputValidationError("invalid clock time \"" + hhmm + "\" (expected HH:MM)");
    return h * 60 + m;
}

std::string formatClockTime(int minute_of_day) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", (minute_of_day / 60) % 24, minute_of_day % 60);
    return buf;
}

absl::CivilDay parseDay(const std::string& s) {
    absl::CivilDay day;
    if (s.size() != 10 || !absl::ParseCivilTime(s, &day))
        throw InputValidationError("invalid date \"" + s + "\" (expected YYYY-MM-DD)");
    return day;
}

std::string formatDay(absl::CivilDay day) {
    return absl::FormatCivilTime(day);
}

std::string formatUtc(std::int64_t ts_utc) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::FromUnixSeconds(ts_utc), absl::UTCTimeZone());
}

SessionClock::SessionClock(const std::string& zone_name, int day_open_minute)
    : zone_name_(zone_name)
    , day_open_minute_(day_open_minute)
{
    if (!absl::LoadTimeZone(zone_name, &tz_))
        throw InputValidationError("unknown timezone \"" + zone_name + "\"");
    if (day_open_minute < 0 || day_open_minute >= MINUTES_PER_DAY)
        throw InputValidationError("trading-day open must be within 00:00-23:59");
}

absl::CivilDay SessionClock::toTradingDay(std::int64_t ts_utc) const {
    checkTimestamp(ts_utc);
    absl::CivilMinute shifted = toLocal(ts_utc) - day_open_minute_;
    return absl::CivilDay(shifted);
}

UtcSpan SessionClock::daySpan(absl::CivilDay day) const {
    absl::CivilMinute open = absl::CivilMinute(day) + day_open_minute_;
    return { toUtc(open), toUtc(open + MINUTES_PER_DAY) };
}

UtcSpan SessionClock::windowSpan(absl::CivilDay day, const SessionWindow& window) const {
    absl::CivilDay start_day = day;
    if (window.kind == WindowKind::PreSession) {
        if (window.start_minute >= day_open_minute_) start_day = day - 1;
    } else {
        if (window.start_minute < day_open_minute_) start_day = day + 1;
    }
    absl::CivilMinute start = absl::CivilMinute(start_day) + window.start_minute;
    return { toUtc(start), toUtc(start + window.lengthMinutes()) };
}

std::int64_t SessionClock::instantOf(absl::CivilDay day, int minute_of_day) const {
    absl::CivilDay d = minute_of_day < day_open_minute_ ? day + 1 : day;
    return toUtc(absl::CivilMinute(d) + minute_of_day);
}

UtcSpan SessionClock::loadSpan(absl::CivilDay day, const std::vector<SessionWindow>& windows) const {
    UtcSpan span = daySpan(day);
    for (const auto& w : windows) {
        UtcSpan ws = windowSpan(day, w);
        span.start = std::min(span.start, ws.start);
        span.end = std::max(span.end, ws.end);
    }
    return span;
}

std::optional<std::string> SessionClock::classify(std::int64_t ts_utc,
                                                  const std::vector<SessionWindow>& windows,
                                                  absl::CivilDay day) const {
    checkTimestamp(ts_utc);
    for (const auto& w : windows) {
        if (windowSpan(day, w).contains(ts_utc)) return w.name;
    }
    return std::nullopt;
}

std::int64_t SessionClock::toUtc(absl::CivilMinute local) const {
    // Skipped/repeated local times resolve to the pre-transition offset.
    return absl::ToUnixSeconds(absl::FromCivil(local, tz_));
}

absl::CivilMinute SessionClock::toLocal(std::int64_t ts_utc) const {
    return absl::ToCivilMinute(absl::FromUnixSeconds(ts_utc), tz_);
}

std::string SessionClock::formatLocal(std::int64_t ts_utc) const {
    return absl::FormatTime("%Y-%m-%d %H:%M", absl::FromUnixSeconds(ts_utc), tz_);
}

int SessionClock::utcOffsetSeconds(std::int64_t ts_utc) const {
    return tz_.At(absl::FromUnixSeconds(ts_utc)).offset;
}

} // namespace orb
