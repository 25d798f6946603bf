#pragma once

#include "bar.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct sqlite3;

namespace orb {

/// "1m" -> 1, "5m" -> 5, "15m" -> 15, "1h"/"1hr" -> 60. Throws InputValidationError otherwise.
int resolutionMinutes(const std::string& resolution);

/// Aggregate ascending 1m bars into interval_minutes buckets aligned to UTC.
/// OHLCV: open=first, high=max, low=min, close=last, volume=sum. Empty buckets are not created.
std::vector<Bar> aggregateBars(const std::vector<Bar>& bars, int interval_minutes);

/// Read side of the bar store. Implementations return bars with
/// start_utc <= ts < end_utc in ascending order; gaps are passed through.
class IBarStore {
public:
    virtual ~IBarStore() = default;

    /// Throws DataGapError when the span cannot be read.
    virtual std::vector<Bar> getBars(const std::string& instrument,
                                     std::int64_t start_utc,
                                     std::int64_t end_utc,
                                     const std::string& resolution = "1m") const = 0;
};

/// Bars held in memory per instrument (CSV / Databento loads, tests).
class MemoryBarStore : public IBarStore {
public:
    /// Sorts the bars; duplicate timestamps throw InputValidationError.
    void setBars(const std::string& instrument, std::vector<Bar> bars);

    std::vector<Bar> getBars(const std::string& instrument,
                             std::int64_t start_utc,
                             std::int64_t end_utc,
                             const std::string& resolution = "1m") const override;

    std::size_t size(const std::string& instrument) const;

private:
    std::map<std::string, std::vector<Bar>> bars_;
};

/// bars_1m(symbol TEXT, ts_utc INTEGER, open, high, low, close, volume) in a SQLite file.
class SqliteBarStore : public IBarStore {
public:
    /// Opens (and creates the table in) db_path. Throws DataGapError if the file cannot be opened.
    explicit SqliteBarStore(const std::string& db_path);
    ~SqliteBarStore() override;

    SqliteBarStore(const SqliteBarStore&) = delete;
    SqliteBarStore& operator=(const SqliteBarStore&) = delete;

    std::vector<Bar> getBars(const std::string& instrument,
                             std::int64_t start_utc,
                             std::int64_t end_utc,
                             const std::string& resolution = "1m") const override;

    /// Insert or replace 1m bars for instrument in one transaction.
    /// Throws PersistenceError on failure (nothing is written).
    void insertBars(const std::string& instrument, const std::vector<Bar>& bars);

private:
    sqlite3* db_ = nullptr;
    std::string db_path_;
};

} // namespace orb
