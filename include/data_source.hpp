#pragma once

#include "bar.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Parses a UTC timestamp into epoch seconds.
/// Accepts epoch seconds, RFC 3339 ("2025-01-10T00:05:00Z", "+10:00" offsets,
/// fractional seconds), "2025-01-10 00:05:00" (taken as UTC) and the Databento
/// filename form "2025-08-04T00_00_00.000000000Z".
std::optional<std::int64_t> parseUtcTimestamp(const std::string& s);

/// One contract found in a Databento folder: bar count and first/last bar time.
struct ContractSummary {
    std::string symbol;          // upper case, as passed to --symbol
    std::size_t bars{0};
    std::int64_t first_ts{0};
    std::int64_t last_ts{0};
};

/// Loads 1-minute OHLCV bars from a CSV file or from a Databento glbx folder (filename = data).
/// CSV: columns ts_utc/timestamp/date/datetime/time, open, high, low, close [, volume] [, symbol].
/// Databento: each file is 0 bytes; filename is comma-separated: ts, ignore, ignore, ignore, o, h, l, c, v, symbol.
/// Bars come out sorted by timestamp. Malformed timestamps and duplicate
/// timestamps throw InputValidationError; other bad rows are skipped and counted.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from CSV file. Returns false if the file or its header is unusable (see lastError()).
    /// symbol_filter: when the CSV has a symbol column, keep only that symbol (case-insensitive).
    bool load(const std::string& symbol_filter = "");

    /// Load bars from Databento glbx... folder. Each filename = one bar (ts, 3 ignored, o, h, l, c, v, symbol).
    /// Optional symbol_filter (e.g. "MGCG5") to load only that symbol.
    bool loadFromDatabentoDir(const std::string& dir, const std::string& symbol_filter = "");

    /// Contracts in a Databento dir, sorted by symbol. Filenames with fewer than
    /// ten fields or an unparseable timestamp are not counted. Empty if the dir
    /// is missing.
    static std::vector<ContractSummary> listContractsInDatabentoDir(const std::string& dir);

    const std::vector<Bar>& bars() const { return bars_; }
    std::vector<Bar> takeBars() { return std::move(bars_); }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    std::size_t skippedRows() const { return skipped_; }
    const std::string& lastError() const { return error_; }

    const Bar& at(std::size_t i) const { return bars_.at(i); }

private:
    std::string filepath_;
    std::vector<Bar> bars_;
    std::size_t skipped_{0};
    std::string error_;

    std::optional<Bar> parseDatabentoFilename(const std::string& filename);
    void sortAndCheck(const std::string& origin);
};

} // namespace orb
