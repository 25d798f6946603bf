#include "data_source.hpp"
#include "errors.hpp"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace orb {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\"");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool parseNumber(const std::string& s, double& out) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::optional<std::int64_t> parseUtcTimestamp(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;
    if (allDigits(s)) {
        try {
            return std::stoll(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (s.size() < 10) return std::nullopt;

    // Databento filenames use '_' in place of ':' in the time part.
    for (std::size_t i = 10; i < s.size(); ++i)
        if (s[i] == '_') s[i] = ':';
    if (s.size() > 10 && s[10] == ' ') s[10] = 'T';

    absl::Time t;
    std::string err;
    if (absl::ParseTime(absl::RFC3339_full, s, &t, &err))
        return absl::ToUnixSeconds(t);

    // No offset: civil time taken as UTC. Drop fractional seconds first.
    std::string civil = s;
    auto dot = civil.find('.', 10);
    if (dot != std::string::npos) civil = civil.substr(0, dot);
    if (!civil.empty() && (civil.back() == 'Z' || civil.back() == 'z')) civil.pop_back();
    absl::CivilSecond cs;
    if (!absl::ParseLenientCivilTime(civil, &cs)) return std::nullopt;
    return absl::ToUnixSeconds(absl::FromCivil(cs, absl::UTCTimeZone()));
}

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load(const std::string& symbol_filter) {
    bars_.clear();
    skipped_ = 0;
    error_.clear();
    std::ifstream f(filepath_);
    if (!f.is_open()) {
        error_ = "cannot open " + filepath_;
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        error_ = "empty file " + filepath_;
        return false;
    }
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    const int iDate = findColumn(headers, {"ts_utc", "timestamp", "datetime", "date", "time", "ts_event"});
    const int iOpen = findColumn(headers, {"open", "o"});
    const int iHigh = findColumn(headers, {"high", "h"});
    const int iLow = findColumn(headers, {"low", "l"});
    const int iClose = findColumn(headers, {"close", "c"});
    const int iVol = findColumn(headers, {"volume", "vol", "v"});
    const int iSym = findColumn(headers, {"symbol", "instrument"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0) {
        error_ = "missing timestamp/open/high/low/close columns in " + filepath_;
        return false;
    }
    std::string want = symbol_filter;
    toLower(want);
    const std::size_t needed = static_cast<std::size_t>(std::max({iDate, iOpen, iHigh, iLow, iClose})) + 1;

    std::size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto parts = split(line, ',');
        if (parts.size() < needed) { ++skipped_; continue; }

        if (!want.empty() && iSym >= 0 && static_cast<std::size_t>(iSym) < parts.size()) {
            std::string sym = parts[static_cast<std::size_t>(iSym)];
            toLower(sym);
            if (sym != want) continue;
        }

        const std::string& ts_text = parts[static_cast<std::size_t>(iDate)];
        auto ts = parseUtcTimestamp(ts_text);
        if (!ts)
            throw InputValidationError(filepath_ + ":" + std::to_string(line_no)
                                       + ": malformed timestamp \"" + ts_text + "\"");

        Bar b;
        b.ts_utc = *ts;
        bool ok = parseNumber(parts[static_cast<std::size_t>(iOpen)], b.open)
               && parseNumber(parts[static_cast<std::size_t>(iHigh)], b.high)
               && parseNumber(parts[static_cast<std::size_t>(iLow)], b.low)
               && parseNumber(parts[static_cast<std::size_t>(iClose)], b.close);
        if (ok && iVol >= 0 && static_cast<std::size_t>(iVol) < parts.size())
            ok = parseNumber(parts[static_cast<std::size_t>(iVol)], b.volume);
        if (!ok) { ++skipped_; continue; }
        bars_.push_back(b);
    }

    sortAndCheck(filepath_);
    return true;
}

std::optional<Bar> DataSource::parseDatabentoFilename(const std::string& filename) {
    // Filename format: ts, ignore, ignore, ignore, open, high, low, close, volume, symbol
    auto parts = split(filename, ',');
    if (parts.size() < 10) return std::nullopt;
    auto ts = parseUtcTimestamp(parts[0]);
    if (!ts)
        throw InputValidationError("malformed timestamp in Databento filename \"" + filename + "\"");
    Bar b;
    b.ts_utc = *ts;
    if (!parseNumber(parts[4], b.open) || !parseNumber(parts[5], b.high) || !parseNumber(parts[6], b.low)
        || !parseNumber(parts[7], b.close) || !parseNumber(parts[8], b.volume))
        return std::nullopt;
    return b;
}

bool DataSource::loadFromDatabentoDir(const std::string& dir, const std::string& symbol_filter) {
    bars_.clear();
    skipped_ = 0;
    error_.clear();
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) {
        error_ = "not a directory: " + dir;
        return false;
    }

    std::string want = symbol_filter;
    toLower(want);
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (ec || !entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        if (filename.empty()) continue;

        // Filter by symbol (last field). Case-insensitive match.
        if (!want.empty()) {
            auto parts = split(filename, ',');
            if (parts.size() < 10) continue;
            std::string sym = parts[9];
            toLower(sym);
            if (sym != want) continue;
        }

        auto bar = parseDatabentoFilename(filename);
        if (!bar) { ++skipped_; continue; }
        bars_.push_back(*bar);
    }

    sortAndCheck(dir);
    return true;
}

std::vector<ContractSummary> DataSource::listContractsInDatabentoDir(const std::string& dir) {
    std::map<std::string, ContractSummary> by_symbol;
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) return {};

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (ec || !entry.is_regular_file()) continue;
        auto parts = split(entry.path().filename().string(), ',');
        if (parts.size() < 10 || parts[9].empty()) continue;
        auto ts = parseUtcTimestamp(parts[0]);
        if (!ts) continue;

        std::string sym = parts[9];
        for (auto& ch : sym) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        ContractSummary& c = by_symbol[sym];
        if (c.bars == 0) {
            c.symbol = sym;
            c.first_ts = *ts;
            c.last_ts = *ts;
        }
        c.first_ts = std::min(c.first_ts, *ts);
        c.last_ts = std::max(c.last_ts, *ts);
        ++c.bars;
    }

    std::vector<ContractSummary> out;
    for (const auto& kv : by_symbol) out.push_back(kv.second);
    return out;
}

void DataSource::sortAndCheck(const std::string& origin) {
    std::sort(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.ts_utc < b.ts_utc;
    });
    auto dup = std::adjacent_find(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.ts_utc == b.ts_utc;
    });
    if (dup != bars_.end())
        throw InputValidationError(origin + ": duplicate bar at " + std::to_string(dup->ts_utc));
}

} // namespace orb
