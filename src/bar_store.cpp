#include "bar_store.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace orb {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

int resolutionMinutes(const std::string& resolution) {
    std::string r = resolution;
    for (auto& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (r == "1m" || r.empty()) return 1;
    if (r == "5m") return 5;
    if (r == "15m") return 15;
    if (r == "1h" || r == "1hr") return 60;
    throw InputValidationError("unsupported bar resolution \"" + resolution + "\" (use 1m, 5m, 15m, 1h)");
}

std::vector<Bar> aggregateBars(const std::vector<Bar>& bars, int interval_minutes) {
    if (interval_minutes <= 1) return bars;
    const std::int64_t interval = static_cast<std::int64_t>(interval_minutes) * 60;
    std::vector<Bar> out;
    for (const Bar& b : bars) {
        std::int64_t bucket = b.ts_utc - (b.ts_utc % interval);
        if (out.empty() || out.back().ts_utc != bucket) {
            Bar agg = b;
            agg.ts_utc = bucket;
            out.push_back(agg);
        } else {
            Bar& agg = out.back();
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    return out;
}

//-----------------------------------------------------------------------------
// MemoryBarStore
//-----------------------------------------------------------------------------
void MemoryBarStore::setBars(const std::string& instrument, std::vector<Bar> bars) {
    std::sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) { return a.ts_utc < b.ts_utc; });
    auto dup = std::adjacent_find(bars.begin(), bars.end(),
                                  [](const Bar& a, const Bar& b) { return a.ts_utc == b.ts_utc; });
    if (dup != bars.end())
        throw InputValidationError(instrument + ": duplicate bar at " + std::to_string(dup->ts_utc));
    bars_[upper(instrument)] = std::move(bars);
}

std::vector<Bar> MemoryBarStore::getBars(const std::string& instrument,
                                         std::int64_t start_utc,
                                         std::int64_t end_utc,
                                         const std::string& resolution) const {
    const int minutes = resolutionMinutes(resolution);
    auto it = bars_.find(upper(instrument));
    if (it == bars_.end() || end_utc <= start_utc) return {};
    const auto& all = it->second;
    std::size_t first = firstBarAtOrAfter(all, start_utc);
    std::size_t last = firstBarAtOrAfter(all, end_utc);
    std::vector<Bar> out(all.begin() + static_cast<std::ptrdiff_t>(first),
                         all.begin() + static_cast<std::ptrdiff_t>(last));
    return aggregateBars(out, minutes);
}

std::size_t MemoryBarStore::size(const std::string& instrument) const {
    auto it = bars_.find(upper(instrument));
    return it == bars_.end() ? 0 : it->second.size();
}

//-----------------------------------------------------------------------------
// SqliteBarStore
//-----------------------------------------------------------------------------
SqliteBarStore::SqliteBarStore(const std::string& db_path) : db_path_(db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw DataGapError("failed to open bar database " + db_path + ": " + msg);
    }

    const char* create_sql = R"(
        CREATE TABLE IF NOT EXISTS bars_1m (
            symbol TEXT NOT NULL,
            ts_utc INTEGER NOT NULL,
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL NOT NULL DEFAULT 0,
            PRIMARY KEY (symbol, ts_utc)
        );
    )";
    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, create_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
        throw DataGapError("failed to create bars_1m in " + db_path + ": " + msg);
    }
}

SqliteBarStore::~SqliteBarStore() {
    if (db_) sqlite3_close(db_);
}

std::vector<Bar> SqliteBarStore::getBars(const std::string& instrument,
                                         std::int64_t start_utc,
                                         std::int64_t end_utc,
                                         const std::string& resolution) const {
    const int minutes = resolutionMinutes(resolution);
    const char* select_sql =
        "SELECT ts_utc, open, high, low, close, volume FROM bars_1m "
        "WHERE symbol = ? AND ts_utc >= ? AND ts_utc < ? ORDER BY ts_utc";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &raw, nullptr) != SQLITE_OK)
        throw DataGapError("failed to prepare bar select: " + std::string(sqlite3_errmsg(db_)));
    Stmt stmt(raw);

    const std::string sym = upper(instrument);
    sqlite3_bind_text(stmt.get(), 1, sym.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, start_utc);
    sqlite3_bind_int64(stmt.get(), 3, end_utc);

    std::vector<Bar> bars;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Bar b;
        b.ts_utc = sqlite3_column_int64(stmt.get(), 0);
        b.open = sqlite3_column_double(stmt.get(), 1);
        b.high = sqlite3_column_double(stmt.get(), 2);
        b.low = sqlite3_column_double(stmt.get(), 3);
        b.close = sqlite3_column_double(stmt.get(), 4);
        b.volume = sqlite3_column_double(stmt.get(), 5);
        bars.push_back(b);
    }
    if (rc != SQLITE_DONE)
        throw DataGapError("failed to read bars for " + sym + ": " + std::string(sqlite3_errmsg(db_)));
    return aggregateBars(bars, minutes);
}

void SqliteBarStore::insertBars(const std::string& instrument, const std::vector<Bar>& bars) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        throw PersistenceError("failed to begin bar insert: " + msg);
    }

    auto rollback = [this](const std::string& what) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw PersistenceError(what + ": " + std::string(sqlite3_errmsg(db_)));
    };

    const char* insert_sql =
        "INSERT OR REPLACE INTO bars_1m (symbol, ts_utc, open, high, low, close, volume) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &raw, nullptr) != SQLITE_OK)
        rollback("failed to prepare bar insert");
    Stmt stmt(raw);

    const std::string sym = upper(instrument);
    for (const Bar& b : bars) {
        sqlite3_bind_text(stmt.get(), 1, sym.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, b.ts_utc);
        sqlite3_bind_double(stmt.get(), 3, b.open);
        sqlite3_bind_double(stmt.get(), 4, b.high);
        sqlite3_bind_double(stmt.get(), 5, b.low);
        sqlite3_bind_double(stmt.get(), 6, b.close);
        sqlite3_bind_double(stmt.get(), 7, b.volume);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            rollback("failed to insert bar");
        sqlite3_reset(stmt.get());
    }
    stmt.reset();

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
        rollback("failed to commit bars");
}

} // namespace orb
