#include "feature_table.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <memory>

namespace orb {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

const char* ROW_COLUMNS =
    "instrument, day, window_name, direction, window_seq, config_version, "
    "range_defined, orb_high, orb_low, orb_size_ticks, orb_bar_count, "
    "outcome, r_multiple, r_multiple_gross, rr, "
    "break_time, risk_ticks, mae_ticks, mfe_ticks, entry_time, entry_price, stop_price, target_price, exit_time, "
    "entry_delay_bars, note, prior_window_name, prior_window_break, prior_window_outcome, prior_day_outcome, "
    "pre_session_name, pre_session_range_ticks, atr_20_ticks, asia_type_code, london_type_code, pre_ny_type_code, "
    "rsi_0030";

constexpr int ROW_COLUMN_COUNT = 37;

std::string errorOf(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "database not open";
}

Stmt prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        throw PersistenceError("failed to prepare \"" + sql.substr(0, 40) + "...\": " + errorOf(db));
    return Stmt(raw);
}

void bindText(sqlite3_stmt* s, int i, const std::string& v) {
    sqlite3_bind_text(s, i, v.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOpt(sqlite3_stmt* s, int i, const std::optional<double>& v) {
    if (v) sqlite3_bind_double(s, i, *v);
    else sqlite3_bind_null(s, i);
}

void bindOpt(sqlite3_stmt* s, int i, const std::optional<std::int64_t>& v) {
    if (v) sqlite3_bind_int64(s, i, *v);
    else sqlite3_bind_null(s, i);
}

void bindOpt(sqlite3_stmt* s, int i, const std::optional<int>& v) {
    if (v) sqlite3_bind_int(s, i, *v);
    else sqlite3_bind_null(s, i);
}

std::string text(sqlite3_stmt* s, int col) {
    const unsigned char* t = sqlite3_column_text(s, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<double> optDouble(sqlite3_stmt* s, int col) {
    if (sqlite3_column_type(s, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(s, col);
}

std::optional<std::int64_t> optInt64(sqlite3_stmt* s, int col) {
    if (sqlite3_column_type(s, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(s, col);
}

std::optional<int> optInt(sqlite3_stmt* s, int col) {
    if (sqlite3_column_type(s, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(s, col);
}

FeatureRow rowFromStmt(sqlite3_stmt* s) {
    FeatureRow r;
    r.instrument = text(s, 0);
    r.day = text(s, 1);
    r.window_name = text(s, 2);
    r.direction = parseDirection(text(s, 3));
    r.window_seq = sqlite3_column_int(s, 4);
    r.config_version = text(s, 5);
    r.range_defined = sqlite3_column_int(s, 6) != 0;
    r.orb_high = optDouble(s, 7);
    r.orb_low = optDouble(s, 8);
    r.orb_size_ticks = optDouble(s, 9);
    r.orb_bar_count = sqlite3_column_int(s, 10);
    r.outcome = parseOutcome(text(s, 11));
    r.r_multiple = sqlite3_column_double(s, 12);
    r.r_multiple_gross = sqlite3_column_double(s, 13);
    r.rr = sqlite3_column_double(s, 14);
    r.break_time = optInt64(s, 15);
    r.risk_ticks = optDouble(s, 16);
    r.mae_ticks = optDouble(s, 17);
    r.mfe_ticks = optDouble(s, 18);
    r.entry_time = optInt64(s, 19);
    r.entry_price = optDouble(s, 20);
    r.stop_price = optDouble(s, 21);
    r.target_price = optDouble(s, 22);
    r.exit_time = optInt64(s, 23);
    r.entry_delay_bars = optInt(s, 24);
    r.note = text(s, 25);
    r.prior_window_name = text(s, 26);
    r.prior_window_break = parseBreakState(text(s, 27));
    r.prior_window_outcome = parseContextOutcome(text(s, 28));
    r.prior_day_outcome = parseContextOutcome(text(s, 29));
    r.pre_session_name = text(s, 30);
    r.pre_session_range_ticks = optDouble(s, 31);
    r.atr_20_ticks = optDouble(s, 32);
    r.asia_type_code = text(s, 33);
    r.london_type_code = text(s, 34);
    r.pre_ny_type_code = text(s, 35);
    r.rsi_0030 = optDouble(s, 36);
    return r;
}

void bindRow(sqlite3_stmt* s, const FeatureRow& r) {
    bindText(s, 1, r.instrument);
    bindText(s, 2, r.day);
    bindText(s, 3, r.window_name);
    bindText(s, 4, toString(r.direction));
    sqlite3_bind_int(s, 5, r.window_seq);
    bindText(s, 6, r.config_version);
    sqlite3_bind_int(s, 7, r.range_defined ? 1 : 0);
    bindOpt(s, 8, r.orb_high);
    bindOpt(s, 9, r.orb_low);
    bindOpt(s, 10, r.orb_size_ticks);
    sqlite3_bind_int(s, 11, r.orb_bar_count);
    bindText(s, 12, toString(r.outcome));
    sqlite3_bind_double(s, 13, r.r_multiple);
    sqlite3_bind_double(s, 14, r.r_multiple_gross);
    sqlite3_bind_double(s, 15, r.rr);
    bindOpt(s, 16, r.break_time);
    bindOpt(s, 17, r.risk_ticks);
    bindOpt(s, 18, r.mae_ticks);
    bindOpt(s, 19, r.mfe_ticks);
    bindOpt(s, 20, r.entry_time);
    bindOpt(s, 21, r.entry_price);
    bindOpt(s, 22, r.stop_price);
    bindOpt(s, 23, r.target_price);
    bindOpt(s, 24, r.exit_time);
    bindOpt(s, 25, r.entry_delay_bars);
    bindText(s, 26, r.note);
    bindText(s, 27, r.prior_window_name);
    bindText(s, 28, toString(r.prior_window_break));
    bindText(s, 29, toString(r.prior_window_outcome));
    bindText(s, 30, toString(r.prior_day_outcome));
    bindText(s, 31, r.pre_session_name);
    bindOpt(s, 32, r.pre_session_range_ticks);
    bindOpt(s, 33, r.atr_20_ticks);
    bindText(s, 34, r.asia_type_code);
    bindText(s, 35, r.london_type_code);
    bindText(s, 36, r.pre_ny_type_code);
    bindOpt(s, 37, r.rsi_0030);
}

void bindKey(sqlite3_stmt* s, const FeatureRow& r) {
    bindText(s, 1, r.instrument);
    bindText(s, 2, r.day);
    bindText(s, 3, r.window_name);
    bindText(s, 4, toString(r.direction));
}

void step(sqlite3* db, sqlite3_stmt* s, const std::string& what) {
    if (sqlite3_step(s) != SQLITE_DONE)
        throw PersistenceError("failed to " + what + ": " + errorOf(db));
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);
}

/// BEGIN on construction, ROLLBACK on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : errorOf(db_);
            sqlite3_free(err_msg);
            throw PersistenceError("failed to begin transaction: " + msg);
        }
    }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
            throw PersistenceError("failed to commit: " + errorOf(db_));
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_{false};
};

} // namespace

FeatureTable::FeatureTable(const std::string& db_path) : db_path_(db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = errorOf(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("failed to open feature database " + db_path + ": " + msg);
    }
    try {
        createTables();
    } catch (const PersistenceError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

FeatureTable::~FeatureTable() {
    if (db_) sqlite3_close(db_);
}

void FeatureTable::createTables() {
    const char* create_sql = R"(
        CREATE TABLE IF NOT EXISTS orb_features (
            instrument TEXT NOT NULL,
            day TEXT NOT NULL,
            window_name TEXT NOT NULL,
            direction TEXT NOT NULL,
            window_seq INTEGER NOT NULL,
            config_version TEXT NOT NULL,
            range_defined INTEGER NOT NULL,
            orb_high REAL,
            orb_low REAL,
            orb_size_ticks REAL,
            orb_bar_count INTEGER NOT NULL,
            outcome TEXT NOT NULL,
            r_multiple REAL NOT NULL,
            r_multiple_gross REAL NOT NULL,
            rr REAL NOT NULL,
            break_time INTEGER,
            risk_ticks REAL,
            mae_ticks REAL,
            mfe_ticks REAL,
            entry_time INTEGER,
            entry_price REAL,
            stop_price REAL,
            target_price REAL,
            exit_time INTEGER,
            entry_delay_bars INTEGER,
            note TEXT NOT NULL,
            prior_window_name TEXT NOT NULL,
            prior_window_break TEXT NOT NULL,
            prior_window_outcome TEXT NOT NULL,
            prior_day_outcome TEXT NOT NULL,
            pre_session_name TEXT NOT NULL,
            pre_session_range_ticks REAL,
            atr_20_ticks REAL,
            asia_type_code TEXT NOT NULL,
            london_type_code TEXT NOT NULL,
            pre_ny_type_code TEXT NOT NULL,
            rsi_0030 REAL,
            PRIMARY KEY (instrument, day, window_name, direction)
        );

        CREATE TABLE IF NOT EXISTS orb_feature_sessions (
            instrument TEXT NOT NULL,
            day TEXT NOT NULL,
            window_name TEXT NOT NULL,
            direction TEXT NOT NULL,
            session_index INTEGER NOT NULL,
            session TEXT NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            range_ticks REAL NOT NULL,
            bar_count INTEGER NOT NULL,
            end_time INTEGER NOT NULL,
            PRIMARY KEY (instrument, day, window_name, direction, session_index)
        );

        CREATE TABLE IF NOT EXISTS orb_days (
            instrument TEXT NOT NULL,
            day TEXT NOT NULL,
            config_version TEXT NOT NULL,
            status TEXT NOT NULL,
            reason TEXT NOT NULL,
            market_closed INTEGER NOT NULL,
            atr_basis_ticks REAL,
            PRIMARY KEY (instrument, day)
        );

        CREATE TABLE IF NOT EXISTS orb_feature_targets (
            instrument TEXT NOT NULL,
            day TEXT NOT NULL,
            window_name TEXT NOT NULL,
            direction TEXT NOT NULL,
            target_index INTEGER NOT NULL,
            rr REAL NOT NULL,
            outcome TEXT NOT NULL,
            r_multiple REAL NOT NULL,
            r_multiple_gross REAL NOT NULL,
            PRIMARY KEY (instrument, day, window_name, direction, target_index)
        );

        CREATE INDEX IF NOT EXISTS idx_orb_features_window
            ON orb_features(instrument, window_name, direction, day);
    )";

    char* err_msg = nullptr;
    if (sqlite3_exec(db_, create_sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : errorOf(db_);
        sqlite3_free(err_msg);
        throw PersistenceError("failed to create feature tables in " + db_path_ + ": " + msg);
    }
}

void FeatureTable::write(const std::string& instrument,
                         const std::vector<FeatureRow>& rows,
                         const std::string& from_day,
                         const std::string& to_day,
                         const std::vector<DayRecord>& days) {
    Transaction tx(db_);

    for (const char* table : {"orb_feature_targets", "orb_feature_sessions", "orb_features", "orb_days"}) {
        Stmt del = prepare(db_, std::string("DELETE FROM ") + table
                                + " WHERE instrument = ? AND day >= ? AND day <= ?");
        bindText(del.get(), 1, instrument);
        bindText(del.get(), 2, from_day);
        bindText(del.get(), 3, to_day);
        if (sqlite3_step(del.get()) != SQLITE_DONE)
            throw PersistenceError("failed to clear " + instrument + " " + from_day + ".." + to_day
                                   + ": " + errorOf(db_));
    }

    Stmt ins = prepare(db_, std::string("INSERT INTO orb_features (") + ROW_COLUMNS + ") VALUES ("
                            "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
                            "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Stmt ins_target = prepare(db_,
        "INSERT INTO orb_feature_targets (instrument, day, window_name, direction, target_index, "
        "rr, outcome, r_multiple, r_multiple_gross) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Stmt ins_session = prepare(db_,
        "INSERT INTO orb_feature_sessions (instrument, day, window_name, direction, session_index, "
        "session, high, low, range_ticks, bar_count, end_time) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Stmt ins_day = prepare(db_,
        "INSERT INTO orb_days (instrument, day, config_version, status, reason, market_closed, "
        "atr_basis_ticks) VALUES (?, ?, ?, ?, ?, ?, ?)");

    for (const auto& r : rows) {
        const std::string key = r.day + " " + r.window_name + " " + toString(r.direction);
        if (r.instrument != instrument || r.day < from_day || r.day > to_day)
            throw PersistenceError("row " + r.instrument + " " + key + " is outside the replaced range "
                                   + instrument + " " + from_day + ".." + to_day);

        bindRow(ins.get(), r);
        step(db_, ins.get(), "insert row " + key);

        for (std::size_t i = 0; i < r.targets.size(); ++i) {
            const TargetResult& t = r.targets[i];
            sqlite3_stmt* s = ins_target.get();
            bindKey(s, r);
            sqlite3_bind_int(s, 5, static_cast<int>(i));
            sqlite3_bind_double(s, 6, t.rr);
            bindText(s, 7, toString(t.outcome));
            sqlite3_bind_double(s, 8, t.r_multiple);
            sqlite3_bind_double(s, 9, t.r_multiple_gross);
            step(db_, s, "insert target rows for " + key);
        }

        for (std::size_t i = 0; i < r.sessions.size(); ++i) {
            const SessionLevel& l = r.sessions[i];
            sqlite3_stmt* s = ins_session.get();
            bindKey(s, r);
            sqlite3_bind_int(s, 5, static_cast<int>(i));
            bindText(s, 6, l.name);
            sqlite3_bind_double(s, 7, l.high);
            sqlite3_bind_double(s, 8, l.low);
            sqlite3_bind_double(s, 9, l.range_ticks);
            sqlite3_bind_int(s, 10, l.bar_count);
            sqlite3_bind_int64(s, 11, l.end_time);
            step(db_, s, "insert session rows for " + key);
        }
    }

    for (const auto& d : days) {
        if (d.instrument != instrument || d.day < from_day || d.day > to_day)
            throw PersistenceError("day " + d.instrument + " " + d.day + " is outside the replaced range "
                                   + instrument + " " + from_day + ".." + to_day);
        sqlite3_stmt* s = ins_day.get();
        bindText(s, 1, d.instrument);
        bindText(s, 2, d.day);
        bindText(s, 3, d.config_version);
        bindText(s, 4, toString(d.status));
        bindText(s, 5, d.reason);
        sqlite3_bind_int(s, 6, d.market_closed ? 1 : 0);
        bindOpt(s, 7, d.atr_basis_ticks);
        step(db_, s, "insert day record " + d.day);
    }

    ins.reset();
    ins_target.reset();
    ins_session.reset();
    ins_day.reset();
    tx.commit();
}

std::vector<FeatureRow> FeatureTable::query(const std::string& where_sql,
                                            const std::vector<std::string>& params) const {
    Stmt s = prepare(db_, std::string("SELECT ") + ROW_COLUMNS + " FROM orb_features WHERE " + where_sql);
    for (std::size_t i = 0; i < params.size(); ++i)
        bindText(s.get(), static_cast<int>(i) + 1, params[i]);

    std::vector<FeatureRow> rows;
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        if (sqlite3_column_count(s.get()) != ROW_COLUMN_COUNT)
            throw PersistenceError("unexpected orb_features layout in " + db_path_);
        rows.push_back(rowFromStmt(s.get()));
    }
    if (rc != SQLITE_DONE)
        throw PersistenceError("failed to read feature rows: " + errorOf(db_));

    for (auto& r : rows) loadChildren(r);
    return rows;
}

void FeatureTable::loadChildren(FeatureRow& row) const {
    Stmt s = prepare(db_,
        "SELECT rr, outcome, r_multiple, r_multiple_gross FROM orb_feature_targets "
        "WHERE instrument = ? AND day = ? AND window_name = ? AND direction = ? ORDER BY target_index");
    bindKey(s.get(), row);

    row.targets.clear();
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        TargetResult t;
        t.rr = sqlite3_column_double(s.get(), 0);
        t.outcome = parseOutcome(text(s.get(), 1));
        t.r_multiple = sqlite3_column_double(s.get(), 2);
        t.r_multiple_gross = sqlite3_column_double(s.get(), 3);
        row.targets.push_back(t);
    }
    if (rc != SQLITE_DONE)
        throw PersistenceError("failed to read target rows: " + errorOf(db_));

    Stmt ss = prepare(db_,
        "SELECT session, high, low, range_ticks, bar_count, end_time FROM orb_feature_sessions "
        "WHERE instrument = ? AND day = ? AND window_name = ? AND direction = ? ORDER BY session_index");
    bindKey(ss.get(), row);

    row.sessions.clear();
    while ((rc = sqlite3_step(ss.get())) == SQLITE_ROW) {
        SessionLevel l;
        l.name = text(ss.get(), 0);
        l.high = sqlite3_column_double(ss.get(), 1);
        l.low = sqlite3_column_double(ss.get(), 2);
        l.range_ticks = sqlite3_column_double(ss.get(), 3);
        l.bar_count = sqlite3_column_int(ss.get(), 4);
        l.end_time = sqlite3_column_int64(ss.get(), 5);
        row.sessions.push_back(l);
    }
    if (rc != SQLITE_DONE)
        throw PersistenceError("failed to read session rows: " + errorOf(db_));
}

std::vector<FeatureRow> FeatureTable::readRange(const std::string& instrument,
                                                const std::string& from_day,
                                                const std::string& to_day) const {
    return query("instrument = ? AND day >= ? AND day <= ? "
                 "ORDER BY day, window_seq, CASE direction WHEN 'UP' THEN 0 ELSE 1 END",
                 { instrument, from_day, to_day });
}

std::optional<FeatureRow> FeatureTable::readRow(const std::string& instrument,
                                                const std::string& day,
                                                const std::string& window_name,
                                                Direction dir) const {
    auto rows = query("instrument = ? AND day = ? AND window_name = ? AND direction = ?",
                      { instrument, day, window_name, toString(dir) });
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<DayRecord> FeatureTable::readDay(const std::string& instrument, const std::string& day) const {
    Stmt s = prepare(db_,
        "SELECT config_version, status, reason, market_closed, atr_basis_ticks FROM orb_days "
        "WHERE instrument = ? AND day = ?");
    bindText(s.get(), 1, instrument);
    bindText(s.get(), 2, day);

    int rc = sqlite3_step(s.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw PersistenceError("failed to read day record " + day + ": " + errorOf(db_));
    DayRecord d;
    d.instrument = instrument;
    d.day = day;
    d.config_version = text(s.get(), 0);
    d.status = parseDayStatus(text(s.get(), 1));
    d.reason = text(s.get(), 2);
    d.market_closed = sqlite3_column_int(s.get(), 3) != 0;
    d.atr_basis_ticks = optDouble(s.get(), 4);
    return d;
}

std::vector<double> FeatureTable::recentAtrBasis(const std::string& instrument,
                                                 const std::string& day,
                                                 const std::string& config_version,
                                                 int limit) const {
    Stmt s = prepare(db_,
        "SELECT atr_basis_ticks FROM orb_days WHERE instrument = ? AND day < ? AND config_version = ? "
        "AND atr_basis_ticks IS NOT NULL ORDER BY day DESC LIMIT ?");
    bindText(s.get(), 1, instrument);
    bindText(s.get(), 2, day);
    bindText(s.get(), 3, config_version);
    sqlite3_bind_int(s.get(), 4, limit);

    std::vector<double> out;
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW)
        out.push_back(sqlite3_column_double(s.get(), 0));
    if (rc != SQLITE_DONE)
        throw PersistenceError("failed to read ATR history: " + errorOf(db_));
    return out;
}

std::size_t FeatureTable::count(const std::string& instrument) const {
    Stmt s = prepare(db_, "SELECT COUNT(*) FROM orb_features WHERE instrument = ?");
    bindText(s.get(), 1, instrument);
    if (sqlite3_step(s.get()) != SQLITE_ROW)
        throw PersistenceError("failed to count feature rows: " + errorOf(db_));
    return static_cast<std::size_t>(sqlite3_column_int64(s.get(), 0));
}

} // namespace orb
