#pragma once

#include "feature_row.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace orb {

/// SQLite home of the feature rows: table orb_features keyed by
/// (instrument, day, window_name, direction), secondary RR targets in
/// orb_feature_targets, visible session levels in orb_feature_sessions and
/// one status record per built day in orb_days. Days are stored as
/// YYYY-MM-DD text so ranges compare lexically.
class FeatureTable {
public:
    /// ":memory:" keeps the table in process. Throws PersistenceError.
    explicit FeatureTable(const std::string& db_path = ":memory:");
    ~FeatureTable();

    FeatureTable(const FeatureTable&) = delete;
    FeatureTable& operator=(const FeatureTable&) = delete;

    /// Replaces every row and day record of `instrument` with
    /// from_day <= day <= to_day by `rows` and `days`, in one transaction.
    /// Entries outside the range or a failed insert roll the whole write back
    /// and throw PersistenceError.
    void write(const std::string& instrument,
               const std::vector<FeatureRow>& rows,
               const std::string& from_day,
               const std::string& to_day,
               const std::vector<DayRecord>& days = {});

    /// Ordered by day, window_seq, direction (UP first).
    std::vector<FeatureRow> readRange(const std::string& instrument,
                                      const std::string& from_day,
                                      const std::string& to_day) const;

    std::optional<FeatureRow> readRow(const std::string& instrument,
                                      const std::string& day,
                                      const std::string& window_name,
                                      Direction dir) const;

    std::optional<DayRecord> readDay(const std::string& instrument, const std::string& day) const;

    /// atr_basis_ticks of up to `limit` days before `day` built under
    /// config_version, most recent first.
    std::vector<double> recentAtrBasis(const std::string& instrument,
                                       const std::string& day,
                                       const std::string& config_version,
                                       int limit) const;

    std::size_t count(const std::string& instrument) const;

    const std::string& path() const { return db_path_; }

private:
    void createTables();
    std::vector<FeatureRow> query(const std::string& where_sql,
                                  const std::vector<std::string>& params) const;
    void loadChildren(FeatureRow& row) const;

    sqlite3* db_ = nullptr;
    std::string db_path_;
};

} // namespace orb
