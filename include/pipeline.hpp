#pragma once

#include "bar_store.hpp"
#include "config.hpp"
#include "feature_row.hpp"
#include "feature_table.hpp"
#include "session_clock.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace orb {

/// Per-day line of the batch log.
struct DayReport {
    std::string day;
    DayStatus status{DayStatus::Ok};
    std::string reason;        // skip/fail cause
    std::size_t rows{0};
    int trades{0};
    int wins{0};
    int losses{0};
    int undefined_ranges{0};   // windows without bars on an otherwise usable day
};

struct BatchSummary {
    std::string from_day;
    std::string to_day;
    int days_ok{0};
    int days_skipped{0};
    int days_failed{0};
    std::size_t rows_written{0};
    int undefined_ranges{0};
    std::vector<DayReport> days;
};

/// Drives bars -> ranges -> breakouts -> outcomes -> rows for a date range,
/// one trading day at a time in ascending order, and persists each day with
/// its status record as soon as it is computed so the next day's context can
/// read it back.
///
/// Error policy: DataGapError skips the day, InputValidationError fails the
/// day, and both clear the day's old rows. ComputationIntegrityError and
/// PersistenceError propagate; nothing is written for the offending day.
///
/// Prior-day context walks back over market-closed days only. A previous
/// trading day that failed, hit a data gap, was never built, or was built
/// under another configuration makes the prior-day outcome UNKNOWN.
class FeaturePipeline {
public:
    /// `cfg` must come from validateConfig.
    FeaturePipeline(const PipelineConfig& cfg,
                    const IBarStore& store,
                    FeatureTable& table,
                    std::ostream& log = std::cout,
                    std::ostream& err = std::cerr);

    /// Rows of one trading day (two per ORB window, UP then DOWN) without
    /// persisting them. Loads the day's bars with a single store call.
    std::vector<FeatureRow> computeDay(absl::CivilDay day);

    /// Recomputes and replaces every day in [from, to].
    BatchSummary run(absl::CivilDay from, absl::CivilDay to);

    const PipelineConfig& config() const { return cfg_; }
    const SessionClock& clock() const { return clock_; }

private:
    std::vector<Bar> loadDayBars(absl::CivilDay day) const;
    std::vector<FeatureRow> buildDay(absl::CivilDay day, DayRecord& record);
    ContextOutcome priorDayOutcome(const std::string& window, Direction dir, absl::CivilDay day) const;

    PipelineConfig cfg_;
    SessionClock clock_;
    const IBarStore& store_;
    FeatureTable& table_;
    std::ostream& log_;
    std::ostream& err_;
};

} // namespace orb
