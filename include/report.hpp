#pragma once

#include "config.hpp"
#include "feature_row.hpp"
#include "pipeline.hpp"
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace orb {

/// Aggregate of the rows of one (window, direction).
struct WindowStats {
    std::string window_name;
    Direction direction{Direction::Up};
    int window_seq{0};
    int days{0};              // rows
    int ranges_defined{0};
    int trades{0};            // entries taken, resolved or not
    int wins{0};
    int losses{0};
    int unresolved{0};
    double total_r{0};        // net
    double total_r_gross{0};
    double win_rate_pct{0};   // wins / (wins + losses)
    double avg_r{0};          // net R per resolved trade
    double avg_mae_ticks{0};
    double avg_mfe_ticks{0};
};

class Report {
public:
    /// `rows` are the persisted rows of the batch range, as read back from the table.
    Report(const PipelineConfig& cfg, const BatchSummary& summary, std::vector<FeatureRow> rows);

    /// Per (window, direction) in window order, UP before DOWN.
    std::vector<WindowStats> computeWindowStats() const;

    /// Counts and per-window table to the console.
    void printSummary(std::ostream& out = std::cout) const;

    /// One line per row, all columns. Returns false and logs to stderr on failure.
    bool writeFeatureCsv(const std::string& filepath) const;

    /// Day log plus summary as a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    const std::vector<FeatureRow>& rows() const { return rows_; }

private:
    void printCounts(std::ostream& out) const;
    void printWindowTable(std::ostream& out) const;

    const PipelineConfig& cfg_;
    const BatchSummary& summary_;
    std::vector<FeatureRow> rows_;
};

} // namespace orb
