#include "report.hpp"
#include "session_clock.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>

namespace orb {

namespace {

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

template <typename T>
void writeOpt(std::ostream& out, const std::optional<T>& v) {
    if (v) out << *v;
}

void writeOptTime(std::ostream& out, const std::optional<std::int64_t>& v) {
    if (v) out << formatUtc(*v);
}

} // namespace

Report::Report(const PipelineConfig& cfg, const BatchSummary& summary, std::vector<FeatureRow> rows)
    : cfg_(cfg), summary_(summary), rows_(std::move(rows)) {}

std::vector<WindowStats> Report::computeWindowStats() const {
    std::map<std::pair<int, int>, WindowStats> by_slot;
    std::map<std::pair<int, int>, int> excursion_counts;
    for (const auto& r : rows_) {
        const auto key = std::make_pair(r.window_seq, r.direction == Direction::Up ? 0 : 1);
        WindowStats& s = by_slot[key];
        s.window_name = r.window_name;
        s.direction = r.direction;
        s.window_seq = r.window_seq;
        ++s.days;
        if (r.range_defined) ++s.ranges_defined;
        if (r.entry_time) ++s.trades;
        if (r.outcome == Outcome::Win) ++s.wins;
        if (r.outcome == Outcome::Loss) ++s.losses;
        if (r.entry_time && r.outcome == Outcome::NoTrade) ++s.unresolved;
        s.total_r += r.r_multiple;
        s.total_r_gross += r.r_multiple_gross;
        if (r.mae_ticks && r.mfe_ticks) {
            s.avg_mae_ticks += *r.mae_ticks;
            s.avg_mfe_ticks += *r.mfe_ticks;
            ++excursion_counts[key];
        }
    }

    std::vector<WindowStats> out;
    for (auto& [key, s] : by_slot) {
        const int resolved = s.wins + s.losses;
        s.win_rate_pct = resolved > 0 ? 100.0 * s.wins / resolved : 0;
        s.avg_r = resolved > 0 ? s.total_r / resolved : 0;
        const int n = excursion_counts[key];
        if (n > 0) {
            s.avg_mae_ticks /= n;
            s.avg_mfe_ticks /= n;
        }
        out.push_back(s);
    }
    return out;
}

void Report::printCounts(std::ostream& out) const {
    out << "Instrument:     " << cfg_.instrument.symbol << "\n";
    out << "Config version: " << cfg_.version << "\n";
    out << "Date range:     " << summary_.from_day << " .. " << summary_.to_day << "\n";
    out << "Days ok:        " << summary_.days_ok << "\n";
    out << "Days skipped:   " << summary_.days_skipped << "\n";
    out << "Days failed:    " << summary_.days_failed << "\n";
    out << "Rows written:   " << summary_.rows_written << "\n";
    out << "Undefined ORBs: " << summary_.undefined_ranges << "\n";
    if (cfg_.instrument.cost)
        out << "Costs:          $" << std::fixed << std::setprecision(2) << cfg_.instrument.cost->costDollars()
            << " per round trip\n";
    else
        out << "Costs:          none (gross R)\n";
}

void Report::printWindowTable(std::ostream& out) const {
    out << std::fixed << std::setprecision(2);
    out << std::setw(8) << "Window" << std::setw(6) << "Dir" << std::setw(7) << "Days"
        << std::setw(8) << "Trades" << std::setw(6) << "Win" << std::setw(6) << "Loss"
        << std::setw(7) << "Open" << std::setw(9) << "Win %" << std::setw(9) << "Avg R"
        << std::setw(10) << "Total R" << "\n";
    out << std::string(76, '-') << "\n";
    for (const auto& s : computeWindowStats()) {
        out << std::setw(8) << s.window_name << std::setw(6) << toString(s.direction)
            << std::setw(7) << s.days << std::setw(8) << s.trades << std::setw(6) << s.wins
            << std::setw(6) << s.losses << std::setw(7) << s.unresolved << std::setw(9) << s.win_rate_pct
            << std::setw(9) << s.avg_r << std::setw(10) << s.total_r << "\n";
    }
    out << std::string(76, '-') << "\n";
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== ORB Feature Build ==========\n";
    printCounts(out);
    out << "\n";
    printWindowTable(out);
    out << "=======================================\n\n";
}

bool Report::writeFeatureCsv(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "instrument,day,window,direction,config_version,range_defined,orb_high,orb_low,orb_size_ticks,"
         "orb_bar_count,outcome,r_multiple,r_multiple_gross,rr,risk_ticks,mae_ticks,mfe_ticks,"
         "break_time,entry_time,entry_price,stop_price,target_price,exit_time,entry_delay_bars,note,"
         "prior_window,prior_window_break,prior_window_outcome,prior_day_outcome,pre_session,"
         "pre_session_range_ticks,atr_20_ticks,asia_type_code,london_type_code,pre_ny_type_code,rsi_0030\n";
    f << std::setprecision(10);
    for (const auto& r : rows_) {
        f << r.instrument << ',' << r.day << ',';
        writeCsvQuoted(f, r.window_name);
        f << ',' << toString(r.direction) << ',' << r.config_version << ','
          << (r.range_defined ? 1 : 0) << ',';
        writeOpt(f, r.orb_high); f << ',';
        writeOpt(f, r.orb_low); f << ',';
        writeOpt(f, r.orb_size_ticks); f << ',';
        f << r.orb_bar_count << ',' << toString(r.outcome) << ',' << r.r_multiple << ','
          << r.r_multiple_gross << ',' << r.rr << ',';
        writeOpt(f, r.risk_ticks); f << ',';
        writeOpt(f, r.mae_ticks); f << ',';
        writeOpt(f, r.mfe_ticks); f << ',';
        writeOptTime(f, r.break_time); f << ',';
        writeOptTime(f, r.entry_time); f << ',';
        writeOpt(f, r.entry_price); f << ',';
        writeOpt(f, r.stop_price); f << ',';
        writeOpt(f, r.target_price); f << ',';
        writeOptTime(f, r.exit_time); f << ',';
        writeOpt(f, r.entry_delay_bars); f << ',';
        f << r.note << ',';
        writeCsvQuoted(f, r.prior_window_name);
        f << ',' << toString(r.prior_window_break) << ',' << toString(r.prior_window_outcome) << ','
          << toString(r.prior_day_outcome) << ',' << r.pre_session_name << ',';
        writeOpt(f, r.pre_session_range_ticks); f << ',';
        writeOpt(f, r.atr_20_ticks); f << ',';
        f << r.asia_type_code << ',' << r.london_type_code << ',' << r.pre_ny_type_code << ',';
        writeOpt(f, r.rsi_0030);
        f << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write feature CSV: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "ORB Feature Build\n";
    f << "=================\n\n";
    printCounts(f);
    f << "\nDays\n----\n";
    for (const auto& d : summary_.days) {
        f << d.day << " " << toString(d.status);
        if (d.status == DayStatus::Ok)
            f << " rows=" << d.rows << " trades=" << d.trades << " W/L=" << d.wins << "/" << d.losses;
        else
            f << " " << d.reason;
        f << "\n";
    }
    f << "\n";
    printWindowTable(f);
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace orb
