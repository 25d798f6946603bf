#include "bar_store.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "feature_table.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "session_clock.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_BAD_INPUT = 1;
constexpr int EXIT_INTEGRITY = 2;
constexpr int EXIT_PERSISTENCE = 3;

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string instrument;
    std::string from_day;
    std::string to_day;

    // Bar source: exactly one of these.
    std::string bars_csv;
    std::string databento_dir;
    std::string bars_db;
    std::string symbol_filter;    // contract filter for CSV / Databento loads
    std::string import_csv;       // with --bars-db: load this CSV into the bar DB first
    bool list_symbols = false;
    bool show_help = false;

    std::string db_path = "orb_features.db";
    std::string export_csv;
    std::string report_path;

    // Overrides applied to every selected window.
    std::string zone;
    std::string day_open;
    std::vector<std::string> windows;
    std::optional<int> confirm;
    std::string stop_mode;
    std::vector<double> rr_targets;
    std::optional<double> min_range;
    std::optional<double> max_range;
    std::string entry_mode;
    std::string risk_anchor;
    std::string direction_policy;
    std::optional<double> entry_buffer;
    std::optional<double> max_stop;
    bool no_costs = false;
    std::optional<double> commission;
    std::optional<double> slippage;
};

void printUsage(std::ostream& out) {
    out << "Usage: orb_features --instrument MGC --from YYYY-MM-DD [--to YYYY-MM-DD]\n"
           "                    (--bars file.csv | --databento-dir DIR | --bars-db bars.db)\n"
           "                    [--db features.db] [--export rows.csv] [--report report.txt]\n"
           "Options:\n"
           "  --symbol S            contract filter for --bars / --databento-dir (e.g. MGCG5)\n"
           "  --list-symbols        list contracts in --databento-dir with bar counts and exit\n"
           "  --import-csv FILE     with --bars-db: insert the CSV's bars into bars_1m first\n"
           "  --zone TZ             reference timezone (default Australia/Brisbane)\n"
           "  --day-open HH:MM      trading-day open (default 09:00)\n"
           "  --windows 0900,1000   subset of ORB windows\n"
           "  --confirm N           confirmation closes (1-3)\n"
           "  --stop FULL|HALF      stop placement\n"
           "  --rr 1,2,3            RR targets, first is primary\n"
           "  --min-range T         minimum range in ticks\n"
           "  --max-range T         maximum range in ticks\n"
           "  --entry CLOSE|NEXT_OPEN\n"
           "  --anchor ORB_EDGE|ENTRY\n"
           "  --policy FIRST_BREAK|INDEPENDENT\n"
           "  --buffer T            entry buffer in ticks\n"
           "  --max-stop T          skip breakouts with a wider stop (ticks)\n"
           "  --no-costs            gross R\n"
           "  --commission USD      round-trip commission\n"
           "  --slippage T          slippage in ticks\n";
}

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument(s);
        return true;
    } catch (const std::logic_error&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument(s);
        return true;
    } catch (const std::logic_error&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}
bool parseOptDouble(const char* s, std::optional<double>& out, std::string& error_msg, const char* flag) {
    double v = 0;
    if (!parseDouble(s, v, error_msg, flag)) return false;
    out = v;
    return true;
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, ','))
        if (!part.empty()) parts.push_back(part);
    return parts;
}

bool parseRrList(const char* s, std::vector<double>& out, std::string& error_msg) {
    out.clear();
    for (const auto& part : splitList(s)) {
        double v = 0;
        if (!parseDouble(part.c_str(), v, error_msg, "--rr")) return false;
        out.push_back(v);
    }
    if (out.empty()) { error_msg = "--rr needs at least one value"; return false; }
    return true;
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> bool {
            if (i + 1 < argc) { ++i; return true; }
            error_msg = "Missing value for " + arg;
            return false;
        };

        if (arg == "--instrument") { if (!next()) return false; cfg.instrument = argv[i]; }
        else if (arg == "--from") { if (!next()) return false; cfg.from_day = argv[i]; }
        else if (arg == "--to") { if (!next()) return false; cfg.to_day = argv[i]; }
        else if (arg == "--bars") { if (!next()) return false; cfg.bars_csv = argv[i]; }
        else if (arg == "--databento-dir") { if (!next()) return false; cfg.databento_dir = argv[i]; }
        else if (arg == "--bars-db") { if (!next()) return false; cfg.bars_db = argv[i]; }
        else if (arg == "--symbol") { if (!next()) return false; cfg.symbol_filter = argv[i]; }
        else if (arg == "--import-csv") { if (!next()) return false; cfg.import_csv = argv[i]; }
        else if (arg == "--list-symbols") { cfg.list_symbols = true; }
        else if (arg == "--db") { if (!next()) return false; cfg.db_path = argv[i]; }
        else if (arg == "--export") { if (!next()) return false; cfg.export_csv = argv[i]; }
        else if (arg == "--report") { if (!next()) return false; cfg.report_path = argv[i]; }
        else if (arg == "--zone") { if (!next()) return false; cfg.zone = argv[i]; }
        else if (arg == "--day-open") { if (!next()) return false; cfg.day_open = argv[i]; }
        else if (arg == "--windows") { if (!next()) return false; cfg.windows = splitList(argv[i]); }
        else if (arg == "--confirm") {
            int n = 0;
            if (!next() || !parseInt(argv[i], n, error_msg, "--confirm")) return false;
            cfg.confirm = n;
        }
        else if (arg == "--stop") { if (!next()) return false; cfg.stop_mode = argv[i]; }
        else if (arg == "--rr") { if (!next() || !parseRrList(argv[i], cfg.rr_targets, error_msg)) return false; }
        else if (arg == "--min-range") { if (!next() || !parseOptDouble(argv[i], cfg.min_range, error_msg, "--min-range")) return false; }
        else if (arg == "--max-range") { if (!next() || !parseOptDouble(argv[i], cfg.max_range, error_msg, "--max-range")) return false; }
        else if (arg == "--entry") { if (!next()) return false; cfg.entry_mode = argv[i]; }
        else if (arg == "--anchor") { if (!next()) return false; cfg.risk_anchor = argv[i]; }
        else if (arg == "--policy") { if (!next()) return false; cfg.direction_policy = argv[i]; }
        else if (arg == "--buffer") { if (!next() || !parseOptDouble(argv[i], cfg.entry_buffer, error_msg, "--buffer")) return false; }
        else if (arg == "--max-stop") { if (!next() || !parseOptDouble(argv[i], cfg.max_stop, error_msg, "--max-stop")) return false; }
        else if (arg == "--no-costs") { cfg.no_costs = true; }
        else if (arg == "--commission") { if (!next() || !parseOptDouble(argv[i], cfg.commission, error_msg, "--commission")) return false; }
        else if (arg == "--slippage") { if (!next() || !parseOptDouble(argv[i], cfg.slippage, error_msg, "--slippage")) return false; }
        else if (arg == "-h" || arg == "--help") { cfg.show_help = true; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if the option combination is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (cfg.list_symbols) {
        if (cfg.databento_dir.empty()) { error_msg = "--list-symbols needs --databento-dir"; return false; }
        return true;
    }
    if (cfg.instrument.empty()) { error_msg = "--instrument is required"; return false; }
    if (cfg.from_day.empty()) { error_msg = "--from is required"; return false; }
    int sources = (cfg.bars_csv.empty() ? 0 : 1) + (cfg.databento_dir.empty() ? 0 : 1) + (cfg.bars_db.empty() ? 0 : 1);
    if (sources != 1) { error_msg = "give exactly one of --bars, --databento-dir, --bars-db"; return false; }
    if (!cfg.import_csv.empty() && cfg.bars_db.empty()) { error_msg = "--import-csv needs --bars-db"; return false; }
    if (cfg.no_costs && (cfg.commission || cfg.slippage)) { error_msg = "--no-costs conflicts with --commission/--slippage"; return false; }
    return true;
}

//-----------------------------------------------------------------------------
// Pipeline config: profile + overrides, then orb::validateConfig
//-----------------------------------------------------------------------------
orb::PipelineConfig buildPipelineConfig(const Config& cfg) {
    using namespace orb;
    PipelineConfig pc;
    pc.instrument = builtinInstrument(cfg.instrument);
    if (!cfg.zone.empty()) pc.reference_zone = cfg.zone;
    if (!cfg.day_open.empty()) pc.day_open_minute = parseClockTime(cfg.day_open);
    if (!cfg.windows.empty())
        pc.instrument.orb_windows = selectWindows(pc.instrument.orb_windows, cfg.windows);

    for (auto& wc : pc.instrument.orb_windows) {
        RiskConfig& r = wc.risk;
        if (cfg.confirm) r.confirmation_closes = *cfg.confirm;
        if (!cfg.stop_mode.empty()) r.stop_mode = parseStopMode(cfg.stop_mode);
        if (!cfg.rr_targets.empty()) r.rr_targets = cfg.rr_targets;
        if (cfg.min_range) r.min_range_ticks = cfg.min_range;
        if (cfg.max_range) r.max_range_ticks = cfg.max_range;
        if (!cfg.entry_mode.empty()) r.entry_mode = parseEntryMode(cfg.entry_mode);
        if (!cfg.risk_anchor.empty()) r.risk_anchor = parseRiskAnchor(cfg.risk_anchor);
        if (!cfg.direction_policy.empty()) r.direction_policy = parseDirectionPolicy(cfg.direction_policy);
        if (cfg.entry_buffer) r.entry_buffer_ticks = *cfg.entry_buffer;
        if (cfg.max_stop) r.max_stop_ticks = cfg.max_stop;
    }

    if (cfg.no_costs) {
        pc.instrument.cost.reset();
    } else if (cfg.commission || cfg.slippage) {
        CostModel cost = pc.instrument.cost.value_or(CostModel{0, 0, pc.instrument.tick_value});
        if (cfg.commission) cost.commission_round_trip = *cfg.commission;
        if (cfg.slippage) cost.slippage_ticks = *cfg.slippage;
        pc.instrument.cost = cost;
    }
    return orb::validateConfig(pc);
}

//-----------------------------------------------------------------------------
// Bar store from the chosen source
//-----------------------------------------------------------------------------
std::unique_ptr<orb::IBarStore> openBarStore(const Config& cfg, const std::string& symbol) {
    using namespace orb;
    if (!cfg.bars_db.empty()) {
        auto store = std::make_unique<SqliteBarStore>(cfg.bars_db);
        if (!cfg.import_csv.empty()) {
            DataSource ds(cfg.import_csv);
            if (!ds.load(cfg.symbol_filter))
                throw InputValidationError(ds.lastError());
            store->insertBars(symbol, ds.bars());
            std::cout << "Imported " << ds.size() << " bars into " << cfg.bars_db << "\n";
        }
        return store;
    }

    DataSource ds(cfg.bars_csv.empty() ? cfg.databento_dir : cfg.bars_csv);
    bool ok = cfg.bars_csv.empty() ? ds.loadFromDatabentoDir(cfg.databento_dir, cfg.symbol_filter)
                                   : ds.load(cfg.symbol_filter);
    if (!ok) throw InputValidationError(ds.lastError());
    if (ds.skippedRows() > 0)
        std::cerr << "Warning: skipped " << ds.skippedRows() << " unparseable rows\n";
    std::cout << "Loaded " << ds.size() << " bars\n";

    auto store = std::make_unique<MemoryBarStore>();
    store->setBars(symbol, ds.takeBars());
    return store;
}

int listSymbols(const Config& cfg) {
    const auto contracts = orb::DataSource::listContractsInDatabentoDir(cfg.databento_dir);
    if (contracts.empty()) {
        std::cerr << "No contracts found in " << cfg.databento_dir << "\n";
        return EXIT_BAD_INPUT;
    }
    std::cout << std::left << std::setw(10) << "Symbol" << std::right << std::setw(9) << "Bars"
              << "  First bar (UTC)       Last bar (UTC)\n";
    for (const auto& c : contracts) {
        std::cout << std::left << std::setw(10) << c.symbol << std::right << std::setw(9) << c.bars
                  << "  " << orb::formatUtc(c.first_ts) << "  " << orb::formatUtc(c.last_ts) << "\n";
    }
    return 0;
}

int runBatch(const Config& cfg) {
    using namespace orb;
    const PipelineConfig pc = buildPipelineConfig(cfg);
    const absl::CivilDay from = parseDay(cfg.from_day);
    const absl::CivilDay to = parseDay(cfg.to_day.empty() ? cfg.from_day : cfg.to_day);

    auto store = openBarStore(cfg, pc.instrument.symbol);
    FeatureTable table(cfg.db_path);
    FeaturePipeline pipeline(pc, *store, table);
    BatchSummary summary = pipeline.run(from, to);

    Report report(pc, summary, table.readRange(pc.instrument.symbol, summary.from_day, summary.to_day));
    report.printSummary(std::cout);
    std::cout << "Rows stored in " << cfg.db_path << "\n";

    bool ok = true;
    if (!cfg.export_csv.empty()) {
        ok = report.writeFeatureCsv(cfg.export_csv) && ok;
        if (ok) std::cout << "Rows exported to " << cfg.export_csv << "\n";
    }
    if (!cfg.report_path.empty()) {
        ok = report.writeReport(cfg.report_path) && ok;
        if (ok) std::cout << "Report written to " << cfg.report_path << "\n";
    }
    return ok ? 0 : EXIT_BAD_INPUT;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return EXIT_BAD_INPUT;
    }
    if (cfg.show_help) {
        printUsage(std::cout);
        return 0;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return EXIT_BAD_INPUT;
    }
    if (cfg.list_symbols) return listSymbols(cfg);

    try {
        return runBatch(cfg);
    } catch (const orb::ComputationIntegrityError& e) {
        std::cerr << "Integrity error, run aborted: " << e.describe() << "\n";
        return EXIT_INTEGRITY;
    } catch (const orb::PersistenceError& e) {
        std::cerr << "Feature table write failed: " << e.what() << "\n";
        return EXIT_PERSISTENCE;
    } catch (const orb::InputValidationError& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        return EXIT_BAD_INPUT;
    } catch (const orb::DataGapError& e) {
        std::cerr << "Bars unavailable: " << e.what() << "\n";
        return EXIT_BAD_INPUT;
    }
}
