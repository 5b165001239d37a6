// src/main.cpp
// Usage:
//   ./anomaly_scan /path/to/logs [--config config.json] [--patterns patterns.json]
//                  [--out report_dir] [--export-patterns file.json] [--custom-only]
//
// Scans every .log/.txt/.out file under the folder, prints a per-category
// summary and writes offline_anomalies_<timestamp>.json into the output dir.
#include "anomaly_scan/anomaly_engine.h"
#include "anomaly_scan/config.h"
#include "anomaly_scan/report.h"
#include "logging.h"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace std;
using namespace anomaly_scan;

static CancellationToken g_cancel;

static void on_sigint(int)
{
    g_cancel.request_cancel();
}

static void usage(const char *argv0)
{
    cerr << "Usage: " << argv0 << " <folder> [--config file] [--patterns file] [--out dir]"
         << " [--export-patterns file] [--custom-only]\n";
}

static int run(int argc, char **argv)
{
    string folder;
    string config_path = "config.json";
    string patterns_path;
    string out_dir;
    string export_path;
    bool custom_only = false;

    for (int i = 1; i < argc; ++i)
    {
        string arg = argv[i];
        auto next = [&](const char *name) -> string {
            if (i + 1 >= argc)
                throw runtime_error(string("missing value for ") + name);
            return argv[++i];
        };
        if (arg == "--config") config_path = next("--config");
        else if (arg == "--patterns") patterns_path = next("--patterns");
        else if (arg == "--out") out_dir = next("--out");
        else if (arg == "--export-patterns") export_path = next("--export-patterns");
        else if (arg == "--custom-only") custom_only = true;
        else if (arg == "-h" || arg == "--help") { usage(argv[0]); return 0; }
        else if (!arg.empty() && arg[0] == '-') { usage(argv[0]); return 1; }
        else folder = arg;
    }

    AppConfig cfg = load_config(config_path);
    if (!patterns_path.empty()) cfg.pattern_file = patterns_path;
    if (!out_dir.empty()) cfg.output_dir = out_dir;

    init_logger(cfg.log_path);

    AnomalyEngine engine(cfg.scan);
    if (!cfg.pattern_file.empty())
    {
        LoadResult res = engine.load_pattern_file(cfg.pattern_file);
        if (!res.ok)
        {
            log_error("Error loading pattern file: " + res.message);
            return 1;
        }
    }
    log_message("Using " + std::to_string(engine.registry().list().size()) + " patterns (" +
                std::to_string(engine.registry().default_count()) + " default + " +
                std::to_string(engine.registry().custom_count()) + " custom)");

    if (!export_path.empty())
    {
        ofstream out(export_path);
        if (!out.is_open())
        {
            log_error("Export failed: cannot open " + export_path);
            return 1;
        }
        out << engine.registry().export_patterns(custom_only) << '\n';
        log_message("Exported patterns to " + export_path);
        if (folder.empty()) return 0;
    }

    if (folder.empty())
    {
        usage(argv[0]);
        return 1;
    }

    signal(SIGINT, on_sigint);

    AggregateReport report = engine.scan_folder(folder, g_cancel,
        [](size_t done, size_t total, size_t anomalies) {
            ostringstream oss;
            oss << "Analyzed " << done << "/" << total << " files (" << anomalies << " anomalies)";
            log_message(oss.str());
        });

    for (const auto &[category, n] : report.per_category_counts)
        cout << setw(28) << left << category << " " << n << "\n";

    string path = save_report(report, cfg.output_dir);
    cout << (report.cancelled ? "Analysis stopped. " : "Analysis complete. ")
         << "Found " << report.total_matches() << " anomalies in "
         << report.total_files << " files. Saved: " << path << endl;

    return report.failed_files == 0 ? 0 : 2;
}

int main(int argc, char **argv)
{
    int rc = 1;
    try {
        rc = run(argc, argv);
    } catch (const exception &e) {
        cerr << "Exception caught: " << e.what() << endl;
    }
    shutdown_logger();
    return rc;
}
