#pragma once
#include <string>

namespace anomaly_scan
{
    struct AggregateReport;

    // Initialize logger; default path if empty => ./anomaly_scan.log
    void init_logger(const std::string &path = "./anomaly_scan.log");

    // Close the log file (console logging continues)
    void shutdown_logger();

    // Log a plain text message (INFO)
    void log_message(const std::string &msg);

    // WARN level, e.g. slow files or an empty folder
    void log_warning(const std::string &msg);

    // ERR level; console copy goes to stderr
    void log_error(const std::string &msg);

    // One formatted summary row for a finished (or cancelled) folder scan.
    void log_scan_summary(const std::string &root, const AggregateReport &report);

} // namespace anomaly_scan
