// src/logging.cpp
#include "logging.h"
#include "anomaly_scan/anomaly_types.h"
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <unistd.h>   // fileno, fsync
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <iostream>

namespace anomaly_scan
{
    static FILE *g_log_fp = nullptr;
    static std::mutex g_log_mutex;
    static std::string g_log_path = "";

    static std::string now_string()
    {
        time_t t = time(nullptr);
        struct tm tm_buf;
        localtime_r(&t, &tm_buf);
        char ts[64];
        strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
        return std::string(ts);
    }

    // caller holds g_log_mutex
    static void open_locked(const std::string &path)
    {
        if (g_log_fp) return;
        g_log_path = path.empty() ? "./anomaly_scan.log" : path;
        // the directory must already exist; we don't create dirs here
        g_log_fp = fopen(g_log_path.c_str(), "a");
        if (!g_log_fp)
        {
            std::cerr << "[logging] Failed to open log file: " << g_log_path << ", logging to console only\n";
            return;
        }
        setvbuf(g_log_fp, nullptr, _IOLBF, 0); // line buffering
        fprintf(g_log_fp, "=== anomaly_scan log started at %s ===\n", now_string().c_str());
        fprintf(g_log_fp, "%-19s | %-5s | %-6s | %s\n", "timestamp", "LEVEL", "TAG", "message");
        fflush(g_log_fp);
        fsync(fileno(g_log_fp));
    }

    // caller holds g_log_mutex
    static void write_locked(const char *level, const char *tag, const std::string &msg, bool to_stderr)
    {
        if (!g_log_fp && g_log_path.empty())
        {
            // lazy init with default path
            open_locked("./anomaly_scan.log");
        }

        char head[64];
        snprintf(head, sizeof(head), "%-19s | %-5s | %-6s | ", now_string().c_str(), level, tag);
        std::string line = std::string(head) + msg;

        // print to console
        if (to_stderr)
            std::cerr << line << std::endl;
        else
            std::cout << line << std::endl;

        // append to file if possible
        if (g_log_fp)
        {
            fprintf(g_log_fp, "%s\n", line.c_str());
            fflush(g_log_fp);
            fsync(fileno(g_log_fp));
        }
    }

    void init_logger(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        open_locked(path);
    }

    void shutdown_logger()
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_log_fp)
        {
            fclose(g_log_fp);
            g_log_fp = nullptr;
        }
    }

    void log_message(const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        write_locked("INFO", "MSG", msg, false);
    }

    void log_warning(const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        write_locked("WARN", "MSG", msg, false);
    }

    void log_error(const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        write_locked("ERR", "MSG", msg, true);
    }

    void log_scan_summary(const std::string &root, const AggregateReport &report)
    {
        char linebuf[512];
        snprintf(linebuf, sizeof(linebuf), "%-9s | files=%-6zu | ok=%-6zu | failed=%-6zu | cancelled=%-6zu | anomalies=%-8zu | %s",
                 report.cancelled ? "CANCELLED" : "DONE",
                 report.total_files, report.successful_files, report.failed_files,
                 report.cancelled_files, report.total_matches(), root.c_str());

        std::lock_guard<std::mutex> lock(g_log_mutex);
        write_locked("INFO", "SCAN", linebuf, false);
    }

} // namespace anomaly_scan
