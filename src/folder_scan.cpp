// src/folder_scan.cpp
// Concurrent folder scan: enumerate -> one task per file -> sort + aggregate.
#include "anomaly_scan/folder_scan.h"
#include "anomaly_scan/line_scanner.h"
#include "anomaly_scan/worker_pool.h"
#include "logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace anomaly_scan
{
    const char *to_string(ScanState state)
    {
        switch (state)
        {
        case ScanState::Idle:        return "idle";
        case ScanState::Enumerating: return "enumerating";
        case ScanState::Running:     return "running";
        case ScanState::Aggregating: return "aggregating";
        case ScanState::Done:        return "done";
        case ScanState::Cancelled:   return "cancelled";
        }
        return "unknown";
    }

    std::size_t compute_worker_count(std::size_t parallelism, std::size_t file_count, std::size_t cap)
    {
        if (file_count == 0)
            return 0;
        if (parallelism == 0)
            parallelism = 1;
        if (cap == 0)
            cap = 16;
        return std::max<std::size_t>(1, std::min({parallelism * 3, file_count, cap}));
    }

    FolderScanOrchestrator::FolderScanOrchestrator(ScanOptions options)
        : options_(std::move(options))
    {
        for (auto &ext : options_.extensions)
        {
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return (char)std::tolower(c); });
        }
    }

    bool FolderScanOrchestrator::accept_extension(const std::string &path) const
    {
        if (options_.extensions.empty())
            return true;

        std::string ext = fs::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        return std::find(options_.extensions.begin(), options_.extensions.end(), ext) != options_.extensions.end();
    }

    std::vector<std::string> FolderScanOrchestrator::enumerate(const std::string &root) const
    {
        std::vector<std::string> files;

        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            log_warning("Not a directory: " + root);
            return files;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        fs::recursive_directory_iterator end;
        for (; !ec && it != end; it.increment(ec))
        {
            std::error_code sec;
            // status() follows symlinks; a dangling link is kept so the open failure gets reported
            if (fs::is_directory(it->status(sec)))
                continue;
            if (!it->is_regular_file(sec) && !it->is_symlink(sec))
                continue;

            std::string path = it->path().string();
            if (accept_extension(path))
                files.push_back(std::move(path));
        }
        if (ec)
            log_warning("Enumeration of " + root + " stopped early: " + ec.message());

        // stable order for reproducibility
        std::sort(files.begin(), files.end());
        return files;
    }

    ScanResult FolderScanOrchestrator::scan_file(const std::string &path,
                                                 const PatternSet &patterns,
                                                 const CancellationToken &cancel) const
    {
        ScanResult r;
        r.file_path = path;
        r.device = fs::path(path).stem().string();

        if (cancel.is_cancelled())
        {
            r.status = ScanStatus::Cancelled;
            return r;
        }

        auto start = std::chrono::steady_clock::now();

        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in.is_open())
        {
            int err = errno;
            r.error = FileAccessError{path, err ? std::strerror(err) : "cannot open file"};
            log_error("Error analyzing " + path + ": " + r.error->message);
            return r;
        }

        try
        {
            StreamLineSource source(in);
            LineScanner scanner(patterns, source, &cancel, options_.line_batch_size);
            r.status = scanner.run(r.matches);
            r.lines_scanned = scanner.lines_read();
        }
        catch (const std::exception &e)
        {
            r.matches.clear();
            r.lines_scanned = 0;
            r.status = ScanStatus::Completed;
            r.error = FileAccessError{path, e.what()};
            log_error("Error analyzing " + path + ": " + e.what());
            return r;
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (elapsed > options_.slow_file_seconds)
        {
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            std::ostringstream oss;
            oss << "Slow file " << path << " (file_size " << std::fixed << std::setprecision(1)
                << (ec ? 0.0 : (double)size / 1024.0 / 1024.0) << " MB) total="
                << std::setprecision(2) << elapsed << "s";
            log_warning(oss.str());
        }
        return r;
    }

    AggregateReport aggregate_results(std::vector<ScanResult> results)
    {
        std::sort(results.begin(), results.end(),
                  [](const ScanResult &a, const ScanResult &b) { return a.file_path < b.file_path; });

        AggregateReport report;
        report.total_files = results.size();
        for (const auto &r : results)
        {
            if (r.error)
            {
                ++report.failed_files;
                continue;
            }
            if (r.status == ScanStatus::Cancelled)
                ++report.cancelled_files;
            for (const auto &m : r.matches)
                ++report.per_category_counts[m.category];
        }
        report.successful_files = report.total_files - report.failed_files;
        report.cancelled = report.cancelled_files > 0;
        report.results = std::move(results);
        return report;
    }

    AggregateReport FolderScanOrchestrator::scan(const std::string &root,
                                                 PatternSetPtr patterns,
                                                 const CancellationToken &cancel,
                                                 const ProgressCallback &progress)
    {
        if (!patterns)
            patterns = std::make_shared<const PatternSet>();

        state_ = ScanState::Enumerating;
        std::vector<std::string> files = enumerate(root);

        std::vector<ScanResult> results;
        if (files.empty())
        {
            log_warning("No log files found in " + root);
        }
        else
        {
            std::size_t workers = compute_worker_count(std::thread::hardware_concurrency(),
                                                       files.size(), options_.max_workers);
            log_message("Found " + std::to_string(files.size()) + " log files in " + root +
                        ". Analyzing with " + std::to_string(workers) + " workers, " +
                        std::to_string(patterns->size()) + " patterns");
            state_ = ScanState::Running;

            std::mutex progress_mtx;
            std::size_t completed = 0;
            std::size_t anomalies = 0;
            const std::size_t total = files.size();
            std::vector<std::future<ScanResult>> futures;
            futures.reserve(total);

            WorkerPool pool(workers);
            for (const auto &f : files)
            {
                futures.push_back(pool.submit([&, f]() {
                    ScanResult r = scan_file(f, *patterns, cancel);
                    if (progress)
                    {
                        std::lock_guard<std::mutex> lock(progress_mtx);
                        ++completed;
                        anomalies += r.matches.size();
                        progress(completed, total, anomalies);
                    }
                    return r;
                }));
            }

            // single wait point: results arrive in any order, sorted below
            results.reserve(total);
            for (auto &fut : futures)
                results.push_back(fut.get());
        }

        state_ = ScanState::Aggregating;
        AggregateReport report = aggregate_results(std::move(results));
        state_ = report.cancelled ? ScanState::Cancelled : ScanState::Done;

        log_scan_summary(root, report);
        return report;
    }

} // namespace anomaly_scan
