#pragma once

#include "anomaly_scan/anomaly_types.h"
#include "anomaly_scan/cancellation.h"
#include "anomaly_scan/compiled_matcher.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace anomaly_scan
{
    enum class ScanState
    {
        Idle,
        Enumerating,
        Running,
        Aggregating,
        Done,
        Cancelled
    };

    const char *to_string(ScanState state);

    struct ScanOptions
    {
        // lower-case suffixes; empty = every regular file
        std::vector<std::string> extensions{".log", ".txt", ".out"};
        std::size_t max_workers = 16;
        std::size_t line_batch_size = 1024;
        double slow_file_seconds = 5.0;
    };

    // Called after each file finishes: (files done, files total, anomalies so far).
    // Invocations are serialized but come from worker threads.
    using ProgressCallback = std::function<void(std::size_t, std::size_t, std::size_t)>;

    // min(parallelism * 3, file_count, cap); never 0 when there is a file to scan
    std::size_t compute_worker_count(std::size_t parallelism, std::size_t file_count, std::size_t cap = 16);

    class FolderScanOrchestrator
    {
    public:
        explicit FolderScanOrchestrator(ScanOptions options = {});

        // Scans every matching file under 'root' with one task per file.
        // Per-file I/O failures end up in ScanResult::error; a cancelled scan
        // still returns a well-formed partial report.
        AggregateReport scan(const std::string &root,
                             PatternSetPtr patterns,
                             const CancellationToken &cancel,
                             const ProgressCallback &progress = nullptr);

        // Recursive listing of candidate files, sorted
        std::vector<std::string> enumerate(const std::string &root) const;

        // Streams one file through a LineScanner
        ScanResult scan_file(const std::string &path,
                             const PatternSet &patterns,
                             const CancellationToken &cancel) const;

        ScanState state() const { return state_.load(); }
        const ScanOptions &options() const { return options_; }

    private:
        bool accept_extension(const std::string &path) const;

        ScanOptions options_;
        std::atomic<ScanState> state_{ScanState::Idle};
    };

    // Sort results by path and fold them into counts
    AggregateReport aggregate_results(std::vector<ScanResult> results);

} // namespace anomaly_scan
