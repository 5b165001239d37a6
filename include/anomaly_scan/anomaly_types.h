#ifndef ANOMALY_SCAN_ANOMALY_TYPES_H
#define ANOMALY_SCAN_ANOMALY_TYPES_H

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace anomaly_scan
{
    // Where a pattern came from; custom entries override defaults with the same source
    enum class PatternOrigin
    {
        Default,
        Custom
    };

    struct AnomalyPattern
    {
        std::string source;   // regex source, unique key inside a registry
        std::string category; // e.g. KERNEL_PANIC
        PatternOrigin origin{PatternOrigin::Default};

        bool operator==(const AnomalyPattern &) const = default;
    };

    // One classified log line
    struct AnomalyMatch
    {
        std::size_t line_number{0};  // 1-based
        std::string line_text;       // trimmed line
        std::string category;
        std::string matched_pattern; // regex source that won
        std::string matched_text;    // substring that triggered the hit

        bool operator==(const AnomalyMatch &) const = default;
    };

    // Per-file I/O failure, recorded in the ScanResult instead of being thrown
    struct FileAccessError
    {
        std::string path;
        std::string message;

        bool operator==(const FileAccessError &) const = default;
    };

    enum class ScanStatus
    {
        Completed,
        Cancelled
    };

    struct ScanResult
    {
        std::string file_path;
        std::string device;  // file stem, e.g. "ap-01" for /logs/ap-01.log
        std::vector<AnomalyMatch> matches;
        std::optional<FileAccessError> error;
        ScanStatus status{ScanStatus::Completed};
        std::size_t lines_scanned{0};

        bool operator==(const ScanResult &) const = default;
    };

    struct AggregateReport
    {
        std::size_t total_files{0};
        std::size_t successful_files{0};
        std::size_t failed_files{0};
        std::size_t cancelled_files{0};  // subset of successful_files that stopped early
        bool cancelled{false};
        std::map<std::string, std::size_t> per_category_counts;
        std::vector<ScanResult> results; // sorted by file_path

        std::size_t total_matches() const;

        bool operator==(const AggregateReport &) const = default;
    };

    // Thrown while parsing/validating a pattern document; entry() names the bad regex
    class PatternLoadError : public std::runtime_error
    {
    public:
        PatternLoadError(const std::string &entry, const std::string &message)
            : std::runtime_error(message), entry_(entry) {}

        const std::string &entry() const noexcept { return entry_; }

    private:
        std::string entry_;
    };

    // Outcome of a registry load; never thrown across the registry boundary
    struct LoadResult
    {
        bool ok{false};
        std::size_t count{0};
        std::string message;
        std::string failing_entry;
    };

    const char *to_string(PatternOrigin origin);
    const char *to_string(ScanStatus status);

} // namespace anomaly_scan

#endif // ANOMALY_SCAN_ANOMALY_TYPES_H
