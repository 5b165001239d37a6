#include <gtest/gtest.h>
#include "anomaly_scan/folder_scan.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace anomaly_scan;
namespace fs = std::filesystem;

// Scratch directory removed at the end of each test
class TempDir
{
public:
    TempDir()
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() /
                ("anomaly_scan_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                 std::to_string(::getpid()));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path &path() const { return path_; }

    fs::path write(const std::string &rel, const std::string &content) const
    {
        fs::path p = path_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    fs::path path_;
};

static PatternSetPtr make_set(const std::vector<std::pair<std::string, std::string>> &entries)
{
    std::vector<AnomalyPattern> patterns;
    for (const auto &[source, category] : entries)
        patterns.push_back(AnomalyPattern{source, category, PatternOrigin::Default});
    return std::make_shared<const PatternSet>(std::move(patterns), 1);
}

// --- worker count ---
TEST(WorkerCountTest, BoundedByParallelismFilesAndCap)
{
    EXPECT_EQ(compute_worker_count(8, 100), 16u);
    EXPECT_EQ(compute_worker_count(2, 100), 6u);
    EXPECT_EQ(compute_worker_count(8, 3), 3u);
    EXPECT_EQ(compute_worker_count(0, 5), 3u);
    EXPECT_EQ(compute_worker_count(4, 0), 0u);
    EXPECT_EQ(compute_worker_count(4, 50, 4), 4u);
}

// --- enumeration ---
TEST(FolderScanTest, EnumeratesRecursivelyWithExtensionFilter)
{
    TempDir dir;
    dir.write("a.log", "x\n");
    dir.write("nested/deeper/b.TXT", "x\n");
    dir.write("nested/c.out", "x\n");
    dir.write("image.bin", "x\n");
    dir.write("README", "x\n");

    FolderScanOrchestrator orch;
    auto files = orch.enumerate(dir.path().string());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "a.log");
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));

    ScanOptions all;
    all.extensions.clear();
    FolderScanOrchestrator orch_all(all);
    EXPECT_EQ(orch_all.enumerate(dir.path().string()).size(), 5u);
}

TEST(FolderScanTest, EmptyFolderGivesEmptyReport)
{
    TempDir dir;
    FolderScanOrchestrator orch;
    CancellationToken token;

    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token);
    EXPECT_EQ(report.total_files, 0u);
    EXPECT_EQ(report.successful_files, 0u);
    EXPECT_EQ(report.failed_files, 0u);
    EXPECT_TRUE(report.results.empty());
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(orch.state(), ScanState::Done);
}

TEST(FolderScanTest, MissingRootGivesEmptyReport)
{
    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan("/nonexistent/anomaly_scan/root", make_set({{"panic", "PANIC"}}), token);
    EXPECT_EQ(report.total_files, 0u);
}

// --- scanning ---
TEST(FolderScanTest, AggregatesSortedResultsAndCounts)
{
    TempDir dir;
    dir.write("b/ap-02.log", "Kernel panic\nok\nsegfault in hostapd\n");
    dir.write("a/ap-01.log", "ok\n\nKERNEL PANIC again\n");
    dir.write("c.txt", "nothing here\n");

    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(),
                                       make_set({{"panic", "PANIC"}, {"segfault", "SEGV"}}), token);

    ASSERT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.successful_files, 3u);
    EXPECT_EQ(report.failed_files, 0u);
    EXPECT_EQ(report.per_category_counts.at("PANIC"), 2u);
    EXPECT_EQ(report.per_category_counts.at("SEGV"), 1u);
    EXPECT_EQ(report.total_matches(), 3u);

    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_LT(report.results[0].file_path, report.results[1].file_path);
    EXPECT_LT(report.results[1].file_path, report.results[2].file_path);

    const ScanResult &first = report.results[0];
    EXPECT_EQ(first.device, "ap-01");
    ASSERT_EQ(first.matches.size(), 1u);
    EXPECT_EQ(first.matches[0].line_number, 3u);
    EXPECT_EQ(first.status, ScanStatus::Completed);
}

TEST(FolderScanTest, OneUnreadableFileAmongThreeIsIsolated)
{
    TempDir dir;
    dir.write("one.log", "Kernel panic\n");
    dir.write("two.log", "all fine\n");
    fs::create_symlink(dir.path() / "does-not-exist.log", dir.path() / "zz-missing.log");

    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token);

    EXPECT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.successful_files, 2u);
    EXPECT_EQ(report.failed_files, 1u);
    EXPECT_EQ(report.total_files, report.successful_files + report.failed_files);
    EXPECT_EQ(report.per_category_counts.at("PANIC"), 1u);

    const ScanResult &failed = report.results[2];
    EXPECT_EQ(fs::path(failed.file_path).filename().string(), "zz-missing.log");
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->path, failed.file_path);
    EXPECT_FALSE(failed.error->message.empty());
    EXPECT_EQ(failed.status, ScanStatus::Completed);
    EXPECT_TRUE(failed.matches.empty());
}

TEST(FolderScanTest, SymlinkLoopIsRecordedAsFailure)
{
    TempDir dir;
    dir.write("a.log", "panic\n");
    dir.write("b.log", "panic\n");
    fs::create_symlink(dir.path() / "c.log", dir.path() / "c.log");

    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token);

    EXPECT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.successful_files, 2u);
    EXPECT_EQ(report.failed_files, 1u);
    EXPECT_EQ(report.per_category_counts.at("PANIC"), 2u);
    ASSERT_TRUE(report.results[2].error.has_value());
    EXPECT_EQ(fs::path(report.results[2].file_path).filename().string(), "c.log");
}

TEST(FolderScanTest, PermissionDeniedFileIsRecorded)
{
    if (::geteuid() == 0)
        GTEST_SKIP() << "root can read mode-000 files";

    TempDir dir;
    dir.write("a.log", "panic\n");
    dir.write("b.log", "panic\n");
    fs::path locked = dir.write("c.log", "panic\n");
    fs::permissions(locked, fs::perms::none);

    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token);
    fs::permissions(locked, fs::perms::owner_all);

    EXPECT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.successful_files, 2u);
    EXPECT_EQ(report.failed_files, 1u);
    EXPECT_TRUE(report.results[2].error.has_value());
}

TEST(FolderScanTest, HugeLineDoesNotStopOtherFiles)
{
    TempDir dir;
    dir.write("a.log", "Kernel panic\n");
    dir.write("b.log", "boot\n" + std::string(2 << 20, 'a') + " Kernel panic\nok\n");
    dir.write("c.log", "segfault in hostapd\n");

    FolderScanOrchestrator orch;
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(),
                                       make_set({{"segfault", "SEGV"}, {"Kernel panic", "PANIC"}}), token);

    EXPECT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.failed_files, 0u);
    EXPECT_EQ(report.per_category_counts.at("PANIC"), 2u);
    EXPECT_EQ(report.per_category_counts.at("SEGV"), 1u);

    const ScanResult &huge = report.results[1];
    ASSERT_EQ(huge.matches.size(), 1u);
    EXPECT_EQ(huge.matches[0].line_number, 2u);
    EXPECT_EQ(huge.lines_scanned, 3u);
}

TEST(FolderScanTest, RepeatedScansAreIdentical)
{
    TempDir dir;
    for (int i = 0; i < 12; ++i)
        dir.write("dev" + std::to_string(i) + ".log",
                  "boot\nLink is down\nCPU:" + std::to_string(i) + " WARNING\nlink is down again\n");

    FolderScanOrchestrator orch;
    CancellationToken token;
    auto set = make_set({{"link is down", "INTERFACE_DOWN"}, {"CPU:\\d+ WARNING", "CPU_WARNING"}});

    AggregateReport a = orch.scan(dir.path().string(), set, token);
    AggregateReport b = orch.scan(dir.path().string(), set, token);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.per_category_counts.at("INTERFACE_DOWN"), 24u);
}

TEST(FolderScanTest, ProgressReportedForEveryFile)
{
    TempDir dir;
    for (int i = 0; i < 5; ++i)
        dir.write("f" + std::to_string(i) + ".log", "panic\n");

    FolderScanOrchestrator orch;
    CancellationToken token;
    std::size_t calls = 0;
    std::size_t last_done = 0;
    std::size_t last_anomalies = 0;
    orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token,
              [&](std::size_t done, std::size_t total, std::size_t anomalies) {
                  ++calls;
                  EXPECT_EQ(total, 5u);
                  last_done = done;
                  last_anomalies = anomalies;
              });

    EXPECT_EQ(calls, 5u);
    EXPECT_EQ(last_done, 5u);
    EXPECT_EQ(last_anomalies, 5u);
}

// --- cancellation ---
TEST(FolderScanTest, CancelledScanReturnsPartialReport)
{
    TempDir dir;
    dir.write("a.log", "panic\n");
    dir.write("b.log", "panic\n");

    FolderScanOrchestrator orch;
    CancellationToken token;
    token.request_cancel();
    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.total_files, 2u);
    EXPECT_EQ(report.cancelled_files, 2u);
    EXPECT_EQ(report.failed_files, 0u);
    for (const auto &r : report.results)
        EXPECT_EQ(r.status, ScanStatus::Cancelled);
    EXPECT_EQ(orch.state(), ScanState::Cancelled);
}

TEST(FolderScanTest, CancelFromProgressStopsRemainingFiles)
{
    TempDir dir;
    for (int i = 0; i < 40; ++i)
        dir.write("f" + std::to_string(i) + ".log", "panic\n");

    ScanOptions opts;
    opts.max_workers = 1;
    FolderScanOrchestrator orch(opts);
    CancellationToken token;
    AggregateReport report = orch.scan(dir.path().string(), make_set({{"panic", "PANIC"}}), token,
                                       [&](std::size_t, std::size_t, std::size_t) { token.request_cancel(); });

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.total_files, 40u);
    EXPECT_EQ(report.results.size(), 40u);
    EXPECT_GE(report.cancelled_files, 1u);
    EXPECT_LT(report.per_category_counts.at("PANIC"), 40u);
}

TEST(AggregateResultsTest, SortsByPathAndCountsFailures)
{
    std::vector<ScanResult> results(3);
    results[0].file_path = "/z.log";
    results[0].matches.push_back(AnomalyMatch{1, "x", "A", "x", "x"});
    results[1].file_path = "/a.log";
    results[1].error = FileAccessError{"/a.log", "Permission denied"};
    results[2].file_path = "/m.log";
    results[2].status = ScanStatus::Cancelled;

    AggregateReport report = aggregate_results(results);
    EXPECT_EQ(report.results[0].file_path, "/a.log");
    EXPECT_EQ(report.results[2].file_path, "/z.log");
    EXPECT_EQ(report.total_files, 3u);
    EXPECT_EQ(report.failed_files, 1u);
    EXPECT_EQ(report.successful_files, 2u);
    EXPECT_EQ(report.cancelled_files, 1u);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.per_category_counts.at("A"), 1u);
}
