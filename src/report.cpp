// src/report.cpp
#include "anomaly_scan/report.h"
#include "logging.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using ordered_json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace anomaly_scan
{
    CategorizedMatches categorize(const std::vector<AnomalyMatch> &matches,
                                  const std::string &testplan,
                                  const std::string &testcase,
                                  const std::string &device)
    {
        CategorizedMatches c;
        c.testplan = testplan.empty() ? "Unknown" : testplan;
        c.testcase = testcase.empty() ? "Unknown" : testcase;
        c.device = device.empty() ? "Unknown" : device;
        c.matches = matches;
        c.count = matches.size();
        for (const auto &m : matches)
            c.categories[m.category].push_back(m);
        return c;
    }

    ordered_json match_to_json(const AnomalyMatch &m)
    {
        return ordered_json{
            {"line_number", m.line_number},
            {"line_text", m.line_text},
            {"category", m.category},
            {"matched_pattern", m.matched_pattern},
            {"matched_text", m.matched_text},
        };
    }

    ordered_json categorized_to_json(const CategorizedMatches &c)
    {
        ordered_json j;
        j["testplan"] = c.testplan;
        j["testcase"] = c.testcase;
        j["device"] = c.device;
        j["count"] = c.count;
        j["anomalies"] = ordered_json::array();
        for (const auto &m : c.matches)
            j["anomalies"].push_back(match_to_json(m));
        j["categories"] = ordered_json::object();
        for (const auto &[category, list] : c.categories)
        {
            ordered_json arr = ordered_json::array();
            for (const auto &m : list)
                arr.push_back(match_to_json(m));
            j["categories"][category] = std::move(arr);
        }
        return j;
    }

    ordered_json report_to_json(const AggregateReport &report)
    {
        ordered_json anomalies = ordered_json::array();
        ordered_json failures = ordered_json::array();
        ordered_json files = ordered_json::array();

        for (const auto &r : report.results)
        {
            files.push_back(ordered_json{
                {"file_path", r.file_path},
                {"device", r.device},
                {"status", to_string(r.status)},
                {"lines_scanned", r.lines_scanned},
                {"anomalies", r.matches.size()},
                {"error", r.error ? ordered_json(r.error->message) : ordered_json(nullptr)},
            });

            if (r.error)
            {
                failures.push_back(ordered_json{{"file_path", r.file_path}, {"error", r.error->message}});
                continue;
            }
            for (const auto &m : r.matches)
            {
                ordered_json rec;
                rec["file_path"] = r.file_path;
                rec["device"] = r.device;
                rec["line_number"] = m.line_number;
                rec["line_text"] = m.line_text;
                rec["category"] = m.category;
                rec["matched_pattern"] = m.matched_pattern;
                rec["matched_text"] = m.matched_text;
                anomalies.push_back(std::move(rec));
            }
        }

        ordered_json counts = ordered_json::object();
        for (const auto &[category, n] : report.per_category_counts)
            counts[category] = n;

        ordered_json j;
        j["summary"] = ordered_json{
            {"total_files", report.total_files},
            {"successful_files", report.successful_files},
            {"failed_files", report.failed_files},
            {"cancelled_files", report.cancelled_files},
            {"cancelled", report.cancelled},
            {"total_anomalies", anomalies.size()},
            {"per_category_counts", std::move(counts)},
        };
        j["files"] = std::move(files);
        j["failures"] = std::move(failures);
        j["anomalies"] = std::move(anomalies);
        return j;
    }

    std::string save_report(const AggregateReport &report, const std::string &dir)
    {
        fs::path out_dir = dir.empty() ? fs::path(".") : fs::path(dir);
        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec)
            throw std::runtime_error("cannot create output directory " + out_dir.string() + ": " + ec.message());

        time_t t = time(nullptr);
        struct tm tm_buf;
        localtime_r(&t, &tm_buf);
        char stamp[32];
        strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);

        fs::path path = out_dir / (std::string("offline_anomalies_") + stamp + ".json");
        std::ofstream out(path);
        if (!out.is_open())
            throw std::runtime_error("cannot open report file " + path.string());

        out << report_to_json(report).dump(2) << '\n';
        out.close();
        if (!out)
            throw std::runtime_error("failed writing report file " + path.string());

        std::string abs = fs::absolute(path).string();
        log_message("Report saved: " + abs);
        return abs;
    }

} // namespace anomaly_scan
