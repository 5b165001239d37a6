#pragma once

#include "anomaly_scan/anomaly_types.h"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace anomaly_scan
{
    // Matches grouped by category for one test run / device
    struct CategorizedMatches
    {
        std::string testplan;
        std::string testcase;
        std::string device;
        std::vector<AnomalyMatch> matches;
        std::size_t count = 0;
        std::map<std::string, std::vector<AnomalyMatch>> categories;
    };

    // Empty labels become "Unknown"
    CategorizedMatches categorize(const std::vector<AnomalyMatch> &matches,
                                  const std::string &testplan = "",
                                  const std::string &testcase = "",
                                  const std::string &device = "");

    nlohmann::ordered_json match_to_json(const AnomalyMatch &m);
    nlohmann::ordered_json categorized_to_json(const CategorizedMatches &c);

    // Export schema: "anomalies" records ordered by file then line, a "failures"
    // list and a "summary" block with the per-category counts.
    nlohmann::ordered_json report_to_json(const AggregateReport &report);

    // Writes report_to_json() as <dir>/offline_anomalies_<YYYYmmdd_HHMMSS>.json.
    // Returns the absolute path; throws std::runtime_error if the file cannot be written.
    std::string save_report(const AggregateReport &report, const std::string &dir);

} // namespace anomaly_scan
