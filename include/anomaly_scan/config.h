#pragma once

#include "anomaly_scan/folder_scan.h"

#include <string>

namespace anomaly_scan
{
    struct AppConfig
    {
        std::string log_path = "./anomaly_scan.log";
        std::string pattern_file;      // empty -> built-in patterns only
        std::string output_dir = ".";
        ScanOptions scan;
    };

    // Reads config.json-style settings; a missing key keeps its default.
    // Throws std::runtime_error on unparsable JSON or wrongly typed values.
    AppConfig parse_config(const std::string &json_text);

    // Missing file -> defaults. Unreadable/invalid file -> std::runtime_error.
    AppConfig load_config(const std::string &path);

} // namespace anomaly_scan
