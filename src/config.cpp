// src/config.cpp
#include "anomaly_scan/config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace anomaly_scan
{
    AppConfig parse_config(const std::string &json_text)
    {
        json config;
        try {
            config = json::parse(json_text);
        } catch (const std::exception &e) {
            throw std::runtime_error(std::string("failed to parse config: ") + e.what());
        }
        if (!config.is_object())
            throw std::runtime_error("config must be a JSON object");

        AppConfig cfg;
        try {
            cfg.log_path    = config.value("log_path", cfg.log_path);
            cfg.pattern_file = config.value("pattern_file", cfg.pattern_file);
            cfg.output_dir  = config.value("output_dir", cfg.output_dir);

            cfg.scan.extensions        = config.value("extensions", cfg.scan.extensions);
            cfg.scan.slow_file_seconds = config.value("slow_file_seconds", cfg.scan.slow_file_seconds);

            const long long max_workers     = config.value("max_workers", 16LL);
            const long long line_batch_size = config.value("line_batch_size", 1024LL);
            if (max_workers <= 0)
                throw std::runtime_error("max_workers must be positive");
            if (line_batch_size <= 0)
                throw std::runtime_error("line_batch_size must be positive");
            cfg.scan.max_workers     = static_cast<std::size_t>(max_workers);
            cfg.scan.line_batch_size = static_cast<std::size_t>(line_batch_size);
        } catch (const json::exception &e) {
            throw std::runtime_error(std::string("invalid config value: ") + e.what());
        }
        return cfg;
    }

    AppConfig load_config(const std::string &path)
    {
        // runs before init_logger(), so nothing is logged here
        if (!std::filesystem::exists(path))
            return AppConfig{};

        std::ifstream config_file(path);
        if (!config_file.is_open())
            throw std::runtime_error("cannot open " + path);

        std::ostringstream buf;
        buf << config_file.rdbuf();
        return parse_config(buf.str());
    }

} // namespace anomaly_scan
