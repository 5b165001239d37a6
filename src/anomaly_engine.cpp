// src/anomaly_engine.cpp
#include "anomaly_scan/anomaly_engine.h"
#include "anomaly_scan/line_scanner.h"

#include <vector>

namespace anomaly_scan
{
    AnomalyEngine::AnomalyEngine(ScanOptions options, bool load_defaults)
        : orchestrator_(std::move(options))
    {
        if (load_defaults)
            registry_.load_defaults();
    }

    std::vector<AnomalyMatch> AnomalyEngine::detect(const std::string &text) const
    {
        PatternSetPtr snapshot = registry_.snapshot();
        return detect_text(*snapshot, text);
    }

    AggregateReport AnomalyEngine::scan_folder(const std::string &root, const ProgressCallback &progress)
    {
        auto token = std::make_shared<CancellationToken>();
        {
            std::lock_guard<std::mutex> lock(token_mtx_);
            active_tokens_.push_back(token);
        }

        auto release = [&]() {
            std::lock_guard<std::mutex> lock(token_mtx_);
            std::erase(active_tokens_, token);
        };

        AggregateReport report;
        try
        {
            report = scan_folder(root, *token, progress);
        }
        catch (...)
        {
            release();
            throw;
        }
        release();
        return report;
    }

    AggregateReport AnomalyEngine::scan_folder(const std::string &root,
                                               const CancellationToken &cancel,
                                               const ProgressCallback &progress)
    {
        // later registry mutations do not reach this scan
        PatternSetPtr snapshot = registry_.snapshot();
        return orchestrator_.scan(root, snapshot, cancel, progress);
    }

    void AnomalyEngine::cancel()
    {
        std::lock_guard<std::mutex> lock(token_mtx_);
        for (auto &token : active_tokens_)
            token->request_cancel();
    }

} // namespace anomaly_scan
