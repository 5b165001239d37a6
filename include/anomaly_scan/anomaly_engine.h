#pragma once

#include "anomaly_scan/anomaly_types.h"
#include "anomaly_scan/cancellation.h"
#include "anomaly_scan/folder_scan.h"
#include "anomaly_scan/pattern_registry.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace anomaly_scan
{
    // Explicitly owned detector: create one at startup and pass it by reference
    // to every consumer. Independent instances share nothing.
    class AnomalyEngine
    {
    public:
        explicit AnomalyEngine(ScanOptions options = {}, bool load_defaults = true);

        AnomalyEngine(const AnomalyEngine &) = delete;
        AnomalyEngine &operator=(const AnomalyEngine &) = delete;

        PatternRegistry &registry() { return registry_; }
        const PatternRegistry &registry() const { return registry_; }

        LoadResult load_pattern_file(const std::string &path) { return registry_.load_custom_file(path); }

        // classify an in-memory blob with the current snapshot
        std::vector<AnomalyMatch> detect(const std::string &text) const;

        // Captures the current snapshot, then runs the orchestrated scan.
        // cancel() stops this scan cooperatively, along with any other
        // scan started through this overload that is still running.
        AggregateReport scan_folder(const std::string &root, const ProgressCallback &progress = nullptr);

        // Same, with a caller-owned token
        AggregateReport scan_folder(const std::string &root,
                                    const CancellationToken &cancel,
                                    const ProgressCallback &progress = nullptr);

        // Request cancellation of every running scan_folder(root, progress) call.
        // Scans driven by a caller-owned token are left to that token.
        void cancel();

        ScanState scan_state() const { return orchestrator_.state(); }

    private:
        PatternRegistry registry_;
        FolderScanOrchestrator orchestrator_;
        std::mutex token_mtx_;
        std::vector<std::shared_ptr<CancellationToken>> active_tokens_;
    };

} // namespace anomaly_scan
