#pragma once

#include <atomic>

namespace anomaly_scan
{
    // Cooperative stop flag shared between the caller and a running scan.
    // Workers poll it between line batches and before each file.
    class CancellationToken
    {
    public:
        void request_cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
        bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }
        void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace anomaly_scan
