#include "anomaly_scan/anomaly_types.h"

namespace anomaly_scan
{
    const char *to_string(PatternOrigin origin)
    {
        switch (origin)
        {
        case PatternOrigin::Default: return "default";
        case PatternOrigin::Custom:  return "custom";
        }
        return "unknown";
    }

    const char *to_string(ScanStatus status)
    {
        switch (status)
        {
        case ScanStatus::Completed: return "completed";
        case ScanStatus::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    std::size_t AggregateReport::total_matches() const
    {
        std::size_t n = 0;
        for (const auto &r : results)
            n += r.matches.size();
        return n;
    }

} // namespace anomaly_scan
