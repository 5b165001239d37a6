// src/default_patterns.cpp
// Built-in anomaly patterns for embedded/network device logs.
#include "anomaly_scan/pattern_registry.h"

namespace anomaly_scan
{
    const PatternEntries &default_pattern_table()
    {
        static const PatternEntries table = {
            // kernel and system crashes
            {R"(Kernel panic)", "KERNEL_PANIC"},
            {R"(Crashdump magic)", "CRASH_DUMP"},
            {R"(Call Trace)", "CALL_TRACE"},
            {R"(Segmentation Fault|segfault)", "SEGMENTATION_FAULT"},
            {R"(Backtrace)", "BACKTRACE"},
            {R"(watchdog bite)", "WATCHDOG_BITE"},
            {R"(Oops)", "OOPS_TRACE"},

            // memory
            {R"(page\+allocation\s+failure)", "PAGE_ALLOCATION_FAILURE"},
            {R"(Unable to handle kernel NULL pointer dereference)", "MEMORY_CORRUPTION"},
            {R"(Unable to handle kernel paging request)", "MEMORY_CORRUPTION"},
            {R"(Out of memory: Kill process)", "OUT_OF_MEMORY"},
            {R"(ERROR:NBUF alloc failed)", "LOW_MEMORY"},

            // reboot loops
            {R"(Reboot Reason)", "DEVICE_REBOOT"},
            {R"(System restart)", "DEVICE_REBOOT"},

            // interfaces
            {R"(Interface down)", "INTERFACE_DOWN"},
            {R"(Link is down)", "INTERFACE_DOWN"},
            {R"(carrier lost)", "INTERFACE_DOWN"},
            {R"(entered disabled state)", "INTERFACE_DISABLED"},

            // authentication
            {R"(authentication failed)", "AUTH_FAILURE"},
            {R"(Authentication timeout)", "AUTH_TIMEOUT"},
            {R"(Invalid credentials)", "AUTH_INVALID_CREDS"},
            {R"(Access denied)", "AUTH_ACCESS_DENIED"},

            // network
            {R"(Packet loss)", "PACKET_LOSS"},
            {R"(High latency)", "HIGH_LATENCY"},
            {R"(Connection timeout)", "CONNECTION_TIMEOUT"},
            {R"(No route to host)", "NO_ROUTE"},
            {R"(Network unreachable)", "NETWORK_UNREACHABLE"},

            // configuration
            {R"(Configuration mismatch)", "CONFIG_MISMATCH"},
            {R"(Invalid configuration)", "CONFIG_INVALID"},
            {R"(Configuration error)", "CONFIG_ERROR"},

            // wifi
            {R"(vap_down)", "VAP_DOWN"},
            {R"(Received CSA)", "CHANNEL_SWITCH"},
            {R"(Invalid beacon report)", "BEACON_REPORT_ISSUE"},

            // resources
            {R"(Resource manager crash)", "RESOURCE_MANAGER_CRASH"},

            // rcu / timing
            {R"(timeout waiting)", "TIMEOUT"},

            // warnings
            {R"(CPU:\d+ WARNING)", "CPU_WARNING"},
        };
        return table;
    }

} // namespace anomaly_scan
