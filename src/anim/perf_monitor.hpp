#pragma once

// PerfMonitor — threshold/cooldown logging of slow timeline operations.
// Disabled by default; CADENCE_PERF_DEBUG=1 turns it on for a process.
// Usage:
//   CADENCE_PERF_SCOPE(monitor, "playback.tick")   — times a scope
//   monitor.report("label", ms, "detail")           — report a measured duration

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cadence
{

class PerfMonitor
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    struct Config
    {
        bool   enabled      = false;
        double threshold_ms = 10.0;
        double cooldown_ms  = 400.0;
    };

    PerfMonitor() = default;
    explicit PerfMonitor(Config config) : config_(config) {}

    // Reads CADENCE_PERF_DEBUG, CADENCE_PERF_THRESHOLD_MS and CADENCE_PERF_COOLDOWN_MS.
    static Config config_from_env();

    // Process-wide monitor configured from the environment on first use.
    static PerfMonitor& shared();

    void   set_config(Config config);
    Config config() const;
    bool   enabled() const;

    // Logs a spike when `duration_ms` reaches the threshold and `label` was not
    // logged within the cooldown. Returns true if a line was logged.
    bool report(const std::string& label,
                double             duration_ms,
                const std::string& detail = {},
                TimePoint          now    = Clock::now());

    uint64_t spike_count() const;

   private:
    mutable std::mutex                         mutex_;
    Config                                     config_;
    std::unordered_map<std::string, TimePoint> last_logged_;
    uint64_t                                   spike_count_ = 0;
};

// RAII scope timer
struct PerfScope
{
    PerfMonitor&                 monitor;
    const char*                  label;
    std::string                  detail;
    PerfMonitor::TimePoint       start;

    PerfScope(PerfMonitor& m, const char* l) : monitor(m), label(l), start(PerfMonitor::Clock::now())
    {
    }
    ~PerfScope()
    {
        if (!monitor.enabled())
            return;
        auto now = PerfMonitor::Clock::now();
        double ms = std::chrono::duration<double, std::milli>(now - start).count();
        monitor.report(label, ms, detail, now);
    }

    PerfScope(const PerfScope&)            = delete;
    PerfScope& operator=(const PerfScope&) = delete;
};

#define CADENCE_PERF_CONCAT_INNER(a, b) a##b
#define CADENCE_PERF_CONCAT(a, b) CADENCE_PERF_CONCAT_INNER(a, b)
#define CADENCE_PERF_SCOPE(monitor, label) \
    ::cadence::PerfScope CADENCE_PERF_CONCAT(_perf_scope_, __LINE__)(monitor, label)

}   // namespace cadence
