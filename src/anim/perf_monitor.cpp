#include "perf_monitor.hpp"

#include <cadence/logger.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace cadence
{

namespace
{

bool env_flag(const char* name)
{
    const char* value = std::getenv(name);
    if (!value)
        return false;
    std::string_view v(value);
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

void env_number(const char* name, double& out)
{
    const char* value = std::getenv(name);
    if (!value)
        return;
    char*  end    = nullptr;
    double parsed = std::strtod(value, &end);
    if (end != value && std::isfinite(parsed) && parsed >= 0.0)
        out = parsed;
}

}   // anonymous namespace

PerfMonitor::Config PerfMonitor::config_from_env()
{
    Config config;
    config.enabled = env_flag("CADENCE_PERF_DEBUG");
    env_number("CADENCE_PERF_THRESHOLD_MS", config.threshold_ms);
    env_number("CADENCE_PERF_COOLDOWN_MS", config.cooldown_ms);
    return config;
}

PerfMonitor& PerfMonitor::shared()
{
    static PerfMonitor monitor(config_from_env());
    return monitor;
}

void PerfMonitor::set_config(Config config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

PerfMonitor::Config PerfMonitor::config() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

bool PerfMonitor::enabled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enabled;
}

bool PerfMonitor::report(const std::string& label,
                         double             duration_ms,
                         const std::string& detail,
                         TimePoint          now)
{
    if (!std::isfinite(duration_ms))
        return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enabled || duration_ms < config_.threshold_ms)
            return false;

        auto it = last_logged_.find(label);
        if (it != last_logged_.end())
        {
            double since = std::chrono::duration<double, std::milli>(now - it->second).count();
            if (since < config_.cooldown_ms)
                return false;
        }
        last_logged_[label] = now;
        ++spike_count_;
    }

    char ms[32];
    std::snprintf(ms, sizeof(ms), "%.2fms", duration_ms);
    if (detail.empty())
        CADENCE_LOG_WARN("perf", "spike {} {}", label, ms);
    else
        CADENCE_LOG_WARN("perf", "spike {} {} ({})", label, ms, detail);
    return true;
}

uint64_t PerfMonitor::spike_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spike_count_;
}

}   // namespace cadence
