#include "folio/core/cache/MemoryMonitor.hpp"

#include "folio/core/util/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <string>
#include <utility>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace folio {

double processResidentMb()
{
#if defined(__linux__)
    std::ifstream statm("/proc/self/statm");
    unsigned long size = 0;
    unsigned long resident = 0;
    if (!(statm >> size >> resident)) {
        return 0.0;
    }
    const long pageSize = sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return 0.0;
    }
    return static_cast<double>(resident) * static_cast<double>(pageSize) / kBytesPerMb;
#else
    return 0.0;
#endif
}

void to_json(nlohmann::json& j, const MemoryStats& s)
{
    j = nlohmann::json{
        {"current_usage_mb", s.currentUsageMb},
        {"threshold_mb", s.thresholdMb},
        {"threshold_exceeded", s.thresholdExceeded},
        {"age_seconds", s.ageSeconds},
    };
    if (s.lastMilestone) {
        j["last_milestone"] = *s.lastMilestone;
    } else {
        j["last_milestone"] = nullptr;
    }
}

MemoryMonitor::MemoryMonitor(double thresholdMb,
                             std::shared_ptr<MinimalLogger> log,
                             Sampler sampler)
    : _thresholdMb(thresholdMb)
    , _log(LoggerOr(std::move(log)))
    , _sampler(sampler ? std::move(sampler) : Sampler(&processResidentMb))
    , _created(detail::SteadyClock::now())
{
    if (!std::isfinite(thresholdMb) || thresholdMb <= 0.0) {
        throw ConfigurationError("MemoryMonitor: threshold_mb must be positive (got " + std::to_string(thresholdMb) + ")");
    }
    _log->info("MemoryMonitor initialized with threshold={} MB", _thresholdMb);
}

double MemoryMonitor::currentUsageMb() const
{
    const double usage = _sampler();
    _log->debug("Current memory usage: {:.2f} MB", usage);
    return usage;
}

bool MemoryMonitor::checkThreshold()
{
    const double usage = currentUsageMb();

    checkMilestones(usage);

    if (usage > _thresholdMb) {
        if (!_exceeded) {
            _log->warn("Memory usage ({:.1f} MB) exceeds threshold ({} MB)", usage, _thresholdMb);
            _exceeded = true;
        }
        return true;
    }

    if (_exceeded) {
        _log->info("Memory usage ({:.1f} MB) dropped below threshold ({} MB)", usage, _thresholdMb);
        _exceeded = false;
    }
    return false;
}

void MemoryMonitor::checkMilestones(double usageMb)
{
    std::optional<int> reached;
    for (int milestone : kMilestonesMb) {
        if (usageMb < milestone) break;
        reached = milestone;
    }

    if (!reached) return;
    if (_lastMilestone && *reached <= *_lastMilestone) return;

    _log->info("Memory milestone reached: {} MB (current: {:.1f} MB)", *reached, usageMb);
    _lastMilestone = reached;
}

double MemoryMonitor::ageSeconds() const
{
    return detail::secondsSince(_created);
}

MemoryStats MemoryMonitor::stats() const
{
    MemoryStats s;
    s.currentUsageMb = currentUsageMb();
    s.thresholdMb = _thresholdMb;
    s.thresholdExceeded = _exceeded;
    s.ageSeconds = ageSeconds();
    s.lastMilestone = _lastMilestone;
    return s;
}

} // namespace folio
