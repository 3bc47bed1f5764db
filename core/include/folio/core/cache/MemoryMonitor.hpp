#pragma once

#include "folio/core/cache/CacheStats.hpp"
#include "folio/core/util/Logging.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <functional>
#include <memory>
#include <optional>

namespace folio {

// Resident set size of this process in MB, 0.0 where it cannot be read
double processResidentMb();

struct MemoryStats {
    double currentUsageMb = 0.0;
    double thresholdMb = 0.0;
    bool thresholdExceeded = false;
    double ageSeconds = 0.0;
    std::optional<int> lastMilestone;
};

void to_json(nlohmann::json& j, const MemoryStats& s);

/**
 * @brief Watches process memory against one threshold
 *
 * check_threshold() warns once when usage goes above the threshold and
 * logs once when it comes back down; repeated polls on the same side stay
 * quiet. Independently, each milestone in kMilestonesMb is logged the first
 * time usage reaches it, and only a milestone higher than the last logged
 * one is ever logged again.
 *
 * The exceeded flag and milestone are not synchronized; poll from one thread.
 */
class MemoryMonitor
{
public:
    enum class State { Normal, Exceeded };

    using Sampler = std::function<double()>;

    static constexpr std::array<int, 7> kMilestonesMb{100, 125, 150, 175, 200, 250, 300};

    /**
     * @param thresholdMb Warning threshold in MB (must be positive)
     * @param sampler Returns current usage in MB; defaults to processResidentMb
     * @throws ConfigurationError if thresholdMb <= 0 or not finite
     */
    explicit MemoryMonitor(double thresholdMb,
                           std::shared_ptr<MinimalLogger> log = nullptr,
                           Sampler sampler = {});

    double currentUsageMb() const;

    // Samples usage, updates the milestone ratchet and the Normal/Exceeded state
    bool checkThreshold();

    State state() const { return _exceeded ? State::Exceeded : State::Normal; }
    double thresholdMb() const { return _thresholdMb; }
    std::optional<int> lastMilestone() const { return _lastMilestone; }
    double ageSeconds() const;

    MemoryStats stats() const;

private:
    void checkMilestones(double usageMb);

    double _thresholdMb;
    std::shared_ptr<MinimalLogger> _log;
    Sampler _sampler;
    bool _exceeded = false;
    std::optional<int> _lastMilestone;
    const detail::SteadyClock::time_point _created;
};

} // namespace folio
