#ifndef LANFLOW_ADAPT_CONCURRENCY_CONTROLLER_H
#define LANFLOW_ADAPT_CONCURRENCY_CONTROLLER_H

#include "lanflow/adapt/device_probe.h"
#include "lanflow/adapt/speed_sampler.h"
#include "lanflow/base/config.h"
#include <cstdint>

namespace lanflow {

enum class SpeedTier {
    Slow,
    Medium,
    Fast
};

const char* to_string(SpeedTier tier);

// Turns the smoothed speed estimate and the device hint into a limit on
// simultaneously active transfers. Polled by the scheduler, never pushed.
class ConcurrencyController {
public:
    ConcurrencyController(const ConcurrencyConfig& config,
                          const SpeedSampler& sampler,
                          DeviceProbe& probe);

    // Tier -> base value -> low-end cap -> clamp to [1, max_concurrency].
    // Probes the device once per call.
    uint32_t recommended_concurrency();

    // Applies the low-end cap and the [1, max_concurrency] clamp to a limit
    // that did not come from the sampler (e.g. one restored from disk).
    uint32_t constrain(uint32_t limit);

    SpeedTier classify(double estimate_mbps) const;

    const DeviceCapability& last_capability() const { return last_capability_; }

private:
    uint32_t tier_concurrency(SpeedTier tier) const;
    bool constrained() const;

    ConcurrencyConfig config_;
    const SpeedSampler& sampler_;
    DeviceProbe& probe_;
    DeviceCapability last_capability_;
};

} // namespace lanflow

#endif // LANFLOW_ADAPT_CONCURRENCY_CONTROLLER_H
