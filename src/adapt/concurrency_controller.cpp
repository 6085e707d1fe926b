#include "lanflow/adapt/concurrency_controller.h"
#include "lanflow/base/logger.h"
#include <algorithm>

namespace lanflow {

const char* to_string(SpeedTier tier) {
    switch (tier) {
        case SpeedTier::Slow: return "slow";
        case SpeedTier::Medium: return "medium";
        case SpeedTier::Fast: return "fast";
    }
    return "unknown";
}

ConcurrencyController::ConcurrencyController(const ConcurrencyConfig& config,
                                             const SpeedSampler& sampler,
                                             DeviceProbe& probe)
    : config_(config), sampler_(sampler), probe_(probe) {}

SpeedTier ConcurrencyController::classify(double estimate_mbps) const {
    if (estimate_mbps > config_.fast_threshold_mbps) {
        return SpeedTier::Fast;
    }
    if (estimate_mbps > config_.medium_threshold_mbps) {
        return SpeedTier::Medium;
    }
    return SpeedTier::Slow;
}

uint32_t ConcurrencyController::tier_concurrency(SpeedTier tier) const {
    switch (tier) {
        case SpeedTier::Fast: return config_.fast_concurrency;
        case SpeedTier::Medium: return config_.medium_concurrency;
        case SpeedTier::Slow: return config_.slow_concurrency;
    }
    return config_.slow_concurrency;
}

uint32_t ConcurrencyController::recommended_concurrency() {
    const double estimate = sampler_.current_estimate();
    const SpeedTier tier = classify(estimate);
    const uint32_t limit = constrain(tier_concurrency(tier));

    Logger::instance().debug("Concurrency recommendation: {} ({} tier at {:.1f} MB/s{})",
                             limit, to_string(tier), estimate, constrained() ? ", constrained device" : "");
    return limit;
}

uint32_t ConcurrencyController::constrain(uint32_t limit) {
    last_capability_ = probe_.probe();
    if (constrained()) {
        limit = std::min(limit, config_.low_end_cap);
    }
    return std::clamp<uint32_t>(limit, 1, std::max<uint32_t>(config_.max_concurrency, 1));
}

bool ConcurrencyController::constrained() const {
    return last_capability_.low_end || last_capability_.available_memory_mb < config_.low_memory_mb;
}

} // namespace lanflow
