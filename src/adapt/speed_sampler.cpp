#include "lanflow/adapt/speed_sampler.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace lanflow {

SpeedSampler::SpeedSampler(const SamplerConfig& config)
    : samples_(std::max<uint32_t>(config.sample_size, 1), 0.0),
      default_estimate_(config.default_estimate_mbps) {}

bool SpeedSampler::record(double sample_mbps) {
    if (!std::isfinite(sample_mbps) || sample_mbps < 0.0) {
        return false;
    }
    samples_[head_] = sample_mbps;
    head_ = (head_ + 1) % samples_.size();
    count_ = std::min(count_ + 1, samples_.size());
    return true;
}

double SpeedSampler::current_estimate() const {
    if (count_ == 0) {
        return default_estimate_;
    }
    // Until the ring wraps, the valid samples are the first count_ slots
    double sum = std::accumulate(samples_.begin(), samples_.begin() + count_, 0.0);
    return sum / static_cast<double>(count_);
}

void SpeedSampler::clear() {
    std::fill(samples_.begin(), samples_.end(), 0.0);
    head_ = 0;
    count_ = 0;
}

} // namespace lanflow
