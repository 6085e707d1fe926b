#ifndef LANFLOW_ADAPT_SPEED_SAMPLER_H
#define LANFLOW_ADAPT_SPEED_SAMPLER_H

#include "lanflow/base/config.h"
#include <cstddef>
#include <vector>

namespace lanflow {

// Fixed-capacity ring of recent throughput samples (MB/s).
// Not synchronized; the owner serializes access.
class SpeedSampler {
public:
    explicit SpeedSampler(const SamplerConfig& config);

    // Append a sample, overwriting the oldest once full.
    // Negative or non-finite samples are ignored; returns whether it was kept.
    bool record(double sample_mbps);

    // Mean of buffered samples, or the configured default when empty
    double current_estimate() const;

    size_t size() const { return count_; }
    size_t capacity() const { return samples_.size(); }
    bool empty() const { return count_ == 0; }
    void clear();

private:
    std::vector<double> samples_;
    size_t head_ = 0;   // next write position
    size_t count_ = 0;
    double default_estimate_;
};

} // namespace lanflow

#endif // LANFLOW_ADAPT_SPEED_SAMPLER_H
