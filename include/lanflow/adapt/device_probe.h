#ifndef LANFLOW_ADAPT_DEVICE_PROBE_H
#define LANFLOW_ADAPT_DEVICE_PROBE_H

#include "lanflow/base/config.h"
#include <cstdint>
#include <memory>

namespace lanflow {

// Coarse device classification consumed by the concurrency controller
struct DeviceCapability {
    bool low_end = false;
    uint64_t available_memory_mb = 0;
    uint32_t cpu_count = 0;
};

class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    virtual DeviceCapability probe() = 0;
};

// Reads the running host via sysinfo(2) and hardware_concurrency()
class SystemDeviceProbe : public DeviceProbe {
public:
    DeviceCapability probe() override;

    // Hosts at or below these are classified low-end
    static constexpr uint32_t LOW_END_MAX_CPUS = 2;
    static constexpr uint64_t LOW_END_MAX_TOTAL_MB = 2048;
};

// Fixed answer, from configuration or tests
class StaticDeviceProbe : public DeviceProbe {
public:
    explicit StaticDeviceProbe(DeviceCapability capability) : capability_(capability) {}

    DeviceCapability probe() override { return capability_; }
    void set(DeviceCapability capability) { capability_ = capability; }

private:
    DeviceCapability capability_;
};

std::unique_ptr<DeviceProbe> make_device_probe(const DeviceConfig& config);

} // namespace lanflow

#endif // LANFLOW_ADAPT_DEVICE_PROBE_H
