#include "lanflow/adapt/device_probe.h"
#include "lanflow/base/logger.h"
#include <cerrno>
#include <cstring>
#include <sys/sysinfo.h>
#include <thread>

namespace lanflow {

DeviceCapability SystemDeviceProbe::probe() {
    DeviceCapability cap;
    cap.cpu_count = std::thread::hardware_concurrency();

    struct sysinfo si {};
    if (sysinfo(&si) != 0) {
        Logger::instance().warning("sysinfo failed: {}, assuming a low-end device", std::strerror(errno));
        cap.low_end = true;
        return cap;
    }

    const uint64_t unit = si.mem_unit ? si.mem_unit : 1;
    const uint64_t total_mb = static_cast<uint64_t>(si.totalram) * unit / (1024 * 1024);
    cap.available_memory_mb = (static_cast<uint64_t>(si.freeram) + si.bufferram) * unit / (1024 * 1024);
    cap.low_end = (cap.cpu_count != 0 && cap.cpu_count <= LOW_END_MAX_CPUS) ||
                  total_mb <= LOW_END_MAX_TOTAL_MB;
    return cap;
}

std::unique_ptr<DeviceProbe> make_device_probe(const DeviceConfig& config) {
    if (config.probe == "static") {
        DeviceCapability cap;
        cap.low_end = config.low_end;
        cap.available_memory_mb = config.memory_mb;
        cap.cpu_count = std::thread::hardware_concurrency();
        return std::make_unique<StaticDeviceProbe>(cap);
    }
    return std::make_unique<SystemDeviceProbe>();
}

} // namespace lanflow
