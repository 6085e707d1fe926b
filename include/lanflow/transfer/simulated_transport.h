#ifndef LANFLOW_TRANSFER_SIMULATED_TRANSPORT_H
#define LANFLOW_TRANSFER_SIMULATED_TRANSPORT_H

#include "lanflow/base/config.h"
#include "lanflow/transfer/transport.h"
#include <atomic>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <elio/elio.hpp>

namespace lanflow {

// In-process transport for the demo binary. All flows share one link;
// each flow is also capped per transfer and optionally per source.
class SimulatedTransport : public Transport {
public:
    explicit SimulatedTransport(const SimulationConfig& config);
    ~SimulatedTransport() override;

    // Driver thread
    void start();
    void stop();

    TransferHandle start_transfer(const TransferRequest& request) override;
    void cancel_transfer(TransferHandle handle) override;
    void poll_progress(TransferHandle handle) override;

    // Upper bound for everything served by `source_id`, in MB/s
    void set_source_speed(const std::string& source_id, double mbps);

    size_t active_flows() const;
    uint64_t bytes_delivered() const { return bytes_delivered_.load(); }

private:
    struct Flow {
        TransferRequest request;
        uint64_t done = 0;
        bool stalled = false;
    };

    elio::coro::task<void> drive();
    void step(double seconds);

    SimulationConfig config_;
    mutable std::mutex mutex_;
    std::map<TransferHandle, Flow> flows_;
    std::map<std::string, double> source_speed_;
    TransferHandle next_handle_ = 1;
    std::mt19937 rng_;
    std::atomic<uint64_t> bytes_delivered_{0};

    std::atomic<bool> running_{false};
    std::thread driver_thread_;
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_SIMULATED_TRANSPORT_H
