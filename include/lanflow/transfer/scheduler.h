#ifndef LANFLOW_TRANSFER_SCHEDULER_H
#define LANFLOW_TRANSFER_SCHEDULER_H

#include "lanflow/adapt/device_probe.h"
#include "lanflow/base/clock.h"
#include "lanflow/base/config.h"
#include "lanflow/p2p/source_registry.h"
#include "lanflow/transfer/transfer_item.h"
#include "lanflow/transfer/transport.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanflow {

struct SchedulerStats {
    size_t active_count = 0;
    size_t queued_count = 0;
    size_t stalled_count = 0;
    size_t completed_count = 0;
    size_t failed_count = 0;
    size_t cancelled_count = 0;
    double avg_throughput_mbps = 0.0;
    uint32_t concurrency_limit = 0;
};

// Owns every transfer, the queue, the active set and the source registry.
// All public methods are thread-safe. Transports talk back only through the
// ProgressChannel in each request.
class TransferScheduler {
public:
    TransferScheduler(const GlobalConfig& config,
                      std::shared_ptr<Transport> transport,
                      std::unique_ptr<DeviceProbe> probe = nullptr,
                      ClockFn clock = steady_clock_fn());
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    // Queues a new transfer and admits it if a slot is free.
    // Throws LanflowError(InvalidArgument) for a zero-byte item.
    TransferId submit(const TransferSpec& spec);

    // Idempotent; false only for an unknown id
    bool cancel(TransferId id);

    // Stops the current attempt, keeps progress and holds the item in the
    // queue with retry priority until resume()
    bool pause(TransferId id);
    bool resume(TransferId id);

    // Back to Queued from Failed or Cancelled, progress discarded
    bool restart(TransferId id);

    // Peer discovery feed
    bool add_source(const SourceDescriptor& source);
    bool remove_source(const std::string& source_id);
    bool update_source_availability(const std::string& source_id, const std::string& content_id,
                                    const ByteRangeSet& ranges);
    bool record_source_heartbeat(const std::string& source_id);

    // External throughput sample in MB/s
    void record_throughput(double mbps);

    // Applies queued transport completions and failures; returns how many
    size_t process_events();

    // One watchdog cycle. Returns false when nothing is Active or Stalled.
    bool tick();

    // Event loop thread and watchdog timer
    void start();
    void stop();
    bool running() const;

    std::vector<TransferItem> list_items() const;
    std::optional<TransferItem> get_item(TransferId id) const;
    std::vector<TransferId> queued_ids() const;
    std::vector<SourceDescriptor> list_sources() const;
    SchedulerStats stats() const;
    uint32_t concurrency_limit() const;

    // True when every item is Completed, Failed or Cancelled
    bool idle() const;

    bool watchdog_polling() const;

    std::string serialize_state() const;

    // Replaces all transfer state. Open attempts are cancelled; restored
    // Active items are re-dispatched by the next watchdog cycle.
    // Throws LanflowError(SerializationError | InvalidState).
    void restore_state(const std::string& data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_SCHEDULER_H
