#ifndef LANFLOW_WATCHDOG_STALL_WATCHDOG_H
#define LANFLOW_WATCHDOG_STALL_WATCHDOG_H

#include "lanflow/base/clock.h"
#include "lanflow/base/config.h"
#include "lanflow/transfer/progress_channel.h"
#include "lanflow/transfer/transfer_item.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lanflow {

// Liveness of one open checkout
struct CheckoutWatch {
    CheckoutId checkout_id = 0;
    TimePoint last_progress_at{};
};

// What the watchdog sees of an Active or Stalled item
struct WatchEntry {
    TransferId id = 0;
    TransferStatus status = TransferStatus::Active;
    bool chunked = false;
    TimePoint last_progress_at{};
    TimePoint stalled_since{};
    uint32_t stall_polls = 0;
    std::vector<CheckoutWatch> checkouts;
};

enum class StallActionKind {
    MarkStalled,     // Active -> Stalled
    ForcePoll,       // ask the transport for a fresh report
    ReassignChunk,   // move a stale chunk checkout to another source
    Redispatch,      // item has no open checkout; start one
    Recover,         // Stalled -> Active
    Fail             // Stalled -> Failed
};

const char* to_string(StallActionKind kind);

struct StallAction {
    StallActionKind kind = StallActionKind::ForcePoll;
    TransferId id = 0;
    CheckoutId checkout_id = 0;   // ForcePoll and ReassignChunk
};

// Periodic liveness scan. scan() is a pure function of its input; the timer
// only decides when the owner's cycle runs.
class StallWatchdog {
public:
    // One watchdog cycle; returns false when nothing is Active or Stalled
    using CycleFn = std::function<bool()>;

    explicit StallWatchdog(const WatchdogConfig& config);
    ~StallWatchdog();

    StallWatchdog(const StallWatchdog&) = delete;
    StallWatchdog& operator=(const StallWatchdog&) = delete;

    std::vector<StallAction> scan(const std::vector<WatchEntry>& entries, TimePoint now) const;

    void set_cycle(CycleFn cycle);

    // Starts the timer thread (idle until armed). With interval_ms == 0 no
    // thread is started and the owner drives cycles through tick().
    void start();
    void stop();

    // Begin polling; no-op while already polling. Safe from inside a cycle.
    void arm();

    // Runs one cycle now and updates the polling state from its result
    bool tick();

    bool polling() const;
    bool manual() const { return config_.interval_ms == 0; }
    uint64_t cycles() const { return cycles_.load(); }

    const WatchdogConfig& config() const { return config_; }

private:
    void run();
    bool run_cycle();
    bool shutting_down() const;
    bool stale(TimePoint last, TimePoint now) const;

    WatchdogConfig config_;
    CycleFn cycle_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool polling_ = false;
    bool rearm_ = false;
    bool shutdown_ = false;
    std::thread thread_;
    std::atomic<uint64_t> cycles_{0};
};

} // namespace lanflow

#endif // LANFLOW_WATCHDOG_STALL_WATCHDOG_H
