#ifndef LANFLOW_TRANSFER_PROGRESS_CHANNEL_H
#define LANFLOW_TRANSFER_PROGRESS_CHANNEL_H

#include "lanflow/base/clock.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lanflow {

using CheckoutId = uint64_t;

enum class TransferEventKind {
    Completed,
    Failed
};

struct TransferEvent {
    TransferEventKind kind = TransferEventKind::Completed;
    CheckoutId checkout_id = 0;
    std::string message;
};

// Terminal transport notifications waiting for the scheduler loop
class EventQueue {
public:
    void push(TransferEvent event);

    // Takes everything queued so far
    std::vector<TransferEvent> drain();

    // Blocks until an event is queued, close() is called or the timeout runs out.
    // Returns true when events are waiting.
    bool wait_for(Milliseconds timeout);

    void close();
    void reopen();
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> events_;
    bool closed_ = false;
};

// Handed to the transport with every request. Progress lands in atomics the
// watchdog reads on its cycle; completion and failure go through the EventQueue.
// After close() every call is ignored.
class ProgressChannel {
public:
    ProgressChannel(CheckoutId checkout_id, std::shared_ptr<EventQueue> events);

    // `bytes` counts from the start of the request; lower values are ignored
    void report(uint64_t bytes, TimePoint at);

    void complete();
    void fail(const std::string& message);

    void close();
    bool closed() const;

    CheckoutId checkout_id() const { return checkout_id_; }
    uint64_t bytes() const;
    TimePoint last_report() const;

private:
    bool finish();

    const CheckoutId checkout_id_;
    std::shared_ptr<EventQueue> events_;
    std::atomic<uint64_t> bytes_{0};
    std::atomic<TimePoint::rep> last_report_{0};
    std::atomic<bool> finished_{false};
    std::atomic<bool> closed_{false};
};

} // namespace lanflow

#endif // LANFLOW_TRANSFER_PROGRESS_CHANNEL_H
