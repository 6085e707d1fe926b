#include "lanflow/transfer/progress_channel.h"

namespace lanflow {

void EventQueue::push(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::vector<TransferEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferEvent> drained(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
}

bool EventQueue::wait_for(Milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
    return !events_.empty();
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void EventQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

ProgressChannel::ProgressChannel(CheckoutId checkout_id, std::shared_ptr<EventQueue> events)
    : checkout_id_(checkout_id), events_(std::move(events)) {}

void ProgressChannel::report(uint64_t bytes, TimePoint at) {
    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    uint64_t current = bytes_.load(std::memory_order_relaxed);
    while (bytes > current &&
           !bytes_.compare_exchange_weak(current, bytes, std::memory_order_release, std::memory_order_relaxed)) {
    }
    if (bytes > current) {
        last_report_.store(at.time_since_epoch().count(), std::memory_order_release);
    }
}

bool ProgressChannel::finish() {
    if (closed_.load(std::memory_order_acquire)) {
        return false;
    }
    return !finished_.exchange(true, std::memory_order_acq_rel);
}

void ProgressChannel::complete() {
    if (finish()) {
        events_->push({TransferEventKind::Completed, checkout_id_, {}});
    }
}

void ProgressChannel::fail(const std::string& message) {
    if (finish()) {
        events_->push({TransferEventKind::Failed, checkout_id_, message});
    }
}

void ProgressChannel::close() {
    closed_.store(true, std::memory_order_release);
}

bool ProgressChannel::closed() const {
    return closed_.load(std::memory_order_acquire);
}

uint64_t ProgressChannel::bytes() const {
    return bytes_.load(std::memory_order_acquire);
}

TimePoint ProgressChannel::last_report() const {
    return TimePoint(TimePoint::duration(last_report_.load(std::memory_order_acquire)));
}

} // namespace lanflow
