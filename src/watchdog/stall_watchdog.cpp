#include "lanflow/watchdog/stall_watchdog.h"
#include "lanflow/base/logger.h"
#include <elio/elio.hpp>
#include <elio/time/timer.hpp>
#include <algorithm>

namespace lanflow {

namespace {

constexpr std::chrono::milliseconds SHUTDOWN_SLICE{20};

} // namespace

const char* to_string(StallActionKind kind) {
    switch (kind) {
        case StallActionKind::MarkStalled: return "mark_stalled";
        case StallActionKind::ForcePoll: return "force_poll";
        case StallActionKind::ReassignChunk: return "reassign_chunk";
        case StallActionKind::Redispatch: return "redispatch";
        case StallActionKind::Recover: return "recover";
        case StallActionKind::Fail: return "fail";
    }
    return "unknown";
}

StallWatchdog::StallWatchdog(const WatchdogConfig& config) : config_(config) {}

StallWatchdog::~StallWatchdog() {
    stop();
}

bool StallWatchdog::stale(TimePoint last, TimePoint now) const {
    return now - last > Milliseconds(config_.stall_threshold_ms);
}

std::vector<StallAction> StallWatchdog::scan(const std::vector<WatchEntry>& entries, TimePoint now) const {
    std::vector<StallAction> actions;

    // Corrective action for an item that stopped moving
    auto correct = [&](const WatchEntry& entry) {
        if (!entry.chunked) {
            for (const auto& checkout : entry.checkouts) {
                actions.push_back({StallActionKind::ForcePoll, entry.id, checkout.checkout_id});
            }
            return;
        }
        bool any = false;
        for (const auto& checkout : entry.checkouts) {
            if (stale(checkout.last_progress_at, now)) {
                actions.push_back({StallActionKind::ReassignChunk, entry.id, checkout.checkout_id});
                any = true;
            }
        }
        if (!any) {
            for (const auto& checkout : entry.checkouts) {
                actions.push_back({StallActionKind::ForcePoll, entry.id, checkout.checkout_id});
            }
        }
    };

    for (const auto& entry : entries) {
        switch (entry.status) {
            case TransferStatus::Active:
                if (entry.checkouts.empty()) {
                    actions.push_back({StallActionKind::Redispatch, entry.id, 0});
                } else if (stale(entry.last_progress_at, now)) {
                    actions.push_back({StallActionKind::MarkStalled, entry.id, 0});
                    correct(entry);
                } else if (entry.chunked) {
                    // Item is moving but one of its sources may not be
                    for (const auto& checkout : entry.checkouts) {
                        if (stale(checkout.last_progress_at, now)) {
                            actions.push_back({StallActionKind::ReassignChunk, entry.id, checkout.checkout_id});
                        }
                    }
                }
                break;

            case TransferStatus::Stalled:
                if (entry.last_progress_at > entry.stalled_since) {
                    actions.push_back({StallActionKind::Recover, entry.id, 0});
                } else if (entry.stall_polls >= config_.max_stall_polls) {
                    actions.push_back({StallActionKind::Fail, entry.id, 0});
                } else if (entry.checkouts.empty()) {
                    actions.push_back({StallActionKind::Redispatch, entry.id, 0});
                } else {
                    correct(entry);
                }
                break;

            case TransferStatus::Queued:
            case TransferStatus::Completed:
            case TransferStatus::Failed:
            case TransferStatus::Cancelled:
                break;
        }
    }
    return actions;
}

void StallWatchdog::set_cycle(CycleFn cycle) {
    std::lock_guard<std::mutex> lock(mutex_);
    cycle_ = std::move(cycle);
}

void StallWatchdog::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = false;
    if (manual()) {
        Logger::instance().debug("Stall watchdog in manual mode");
        return;
    }
    if (!thread_.joinable()) {
        thread_ = std::thread([this] { run(); });
    }
}

void StallWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        polling_ = false;
        rearm_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StallWatchdog::arm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (polling_) {
            rearm_ = true;
            return;
        }
        polling_ = true;
        rearm_ = false;
    }
    cv_.notify_all();
}

bool StallWatchdog::polling() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polling_;
}

bool StallWatchdog::tick() {
    return run_cycle();
}

bool StallWatchdog::run_cycle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ && !manual()) {
            return false;
        }
        rearm_ = false;
    }

    const bool keep = cycle_ ? cycle_() : false;
    cycles_++;

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ && !manual()) {
        return false;
    }
    if (keep || rearm_) {
        polling_ = true;
        rearm_ = false;
        return true;
    }
    polling_ = false;
    return false;
}

bool StallWatchdog::shutting_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

void StallWatchdog::run() {
    Logger::instance().debug("Stall watchdog thread started ({}ms interval, {}ms threshold)",
                             config_.interval_ms, config_.stall_threshold_ms);

    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        cv_.wait(lock, [this] { return shutdown_ || polling_; });
        if (shutdown_) {
            break;
        }
        lock.unlock();

        Logger::instance().debug("Stall watchdog polling");
        elio::run([this]() -> elio::coro::task<void> {
            const auto interval = std::chrono::milliseconds(config_.interval_ms);
            do {
                // Sliced: stop() returns within one SHUTDOWN_SLICE
                auto remaining = interval;
                while (remaining.count() > 0 && !shutting_down()) {
                    const auto slice = std::min(remaining, SHUTDOWN_SLICE);
                    co_await elio::time::sleep_for(slice);
                    remaining -= slice;
                }
            } while (!shutting_down() && run_cycle());
            co_return;
        }());
        Logger::instance().debug("Stall watchdog idle after {} cycles", cycles_.load());

        lock.lock();
    }

    Logger::instance().debug("Stall watchdog thread exiting");
}

} // namespace lanflow
