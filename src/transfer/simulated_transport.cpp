#include "lanflow/transfer/simulated_transport.h"
#include "lanflow/base/logger.h"
#include <elio/time/timer.hpp>
#include <algorithm>
#include <chrono>
#include <vector>

namespace lanflow {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

} // namespace

SimulatedTransport::SimulatedTransport(const SimulationConfig& config)
    : config_(config), rng_(std::random_device{}()) {}

SimulatedTransport::~SimulatedTransport() {
    stop();
}

void SimulatedTransport::start() {
    if (running_.exchange(true)) {
        return;
    }

    driver_thread_ = std::thread([this]() {
        Logger::instance().debug("Simulated link started: {:.1f} MB/s shared, {:.1f} MB/s per transfer",
                                 config_.link_mbps, config_.per_transfer_mbps);
        elio::run(drive());
        Logger::instance().debug("Simulated link stopped");
    });
}

void SimulatedTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (driver_thread_.joinable()) {
        driver_thread_.join();
    }
}

elio::coro::task<void> SimulatedTransport::drive() {
    const auto tick = std::chrono::milliseconds(std::max<uint32_t>(config_.tick_ms, 1));
    auto last = std::chrono::steady_clock::now();

    while (running_) {
        co_await elio::time::sleep_for(tick);

        auto now = std::chrono::steady_clock::now();
        step(std::chrono::duration<double>(now - last).count());
        last = now;
    }
    co_return;
}

void SimulatedTransport::step(double seconds) {
    std::vector<std::shared_ptr<ProgressChannel>> completed;
    std::vector<std::shared_ptr<ProgressChannel>> failed;
    std::vector<std::pair<std::shared_ptr<ProgressChannel>, uint64_t>> reports;
    const auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t moving = 0;
        for (const auto& [handle, flow] : flows_) {
            if (!flow.stalled) moving++;
        }
        if (moving == 0) {
            return;
        }

        const double link_share = config_.link_mbps * BYTES_PER_MB * seconds / static_cast<double>(moving);
        const double flow_cap = config_.per_transfer_mbps * BYTES_PER_MB * seconds;
        std::uniform_real_distribution<double> roll(0.0, 1.0);

        for (auto it = flows_.begin(); it != flows_.end();) {
            Flow& flow = it->second;

            if (config_.failure_rate > 0.0 && roll(rng_) < config_.failure_rate) {
                failed.push_back(flow.request.channel);
                it = flows_.erase(it);
                continue;
            }
            if (!flow.stalled && config_.stall_rate > 0.0 && roll(rng_) < config_.stall_rate) {
                Logger::instance().debug("Simulated stall on transfer {}", flow.request.item_id);
                flow.stalled = true;
            }
            if (flow.stalled) {
                ++it;
                continue;
            }

            double budget = std::min(link_share, flow_cap);
            auto speed = source_speed_.find(flow.request.source_id);
            if (speed != source_speed_.end()) {
                budget = std::min(budget, speed->second * BYTES_PER_MB * seconds);
            }

            const uint64_t step_bytes = std::min<uint64_t>(static_cast<uint64_t>(budget),
                                                           flow.request.length - flow.done);
            flow.done += step_bytes;
            bytes_delivered_ += step_bytes;
            reports.emplace_back(flow.request.channel, flow.done);

            if (flow.done >= flow.request.length) {
                completed.push_back(flow.request.channel);
                it = flows_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [channel, bytes] : reports) {
        channel->report(bytes, now);
    }
    for (auto& channel : completed) {
        channel->complete();
    }
    for (auto& channel : failed) {
        channel->fail("simulated link failure");
    }
}

TransferHandle SimulatedTransport::start_transfer(const TransferRequest& request) {
    if (!running_) {
        throw LanflowError(ErrorCode::TransportError, "simulated link is not running");
    }
    if (!request.channel) {
        throw LanflowError(ErrorCode::InvalidArgument, "transfer request without a progress channel");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const TransferHandle handle = next_handle_++;
    flows_[handle] = Flow{request, 0, false};
    Logger::instance().debug("Simulated transfer {} started: item {} [{}, +{}){}", handle, request.item_id,
                             request.offset, request.length,
                             request.source_id.empty() ? "" : " from " + request.source_id);
    return handle;
}

void SimulatedTransport::cancel_transfer(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    flows_.erase(handle);
}

void SimulatedTransport::poll_progress(TransferHandle handle) {
    std::shared_ptr<ProgressChannel> channel;
    uint64_t done = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flows_.find(handle);
        if (it == flows_.end()) {
            return;
        }
        // A poll unsticks a stalled flow
        it->second.stalled = false;
        channel = it->second.request.channel;
        done = it->second.done;
    }
    channel->report(done, std::chrono::steady_clock::now());
}

void SimulatedTransport::set_source_speed(const std::string& source_id, double mbps) {
    std::lock_guard<std::mutex> lock(mutex_);
    source_speed_[source_id] = mbps;
}

size_t SimulatedTransport::active_flows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flows_.size();
}

} // namespace lanflow
