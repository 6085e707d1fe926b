#include "lanflow/transfer/scheduler.h"
#include "lanflow/adapt/concurrency_controller.h"
#include "lanflow/adapt/speed_sampler.h"
#include "lanflow/base/logger.h"
#include "lanflow/p2p/chunk_allocator.h"
#include "lanflow/transfer/progress_channel.h"
#include "lanflow/transfer/state_codec.h"
#include "lanflow/transfer/transfer_queue.h"
#include "lanflow/watchdog/stall_watchdog.h"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace lanflow {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
constexpr auto EVENT_WAIT = std::chrono::milliseconds(100);

double throughput_mbps(uint64_t bytes, TimePoint from, TimePoint to) {
    const double seconds = std::chrono::duration<double>(to - from).count();
    if (seconds <= 0.0 || bytes == 0) {
        return -1.0;
    }
    return static_cast<double>(bytes) / BYTES_PER_MB / seconds;
}

} // namespace

// One open request against the transport
struct Checkout {
    CheckoutId id = 0;
    TransferId item = 0;
    std::optional<uint32_t> chunk;
    std::string source_id;
    TransferHandle handle = 0;
    std::shared_ptr<ProgressChannel> channel;
    uint64_t base = 0;      // bytes already done at the request offset
    uint64_t seen = 0;      // channel bytes last folded into the item
    TimePoint opened_at{};
    TimePoint last_progress_at{};
    bool endgame = false;
};

struct AttemptStart {
    TimePoint at{};
    uint64_t bytes = 0;
};

struct TransferScheduler::Impl {
    GlobalConfig config;
    std::shared_ptr<Transport> transport;
    std::unique_ptr<DeviceProbe> probe;
    ClockFn clock;

    mutable std::mutex mutex;

    std::map<TransferId, TransferItem> items;
    TransferQueue queue;
    std::set<TransferId> active;     // Active and Stalled
    std::set<TransferId> terminal;
    std::map<CheckoutId, Checkout> checkouts;
    std::map<TransferId, AttemptStart> attempt_started;

    SourceRegistry registry;
    ChunkAllocator allocator;
    SpeedSampler sampler;
    ConcurrencyController controller;
    uint32_t limit = 1;
    uint32_t completed_since_adapt = 0;

    TransferId next_id = 1;
    CheckoutId next_checkout = 1;

    std::shared_ptr<EventQueue> events = std::make_shared<EventQueue>();
    StallWatchdog watchdog;

    std::atomic<bool> running{false};
    std::thread loop_thread;

    Impl(const GlobalConfig& cfg, std::shared_ptr<Transport> t, std::unique_ptr<DeviceProbe> p, ClockFn c)
        : config(cfg),
          transport(std::move(t)),
          probe(p ? std::move(p) : make_device_probe(cfg.device)),
          clock(c ? std::move(c) : steady_clock_fn()),
          registry(cfg.source),
          allocator(cfg.chunk),
          sampler(cfg.sampler),
          controller(cfg.concurrency, sampler, *probe),
          watchdog(cfg.watchdog) {
        limit = controller.recommended_concurrency();
    }

    TransferItem& item_ref(TransferId id) { return items.at(id); }

    void transition(TransferItem& item, TransferStatus to) {
        Logger::instance().debug("Transfer {} ({}): {} -> {}", item.id, item.display_name,
                                 to_string(item.status), to_string(to));
        item.status = to;
    }

    std::vector<SourceDescriptor> candidates(const TransferItem& item) const {
        std::vector<SourceDescriptor> result;
        for (const auto& id : item.sources) {
            if (auto source = registry.get(id)) {
                result.push_back(std::move(*source));
            }
        }
        return result;
    }

    std::vector<CheckoutId> checkouts_of(TransferId id) const {
        std::vector<CheckoutId> result;
        for (const auto& [cid, co] : checkouts) {
            if (co.item == id) {
                result.push_back(cid);
            }
        }
        return result;
    }

    std::vector<CheckoutId> checkouts_on(const std::string& source_id) const {
        std::vector<CheckoutId> result;
        for (const auto& [cid, co] : checkouts) {
            if (co.source_id == source_id) {
                result.push_back(cid);
            }
        }
        return result;
    }

    bool has_checkouts(TransferId id) const {
        return std::any_of(checkouts.begin(), checkouts.end(),
                           [id](const auto& entry) { return entry.second.item == id; });
    }

    // Closes the channel so late callbacks are dropped, and optionally tells
    // the transport to stop
    void close_checkout(CheckoutId id, bool cancel_transport) {
        auto it = checkouts.find(id);
        if (it == checkouts.end()) {
            return;
        }
        Checkout co = std::move(it->second);
        checkouts.erase(it);

        co.channel->close();
        if (cancel_transport) {
            try {
                transport->cancel_transfer(co.handle);
            } catch (const std::exception& e) {
                Logger::instance().warning("Cancelling transfer handle {} failed: {}", co.handle, e.what());
            }
        }
        if (!co.source_id.empty()) {
            registry.release(co.source_id);
        }
    }

    void close_item_checkouts(TransferItem& item) {
        if (item.chunk_plan) {
            allocator.release_all(*item.chunk_plan);
        }
        for (auto cid : checkouts_of(item.id)) {
            close_checkout(cid, true);
        }
    }

    // Opens one request. Returns false if the transport refused it.
    bool open_checkout(TransferItem& item, std::optional<uint32_t> chunk, const std::string& source_id,
                       const ByteRange& range, uint64_t base, bool endgame) {
        const TimePoint now = clock();

        Checkout co;
        co.id = next_checkout++;
        co.item = item.id;
        co.chunk = chunk;
        co.source_id = source_id;
        co.channel = std::make_shared<ProgressChannel>(co.id, events);
        co.base = base;
        co.opened_at = now;
        co.last_progress_at = now;
        co.endgame = endgame;

        TransferRequest request;
        request.item_id = item.id;
        request.display_name = item.display_name;
        request.content_id = item.content_id;
        request.encrypted = item.encrypted;
        request.offset = range.offset;
        request.length = range.length;
        request.source_id = source_id;
        request.chunk_index = chunk;
        request.channel = co.channel;

        try {
            co.handle = transport->start_transfer(request);
        } catch (const std::exception& e) {
            co.channel->close();
            Logger::instance().warning("Transport refused transfer {} ({}){}: {}", item.id, item.display_name,
                                       source_id.empty() ? "" : " from " + source_id, e.what());
            item.last_error = ErrorCode::TransportError;
            item.error_message = e.what();
            return false;
        }

        if (!source_id.empty()) {
            registry.acquire(source_id);
        }
        checkouts.emplace(co.id, std::move(co));
        return true;
    }

    // Starts whatever the item needs right now. Single-source items get one
    // request for the missing tail; chunked items get every chunk the
    // allocator can place.
    void dispatch(TransferItem& item) {
        if (!item.multi_source()) {
            if (has_checkouts(item.id)) {
                return;
            }
            if (item.bytes_transferred >= item.total_bytes) {
                complete_item(item);
                return;
            }
            const ByteRange range{item.bytes_transferred, item.total_bytes - item.bytes_transferred};
            if (!open_checkout(item, std::nullopt, "", range, item.bytes_transferred, false)) {
                attempt_failed(item, ErrorCode::TransferFailed, item.error_message);
            }
            return;
        }

        auto sources = candidates(item);
        if (!item.chunk_plan) {
            item.chunk_plan = allocator.plan_chunks(item.content_id, item.total_bytes, sources);
        }
        if (item.chunk_plan->complete()) {
            complete_item(item);
            return;
        }

        // A refused checkout excludes its source for that chunk, so this ends
        std::vector<std::string> removed;
        bool refused = true;
        while (refused) {
            refused = false;
            for (const auto& checkout : allocator.dispatch(*item.chunk_plan, sources)) {
                if (open_checkout(item, checkout.chunk_index, checkout.source_id, checkout.range,
                                  checkout.base, checkout.endgame)) {
                    continue;
                }
                allocator.fail_chunk(*item.chunk_plan, checkout.chunk_index, checkout.source_id, sources);
                if (registry.record_outcome(checkout.source_id, false) == SourceVerdict::Removed) {
                    removed.push_back(checkout.source_id);
                }
                refused = true;
            }
            if (refused) {
                sources = candidates(item);
            }
        }

        if (!has_checkouts(item.id) && item.status == TransferStatus::Active && !placeable(item, sources)) {
            Logger::instance().warning("Transfer {} ({}) has no source for its remaining {} chunks",
                                       item.id, item.display_name, item.chunk_plan->remaining());
            mark_stalled(item, clock());
        }

        for (const auto& source_id : removed) {
            drop_source_checkouts(source_id);
        }
    }

    // Some unfinished chunk has a holder, busy or not
    bool placeable(const TransferItem& item, const std::vector<SourceDescriptor>& sources) const {
        const auto& plan = *item.chunk_plan;
        for (const auto& chunk : plan.chunks) {
            if (chunk.status != ChunkStatus::Completed && allocator.has_eligible_source(plan, chunk.index, sources)) {
                return true;
            }
        }
        return false;
    }

    void activate(TransferItem& item) {
        const TimePoint now = clock();
        transition(item, TransferStatus::Active);
        if (item.started_at == TimePoint{}) {
            item.started_at = now;
        }
        item.last_progress_at = now;
        item.stall_polls = 0;
        item.paused = false;
        active.insert(item.id);
        attempt_started[item.id] = {now, item.bytes_transferred};

        Logger::instance().info("Starting transfer {} ({}, {} bytes{}{})", item.id, item.display_name,
                                item.total_bytes, item.encrypted ? ", encrypted" : "",
                                item.attempts > 0 ? ", retry " + std::to_string(item.attempts) : "");
        dispatch(item);
    }

    // Fills free slots from the queue
    void admit() {
        while (active.size() < limit && queue.ready_count() > 0) {
            auto entry = queue.pop_next();
            if (!entry) {
                break;
            }
            activate(item_ref(entry->id));
        }
        if (!active.empty()) {
            watchdog.arm();
        }
    }

    void reevaluate_concurrency() {
        const uint32_t recommended = controller.recommended_concurrency();
        if (recommended != limit) {
            Logger::instance().info("Concurrency limit {} -> {} (estimate {:.1f} MB/s)",
                                    limit, recommended, sampler.current_estimate());
            limit = recommended;
        }
    }

    void finish(TransferItem& item, TransferStatus status) {
        transition(item, status);
        item.finished_at = clock();
        active.erase(item.id);
        terminal.insert(item.id);
        attempt_started.erase(item.id);
    }

    void complete_item(TransferItem& item) {
        close_item_checkouts(item);

        const TimePoint now = clock();
        auto started = attempt_started.find(item.id);
        if (started != attempt_started.end()) {
            const double mbps = throughput_mbps(item.total_bytes - started->second.bytes, started->second.at, now);
            if (mbps >= 0.0) {
                sampler.record(mbps);
            }
        }

        item.bytes_transferred = item.total_bytes;
        item.last_error = ErrorCode::Success;
        item.error_message.clear();
        finish(item, TransferStatus::Completed);
        Logger::instance().info("Transfer {} ({}) completed", item.id, item.display_name);

        if (++completed_since_adapt >= std::max<uint32_t>(config.scheduler.adaptation_interval, 1)) {
            completed_since_adapt = 0;
            reevaluate_concurrency();
        }
    }

    // A failed attempt goes back to the queue with retry priority until the
    // retries run out
    void attempt_failed(TransferItem& item, ErrorCode code, const std::string& message) {
        close_item_checkouts(item);
        attempt_started.erase(item.id);

        item.attempts++;
        item.last_error = code;
        item.error_message = message;
        transition(item, TransferStatus::Failed);

        if (item.attempts <= config.scheduler.max_retries) {
            Logger::instance().warning("Transfer {} ({}) failed, attempt {}/{}: {}: {}", item.id, item.display_name,
                                       item.attempts, config.scheduler.max_retries + 1, to_string(code), message);
            active.erase(item.id);
            item.retry_priority = true;
            transition(item, TransferStatus::Queued);
            queue.insert(item);
            return;
        }

        if (code != ErrorCode::StallTimeout) {
            item.last_error = ErrorCode::RetriesExhausted;
        }
        finish(item, TransferStatus::Failed);
        Logger::instance().error("Transfer {} ({}) failed after {} attempts: {}", item.id, item.display_name,
                                 item.attempts, message);
    }

    void mark_stalled(TransferItem& item, TimePoint now) {
        if (item.status != TransferStatus::Active) {
            return;
        }
        transition(item, TransferStatus::Stalled);
        item.stalled_since = now;
        item.stall_polls = 0;
        Logger::instance().warning("Transfer {} ({}) stalled at {}/{} bytes", item.id, item.display_name,
                                   item.bytes_transferred, item.total_bytes);
    }

    void recover(TransferItem& item) {
        transition(item, TransferStatus::Active);
        item.stall_polls = 0;
        Logger::instance().info("Transfer {} ({}) moving again", item.id, item.display_name);
    }

    // Folds channel counters into checkouts, chunks and items
    void sync_progress(TimePoint now) {
        for (auto& [cid, co] : checkouts) {
            const uint64_t bytes = co.channel->bytes();
            if (bytes <= co.seen) {
                continue;
            }
            co.seen = bytes;
            co.last_progress_at = now;

            TransferItem& item = item_ref(co.item);
            uint64_t done = item.bytes_transferred;
            if (co.chunk && item.chunk_plan) {
                allocator.record_progress(*item.chunk_plan, *co.chunk, co.base + bytes);
                done = item.chunk_plan->bytes_done();
            } else if (!co.chunk) {
                done = std::min(co.base + bytes, item.total_bytes);
            }
            if (done > item.bytes_transferred) {
                item.bytes_transferred = done;
                item.last_progress_at = now;
            }
        }
    }

    // Removal, eviction or too many failures. Its chunks move on without a
    // reliability penalty.
    void drop_source_checkouts(const std::string& source_id) {
        std::set<TransferId> touched;
        for (auto cid : checkouts_on(source_id)) {
            auto it = checkouts.find(cid);
            if (it == checkouts.end()) {
                continue;
            }
            const Checkout co = it->second;
            close_checkout(cid, true);
            TransferItem& item = item_ref(co.item);
            if (co.chunk && item.chunk_plan) {
                allocator.fail_chunk(*item.chunk_plan, *co.chunk, source_id, candidates(item));
            }
            touched.insert(co.item);
        }
        for (auto id : touched) {
            TransferItem& item = item_ref(id);
            if (item.status == TransferStatus::Active || item.status == TransferStatus::Stalled) {
                dispatch(item);
            }
        }
    }

    void on_source_failure(const std::string& source_id) {
        if (registry.record_outcome(source_id, false) == SourceVerdict::Removed) {
            drop_source_checkouts(source_id);
        }
    }

    void on_completed(const Checkout& co) {
        TransferItem& item = item_ref(co.item);
        const TimePoint now = clock();

        if (!co.chunk) {
            if (item.bytes_transferred < item.total_bytes) {
                attempt_failed(item, ErrorCode::ShortTransfer,
                               "transport finished at " + std::to_string(item.bytes_transferred) + " of " +
                               std::to_string(item.total_bytes) + " bytes");
            } else {
                complete_item(item);
            }
            return;
        }

        auto& plan = *item.chunk_plan;
        const uint32_t index = *co.chunk;
        auto result = allocator.complete_chunk(plan, index, co.source_id);
        if (result.accepted) {
            registry.record_outcome(co.source_id, true);
            const double mbps = throughput_mbps(plan.chunks[index].range.length - co.base, co.opened_at, now);
            if (mbps >= 0.0) {
                registry.record_bandwidth(co.source_id, mbps);
            }
            for (const auto& loser : result.losers) {
                for (auto cid : checkouts_of(item.id)) {
                    const auto& other = checkouts.at(cid);
                    if (other.chunk == co.chunk && other.source_id == loser) {
                        close_checkout(cid, true);
                        break;
                    }
                }
            }
        }

        const uint64_t done = plan.bytes_done();
        if (done > item.bytes_transferred) {
            item.bytes_transferred = done;
            item.last_progress_at = now;
        }
        if (plan.complete()) {
            complete_item(item);
        } else {
            dispatch(item);
        }
    }

    void on_failed(const Checkout& co, const std::string& message) {
        TransferItem& item = item_ref(co.item);
        if (!co.chunk) {
            attempt_failed(item, ErrorCode::TransferFailed, message);
            return;
        }

        Logger::instance().warning("Chunk {} of transfer {} failed on {}: {}", *co.chunk, item.id,
                                   co.source_id, message);
        allocator.fail_chunk(*item.chunk_plan, *co.chunk, co.source_id, candidates(item));
        on_source_failure(co.source_id);
        if (item.status == TransferStatus::Active || item.status == TransferStatus::Stalled) {
            dispatch(item);
        }
    }

    size_t drain_events() {
        auto drained = events->drain();
        if (drained.empty()) {
            return 0;
        }

        const TimePoint now = clock();
        sync_progress(now);

        size_t applied = 0;
        for (auto& event : drained) {
            auto it = checkouts.find(event.checkout_id);
            if (it == checkouts.end()) {
                continue;   // closed before the transport finished
            }
            const Checkout co = it->second;
            close_checkout(co.id, false);
            applied++;

            switch (event.kind) {
                case TransferEventKind::Completed:
                    on_completed(co);
                    break;
                case TransferEventKind::Failed:
                    on_failed(co, event.message.empty() ? "transport reported failure" : event.message);
                    break;
            }
        }
        admit();
        return applied;
    }

    void force_poll(CheckoutId cid) {
        auto it = checkouts.find(cid);
        if (it == checkouts.end()) {
            return;
        }
        try {
            transport->poll_progress(it->second.handle);
        } catch (const std::exception& e) {
            Logger::instance().warning("Progress poll for transfer {} failed: {}", it->second.item, e.what());
        }
    }

    void reassign_chunk(TransferItem& item, CheckoutId cid) {
        auto it = checkouts.find(cid);
        if (it == checkouts.end() || !it->second.chunk || !item.chunk_plan) {
            return;
        }
        const Checkout co = it->second;
        auto next = allocator.reassign_stalled(*item.chunk_plan, *co.chunk, co.source_id, candidates(item));
        if (!next) {
            force_poll(cid);
            return;
        }
        close_checkout(cid, true);
        dispatch(item);
    }

    void redispatch(TransferItem& item) {
        if (item.chunk_plan) {
            allocator.clear_exclusions(*item.chunk_plan);
        }
        Logger::instance().debug("Re-dispatching transfer {} ({})", item.id, item.display_name);
        dispatch(item);
    }

    std::vector<WatchEntry> watch_entries() const {
        std::vector<WatchEntry> entries;
        for (auto id : active) {
            const TransferItem& item = items.at(id);
            WatchEntry entry;
            entry.id = id;
            entry.status = item.status;
            entry.chunked = item.chunk_plan.has_value();
            entry.last_progress_at = item.last_progress_at;
            entry.stalled_since = item.stalled_since;
            entry.stall_polls = item.stall_polls;
            for (const auto& [cid, co] : checkouts) {
                if (co.item == id) {
                    entry.checkouts.push_back({cid, co.last_progress_at});
                }
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    bool watchdog_cycle() {
        std::lock_guard<std::mutex> lock(mutex);
        const TimePoint now = clock();

        drain_events();
        sync_progress(now);

        for (const auto& source_id : registry.evict_stale(now)) {
            drop_source_checkouts(source_id);
        }

        std::set<TransferId> polled;
        for (const auto& action : watchdog.scan(watch_entries(), now)) {
            auto it = items.find(action.id);
            if (it == items.end()) {
                continue;
            }
            TransferItem& item = it->second;
            // An earlier action in this cycle may have finished the item
            if (item.status != TransferStatus::Active && item.status != TransferStatus::Stalled) {
                continue;
            }

            switch (action.kind) {
                case StallActionKind::MarkStalled:
                    mark_stalled(item, now);
                    break;
                case StallActionKind::ForcePoll:
                    force_poll(action.checkout_id);
                    break;
                case StallActionKind::ReassignChunk:
                    reassign_chunk(item, action.checkout_id);
                    break;
                case StallActionKind::Redispatch:
                    redispatch(item);
                    break;
                case StallActionKind::Recover:
                    recover(item);
                    break;
                case StallActionKind::Fail:
                    attempt_failed(item, ErrorCode::StallTimeout,
                                   "no progress for " + std::to_string(item.stall_polls) + " watchdog polls");
                    break;
            }

            if (item.status == TransferStatus::Stalled && action.kind != StallActionKind::MarkStalled &&
                polled.insert(item.id).second) {
                item.stall_polls++;
            }
        }

        admit();
        return !active.empty();
    }

    void event_loop() {
        Logger::instance().info("Transfer scheduler event loop started");
        while (running.load()) {
            if (events->wait_for(EVENT_WAIT)) {
                std::lock_guard<std::mutex> lock(mutex);
                drain_events();
            }
        }
        Logger::instance().info("Transfer scheduler event loop stopped");
    }

    SchedulerSnapshot snapshot_state() const {
        SchedulerSnapshot snapshot;
        snapshot.next_id = next_id;
        snapshot.concurrency_limit = limit;
        for (const auto& [id, item] : items) {
            TransferItem copy = item;
            if (copy.chunk_plan) {
                for (auto& chunk : copy.chunk_plan->chunks) {
                    chunk.active_sources.clear();
                }
            }
            snapshot.items.push_back(std::move(copy));
        }
        snapshot.queue_order = queue.ordered_ids();
        return snapshot;
    }
};

TransferScheduler::TransferScheduler(const GlobalConfig& config,
                                     std::shared_ptr<Transport> transport,
                                     std::unique_ptr<DeviceProbe> probe,
                                     ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(transport), std::move(probe), std::move(clock))) {
    if (!impl_->transport) {
        throw LanflowError(ErrorCode::InvalidArgument, "transfer scheduler needs a transport");
    }
    impl_->watchdog.set_cycle([impl = impl_.get()] { return impl->watchdog_cycle(); });
    Logger::instance().info("Transfer scheduler created, concurrency limit {}", impl_->limit);
}

TransferScheduler::~TransferScheduler() {
    stop();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& [id, item] : impl_->items) {
        if (item.status == TransferStatus::Active || item.status == TransferStatus::Stalled) {
            for (auto cid : impl_->checkouts_of(id)) {
                impl_->close_checkout(cid, true);
            }
        }
    }
}

TransferId TransferScheduler::submit(const TransferSpec& spec) {
    if (spec.total_bytes == 0) {
        throw LanflowError(ErrorCode::InvalidArgument, "transfer '" + spec.display_name + "' has no bytes");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    TransferItem item;
    item.id = impl_->next_id++;
    item.display_name = spec.display_name;
    item.content_id = spec.content_id.empty() ? spec.display_name : spec.content_id;
    item.total_bytes = spec.total_bytes;
    item.encrypted = spec.encrypted;
    item.sources = spec.sources;
    item.created_at = impl_->clock();

    const TransferId id = item.id;
    impl_->queue.insert(item);
    impl_->items.emplace(id, std::move(item));
    Logger::instance().debug("Queued transfer {} ({}, {} bytes)", id, spec.display_name, spec.total_bytes);

    impl_->admit();
    return id;
}

bool TransferScheduler::cancel(TransferId id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->items.find(id);
    if (it == impl_->items.end()) {
        return false;
    }
    TransferItem& item = it->second;
    if (is_terminal(item.status)) {
        return true;
    }

    impl_->queue.remove(id);
    impl_->close_item_checkouts(item);
    item.paused = false;
    impl_->finish(item, TransferStatus::Cancelled);
    Logger::instance().info("Transfer {} ({}) cancelled", id, item.display_name);

    impl_->admit();
    return true;
}

bool TransferScheduler::pause(TransferId id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->items.find(id);
    if (it == impl_->items.end() || is_terminal(it->second.status)) {
        return false;
    }
    TransferItem& item = it->second;
    if (item.paused) {
        return true;
    }

    if (item.status == TransferStatus::Active || item.status == TransferStatus::Stalled) {
        impl_->close_item_checkouts(item);
        impl_->active.erase(id);
        impl_->attempt_started.erase(id);
        impl_->transition(item, TransferStatus::Queued);
    }
    item.paused = true;
    item.retry_priority = true;
    impl_->queue.insert(item);
    impl_->queue.set_held(id, true);
    Logger::instance().info("Transfer {} ({}) paused at {}/{} bytes", id, item.display_name,
                            item.bytes_transferred, item.total_bytes);

    impl_->admit();
    return true;
}

bool TransferScheduler::resume(TransferId id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->items.find(id);
    if (it == impl_->items.end() || !it->second.paused) {
        return false;
    }
    it->second.paused = false;
    impl_->queue.set_held(id, false);
    Logger::instance().info("Transfer {} ({}) resumed", id, it->second.display_name);

    impl_->admit();
    return true;
}

bool TransferScheduler::restart(TransferId id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->items.find(id);
    if (it == impl_->items.end()) {
        return false;
    }
    TransferItem& item = it->second;
    if (item.status != TransferStatus::Failed && item.status != TransferStatus::Cancelled) {
        return false;
    }

    impl_->terminal.erase(id);
    impl_->transition(item, TransferStatus::Queued);
    item.bytes_transferred = 0;
    item.attempts = 0;
    item.retry_priority = false;
    item.stall_polls = 0;
    item.last_error = ErrorCode::Success;
    item.error_message.clear();
    item.chunk_plan.reset();
    item.started_at = {};
    item.finished_at = {};
    impl_->queue.insert(item);
    Logger::instance().info("Transfer {} ({}) restarted", id, item.display_name);

    impl_->admit();
    return true;
}

bool TransferScheduler::add_source(const SourceDescriptor& source) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const bool added = impl_->registry.register_source(source, impl_->clock());

    // A new holder may unblock waiting chunks
    for (auto id : std::vector<TransferId>(impl_->active.begin(), impl_->active.end())) {
        TransferItem& item = impl_->item_ref(id);
        if (item.chunk_plan && !is_terminal(item.status)) {
            impl_->dispatch(item);
        }
    }
    impl_->admit();
    return added;
}

bool TransferScheduler::remove_source(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->registry.remove_source(source_id)) {
        return false;
    }
    impl_->drop_source_checkouts(source_id);
    impl_->admit();
    return true;
}

bool TransferScheduler::update_source_availability(const std::string& source_id, const std::string& content_id,
                                                   const ByteRangeSet& ranges) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->registry.update_availability(source_id, content_id, ranges, impl_->clock())) {
        return false;
    }
    for (auto id : std::vector<TransferId>(impl_->active.begin(), impl_->active.end())) {
        TransferItem& item = impl_->item_ref(id);
        if (item.chunk_plan && item.content_id == content_id && !is_terminal(item.status)) {
            impl_->dispatch(item);
        }
    }
    impl_->admit();
    return true;
}

bool TransferScheduler::record_source_heartbeat(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registry.touch(source_id, impl_->clock());
}

void TransferScheduler::record_throughput(double mbps) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->sampler.record(mbps)) {
        Logger::instance().debug("Ignoring throughput sample {}", mbps);
    }
}

size_t TransferScheduler::process_events() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->drain_events();
}

bool TransferScheduler::tick() {
    return impl_->watchdog.tick();
}

void TransferScheduler::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->events->reopen();
    impl_->loop_thread = std::thread([impl = impl_.get()] { impl->event_loop(); });
    impl_->watchdog.start();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->active.empty()) {
        impl_->watchdog.arm();
    }
}

void TransferScheduler::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    impl_->events->close();
    if (impl_->loop_thread.joinable()) {
        impl_->loop_thread.join();
    }
    impl_->watchdog.stop();
}

bool TransferScheduler::running() const {
    return impl_->running.load();
}

std::vector<TransferItem> TransferScheduler::list_items() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<TransferItem> result;
    result.reserve(impl_->items.size());
    for (const auto& [id, item] : impl_->items) {
        result.push_back(item);
    }
    return result;
}

std::optional<TransferItem> TransferScheduler::get_item(TransferId id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->items.find(id);
    if (it == impl_->items.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TransferId> TransferScheduler::queued_ids() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.ordered_ids();
}

std::vector<SourceDescriptor> TransferScheduler::list_sources() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->registry.snapshot();
}

SchedulerStats TransferScheduler::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    SchedulerStats stats;
    for (const auto& [id, item] : impl_->items) {
        switch (item.status) {
            case TransferStatus::Queued: stats.queued_count++; break;
            case TransferStatus::Active: stats.active_count++; break;
            case TransferStatus::Stalled: stats.stalled_count++; break;
            case TransferStatus::Completed: stats.completed_count++; break;
            case TransferStatus::Failed: stats.failed_count++; break;
            case TransferStatus::Cancelled: stats.cancelled_count++; break;
        }
    }
    stats.avg_throughput_mbps = impl_->sampler.current_estimate();
    stats.concurrency_limit = impl_->limit;
    return stats;
}

uint32_t TransferScheduler::concurrency_limit() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->limit;
}

bool TransferScheduler::idle() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->terminal.size() == impl_->items.size();
}

bool TransferScheduler::watchdog_polling() const {
    return impl_->watchdog.polling();
}

std::string TransferScheduler::serialize_state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return encode_state(impl_->snapshot_state());
}

void TransferScheduler::restore_state(const std::string& data) {
    SchedulerSnapshot snapshot = decode_state(data);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    const TimePoint now = impl_->clock();

    for (const auto& [id, item] : impl_->items) {
        for (auto cid : impl_->checkouts_of(id)) {
            impl_->close_checkout(cid, true);
        }
    }
    impl_->events->drain();

    std::map<TransferId, TransferItem> items;
    std::set<TransferId> active;
    std::set<TransferId> terminal;
    TransferQueue queue;

    for (auto& item : snapshot.items) {
        item.created_at = now;
        item.last_progress_at = now;
        item.stalled_since = now;
        if (is_terminal(item.status)) {
            terminal.insert(item.id);
        } else if (item.status != TransferStatus::Queued) {
            active.insert(item.id);
        }
        items.emplace(item.id, std::move(item));
    }
    for (auto id : snapshot.queue_order) {
        queue.insert(items.at(id));
        if (items.at(id).paused) {
            queue.set_held(id, true);
        }
    }

    impl_->items = std::move(items);
    impl_->active = std::move(active);
    impl_->terminal = std::move(terminal);
    impl_->queue = std::move(queue);
    impl_->attempt_started.clear();
    impl_->next_id = snapshot.next_id;
    if (snapshot.concurrency_limit > 0) {
        // Saved on another run, possibly another device
        impl_->limit = impl_->controller.constrain(snapshot.concurrency_limit);
    }

    Logger::instance().info("Restored {} transfers ({} active, {} queued, {} finished)",
                            impl_->items.size(), impl_->active.size(), impl_->queue.size(),
                            impl_->terminal.size());
    if (!impl_->active.empty()) {
        impl_->watchdog.arm();
    }
}

} // namespace lanflow
