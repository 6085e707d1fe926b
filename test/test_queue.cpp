#include <catch2/catch_test_macros.hpp>
#include "lanflow/transfer/progress_channel.h"
#include "lanflow/transfer/transfer_item.h"
#include "lanflow/transfer/transfer_queue.h"

using namespace lanflow;

namespace {

TransferItem make_item(TransferId id, uint64_t size, bool encrypted = false, bool retry = false) {
    TransferItem item;
    item.id = id;
    item.display_name = "item-" + std::to_string(id);
    item.total_bytes = size;
    item.encrypted = encrypted;
    item.retry_priority = retry;
    return item;
}

} // namespace

TEST_CASE("TransferQueue - Staged ordering", "[queue][order]") {
    TransferQueue queue;

    // A: 5 MB plain, B: 1 MB encrypted, C: 2 MB plain retry
    queue.insert(make_item(1, 5 * 1024 * 1024));
    queue.insert(make_item(2, 1 * 1024 * 1024, true));
    queue.insert(make_item(3, 2 * 1024 * 1024, false, true));

    // Verify retry first, then encrypted, then the plain item
    REQUIRE(queue.ordered_ids() == std::vector<TransferId>{3, 2, 1});
    REQUIRE(queue.pop_next()->id == 3);
    REQUIRE(queue.pop_next()->id == 2);
    REQUIRE(queue.pop_next()->id == 1);
    REQUIRE_FALSE(queue.pop_next().has_value());
}

TEST_CASE("TransferQueue - Smaller items first, FIFO among equals", "[queue][order]") {
    TransferQueue queue;

    queue.insert(make_item(1, 300));
    queue.insert(make_item(2, 100));
    queue.insert(make_item(3, 200));
    queue.insert(make_item(4, 100));

    REQUIRE(queue.ordered_ids() == std::vector<TransferId>{2, 4, 3, 1});
}

TEST_CASE("TransferQueue - Encrypted beats size", "[queue][order]") {
    TransferQueue queue;

    queue.insert(make_item(1, 10));
    queue.insert(make_item(2, 1000, true));

    REQUIRE(queue.peek()->id == 2);
}

TEST_CASE("TransferQueue - Re-insert moves an entry", "[queue]") {
    TransferQueue queue;

    queue.insert(make_item(1, 100));
    queue.insert(make_item(2, 200));
    REQUIRE(queue.ordered_ids().front() == 1);

    // Item 2 comes back with retry priority
    queue.insert(make_item(2, 200, false, true));
    REQUIRE(queue.size() == 2);
    REQUIRE(queue.ordered_ids() == std::vector<TransferId>{2, 1});
}

TEST_CASE("TransferQueue - Remove and contains", "[queue]") {
    TransferQueue queue;

    queue.insert(make_item(1, 100));
    queue.insert(make_item(2, 100));

    REQUIRE(queue.contains(1));
    REQUIRE(queue.remove(1));
    REQUIRE_FALSE(queue.contains(1));
    REQUIRE_FALSE(queue.remove(1));
    REQUIRE(queue.size() == 1);

    queue.clear();
    REQUIRE(queue.empty());
}

TEST_CASE("TransferQueue - Held entries are skipped", "[queue][held]") {
    TransferQueue queue;

    queue.insert(make_item(1, 100));
    queue.insert(make_item(2, 200));

    REQUIRE(queue.set_held(1, true));
    REQUIRE(queue.held(1));
    REQUIRE(queue.ready_count() == 1);
    REQUIRE(queue.peek()->id == 2);

    // Held entry keeps its place but is never popped
    REQUIRE(queue.pop_next()->id == 2);
    REQUIRE_FALSE(queue.pop_next().has_value());
    REQUIRE(queue.size() == 1);

    REQUIRE(queue.set_held(1, false));
    REQUIRE(queue.pop_next()->id == 1);

    // Unknown ids cannot be held
    REQUIRE_FALSE(queue.set_held(42, true));
}

TEST_CASE("TransferQueue - Re-insert releases a hold", "[queue][held]") {
    TransferQueue queue;

    queue.insert(make_item(1, 100));
    queue.set_held(1, true);
    queue.insert(make_item(1, 100));

    REQUIRE_FALSE(queue.held(1));
    REQUIRE(queue.ready_count() == 1);
}

TEST_CASE("TransferStatus - Names and terminal states", "[queue][status]") {
    REQUIRE(std::string(to_string(TransferStatus::Stalled)) == "stalled");
    REQUIRE(transfer_status_from_string("cancelled") == TransferStatus::Cancelled);
    REQUIRE_FALSE(transfer_status_from_string("bogus").has_value());

    REQUIRE(is_terminal(TransferStatus::Completed));
    REQUIRE(is_terminal(TransferStatus::Failed));
    REQUIRE(is_terminal(TransferStatus::Cancelled));
    REQUIRE_FALSE(is_terminal(TransferStatus::Stalled));
    REQUIRE_FALSE(is_terminal(TransferStatus::Queued));
}

TEST_CASE("TransferItem - Progress percentage", "[queue][item]") {
    TransferItem item = make_item(1, 200);
    item.bytes_transferred = 50;
    REQUIRE(item.progress_percent() == 25.0);
    REQUIRE_FALSE(item.multi_source());

    item.sources = {"peer-a"};
    REQUIRE(item.multi_source());
}

TEST_CASE("ProgressChannel - Reports only move forward", "[queue][channel]") {
    auto events = std::make_shared<EventQueue>();
    ProgressChannel channel(7, events);
    const TimePoint t1 = TimePoint{} + std::chrono::seconds(1);
    const TimePoint t2 = TimePoint{} + std::chrono::seconds(2);

    channel.report(100, t1);
    channel.report(50, t2);
    REQUIRE(channel.bytes() == 100);
    REQUIRE(channel.last_report() == t1);

    channel.report(150, t2);
    REQUIRE(channel.bytes() == 150);
    REQUIRE(channel.last_report() == t2);
}

TEST_CASE("ProgressChannel - One terminal event per checkout", "[queue][channel]") {
    auto events = std::make_shared<EventQueue>();
    ProgressChannel channel(7, events);

    channel.complete();
    channel.fail("late failure");
    channel.complete();

    auto drained = events->drain();
    REQUIRE(drained.size() == 1);
    REQUIRE(drained[0].kind == TransferEventKind::Completed);
    REQUIRE(drained[0].checkout_id == 7);
    REQUIRE(events->empty());
}

TEST_CASE("ProgressChannel - Closed channel ignores the transport", "[queue][channel]") {
    auto events = std::make_shared<EventQueue>();
    ProgressChannel channel(3, events);

    channel.close();
    REQUIRE(channel.closed());
    channel.report(10, TimePoint{} + std::chrono::seconds(1));
    channel.fail("gone");

    REQUIRE(channel.bytes() == 0);
    REQUIRE(events->empty());

    // Nothing queued: wait returns after the timeout
    REQUIRE_FALSE(events->wait_for(Milliseconds(1)));
    events->push({TransferEventKind::Failed, 3, "direct"});
    REQUIRE(events->wait_for(Milliseconds(1)));
}
