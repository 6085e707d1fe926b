#include <catch2/catch_test_macros.hpp>
#include "lanflow/watchdog/stall_watchdog.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace lanflow;

namespace {

const TimePoint T0 = TimePoint{} + std::chrono::hours(1);

TimePoint ms(int offset) {
    return T0 + Milliseconds(offset);
}

WatchdogConfig manual_config() {
    WatchdogConfig config;
    config.interval_ms = 0;
    config.stall_threshold_ms = 800;
    config.max_stall_polls = 3;
    return config;
}

WatchEntry active(TransferId id, TimePoint last, std::vector<CheckoutWatch> checkouts, bool chunked = false) {
    WatchEntry entry;
    entry.id = id;
    entry.status = TransferStatus::Active;
    entry.chunked = chunked;
    entry.last_progress_at = last;
    entry.checkouts = std::move(checkouts);
    return entry;
}

std::vector<StallActionKind> kinds(const std::vector<StallAction>& actions) {
    std::vector<StallActionKind> result;
    for (const auto& action : actions) {
        result.push_back(action.kind);
    }
    return result;
}

} // namespace

TEST_CASE("StallWatchdog - Moving transfer needs nothing", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    auto actions = watchdog.scan({active(1, ms(0), {{10, ms(0)}})}, ms(800));
    REQUIRE(actions.empty());
}

TEST_CASE("StallWatchdog - Stale transfer is marked and polled", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    auto actions = watchdog.scan({active(1, ms(0), {{10, ms(0)}})}, ms(801));

    REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::MarkStalled,
                                                           StallActionKind::ForcePoll});
    REQUIRE(actions[1].checkout_id == 10);
}

TEST_CASE("StallWatchdog - Active item without checkouts is redispatched", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    auto actions = watchdog.scan({active(7, ms(0), {})}, ms(5000));
    REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::Redispatch});
    REQUIRE(actions[0].id == 7);
}

TEST_CASE("StallWatchdog - Chunked item reassigns only the stale source", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    // Item moved recently through checkout 2; checkout 1 has been silent
    auto entry = active(1, ms(900), {{1, ms(0)}, {2, ms(900)}}, true);
    auto actions = watchdog.scan({entry}, ms(1000));

    REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::ReassignChunk});
    REQUIRE(actions[0].checkout_id == 1);
}

TEST_CASE("StallWatchdog - Stalled chunked item with live checkouts is polled", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    WatchEntry entry = active(1, ms(0), {{1, ms(500)}}, true);
    entry.status = TransferStatus::Stalled;
    entry.stalled_since = ms(900);

    auto actions = watchdog.scan({entry}, ms(1000));
    REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::ForcePoll});
}

TEST_CASE("StallWatchdog - Stalled item recovers or fails", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    WatchEntry entry = active(1, ms(0), {{1, ms(0)}});
    entry.status = TransferStatus::Stalled;
    entry.stalled_since = ms(900);

    SECTION("progress after the stall recovers it") {
        entry.last_progress_at = ms(950);
        auto actions = watchdog.scan({entry}, ms(1000));
        REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::Recover});
    }

    SECTION("still silent: poll again") {
        entry.stall_polls = 2;
        auto actions = watchdog.scan({entry}, ms(1000));
        REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::ForcePoll});
    }

    SECTION("poll budget exhausted fails it") {
        entry.stall_polls = 3;
        auto actions = watchdog.scan({entry}, ms(1000));
        REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::Fail});
    }

    SECTION("no checkout left: redispatch") {
        entry.checkouts.clear();
        auto actions = watchdog.scan({entry}, ms(1000));
        REQUIRE(kinds(actions) == std::vector<StallActionKind>{StallActionKind::Redispatch});
    }
}

TEST_CASE("StallWatchdog - Terminal and queued items ignored", "[watchdog][scan]") {
    StallWatchdog watchdog(manual_config());

    WatchEntry queued = active(1, ms(0), {});
    queued.status = TransferStatus::Queued;
    WatchEntry done = active(2, ms(0), {});
    done.status = TransferStatus::Completed;

    REQUIRE(watchdog.scan({queued, done}, ms(10000)).empty());
    REQUIRE(std::string(to_string(StallActionKind::ReassignChunk)) == "reassign_chunk");
}

TEST_CASE("StallWatchdog - Manual mode follows cycle results", "[watchdog][timer]") {
    StallWatchdog watchdog(manual_config());
    REQUIRE(watchdog.manual());

    int remaining = 2;
    watchdog.set_cycle([&] { return --remaining > 0; });
    watchdog.start();

    REQUIRE_FALSE(watchdog.polling());
    watchdog.arm();
    REQUIRE(watchdog.polling());

    REQUIRE(watchdog.tick());
    REQUIRE(watchdog.polling());

    // Verify the watchdog idles once the cycle reports nothing active
    REQUIRE_FALSE(watchdog.tick());
    REQUIRE_FALSE(watchdog.polling());
    REQUIRE(watchdog.cycles() == 2);

    watchdog.stop();
}

TEST_CASE("StallWatchdog - Arm during a cycle keeps polling", "[watchdog][timer]") {
    StallWatchdog watchdog(manual_config());

    watchdog.set_cycle([&] {
        watchdog.arm();
        return false;
    });
    watchdog.arm();

    REQUIRE(watchdog.tick());
    REQUIRE(watchdog.polling());
}

TEST_CASE("StallWatchdog - Timer thread runs cycles until idle", "[watchdog][timer]") {
    WatchdogConfig config = manual_config();
    config.interval_ms = 10;
    StallWatchdog watchdog(config);

    std::atomic<int> runs{0};
    watchdog.set_cycle([&] { return ++runs < 3; });
    watchdog.start();

    // Idle until armed
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(runs.load() == 0);

    watchdog.arm();
    for (int i = 0; i < 200 && (runs.load() < 3 || watchdog.polling()); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(runs.load() == 3);
    REQUIRE_FALSE(watchdog.polling());

    // Re-arming starts a new polling session
    watchdog.arm();
    for (int i = 0; i < 200 && runs.load() < 4; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(runs.load() >= 4);

    watchdog.stop();
}

TEST_CASE("StallWatchdog - Stop does not wait out a long interval", "[watchdog][timer]") {
    WatchdogConfig config = manual_config();
    config.interval_ms = 60000;
    StallWatchdog watchdog(config);

    std::atomic<int> runs{0};
    watchdog.set_cycle([&] { return ++runs > 0; });
    watchdog.start();
    watchdog.arm();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    const auto before = std::chrono::steady_clock::now();
    watchdog.stop();
    const auto waited = std::chrono::steady_clock::now() - before;

    REQUIRE(waited < std::chrono::seconds(2));
    REQUIRE(runs.load() == 0);
    REQUIRE_FALSE(watchdog.polling());
}
