#include <catch2/catch_test_macros.hpp>

#include <clawdesk/downloader/progress_channel.h>

#include <chrono>
#include <thread>

using namespace clawdesk::downloader;
using namespace std::chrono_literals;

TEST_CASE("ProgressChannel keeps only the latest event", "[downloader][progress]") {
    ProgressChannel channel;
    auto initial = channel.latest();
    CHECK(initial.sequence == 0);
    CHECK_FALSE(initial.closed);

    channel.publish({"u", 10, 100});
    channel.publish({"u", 40, 100});
    auto snap = channel.latest();
    CHECK(snap.sequence == 2);
    CHECK(snap.event.downloaded == 40);
    CHECK(snap.event.total == 100);
}

TEST_CASE("ProgressChannel ignores events after close", "[downloader][progress]") {
    ProgressChannel channel;
    channel.publish({"u", 1, 0});
    channel.close();
    channel.publish({"u", 2, 0});
    auto snap = channel.latest();
    CHECK(snap.closed);
    CHECK(snap.sequence == 1);
    CHECK(snap.event.downloaded == 1);
}

TEST_CASE("ProgressChannel wakes a waiting reader", "[downloader][progress]") {
    ProgressChannel channel;

    SECTION("on publish") {
        std::thread producer([&] {
            std::this_thread::sleep_for(20ms);
            channel.publish({"u", 7, 0});
        });
        auto snap = channel.waitForUpdate(0, 5s);
        producer.join();
        CHECK(snap.sequence == 1);
        CHECK(snap.event.downloaded == 7);
    }

    SECTION("on close") {
        std::thread closer([&] {
            std::this_thread::sleep_for(20ms);
            channel.close();
        });
        auto snap = channel.waitForUpdate(0, 5s);
        closer.join();
        CHECK(snap.closed);
        CHECK(snap.sequence == 0);
    }

    SECTION("times out without news") {
        channel.publish({"u", 1, 0});
        auto snap = channel.waitForUpdate(1, 10ms);
        CHECK(snap.sequence == 1);
        CHECK_FALSE(snap.closed);
    }
}

TEST_CASE("ProgressChannel callbacks bind publish and cancel", "[downloader][progress]") {
    ProgressChannel channel;
    auto onProgress = channel.progressCallback();
    auto shouldCancel = channel.cancelPredicate();

    onProgress({"u", 5, 10});
    CHECK(channel.latest().event.downloaded == 5);

    CHECK_FALSE(shouldCancel());
    channel.cancel();
    CHECK(shouldCancel());
    CHECK(channel.isCancelled());
}
