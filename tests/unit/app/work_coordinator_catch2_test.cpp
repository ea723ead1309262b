// WorkCoordinator test suite (Catch2)
// Worker pool lifecycle, strand ordering and drain-on-stop.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>

#include <clawdesk/app/work_coordinator.h>

using namespace clawdesk::app;
using namespace std::chrono_literals;

TEST_CASE("WorkCoordinator lifecycle", "[app][work_coordinator][lifecycle]") {
    SECTION("Construct without starting") {
        WorkCoordinator coordinator;
        REQUIRE_FALSE(coordinator.isRunning());
        REQUIRE(coordinator.getWorkerCount() == 0);
    }

    SECTION("Stop and join without start are no-ops") {
        WorkCoordinator coordinator;
        coordinator.stop();
        coordinator.join();
        REQUIRE_FALSE(coordinator.isRunning());
    }

    SECTION("Start and stop basic lifecycle") {
        WorkCoordinator coordinator;
        coordinator.start(3);
        REQUIRE(coordinator.isRunning());
        REQUIRE(coordinator.getWorkerCount() == 3);

        coordinator.stop();
        coordinator.join();
        REQUIRE_FALSE(coordinator.isRunning());
        REQUIRE(coordinator.getWorkerCount() == 0);
    }

    SECTION("Default thread count is two, zero is raised to one") {
        WorkCoordinator defaults;
        defaults.start();
        REQUIRE(defaults.getWorkerCount() == 2);

        WorkCoordinator single;
        single.start(0);
        REQUIRE(single.getWorkerCount() == 1);
    }

    SECTION("Double start throws") {
        WorkCoordinator coordinator;
        coordinator.start(1);
        REQUIRE_THROWS_AS(coordinator.start(1), std::runtime_error);
    }
}

TEST_CASE("WorkCoordinator work execution", "[app][work_coordinator][execution]") {
    WorkCoordinator coordinator;
    coordinator.start(4);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> done;
    for (int i = 0; i < 50; ++i) {
        auto p = std::make_shared<std::promise<void>>();
        done.push_back(p->get_future());
        boost::asio::post(coordinator.getExecutor(), [&counter, p] {
            counter.fetch_add(1);
            p->set_value();
        });
    }
    for (auto& f : done) {
        REQUIRE(f.wait_for(5s) == std::future_status::ready);
    }
    REQUIRE(counter.load() == 50);
}

TEST_CASE("WorkCoordinator strand keeps submission order", "[app][work_coordinator][strand]") {
    WorkCoordinator coordinator;
    coordinator.start(4);
    auto strand = coordinator.makeStrand();

    std::mutex mutex;
    std::vector<int> order;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};
    auto finished = std::make_shared<std::promise<void>>();
    auto finishedFuture = finished->get_future();

    constexpr int kJobs = 40;
    for (int i = 0; i < kJobs; ++i) {
        boost::asio::post(strand, [&, i, finished] {
            if (inside.fetch_add(1) != 0) {
                overlapped = true;
            }
            std::this_thread::sleep_for(1ms);
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }
            inside.fetch_sub(1);
            if (i == kJobs - 1) {
                finished->set_value();
            }
        });
    }

    REQUIRE(finishedFuture.wait_for(10s) == std::future_status::ready);
    REQUIRE_FALSE(overlapped.load());
    REQUIRE(order.size() == kJobs);
    for (int i = 0; i < kJobs; ++i) {
        CHECK(order[static_cast<std::size_t>(i)] == i);
    }
}

TEST_CASE("WorkCoordinator shutdown drains queued work", "[app][work_coordinator][shutdown]") {
    WorkCoordinator coordinator;
    coordinator.start(1);

    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        boost::asio::post(coordinator.getExecutor(), [&ran] {
            std::this_thread::sleep_for(2ms);
            ran.fetch_add(1);
        });
    }
    coordinator.stop();
    coordinator.join();
    REQUIRE(ran.load() == 10);
}
