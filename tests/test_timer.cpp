#include "../include/core/timer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

using namespace chartagent::core;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

// Poll until pred holds or two seconds pass
static bool eventually(const std::function<bool()>& pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

TEST(fires_repeatedly) {
    ThreadTimer timer;
    std::atomic<int> fires{0};

    timer.arm(10, [&]() { ++fires; });
    ASSERT_TRUE(timer.is_armed());
    ASSERT_TRUE(eventually([&]() { return fires.load() >= 3; }));

    timer.cancel();
    timer.wait();
    ASSERT_FALSE(timer.is_armed());
}

TEST(first_fire_waits_one_interval) {
    ThreadTimer timer;
    std::atomic<int> fires{0};

    timer.arm(500, [&]() { ++fires; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ(fires.load(), 0);

    timer.cancel();
    timer.wait(); // Cancel wakes the sleeping worker
    ASSERT_EQ(fires.load(), 0);
}

TEST(cancel_stops_further_fires) {
    ThreadTimer timer;
    std::atomic<int> fires{0};

    timer.arm(5, [&]() { ++fires; });
    ASSERT_TRUE(eventually([&]() { return fires.load() >= 1; }));

    timer.cancel();
    timer.wait();
    int after_cancel = fires.load();

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    ASSERT_EQ(fires.load(), after_cancel);
}

TEST(rearm_replaces_previous_callback) {
    ThreadTimer timer;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    timer.arm(5, [&]() { ++first; });
    ASSERT_TRUE(eventually([&]() { return first.load() >= 1; }));

    timer.arm(5, [&]() { ++second; }); // Joins the old worker before returning
    int first_frozen = first.load();

    ASSERT_TRUE(eventually([&]() { return second.load() >= 2; }));
    ASSERT_EQ(first.load(), first_frozen);

    timer.cancel();
    timer.wait();
}

TEST(cancel_from_inside_callback) {
    ThreadTimer timer;
    std::atomic<int> fires{0};

    timer.arm(5, [&]() {
        ++fires;
        timer.cancel();
    });

    ASSERT_TRUE(eventually([&]() { return !timer.is_armed(); }));
    timer.wait();
    ASSERT_EQ(fires.load(), 1);
}

TEST(rearm_from_inside_callback) {
    ThreadTimer timer;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    timer.arm(5, [&]() {
        if (++first == 1) {
            timer.arm(5, [&]() { ++second; }); // Old worker detaches itself
        }
    });

    ASSERT_TRUE(eventually([&]() { return second.load() >= 2; }));
    ASSERT_EQ(first.load(), 1);

    timer.cancel();
    timer.wait();

    // Give the detached worker time to observe the new generation and exit
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
}

TEST(wait_without_arm_returns) {
    ThreadTimer timer;
    timer.cancel();
    timer.wait();
    ASSERT_FALSE(timer.is_armed());
}

TEST(manual_timer_fires_on_demand) {
    ManualTimer timer;
    int fires = 0;

    ASSERT_FALSE(timer.fire());
    timer.arm(60000, [&]() { ++fires; });
    ASSERT_EQ(timer.interval_ms(), 60000u);
    ASSERT_TRUE(timer.fire());
    ASSERT_TRUE(timer.fire());
    ASSERT_EQ(fires, 2);

    timer.cancel();
    ASSERT_FALSE(timer.fire());
    ASSERT_EQ(timer.arm_count(), 1);
}

int main() {
    std::cout << "\n=== Timer Tests ===\n\n";

    RUN_TEST(fires_repeatedly);
    RUN_TEST(first_fire_waits_one_interval);
    RUN_TEST(cancel_stops_further_fires);
    RUN_TEST(rearm_replaces_previous_callback);
    RUN_TEST(cancel_from_inside_callback);
    RUN_TEST(rearm_from_inside_callback);
    RUN_TEST(wait_without_arm_returns);
    RUN_TEST(manual_timer_fires_on_demand);

    std::cout << "\n=== All Timer Tests Passed! ===\n";
    return 0;
}
