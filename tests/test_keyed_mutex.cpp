#include <catch2/catch_test_macros.hpp>
#include "keyed_mutex.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace lyricache;

TEST_CASE("KeyedMutex: slot dropped after release", "[keyed_mutex]") {
    KeyedMutex km;
    {
        auto lock = km.acquire("lemon");
        REQUIRE(lock.owns_lock());
        REQUIRE(km.active_keys() == 1);
    }
    REQUIRE(km.active_keys() == 0);
}

TEST_CASE("KeyedMutex: different keys do not block", "[keyed_mutex]") {
    KeyedMutex km;
    auto a = km.acquire("a");
    auto b = km.acquire("b");
    REQUIRE(a.owns_lock());
    REQUIRE(b.owns_lock());
    REQUIRE(km.active_keys() == 2);
}

TEST_CASE("KeyedMutex: moved lock releases once", "[keyed_mutex]") {
    KeyedMutex km;
    auto first = km.acquire("k");
    KeyedMutex::Lock second = std::move(first);
    REQUIRE_FALSE(first.owns_lock());  // NOLINT(bugprone-use-after-move)
    REQUIRE(second.owns_lock());
    second = KeyedMutex::Lock();
    REQUIRE(km.active_keys() == 0);

    // Key is free again
    auto again = km.acquire("k");
    REQUIRE(again.owns_lock());
}

TEST_CASE("KeyedMutex: same key is mutually exclusive", "[keyed_mutex]") {
    KeyedMutex km;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; i++) {
                auto lock = km.acquire("shared");
                int now = ++inside;
                int prev = max_inside.load();
                while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
                counter++;
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(counter == 8 * 200);
    REQUIRE(max_inside.load() == 1);
    REQUIRE(km.active_keys() == 0);
}

TEST_CASE("KeyedMutex: waiter proceeds after holder releases", "[keyed_mutex]") {
    KeyedMutex km;
    std::atomic<bool> acquired{false};

    auto holder = km.acquire("k");
    std::thread waiter([&]() {
        auto lock = km.acquire("k");
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(acquired.load());

    holder = KeyedMutex::Lock();
    waiter.join();
    REQUIRE(acquired.load());
    REQUIRE(km.active_keys() == 0);
}
