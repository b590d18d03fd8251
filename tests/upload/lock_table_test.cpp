#include "rus/upload/lock_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using rus::upload::UploadLock;
using rus::upload::UploadLockTable;

TEST(UploadLockTableTest, SlotExistsOnlyWhileHeld) {
    UploadLockTable locks;
    EXPECT_EQ(locks.active(), 0u);

    {
        auto lock = locks.acquire("a");
        EXPECT_EQ(lock.id(), "a");
        EXPECT_EQ(locks.active(), 1u);
    }

    EXPECT_EQ(locks.active(), 0u);
}

TEST(UploadLockTableTest, MovedLockReleasesOnce) {
    UploadLockTable locks;
    {
        auto first = locks.acquire("a");
        UploadLock second(std::move(first));
        EXPECT_EQ(locks.active(), 1u);
    }
    EXPECT_EQ(locks.active(), 0u);

    // Slot can be taken again, nothing left locked
    auto again = locks.acquire("a");
    EXPECT_EQ(locks.active(), 1u);
}

TEST(UploadLockTableTest, SameIdIsMutuallyExclusive) {
    UploadLockTable locks;
    int counter = 0;   // Deliberately unsynchronized, guarded by the lock
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto lock = locks.acquire("shared");
                const int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                }
                ++counter;
                --inside;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counter, 1600);
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.active(), 0u);
}

TEST(UploadLockTableTest, DifferentIdsDoNotBlock) {
    UploadLockTable locks;
    auto held = locks.acquire("a");

    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto lock = locks.acquire("b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.active(), 1u);
}
