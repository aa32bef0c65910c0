// ============================================================
// path_lock_test.cpp -- Per-path write lock tests
// ============================================================

#include "../server/path_lock.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(PathLockTest, EntryRemovedWhenReleased) {
    PathLockTable table;
    {
        auto g = table.lock("/out/a");
        EXPECT_TRUE(g.owns_lock());
        EXPECT_EQ(table.size(), 1u);
    }
    EXPECT_EQ(table.size(), 0u);
}

TEST(PathLockTest, DifferentPathsDoNotBlock) {
    PathLockTable table;
    auto a = table.lock("/out/a");
    auto b = table.lock("/out/b");
    EXPECT_EQ(table.size(), 2u);
}

TEST(PathLockTest, MovedGuardReleasesOnce) {
    PathLockTable table;
    PathLockTable::Guard outer;
    EXPECT_FALSE(outer.owns_lock());
    {
        auto g = table.lock("/out/a");
        outer = std::move(g);
        EXPECT_FALSE(g.owns_lock());
    }
    EXPECT_EQ(table.size(), 1u);
    outer = PathLockTable::Guard();
    EXPECT_EQ(table.size(), 0u);
}

/**
 * @test Writers of the same path never overlap
 */
TEST(PathLockTest, SamePathIsMutuallyExclusive) {
    PathLockTable table;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                auto g = table.lock("/out/same");
                int now = ++inside;
                int prev = max_inside.load();
                while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(table.size(), 0u);
}
