/**
 * @file ConnectionThrottleTest.cpp
 * @brief Unit tests for the per-host connection limiter
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/ConnectionThrottle.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST(ConnectionThrottleTest, LimitFor_DefaultsToOne) {
    ConnectionThrottle throttle({{BackendType::SMB, 4}, {BackendType::FTP, 0}});

    EXPECT_EQ(throttle.limit_for(BackendType::SMB), 4);
    EXPECT_EQ(throttle.limit_for(BackendType::FTP), 1);
    EXPECT_EQ(throttle.limit_for(BackendType::SFTP), 1);
}

TEST(ConnectionThrottleTest, TryAcquire_RespectsLimit) {
    ConnectionThrottle throttle({{BackendType::SFTP, 2}});

    auto first = throttle.try_acquire(BackendType::SFTP, "sftp://h");
    auto second = throttle.try_acquire(BackendType::SFTP, "sftp://h");
    auto third = throttle.try_acquire(BackendType::SFTP, "sftp://h");

    EXPECT_TRUE(first.has_value());
    EXPECT_TRUE(second.has_value());
    EXPECT_FALSE(third.has_value());
    EXPECT_EQ(throttle.active_count(BackendType::SFTP, "sftp://h"), 2);
}

TEST(ConnectionThrottleTest, Hosts_HaveSeparateBudgets) {
    ConnectionThrottle throttle({{BackendType::SMB, 1}});

    auto nas1 = throttle.try_acquire(BackendType::SMB, "smb://nas1");
    auto nas2 = throttle.try_acquire(BackendType::SMB, "smb://nas2");

    EXPECT_TRUE(nas1.has_value());
    EXPECT_TRUE(nas2.has_value());
}

TEST(ConnectionThrottleTest, Permit_ReleasesOnDestructionAndMove) {
    ConnectionThrottle throttle({{BackendType::FTP, 1}});

    {
        auto permit = throttle.acquire(BackendType::FTP, "ftp://h");
        EXPECT_TRUE(permit.is_held());
        auto moved = std::move(permit);
        EXPECT_FALSE(permit.is_held());
        EXPECT_EQ(throttle.active_count(BackendType::FTP, "ftp://h"), 1);
    }
    EXPECT_EQ(throttle.active_count(BackendType::FTP, "ftp://h"), 0);

    auto again = throttle.acquire(BackendType::FTP, "ftp://h");
    again.release();
    again.release();
    EXPECT_EQ(throttle.active_count(BackendType::FTP, "ftp://h"), 0);
}

TEST(ConnectionThrottleTest, Acquire_NeverExceedsLimitUnderContention) {
    ConnectionThrottle throttle({{BackendType::SMB, 3}});
    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            auto permit = throttle.acquire(BackendType::SMB, "smb://nas");
            int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
            --current;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(throttle.active_count(BackendType::SMB, "smb://nas"), 0);
}

TEST(ConnectionThrottleTest, Acquire_BlocksUntilReleased) {
    ConnectionThrottle throttle({{BackendType::SFTP, 1}});
    auto held = throttle.acquire(BackendType::SFTP, "sftp://h");
    std::atomic<bool> acquired{false};

    std::thread waiter([&]() {
        auto permit = throttle.acquire(BackendType::SFTP, "sftp://h");
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    EXPECT_FALSE(acquired.load());

    held.release();
    EXPECT_TRUE(ThreadingTestHelper::WaitUntil([&]() { return acquired.load(); }));
    waiter.join();
}
