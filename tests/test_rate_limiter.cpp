#include <gtest/gtest.h>
#include "rate_limiter.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace chathub;
using namespace std::chrono_literals;

TEST(SlidingWindowTest, AdmitsUpToLimitWithinWindow) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    for (int i = 0; i < 5; ++i) {
        auto res = window.check(5, t0 + std::chrono::seconds(i));
        EXPECT_TRUE(res.allowed);
        EXPECT_EQ(res.current, i + 1);
        EXPECT_EQ(res.reset_after_sec, 0);
    }

    auto rejected = window.check(5, t0 + 10s);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.current, 5);
    EXPECT_EQ(window.size(), 5u);
}

TEST(SlidingWindowTest, WaitHintCountsDownFromOldestEvent) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    ASSERT_TRUE(window.check(2, t0).allowed);
    ASSERT_TRUE(window.check(2, t0 + 5s).allowed);

    EXPECT_EQ(window.check(2, t0 + 10s).reset_after_sec, 50);
    EXPECT_EQ(window.check(2, t0 + 10s + 500ms).reset_after_sec, 50);
}

TEST(SlidingWindowTest, WaitHintIsNeverBelowOneSecond) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    ASSERT_TRUE(window.check(1, t0).allowed);

    auto res = window.check(1, t0 + 59s + 900ms);
    EXPECT_FALSE(res.allowed);
    EXPECT_EQ(res.reset_after_sec, 1);
}

TEST(SlidingWindowTest, WaitingTheReportedTimeSucceeds) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    ASSERT_TRUE(window.check(1, t0 + 250ms).allowed);

    auto midway = t0 + 30s;
    auto res = window.check(1, midway);
    ASSERT_FALSE(res.allowed);

    auto retry = window.check(1, midway + std::chrono::seconds(res.reset_after_sec));
    EXPECT_TRUE(retry.allowed);
}

TEST(SlidingWindowTest, EventsLeaveTheWindowAfterSixtySeconds) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    ASSERT_TRUE(window.check(3, t0).allowed);
    ASSERT_TRUE(window.check(3, t0 + 1s).allowed);
    ASSERT_TRUE(window.check(3, t0 + 2s).allowed);
    ASSERT_FALSE(window.check(3, t0 + 59s).allowed);

    // Only the first stamp has expired.
    auto res = window.check(3, t0 + 60s);
    EXPECT_TRUE(res.allowed);
    EXPECT_EQ(res.current, 3);
    EXPECT_FALSE(window.check(3, t0 + 60s).allowed);
}

TEST(SlidingWindowTest, RejectedAttemptsAreNotRecorded) {
    SlidingWindow window;
    auto t0 = SlidingWindow::Clock::now();

    ASSERT_TRUE(window.check(1, t0).allowed);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(window.check(1, t0 + 1s).allowed);
    }
    EXPECT_EQ(window.size(), 1u);
    EXPECT_TRUE(window.check(1, t0 + 61s).allowed);
}

TEST(SlidingWindowTest, ZeroLimitRejectsEverything) {
    SlidingWindow window;
    auto res = window.check(0, SlidingWindow::Clock::now());
    EXPECT_FALSE(res.allowed);
    EXPECT_EQ(res.reset_after_sec, 60);
}

TEST(RateLimiterTest, KeysAreIndependent) {
    RateLimiter limiter(2);
    auto now = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.check("alice", now).allowed);
    EXPECT_TRUE(limiter.check("alice", now).allowed);
    EXPECT_FALSE(limiter.check("alice", now).allowed);

    EXPECT_TRUE(limiter.check("bob", now).allowed);
    EXPECT_EQ(limiter.tracked_keys(), 2u);
    EXPECT_EQ(limiter.limit(), 2);
}

TEST(RateLimiterTest, ConcurrentCallersNeverExceedLimit) {
    RateLimiter limiter(100);
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (limiter.check("shared").allowed) admitted++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(admitted.load(), 100);
}
