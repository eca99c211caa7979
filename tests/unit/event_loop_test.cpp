#include "events/event_loop.hpp"

#include <gtest/gtest.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <vector>

using qode::events::EventLoop;

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(::pipe(pipe_fds_), 0); }

    void TearDown() override {
        for (int fd : pipe_fds_) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    EventLoop loop_;
    int pipe_fds_[2] = {-1, -1};
};

TEST_F(EventLoopTest, TimersFireInDeadlineOrder) {
    std::vector<int> order;
    loop_.call_later(30, [&] { order.push_back(3); });
    loop_.call_later(10, [&] { order.push_back(1); });
    loop_.call_later(20, [&] { order.push_back(2); });

    ASSERT_TRUE(loop_.run_until([&] { return order.size() == 3; }, 1000));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop_.timer_count(), 0u);
}

TEST_F(EventLoopTest, EqualDeadlinesFireInSchedulingOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop_.call_later(0, [&order, i] { order.push_back(i); });
    }
    loop_.run_once(0);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(EventLoopTest, CancelledTimerNeverFires) {
    bool fired = false;
    auto id = loop_.call_later(5, [&] { fired = true; });
    EXPECT_TRUE(loop_.has_timer(id));

    loop_.cancel(id);
    EXPECT_FALSE(loop_.has_timer(id));

    loop_.run_until([] { return false; }, 30);
    EXPECT_FALSE(fired);
}

TEST_F(EventLoopTest, TimerScheduledFromTimerWaitsForNextIteration) {
    int runs = 0;
    loop_.call_later(0, [&] {
        ++runs;
        loop_.call_later(0, [&] { ++runs; });
    });

    loop_.run_once(0);
    EXPECT_EQ(runs, 1);
    loop_.run_once(0);
    EXPECT_EQ(runs, 2);
}

TEST_F(EventLoopTest, PostedCallbackRunsOnNextIteration) {
    bool ran = false;
    loop_.post([&] { ran = true; });
    EXPECT_FALSE(ran);
    loop_.run_once(0);
    EXPECT_TRUE(ran);
}

TEST_F(EventLoopTest, WatcherSeesReadableFd) {
    std::string received;
    loop_.watch(pipe_fds_[0], POLLIN, [&](short) {
        char buf[16];
        ssize_t n = ::read(pipe_fds_[0], buf, sizeof(buf));
        if (n > 0) {
            received.append(buf, static_cast<size_t>(n));
        }
    });
    ASSERT_EQ(::write(pipe_fds_[1], "ping", 4), 4);

    ASSERT_TRUE(loop_.run_until([&] { return received == "ping"; }, 1000));
    EXPECT_TRUE(loop_.is_watching(pipe_fds_[0]));
}

TEST_F(EventLoopTest, UnwatchFromOwnCallback) {
    int calls = 0;
    loop_.watch(pipe_fds_[0], POLLIN, [&](short) {
        ++calls;
        loop_.unwatch(pipe_fds_[0]);
    });
    ASSERT_EQ(::write(pipe_fds_[1], "x", 1), 1);

    loop_.run_until([&] { return calls > 0; }, 1000);
    loop_.run_once(10);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(loop_.watcher_count(), 0u);
}

TEST_F(EventLoopTest, RunUntilTimesOut) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop_.run_until([] { return false; }, 60));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 60);
}

TEST_F(EventLoopTest, StopEndsRun) {
    loop_.call_later(5, [&] { loop_.stop(); });
    loop_.run();
    SUCCEED();
}
