#include "events/signal.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using qode::events::Signal;

TEST(SignalTest, EmitReachesSubscribersInOrder) {
    Signal<int, const std::string &> signal;
    std::vector<std::string> calls;

    signal.connect([&](int n, const std::string &s) { calls.push_back("a" + std::to_string(n) + s); });
    signal.connect([&](int n, const std::string &s) { calls.push_back("b" + std::to_string(n) + s); });
    signal.emit(7, "x");

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "a7x");
    EXPECT_EQ(calls[1], "b7x");
}

TEST(SignalTest, IdsAreNonZeroAndUnique) {
    Signal<> signal;
    auto first = signal.connect([] {});
    auto second = signal.connect([] {});
    EXPECT_NE(first, 0u);
    EXPECT_NE(first, second);
    EXPECT_EQ(signal.slot_count(), 2u);
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<> signal;
    int count = 0;
    auto id = signal.connect([&] { ++count; });

    signal.emit();
    signal.disconnect(id);
    signal.emit();

    EXPECT_EQ(count, 1);
    EXPECT_EQ(signal.slot_count(), 0u);
}

TEST(SignalTest, DisconnectUnknownIdIsNoOp) {
    Signal<> signal;
    signal.connect([] {});
    signal.disconnect(999);
    EXPECT_EQ(signal.slot_count(), 1u);
}

TEST(SignalTest, SlotDisconnectedDuringEmitIsSkipped) {
    Signal<> signal;
    int second_calls = 0;
    Signal<>::SlotId second = 0;

    signal.connect([&] { signal.disconnect(second); });
    second = signal.connect([&] { ++second_calls; });
    signal.emit();

    EXPECT_EQ(second_calls, 0);
}

TEST(SignalTest, SlotConnectedDuringEmitWaitsForNextEmit) {
    Signal<> signal;
    int late_calls = 0;
    bool connected = false;

    signal.connect([&] {
        if (!connected) {
            connected = true;
            signal.connect([&] { ++late_calls; });
        }
    });

    signal.emit();
    EXPECT_EQ(late_calls, 0);
    signal.emit();
    EXPECT_EQ(late_calls, 1);
}

TEST(SignalTest, DisconnectAllClearsSubscribers) {
    Signal<int> signal;
    int count = 0;
    signal.connect([&](int) { ++count; });
    signal.connect([&](int) { ++count; });

    signal.disconnect_all();
    signal.emit(1);

    EXPECT_EQ(count, 0);
}
