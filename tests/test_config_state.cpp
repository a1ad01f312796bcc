#include <gtest/gtest.h>
#include "config_state.hpp"
#include <thread>
#include <vector>

using namespace slb;

TEST(ConfigStateTest, CounterStartsAtZero) {
    ConfigState state;
    EXPECT_EQ(state.global_counter(), 0u);
}

TEST(ConfigStateTest, ConcurrentIncrementsAreNotLost) {
    ConfigState state;

    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&state] {
            for (int i = 0; i < kPerThread; ++i) {
                state.increment_global_counter();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(state.global_counter(), static_cast<uint64_t>(kThreads * kPerThread));
}

TEST(ConfigStateTest, ReturnsConfiguredTunables) {
    ConfigState state(RoutingTunables{3, 1}, true);

    auto tunables = state.tunables();
    EXPECT_EQ(tunables.ws_round_robin_step, 3);
    EXPECT_EQ(tunables.http_cursor_reset_value, 1);
    EXPECT_TRUE(state.debug_mode());
}

TEST(ConfigStateTest, DefaultsDisableDebug) {
    ConfigState state;

    EXPECT_EQ(state.tunables().ws_round_robin_step, 2);
    EXPECT_EQ(state.tunables().http_cursor_reset_value, 0);
    EXPECT_FALSE(state.debug_mode());
}
