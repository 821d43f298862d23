/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <transports/websocket/reconnect_policy.h>

using namespace std::chrono_literals;
using colony::websocket::reconnect_policy;

TEST(reconnect_policy_test, default_is_constant_five_seconds)
{
    reconnect_policy policy;
    EXPECT_EQ(policy.kind, colony::websocket::backoff_kind::constant);
    EXPECT_EQ(policy.next_delay(1), 5000ms);
    EXPECT_EQ(policy.next_delay(2), 5000ms);
    EXPECT_EQ(policy.next_delay(50), 5000ms);
}

TEST(reconnect_policy_test, exponential_doubles_up_to_the_cap)
{
    auto policy = reconnect_policy::exponential_backoff(100ms, 1000ms);
    EXPECT_EQ(policy.next_delay(1), 100ms);
    EXPECT_EQ(policy.next_delay(2), 200ms);
    EXPECT_EQ(policy.next_delay(3), 400ms);
    EXPECT_EQ(policy.next_delay(4), 800ms);
    EXPECT_EQ(policy.next_delay(5), 1000ms);
    EXPECT_EQ(policy.next_delay(4000), 1000ms);
}

TEST(reconnect_policy_test, jitter_stays_within_bounds)
{
    auto policy = reconnect_policy::exponential_backoff(100ms, 1000ms, 50ms);
    for (int i = 0; i < 200; ++i)
    {
        auto delay = policy.next_delay(1);
        EXPECT_GE(delay, 100ms);
        EXPECT_LE(delay, 150ms);
    }
}

TEST(reconnect_policy_test, constant_delay_helper)
{
    auto policy = reconnect_policy::constant_delay(250ms);
    EXPECT_EQ(policy.next_delay(1), 250ms);
    EXPECT_EQ(policy.next_delay(9), 250ms);
}
