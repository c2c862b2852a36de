#include <gwlink/reconnect_policy.hpp>

#include <gtest/gtest.h>

using namespace gwlink;
using std::chrono::milliseconds;

TEST(ReconnectPolicy, DoublesUntilCapped) {
    reconnect_config config;
    config.initial_delay = milliseconds(1000);
    config.max_delay = milliseconds(30000);
    reconnect_policy policy(config);

    EXPECT_EQ(policy.delay_for(0), milliseconds(1000));
    EXPECT_EQ(policy.delay_for(1), milliseconds(2000));
    EXPECT_EQ(policy.delay_for(2), milliseconds(4000));
    EXPECT_EQ(policy.delay_for(4), milliseconds(16000));
    EXPECT_EQ(policy.delay_for(5), milliseconds(30000));
    EXPECT_EQ(policy.delay_for(6), milliseconds(30000));
}

TEST(ReconnectPolicy, LargeAttemptCountsStayCapped) {
    reconnect_config config;
    config.initial_delay = milliseconds(100);
    config.max_delay = milliseconds(1000);
    reconnect_policy policy(config);

    EXPECT_EQ(policy.delay_for(64), milliseconds(1000));
    EXPECT_EQ(policy.delay_for(4000000000u), milliseconds(1000));
}

TEST(ReconnectPolicy, CountsAttemptsUntilExhausted) {
    reconnect_config config;
    config.max_attempts = 3;
    config.initial_delay = milliseconds(100);
    config.max_delay = milliseconds(1000);
    reconnect_policy policy(config);

    EXPECT_EQ(policy.next_delay(), milliseconds(100));
    policy.record_attempt();
    EXPECT_EQ(policy.next_delay(), milliseconds(200));
    policy.record_attempt();
    EXPECT_EQ(policy.next_delay(), milliseconds(400));
    EXPECT_FALSE(policy.exhausted());
    policy.record_attempt();

    EXPECT_TRUE(policy.exhausted());
    EXPECT_EQ(policy.attempts(), 3u);

    policy.reset();
    EXPECT_FALSE(policy.exhausted());
    EXPECT_EQ(policy.next_delay(), milliseconds(100));
}

TEST(ReconnectPolicy, ZeroAttemptsIsExhaustedImmediately) {
    reconnect_config config;
    config.max_attempts = 0;
    reconnect_policy policy(config);

    EXPECT_TRUE(policy.exhausted());
}
