#include <gwlink/net/expirator.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using gwlink::net::expirator;

class ExpiratorTest : public ::testing::Test {
protected:
    boost::asio::io_context io_context;
    int expired_count{0};
    std::vector<int> expired_keys;

    std::shared_ptr<expirator<int, std::string>> make() {
        return std::make_shared<expirator<int, std::string>>(
            &io_context,
            [this](int key, std::string) {
                expired_count++;
                expired_keys.push_back(key);
            });
    }
};

TEST_F(ExpiratorTest, BasicAddAndExpire) {
    auto exp = make();

    exp->add(1, std::chrono::milliseconds(20), "first");
    exp->add(2, std::chrono::milliseconds(40), "second");

    EXPECT_EQ(exp->size(), 2u);
    EXPECT_TRUE(exp->contains(1));
    EXPECT_TRUE(exp->is_running());

    io_context.run();

    EXPECT_EQ(expired_count, 2);
    EXPECT_TRUE(exp->empty());
    EXPECT_FALSE(exp->is_running());
}

TEST_F(ExpiratorTest, ExpirationOrder) {
    auto exp = make();

    // Added in reverse order
    exp->add(3, std::chrono::milliseconds(60), "third");
    exp->add(2, std::chrono::milliseconds(40), "second");
    exp->add(1, std::chrono::milliseconds(20), "first");

    io_context.run();

    ASSERT_EQ(expired_keys.size(), 3u);
    EXPECT_EQ(expired_keys[0], 1);
    EXPECT_EQ(expired_keys[1], 2);
    EXPECT_EQ(expired_keys[2], 3);
}

TEST_F(ExpiratorTest, TakeBeforeExpiry) {
    auto exp = make();

    exp->add(1, std::chrono::milliseconds(20), "first");
    exp->add(2, std::chrono::milliseconds(20), "second");

    auto info = exp->take(1);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*info, "first");
    EXPECT_FALSE(exp->take(1).has_value());

    io_context.run();

    ASSERT_EQ(expired_keys.size(), 1u);
    EXPECT_EQ(expired_keys[0], 2);
}

TEST_F(ExpiratorTest, TakingLastEntryStops) {
    auto exp = make();

    exp->add(1, std::chrono::seconds(10), "only");
    exp->take(1);

    EXPECT_FALSE(exp->is_running());
    io_context.run();
    EXPECT_EQ(expired_count, 0);
}

TEST_F(ExpiratorTest, DuplicateKey) {
    auto exp = make();

    EXPECT_TRUE(exp->add(1, std::chrono::seconds(1), "first"));
    EXPECT_FALSE(exp->add(1, std::chrono::seconds(1), "duplicate"));
    EXPECT_EQ(exp->size(), 1u);
    ASSERT_NE(exp->find(1), nullptr);
    EXPECT_EQ(*exp->find(1), "first");
}

TEST_F(ExpiratorTest, DrainReturnsDeadlineOrderWithoutExpiring) {
    auto exp = make();

    exp->add(1, std::chrono::seconds(30), "late");
    exp->add(2, std::chrono::seconds(10), "early");

    auto drained = exp->drain();

    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].first, 2);
    EXPECT_EQ(drained[1].first, 1);
    EXPECT_TRUE(exp->empty());

    io_context.run();
    EXPECT_EQ(expired_count, 0);
}

TEST_F(ExpiratorTest, EarlierEntryRearmsTimer) {
    auto exp = make();

    exp->add(1, std::chrono::seconds(10), "slow");
    exp->add(2, std::chrono::milliseconds(10), "fast");

    io_context.run_for(std::chrono::milliseconds(200));

    ASSERT_EQ(expired_keys.size(), 1u);
    EXPECT_EQ(expired_keys[0], 2);
    EXPECT_TRUE(exp->contains(1));
}

TEST_F(ExpiratorTest, HandlerMayAddEntries) {
    std::shared_ptr<expirator<int, std::string>> exp;
    exp = std::make_shared<expirator<int, std::string>>(
        &io_context,
        [&](int key, std::string) {
            expired_keys.push_back(key);
            if (key == 1)
                exp->add(2, std::chrono::milliseconds(10), "follow-up");
        });

    exp->add(1, std::chrono::milliseconds(10), "first");
    io_context.run();

    ASSERT_EQ(expired_keys.size(), 2u);
    EXPECT_EQ(expired_keys[1], 2);
}

TEST_F(ExpiratorTest, NullHandlerThrows) {
    EXPECT_THROW((expirator<int, int>(&io_context, nullptr)), std::invalid_argument);
}
