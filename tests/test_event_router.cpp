#include <gwlink/event_router.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace gwlink;

class EventRouterTest : public ::testing::Test {
protected:
    std::vector<std::string> errors;
    event_router router{logger([this](log_level level, std::string_view message, const Json::Value&) {
        if (level == log_level::error)
            errors.emplace_back(message);
    })};

    static session_event event_for(const std::string& session_id, event_type type = event_type::progress) {
        session_event event;
        event.type = type;
        event.session_id = session_id;
        event.data["sessionId"] = session_id;
        return event;
    }
};

TEST(EventMapping, KnownNames) {
    EXPECT_EQ(map_event_type("session.progress"), event_type::progress);
    EXPECT_EQ(map_event_type("session.tool_call"), event_type::tool_call);
    EXPECT_EQ(map_event_type("session.thinking"), event_type::thinking);
    EXPECT_EQ(map_event_type("session.complete"), event_type::complete);
    EXPECT_EQ(map_event_type("session.error"), event_type::error);
    EXPECT_EQ(map_event_type("session.output"), event_type::output);
}

TEST(EventMapping, UnknownNamesAreProgress) {
    EXPECT_EQ(map_event_type(""), event_type::progress);
    EXPECT_EQ(map_event_type("session.unknown"), event_type::progress);
    EXPECT_EQ(map_event_type("tick"), event_type::progress);
}

TEST(EventMapping, SessionIdFromPayload) {
    protocol::event_frame evt;
    evt.event = "session.complete";
    evt.payload = Json::Value(Json::objectValue);
    (*evt.payload)["sessionId"] = "abc";
    evt.seq = 9;

    auto event = make_session_event(evt);
    EXPECT_EQ(event.type, event_type::complete);
    EXPECT_EQ(event.session_id, "abc");
    ASSERT_TRUE(event.seq.has_value());
    EXPECT_EQ(*event.seq, 9);
    EXPECT_GT(event.timestamp, 0);

    evt.payload = Json::Value(Json::objectValue);
    (*evt.payload)["session_id"] = "def";
    EXPECT_EQ(make_session_event(evt).session_id, "def");

    evt.payload.reset();
    EXPECT_TRUE(make_session_event(evt).session_id.empty());
}

TEST_F(EventRouterTest, DeliversToExactAndWildcard) {
    int exact = 0, other = 0, wildcard = 0;
    auto a = router.subscribe("s1", [&](const session_event&) { exact++; });
    auto b = router.subscribe("s2", [&](const session_event&) { other++; });
    auto w = router.subscribe(std::string(wildcard_session), [&](const session_event&) { wildcard++; });

    EXPECT_EQ(router.dispatch(event_for("s1")), 2u);

    EXPECT_EQ(exact, 1);
    EXPECT_EQ(other, 0);
    EXPECT_EQ(wildcard, 1);
}

TEST_F(EventRouterTest, SecondSubscriberDoesNotReplaceFirst) {
    int first = 0, second = 0;
    auto a = router.subscribe("s1", [&](const session_event&) { first++; });
    auto b = router.subscribe("s1", [&](const session_event&) { second++; });

    router.dispatch(event_for("s1"));

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(router.subscriber_count("s1"), 2u);
}

TEST_F(EventRouterTest, EventWithoutSessionGoesToWildcardOnly) {
    int empty_key = 0, wildcard = 0;
    auto a = router.subscribe("", [&](const session_event&) { empty_key++; });
    auto w = router.subscribe(std::string(wildcard_session), [&](const session_event&) { wildcard++; });

    router.dispatch(session_event{});

    EXPECT_EQ(empty_key, 0);
    EXPECT_EQ(wildcard, 1);
}

TEST_F(EventRouterTest, ThrowingSubscriberDoesNotStopDelivery) {
    int later = 0, wildcard = 0;
    auto a = router.subscribe("s1", [](const session_event&) { throw std::runtime_error("subscriber failed"); });
    auto b = router.subscribe("s1", [&](const session_event&) { later++; });
    auto w = router.subscribe(std::string(wildcard_session), [](const session_event&) { throw std::logic_error("wildcard failed"); });
    auto w2 = router.subscribe(std::string(wildcard_session), [&](const session_event&) { wildcard++; });

    EXPECT_NO_THROW(router.dispatch(event_for("s1")));

    EXPECT_EQ(later, 1);
    EXPECT_EQ(wildcard, 1);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Event handler error");
    EXPECT_EQ(errors[1], "Wildcard event handler error");
}

TEST_F(EventRouterTest, UnsubscribeIsIdempotentAndRemovesEmptySet) {
    int count = 0;
    auto sub = router.subscribe("s1", [&](const session_event&) { count++; });
    EXPECT_TRUE(sub.active());
    EXPECT_EQ(router.session_count(), 1u);

    sub.unsubscribe();
    sub.unsubscribe();

    EXPECT_FALSE(sub.active());
    EXPECT_EQ(router.session_count(), 0u);

    router.dispatch(event_for("s1"));
    EXPECT_EQ(count, 0);
}

TEST_F(EventRouterTest, UnsubscribeKeepsOtherSubscribers) {
    int first = 0, second = 0;
    auto a = router.subscribe("s1", [&](const session_event&) { first++; });
    auto b = router.subscribe("s1", [&](const session_event&) { second++; });

    a.unsubscribe();
    router.dispatch(event_for("s1"));

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST_F(EventRouterTest, CallbackMayUnsubscribeItself) {
    int count = 0;
    subscription self;
    self = router.subscribe("s1", [&](const session_event&) {
        count++;
        self.unsubscribe();
    });

    router.dispatch(event_for("s1"));
    router.dispatch(event_for("s1"));

    EXPECT_EQ(count, 1);
}

TEST_F(EventRouterTest, SubscriberAddedDuringDispatchWaitsForNextEvent) {
    int late = 0;
    std::vector<subscription> added;
    auto a = router.subscribe("s1", [&](const session_event&) {
        if (added.empty())
            added.push_back(router.subscribe("s1", [&](const session_event&) { late++; }));
    });

    router.dispatch(event_for("s1"));
    EXPECT_EQ(late, 0);

    router.dispatch(event_for("s1"));
    EXPECT_EQ(late, 1);
}

TEST(Subscription, OutlivingTheRouterIsHarmless) {
    subscription sub;
    {
        event_router router;
        sub = router.subscribe("s1", [](const session_event&) {});
    }

    EXPECT_FALSE(sub.active());
    EXPECT_NO_THROW(sub.unsubscribe());
}
