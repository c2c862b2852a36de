#include <gwlink/net/websocket_transport.hpp>

#include <gtest/gtest.h>

using gwlink::net::parse_websocket_url;

TEST(WebSocketUrl, PlainWithPort) {
    auto url = parse_websocket_url("ws://127.0.0.1:18789");
    ASSERT_TRUE(url.has_value());
    EXPECT_FALSE(url->secure);
    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->port, "18789");
    EXPECT_EQ(url->target, "/");
}

TEST(WebSocketUrl, SecureDefaultsPortAndKeepsPath) {
    auto url = parse_websocket_url("wss://gateway.example.com/ws/v1?client=gwlink");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->secure);
    EXPECT_EQ(url->host, "gateway.example.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/ws/v1?client=gwlink");
}

TEST(WebSocketUrl, QueryWithoutPath) {
    auto url = parse_websocket_url("ws://localhost?token=abc");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/?token=abc");
}

TEST(WebSocketUrl, BracketedIpv6) {
    auto url = parse_websocket_url("ws://[::1]:9000/gw");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "9000");
    EXPECT_EQ(url->target, "/gw");
}

TEST(WebSocketUrl, Rejects) {
    EXPECT_FALSE(parse_websocket_url("http://localhost").has_value());
    EXPECT_FALSE(parse_websocket_url("ws://").has_value());
    EXPECT_FALSE(parse_websocket_url("ws://host:port").has_value());
    EXPECT_FALSE(parse_websocket_url("ws://[::1").has_value());
    EXPECT_FALSE(parse_websocket_url("ws://[::1]x").has_value());
}

TEST(WebSocketTransport, InvalidUrlFailsAsynchronously) {
    boost::asio::io_context io_context;
    gwlink::net::websocket_transport transport(&io_context);

    std::optional<std::string> error;
    bool called = false;
    transport.async_open("ws://host:notaport", [&](std::optional<std::string> e) {
        called = true;
        error = std::move(e);
    });

    EXPECT_FALSE(called);
    io_context.run();

    ASSERT_TRUE(called);
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("invalid websocket url"), std::string::npos);
    EXPECT_FALSE(transport.is_open());
}
