#include <gwlink/net/websocket_transport.hpp>

#include "common/mock_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace gwlink;
using std::chrono::milliseconds;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace
{
// Loopback gateway: accepts one WebSocket client and records its frames
struct loopback_gateway : std::enable_shared_from_this<loopback_gateway>
{
    tcp::acceptor acceptor;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    beast::flat_buffer buffer;
    std::vector<std::string> received;
    bool accepted{false};
    bool finished{false};

    explicit loopback_gateway(boost::asio::io_context& io_context)
      : acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
    {
    }

    std::string url() const
    {
        return "ws://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
    }

    void start()
    {
        acceptor.async_accept([self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (ec)
                return;
            self->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(std::move(socket));
            self->ws->async_accept([self](beast::error_code ec) {
                if (ec)
                    return;
                self->accepted = true;
                self->read();
            });
        });
    }

    void read()
    {
        ws->async_read(buffer, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->finished = true;
                return;
            }
            self->received.push_back(beast::buffers_to_string(self->buffer.data()));
            self->buffer.consume(self->buffer.size());
            self->read();
        });
    }

    void send(std::string text)
    {
        auto message = std::make_shared<std::string>(std::move(text));
        ws->text(true);
        ws->async_write(boost::asio::buffer(*message), [message](beast::error_code, std::size_t) {});
    }

    void close()
    {
        ws->async_close(websocket::close_code::going_away, [self = shared_from_this()](beast::error_code) {});
    }
};

struct recording_handler : net::transport_handler
{
    std::vector<std::string>* messages;
    std::optional<std::optional<std::string>>* closed;

    recording_handler(std::vector<std::string>* m, std::optional<std::optional<std::string>>* c)
      : messages(m)
      , closed(c)
    {
    }

    void on_message(std::string_view text) override { messages->emplace_back(text); }
    void on_close(std::optional<std::string> error) override { *closed = std::move(error); }
};
} // namespace

class WebSocketTransportTest : public ::testing::Test {
protected:
    boost::asio::io_context io_context;
    std::shared_ptr<loopback_gateway> gateway = std::make_shared<loopback_gateway>(io_context);
    std::unique_ptr<net::websocket_transport> transport = std::make_unique<net::websocket_transport>(&io_context);
    std::vector<std::string> messages;
    std::optional<std::optional<std::string>> closed;

    void SetUp() override {
        transport->set_handler(std::make_unique<recording_handler>(&messages, &closed));
        gateway->start();
    }

    void open() {
        std::optional<std::optional<std::string>> result;
        transport->async_open(gateway->url(), [&](std::optional<std::string> error) { result = std::move(error); });
        ASSERT_TRUE(run_until([&] { return result.has_value() && gateway->accepted; }));
        ASSERT_FALSE(result->has_value()) << **result;
        ASSERT_TRUE(transport->is_open());
    }

    bool run_until(const std::function<bool()>& done) {
        return test::run_until(io_context, done);
    }
};

TEST_F(WebSocketTransportTest, ExchangesTextFrames) {
    open();

    transport->send(R"({"type":"req","id":"1","method":"ping"})");
    ASSERT_TRUE(run_until([&] { return gateway->received.size() == 1; }));
    EXPECT_EQ(gateway->received[0], R"({"type":"req","id":"1","method":"ping"})");

    gateway->send(R"({"type":"res","id":"1","ok":true})");
    ASSERT_TRUE(run_until([&] { return messages.size() == 1; }));
    EXPECT_EQ(messages[0], R"({"type":"res","id":"1","ok":true})");
}

TEST_F(WebSocketTransportTest, CloseDuringLargeWriteFinishesCleanly) {
    open();

    transport->send(std::string(8 * 1024 * 1024, 'x'));
    transport->send("queued behind the large frame");
    transport->close(net::transport::normal_closure, "Client disconnect");
    EXPECT_FALSE(transport->is_open());

    ASSERT_TRUE(run_until([&] { return gateway->finished; }));
    test::run_for(io_context, milliseconds(50));

    // Local close never reports through on_close
    EXPECT_FALSE(closed.has_value());
    for (const auto& frame : gateway->received)
        EXPECT_NE(frame, "queued behind the large frame");
}

TEST_F(WebSocketTransportTest, RemoteCloseIsReported) {
    open();

    gateway->close();
    ASSERT_TRUE(run_until([&] { return closed.has_value(); }));
    ASSERT_TRUE(closed->has_value());
    EXPECT_NE((*closed)->find("closed by peer"), std::string::npos) << **closed;
    EXPECT_FALSE(transport->is_open());
}

TEST_F(WebSocketTransportTest, InvalidUrlFailsOpen) {
    std::optional<std::optional<std::string>> result;
    transport->async_open("http://127.0.0.1", [&](std::optional<std::string> error) { result = std::move(error); });

    ASSERT_TRUE(run_until([&] { return result.has_value(); }));
    ASSERT_TRUE(result->has_value());
    EXPECT_NE((*result)->find("invalid websocket url"), std::string::npos);
}
