#pragma once

#include <gwlink/net/transport.hpp>

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gwlink::net
{

struct url_parts
{
    bool secure{false};
    std::string host;
    std::string port;
    std::string target;  // path plus query, at least "/"
};

// ws://host[:port][/path][?query] and wss://...
std::optional<url_parts> parse_websocket_url(std::string_view url);

class connection_base;

// ============================================================================
// WebSocket Transport (Boost.Beast, plain TCP or TLS)
// ============================================================================

class websocket_transport : public transport
{
    boost::asio::io_context* io_context_;
    boost::asio::ssl::context ssl_context_;
    std::shared_ptr<transport_handler> handler_;
    std::shared_ptr<connection_base> connection_;

public:
    explicit websocket_transport(boost::asio::io_context* io_context);

    websocket_transport(const websocket_transport&) = delete;
    websocket_transport& operator=(const websocket_transport&) = delete;
    websocket_transport(websocket_transport&&) = delete;
    websocket_transport& operator=(websocket_transport&&) = delete;
    ~websocket_transport() override;

    void set_handler(std::unique_ptr<transport_handler> handler) override;
    void async_open(const std::string& url, open_handler handler) override;
    void send(std::string text) override;
    void close(uint16_t code, std::string_view reason) override;
    bool is_open() const override;

    boost::asio::ssl::context& ssl_context() { return ssl_context_; }
};

} // namespace gwlink::net
