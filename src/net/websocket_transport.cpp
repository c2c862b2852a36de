#include <gwlink/net/websocket_transport.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <fmt/core.h>

#include <deque>
#include <iterator>
#include <type_traits>

namespace gwlink::net
{

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

std::optional<url_parts> parse_websocket_url(std::string_view url)
{
    url_parts parts;

    if (url.rfind("ws://", 0) == 0)
    {
        url.remove_prefix(5);
    }
    else if (url.rfind("wss://", 0) == 0)
    {
        parts.secure = true;
        url.remove_prefix(6);
    }
    else
    {
        return {};
    }

    auto target_pos = url.find_first_of("/?");
    auto authority = url.substr(0, target_pos);
    if (target_pos == std::string_view::npos)
        parts.target = "/";
    else if (url[target_pos] == '?')
        parts.target = "/" + std::string(url.substr(target_pos));
    else
        parts.target = std::string(url.substr(target_pos));

    // Bracketed IPv6 literal
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            return {};
        parts.host = std::string(authority.substr(1, close - 1));
        authority.remove_prefix(close + 1);
        if (!authority.empty())
        {
            if (authority.front() != ':')
                return {};
            parts.port = std::string(authority.substr(1));
        }
    }
    else
    {
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos)
        {
            parts.host = std::string(authority);
        }
        else
        {
            parts.host = std::string(authority.substr(0, colon));
            parts.port = std::string(authority.substr(colon + 1));
        }
    }

    if (parts.host.empty())
        return {};

    if (parts.port.empty())
        parts.port = parts.secure ? "443" : "80";

    for (char c : parts.port)
    {
        if (c < '0' || c > '9')
            return {};
    }

    return parts;
}

// ============================================================================
// Connection - one socket, created per async_open
// ============================================================================

class connection_base
{
public:
    virtual ~connection_base() = default;
    virtual void open(transport::open_handler handler) = 0;
    virtual void send(std::string text) = 0;
    virtual void close(uint16_t code, std::string_view reason) = 0;
    virtual bool is_open() const = 0;
};

namespace
{

template<bool Secure>
class ws_connection : public connection_base, public std::enable_shared_from_this<ws_connection<Secure>>
{
    using next_layer = std::conditional_t<Secure, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
    using stream_type = websocket::stream<next_layer>;

    tcp::resolver resolver_;
    std::unique_ptr<stream_type> ws_;
    url_parts url_;
    std::weak_ptr<transport_handler> handler_;
    transport::open_handler open_handler_;
    beast::flat_buffer read_buf_;
    std::deque<std::string> write_queue_;
    bool writing_{false};
    bool open_{false};
    bool closed_{false};

public:
    ws_connection(boost::asio::io_context* io_context,
                  ssl::context& ssl_context,
                  url_parts url,
                  std::weak_ptr<transport_handler> handler)
      : resolver_(*io_context)
      , url_(std::move(url))
      , handler_(std::move(handler))
    {
        if constexpr (Secure)
            ws_ = std::make_unique<stream_type>(*io_context, ssl_context);
        else
            ws_ = std::make_unique<stream_type>(*io_context);
    }

    void open(transport::open_handler handler) override
    {
        open_handler_ = std::move(handler);

        resolver_.async_resolve(
            url_.host,
            url_.port,
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            });
    }

    void send(std::string text) override
    {
        if (!open_ || closed_)
            return;

        write_queue_.push_back(std::move(text));
        if (!writing_)
            do_write();
    }

    void close(uint16_t code, std::string_view reason) override
    {
        if (closed_)
            return;

        closed_ = true;
        open_handler_ = {};

        boost::system::error_code ignored;
        resolver_.cancel();

        if (!open_)
        {
            beast::get_lowest_layer(*ws_).socket().close(ignored);
            return;
        }

        open_ = false;
        drop_queued_writes();

        ws_->async_close(
            websocket::close_reason(static_cast<websocket::close_code>(code), std::string(reason)),
            [self = this->shared_from_this()](beast::error_code) {
                boost::system::error_code ec;
                beast::get_lowest_layer(*self->ws_).socket().close(ec);
            });
    }

    bool is_open() const override
    {
        return open_ && !closed_;
    }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (closed_)
            return;

        if (ec)
            return fail_open(fmt::format("resolve {}: {}", url_.host, ec.message()));

        beast::get_lowest_layer(*ws_).async_connect(
            results,
            [self = this->shared_from_this()](beast::error_code ec, tcp::endpoint) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec)
    {
        if (closed_)
            return;

        if (ec)
            return fail_open(fmt::format("connect {}:{}: {}", url_.host, url_.port, ec.message()));

        if constexpr (Secure)
        {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url_.host.c_str()))
            {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
                return fail_open(fmt::format("tls sni: {}", sni_ec.message()));
            }

            ws_->next_layer().async_handshake(
                ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec) {
                    if (self->closed_)
                        return;
                    if (ec)
                        return self->fail_open(fmt::format("tls handshake: {}", ec.message()));
                    self->do_ws_handshake();
                });
        }
        else
        {
            do_ws_handshake();
        }
    }

    void do_ws_handshake()
    {
        // websocket::stream has its own timeouts once the upgrade starts
        beast::get_lowest_layer(*ws_).expires_never();
        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "gwlink");
        }));

        auto host = url_.host + ":" + url_.port;
        ws_->async_handshake(
            host,
            url_.target,
            [self = this->shared_from_this()](beast::error_code ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(beast::error_code ec)
    {
        if (closed_)
            return;

        if (ec)
            return fail_open(fmt::format("websocket upgrade: {}", ec.message()));

        ws_->text(true);
        open_ = true;

        auto handler = std::move(open_handler_);
        open_handler_ = {};
        if (handler)
            handler(std::nullopt);

        if (!closed_)
            do_read();
    }

    void fail_open(std::string error)
    {
        closed_ = true;
        boost::system::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);

        auto handler = std::move(open_handler_);
        open_handler_ = {};
        if (handler)
            handler(std::move(error));
    }

    void do_read()
    {
        ws_->async_read(
            read_buf_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec)
    {
        if (closed_)
            return;

        if (ec)
        {
            if (ec == websocket::error::closed)
            {
                auto reason = ws_->reason();
                return fail_connection(fmt::format("closed by peer ({}) {}", reason.code, std::string(reason.reason.c_str())));
            }
            return fail_connection(ec.message());
        }

        auto text = beast::buffers_to_string(read_buf_.data());
        read_buf_.consume(read_buf_.size());

        if (auto handler = handler_.lock())
            handler->on_message(text);

        if (!closed_)
            do_read();
    }

    void do_write()
    {
        writing_ = true;
        ws_->async_write(
            boost::asio::buffer(write_queue_.front()),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec)
    {
        writing_ = false;

        if (closed_)
        {
            write_queue_.clear();
            return;
        }

        if (ec)
            return fail_connection(fmt::format("write: {}", ec.message()));

        write_queue_.pop_front();
        if (!write_queue_.empty())
            do_write();
    }

    // The frame being written stays alive until on_write runs
    void drop_queued_writes()
    {
        if (writing_ && !write_queue_.empty())
            write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
        else
            write_queue_.clear();
    }

    void fail_connection(std::string error)
    {
        closed_ = true;
        open_ = false;
        drop_queued_writes();

        boost::system::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);

        if (auto handler = handler_.lock())
            handler->on_close(std::move(error));
    }
};

} // namespace

// ============================================================================
// websocket_transport
// ============================================================================

websocket_transport::websocket_transport(boost::asio::io_context* io_context)
  : io_context_(io_context)
  , ssl_context_(ssl::context::tls_client)
{
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
}

websocket_transport::~websocket_transport()
{
    if (connection_)
        connection_->close(normal_closure, "transport destroyed");
}

void websocket_transport::set_handler(std::unique_ptr<transport_handler> handler)
{
    handler_ = std::shared_ptr<transport_handler>(std::move(handler));
}

void websocket_transport::async_open(const std::string& url, open_handler handler)
{
    if (connection_)
    {
        connection_->close(normal_closure, "reopening");
        connection_.reset();
    }

    auto parts = parse_websocket_url(url);
    if (!parts)
    {
        boost::asio::post(*io_context_, [handler = std::move(handler), url] {
            handler(fmt::format("invalid websocket url '{}'", url));
        });
        return;
    }

    if (parts->secure)
        connection_ = std::make_shared<ws_connection<true>>(io_context_, ssl_context_, std::move(*parts), handler_);
    else
        connection_ = std::make_shared<ws_connection<false>>(io_context_, ssl_context_, std::move(*parts), handler_);

    connection_->open(std::move(handler));
}

void websocket_transport::send(std::string text)
{
    if (connection_)
        connection_->send(std::move(text));
}

void websocket_transport::close(uint16_t code, std::string_view reason)
{
    if (connection_)
    {
        connection_->close(code, reason);
        connection_.reset();
    }
}

bool websocket_transport::is_open() const
{
    return connection_ && connection_->is_open();
}

} // namespace gwlink::net
