#pragma once

#include <gwlink/config.hpp>
#include <gwlink/connection_status.hpp>
#include <gwlink/error.hpp>
#include <gwlink/event_router.hpp>
#include <gwlink/logger.hpp>
#include <gwlink/net/transport.hpp>
#include <gwlink/pending_requests.hpp>
#include <gwlink/protocol/frame.hpp>
#include <gwlink/reconnect_policy.hpp>

#include <boost/asio.hpp>
#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwlink
{

class client_observer;

inline constexpr std::chrono::milliseconds default_request_timeout{30000};

// ============================================================================
// RPC Client - one authenticated gateway connection
// ============================================================================
//
// Must be owned by a std::shared_ptr and driven from its io_context.
//
//   disconnected -> connecting -> connected
//                        |            |
//                        +-> error <--+  (rejected/timed out, or reconnect exhausted)
//
class rpc_client : public std::enable_shared_from_this<rpc_client>
{
    class client_transport_handler;

    boost::asio::io_context* io_context_;
    client_config config_;
    logger log_;
    std::shared_ptr<client_observer> observer_;
    std::shared_ptr<net::transport> transport_;

    pending_request_table pending_;
    event_router router_;
    reconnect_policy reconnect_;

    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer reconnect_timer_;

    connection_status status_{connection_status::disconnected};
    std::vector<connect_handler> connect_waiters_;
    std::optional<std::string> handshake_id_;
    uint64_t attempt_{0};
    bool handler_installed_{false};
    bool reconnect_scheduled_{false};
    // Set while an attempt started by the reconnect timer is in flight
    bool reconnecting_{false};

public:
    // Throws std::invalid_argument for an invalid config. A null transport
    // selects the Boost.Beast WebSocket transport.
    rpc_client(boost::asio::io_context* io_context,
               client_config config,
               std::shared_ptr<net::transport> transport = nullptr);

    rpc_client(const rpc_client&) = delete;
    rpc_client& operator=(const rpc_client&) = delete;
    rpc_client(rpc_client&&) = delete;
    rpc_client& operator=(rpc_client&&) = delete;
    ~rpc_client();

    // Completes once the handshake succeeds or fails. Joins an attempt
    // already in flight.
    void connect(connect_handler handler);

    void disconnect();

    connection_status status() const { return status_; }

    void call(std::string method,
              Json::Value params,
              completion_handler<Json::Value> handler,
              std::chrono::milliseconds timeout = default_request_timeout);

    // Use wildcard_session to receive every event
    subscription subscribe(std::string session_id, event_callback callback);

    const client_config& config() const { return config_; }
    boost::asio::io_context* io_context() const { return io_context_; }

    size_t pending_count() const { return pending_.size(); }
    uint32_t reconnect_attempts() const { return reconnect_.attempts(); }
    bool reconnect_scheduled() const { return reconnect_scheduled_; }

private:
    void install_transport_handler();
    void start_attempt();
    void on_open(uint64_t attempt, std::optional<std::string> error);
    void on_message(std::string_view text);
    void on_close(std::optional<std::string> error);

    void on_event(protocol::event_frame&& evt);
    void on_response(protocol::response_frame&& res);

    void send_handshake();
    void on_handshake_result(std::optional<gateway_error> error);

    void fail_attempt(const gateway_error& error);
    void resolve_waiters(const std::optional<gateway_error>& error);
    void schedule_reconnect();

    void set_status(connection_status status);
    Json::Value handshake_params() const;
};

} // namespace gwlink
