#pragma once

#include <gwlink/config.hpp>
#include <gwlink/error.hpp>
#include <gwlink/event_router.hpp>
#include <gwlink/net/transport.hpp>
#include <gwlink/rpc_client.hpp>

#include <boost/asio.hpp>
#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwlink
{

inline constexpr std::chrono::milliseconds ping_timeout{5000};
inline constexpr std::chrono::milliseconds connection_test_timeout{10000};

// ============================================================================
// Gateway Records
// ============================================================================

enum class session_status
{
    pending,
    running,
    completed,
    failed
};

const char* to_string(session_status status);

// Unknown strings are pending
session_status parse_session_status(std::string_view text);

struct session_info
{
    std::string id;
    session_status status{session_status::pending};
    int64_t created_at{0};
    std::optional<int64_t> completed_at;
};

struct send_task_options
{
    std::string prompt;
    std::optional<std::string> working_dir;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::optional<std::string> system_prompt;
    std::map<std::string, std::string> environment;
};

struct send_task_result
{
    std::string session_id;
};

struct history_message
{
    std::string role;
    std::string content;
    int64_t timestamp{0};
};

struct session_history
{
    std::string session_id;
    std::vector<history_message> messages;
};

struct stop_session_result
{
    bool success{false};
};

struct gateway_status
{
    std::string version;
    int64_t active_sessions{0};
    int64_t uptime{0};
};

struct ping_result
{
    bool pong{false};
    std::chrono::milliseconds latency{0};
};

// Payload readers, missing fields keep their defaults
session_info parse_session_info(const Json::Value& node);
std::vector<session_info> parse_session_list(const Json::Value& payload);
send_task_result parse_send_task_result(const Json::Value& payload);
session_history parse_session_history(const Json::Value& payload);
stop_session_result parse_stop_session_result(const Json::Value& payload);
gateway_status parse_gateway_status(const Json::Value& payload);

Json::Value make_send_task_params(const send_task_options& options);

// ============================================================================
// Gateway Client - named gateway operations over an rpc_client
// ============================================================================

class gateway_client
{
    std::shared_ptr<rpc_client> rpc_;

public:
    gateway_client(boost::asio::io_context* io_context,
                   client_config config,
                   std::shared_ptr<net::transport> transport = nullptr);

    explicit gateway_client(std::shared_ptr<rpc_client> rpc);

    void connect(connect_handler handler) { rpc_->connect(std::move(handler)); }
    void disconnect() { rpc_->disconnect(); }
    connection_status status() const { return rpc_->status(); }

    subscription subscribe(std::string session_id, event_callback callback)
    {
        return rpc_->subscribe(std::move(session_id), std::move(callback));
    }

    void call(std::string method,
              Json::Value params,
              completion_handler<Json::Value> handler,
              std::chrono::milliseconds timeout = default_request_timeout)
    {
        rpc_->call(std::move(method), std::move(params), std::move(handler), timeout);
    }

    void send_task(const send_task_options& options, completion_handler<send_task_result> handler);
    void resume_session(const std::string& session_id,
                        std::optional<std::string> prompt,
                        completion_handler<send_task_result> handler);
    void list_sessions(completion_handler<std::vector<session_info>> handler);
    void get_session_history(const std::string& session_id, completion_handler<session_history> handler);
    void stop_session(const std::string& session_id, completion_handler<stop_session_result> handler);
    void get_gateway_status(completion_handler<gateway_status> handler);

    // Round trip of a ping request, measured on the steady clock
    void ping(completion_handler<ping_result> handler);

    rpc_client& rpc() { return *rpc_; }
    const std::shared_ptr<rpc_client>& rpc_ptr() const { return rpc_; }
};

// ============================================================================
// Connectivity test
// ============================================================================

struct connection_test_options
{
    std::string gateway_url;
    std::string auth_token;
    std::chrono::milliseconds timeout{connection_test_timeout};
    logger_fn logger;
    std::shared_ptr<net::transport> transport;  // null selects WebSocket
};

struct connection_test_result
{
    bool success{false};
    std::optional<std::chrono::milliseconds> latency;
    std::optional<std::string> version;
    std::optional<std::string> error;
};

// Connects without reconnection, pings, reads the gateway version and
// always disconnects before reporting. Never fails through an exception.
void test_connection(boost::asio::io_context* io_context,
                     connection_test_options options,
                     std::function<void(connection_test_result)> handler);

} // namespace gwlink
