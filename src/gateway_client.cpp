#include <gwlink/gateway_client.hpp>

#include <fmt/core.h>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace gwlink
{

namespace
{
std::string read_string(const Json::Value& node, const char* key)
{
    if (!node.isObject() || !node[key].isString())
        return {};
    return node[key].asString();
}

std::optional<int64_t> read_int(const Json::Value& node, const char* key)
{
    if (!node.isObject())
        return {};

    // Out of range values read as absent
    const auto& value = node[key];
    if (value.isInt64())
        return value.asInt64();
    if (value.isDouble())
    {
        auto number = value.asDouble();
        if (std::isfinite(number) && number >= -9.2e18 && number <= 9.2e18)
            return static_cast<int64_t>(number);
    }
    return {};
}

// The gateway answers in camelCase, older builds in snake_case
std::string read_session_id(const Json::Value& node)
{
    auto id = read_string(node, "sessionId");
    return id.empty() ? read_string(node, "session_id") : id;
}

// A payload the parser cannot read completes the call with a remote_error
template<typename T, typename Parser>
completion_handler<Json::Value> parse_with(std::string_view method, completion_handler<T> handler, Parser parse)
{
    return [method = std::string(method), handler = std::move(handler), parse](std::optional<gateway_error> error,
                                                                               Json::Value payload) {
        if (!handler)
            return;

        if (error)
            return handler(std::move(error), T{});

        T result;
        try
        {
            result = parse(payload);
        }
        catch (const Json::Exception& e)
        {
            return handler(gateway_error(error_kind::remote_error,
                                         fmt::format("Invalid '{}' payload: {}", method, e.what()),
                                         "INVALID_PAYLOAD",
                                         payload),
                           T{});
        }

        handler(std::nullopt, std::move(result));
    };
}
} // namespace

// ============================================================================
// Records
// ============================================================================

const char* to_string(session_status status)
{
    switch (status)
    {
        case session_status::pending:
            return "pending";
        case session_status::running:
            return "running";
        case session_status::completed:
            return "completed";
        case session_status::failed:
            return "failed";
    }
    return "pending";
}

session_status parse_session_status(std::string_view text)
{
    if (text == "running")
        return session_status::running;
    if (text == "completed")
        return session_status::completed;
    if (text == "failed")
        return session_status::failed;
    return session_status::pending;
}

session_info parse_session_info(const Json::Value& node)
{
    session_info info;
    info.id = read_string(node, "id");
    info.status = parse_session_status(read_string(node, "status"));
    info.created_at = read_int(node, "createdAt").value_or(0);
    info.completed_at = read_int(node, "completedAt");
    return info;
}

std::vector<session_info> parse_session_list(const Json::Value& payload)
{
    const Json::Value* list = &payload;
    if (payload.isObject() && payload["sessions"].isArray())
        list = &payload["sessions"];

    std::vector<session_info> sessions;
    if (!list->isArray())
        return sessions;

    sessions.reserve(list->size());
    for (const auto& node : *list)
        sessions.push_back(parse_session_info(node));
    return sessions;
}

send_task_result parse_send_task_result(const Json::Value& payload)
{
    return send_task_result{read_session_id(payload)};
}

session_history parse_session_history(const Json::Value& payload)
{
    session_history history;
    history.session_id = read_session_id(payload);

    if (!payload.isObject() || !payload["messages"].isArray())
        return history;

    for (const auto& node : payload["messages"])
    {
        history_message message;
        message.role = read_string(node, "role");
        message.content = read_string(node, "content");
        message.timestamp = read_int(node, "timestamp").value_or(0);
        history.messages.push_back(std::move(message));
    }
    return history;
}

stop_session_result parse_stop_session_result(const Json::Value& payload)
{
    stop_session_result result;
    if (payload.isObject() && payload["success"].isBool())
        result.success = payload["success"].asBool();
    return result;
}

gateway_status parse_gateway_status(const Json::Value& payload)
{
    gateway_status status;
    status.version = read_string(payload, "version");
    status.active_sessions = read_int(payload, "activeSessions").value_or(0);
    status.uptime = read_int(payload, "uptime").value_or(0);
    return status;
}

Json::Value make_send_task_params(const send_task_options& options)
{
    Json::Value params(Json::objectValue);
    params["prompt"] = options.prompt;

    if (options.working_dir)
        params["working_dir"] = *options.working_dir;
    if (options.model)
        params["model"] = *options.model;
    if (options.max_turns)
        params["max_turns"] = *options.max_turns;
    if (options.system_prompt)
        params["system_prompt"] = *options.system_prompt;

    if (!options.environment.empty())
    {
        auto& env = params["environment"];
        for (const auto& [key, value] : options.environment)
            env[key] = value;
    }

    return params;
}

// ============================================================================
// gateway_client
// ============================================================================

gateway_client::gateway_client(boost::asio::io_context* io_context,
                               client_config config,
                               std::shared_ptr<net::transport> transport)
  : rpc_(std::make_shared<rpc_client>(io_context, std::move(config), std::move(transport)))
{
}

gateway_client::gateway_client(std::shared_ptr<rpc_client> rpc)
  : rpc_(std::move(rpc))
{
    if (!rpc_)
        throw std::invalid_argument("gateway_client: rpc client cannot be null");
}

void gateway_client::send_task(const send_task_options& options, completion_handler<send_task_result> handler)
{
    rpc_->call("sessions_send",
               make_send_task_params(options),
               parse_with("sessions_send", std::move(handler), parse_send_task_result));
}

void gateway_client::resume_session(const std::string& session_id,
                                    std::optional<std::string> prompt,
                                    completion_handler<send_task_result> handler)
{
    Json::Value params;
    params["session_id"] = session_id;
    if (prompt)
        params["prompt"] = *prompt;

    rpc_->call("sessions_resume",
               std::move(params),
               parse_with("sessions_resume", std::move(handler), parse_send_task_result));
}

void gateway_client::list_sessions(completion_handler<std::vector<session_info>> handler)
{
    rpc_->call("sessions_list",
               Json::Value(Json::objectValue),
               parse_with("sessions_list", std::move(handler), parse_session_list));
}

void gateway_client::get_session_history(const std::string& session_id, completion_handler<session_history> handler)
{
    Json::Value params;
    params["session_id"] = session_id;
    rpc_->call("sessions_history",
               std::move(params),
               parse_with("sessions_history", std::move(handler), parse_session_history));
}

void gateway_client::stop_session(const std::string& session_id, completion_handler<stop_session_result> handler)
{
    Json::Value params;
    params["session_id"] = session_id;
    rpc_->call("sessions_stop",
               std::move(params),
               parse_with("sessions_stop", std::move(handler), parse_stop_session_result));
}

void gateway_client::get_gateway_status(completion_handler<gateway_status> handler)
{
    rpc_->call("status",
               Json::Value(Json::objectValue),
               parse_with("status", std::move(handler), parse_gateway_status));
}

void gateway_client::ping(completion_handler<ping_result> handler)
{
    auto start = std::chrono::steady_clock::now();

    rpc_->call(
        "ping",
        Json::Value(Json::objectValue),
        [handler = std::move(handler), start](std::optional<gateway_error> error, Json::Value) {
            if (!handler)
                return;

            if (error)
                return handler(std::move(error), ping_result{});

            ping_result result;
            result.pong = true;
            result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            handler(std::nullopt, result);
        },
        ping_timeout);
}

// ============================================================================
// test_connection
// ============================================================================

namespace
{
void finish_test(const std::shared_ptr<gateway_client>& client,
                 const std::function<void(connection_test_result)>& handler,
                 connection_test_result result)
{
    client->disconnect();
    if (handler)
        handler(std::move(result));
}

connection_test_result failed_test(const gateway_error& error)
{
    connection_test_result result;
    result.error = error.what();
    return result;
}
} // namespace

void test_connection(boost::asio::io_context* io_context,
                     connection_test_options options,
                     std::function<void(connection_test_result)> handler)
{
    client_config config;
    config.gateway_url = std::move(options.gateway_url);
    config.auth_token = std::move(options.auth_token);
    config.connection_timeout = options.timeout;
    config.reconnect.enabled = false;
    config.logger = std::move(options.logger);

    std::shared_ptr<gateway_client> client;
    try
    {
        client = std::make_shared<gateway_client>(io_context, std::move(config), std::move(options.transport));
    }
    catch (const std::invalid_argument& e)
    {
        connection_test_result result;
        result.error = e.what();
        boost::asio::post(*io_context, [handler = std::move(handler), result = std::move(result)] {
            if (handler)
                handler(result);
        });
        return;
    }

    client->connect([client, handler](std::optional<gateway_error> error) {
        if (error)
            return finish_test(client, handler, failed_test(*error));

        client->ping([client, handler](std::optional<gateway_error> error, ping_result pong) {
            if (error)
                return finish_test(client, handler, failed_test(*error));

            client->get_gateway_status([client, handler, pong](std::optional<gateway_error> error, gateway_status status) {
                if (error)
                    return finish_test(client, handler, failed_test(*error));

                connection_test_result result;
                result.success = true;
                result.latency = pong.latency;
                result.version = status.version;
                finish_test(client, handler, std::move(result));
            });
        });
    });
}

} // namespace gwlink
