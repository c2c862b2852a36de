#include <gwlink/rpc_client.hpp>

#include <gwlink/net/websocket_transport.hpp>
#include <gwlink/observer.hpp>

#include <fmt/core.h>

#include <utility>
#include <variant>

namespace gwlink
{

// ============================================================================
// Transport callbacks, forwarded while the client is alive
// ============================================================================

class rpc_client::client_transport_handler : public net::transport_handler
{
    std::weak_ptr<rpc_client> client_;

public:
    explicit client_transport_handler(std::weak_ptr<rpc_client> client)
      : client_(std::move(client))
    {
    }

    void on_message(std::string_view text) override
    {
        if (auto client = client_.lock())
            client->on_message(text);
    }

    void on_close(std::optional<std::string> error) override
    {
        if (auto client = client_.lock())
            client->on_close(std::move(error));
    }
};

rpc_client::rpc_client(boost::asio::io_context* io_context,
                       client_config config,
                       std::shared_ptr<net::transport> transport)
  : io_context_(io_context)
  , config_(std::move(config))
  , log_(config_.logger)
  , observer_(config_.observer)
  , transport_(std::move(transport))
  , pending_(io_context, log_)
  , router_(log_)
  , reconnect_(config_.reconnect)
  , connect_timer_(*io_context)
  , reconnect_timer_(*io_context)
{
    config_.validate();

    if (!transport_)
        transport_ = std::make_shared<net::websocket_transport>(io_context_);

    pending_.set_settle_hook([this](const std::string&, const pending_request& entry, const std::optional<gateway_error>& error) {
        if (!observer_)
            return;

        std::optional<error_kind> outcome;
        if (error)
            outcome = error->kind();

        observer_->on_request_settled(entry.method, outcome, std::chrono::steady_clock::now() - entry.sent_at, pending_.size());
    });
}

rpc_client::~rpc_client()
{
    connect_timer_.cancel();
    reconnect_timer_.cancel();
    transport_->close(net::transport::normal_closure, "Client destroyed");

    auto error = connection_closed_error();
    pending_.fail_all(error);
    resolve_waiters(error);
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void rpc_client::connect(connect_handler handler)
{
    if (status_ == connection_status::connected)
    {
        if (handler)
        {
            boost::asio::post(*io_context_, [handler = std::move(handler), log = log_] {
                try
                {
                    handler(std::nullopt);
                }
                catch (const std::exception& e)
                {
                    log.error("Exception in connect handler", Json::Value(e.what()));
                }
            });
        }
        return;
    }

    if (handler)
        connect_waiters_.push_back(std::move(handler));

    if (status_ == connection_status::connecting)
        return;

    start_attempt();
}

void rpc_client::disconnect()
{
    reconnect_timer_.cancel();
    reconnect_scheduled_ = false;
    connect_timer_.cancel();
    reconnecting_ = false;

    // Invalidates callbacks of the attempt in flight
    ++attempt_;
    handshake_id_.reset();

    auto previous = status_;
    transport_->close(net::transport::normal_closure, "Client disconnect");
    set_status(connection_status::disconnected);

    auto error = connection_closed_error();
    pending_.fail_all(error);
    resolve_waiters(error);

    if (previous != connection_status::disconnected)
        log_.info("Disconnected from gateway");
}

void rpc_client::install_transport_handler()
{
    if (handler_installed_)
        return;

    transport_->set_handler(std::make_unique<client_transport_handler>(weak_from_this()));
    handler_installed_ = true;
}

void rpc_client::start_attempt()
{
    install_transport_handler();

    handshake_id_.reset();
    auto attempt = ++attempt_;
    set_status(connection_status::connecting);

    Json::Value meta;
    meta["url"] = config_.gateway_url;
    log_.info("Connecting to gateway", meta);

    connect_timer_.expires_after(config_.connection_timeout);
    connect_timer_.async_wait([this, wptr = weak_from_this(), attempt](boost::system::error_code ec) {
        if (wptr.expired() || ec)
            return;

        if (attempt != attempt_ || status_ != connection_status::connecting)
            return;

        fail_attempt(handshake_error(fmt::format("Connection timeout after {}ms", config_.connection_timeout.count())));
    });

    transport_->async_open(config_.gateway_url, [this, wptr = weak_from_this(), attempt](std::optional<std::string> error) {
        if (wptr.expired())
            return;

        on_open(attempt, std::move(error));
    });
}

void rpc_client::on_open(uint64_t attempt, std::optional<std::string> error)
{
    if (attempt != attempt_ || status_ != connection_status::connecting)
        return;

    if (error)
        return fail_attempt(handshake_error(*error));

    log_.info("Transport open, awaiting challenge");
}

void rpc_client::on_close(std::optional<std::string> error)
{
    Json::Value meta;
    if (error)
        meta["error"] = *error;

    if (status_ == connection_status::connected)
    {
        set_status(connection_status::disconnected);
        log_.info("Connection to gateway lost", meta);

        pending_.fail_all(connection_closed_error());

        if (config_.reconnect.enabled)
            schedule_reconnect();
    }
    else if (status_ == connection_status::connecting)
    {
        fail_attempt(handshake_error(error.value_or("connection closed before authentication")));
    }
}

void rpc_client::fail_attempt(const gateway_error& error)
{
    connect_timer_.cancel();
    auto handshake_id = std::move(handshake_id_);
    handshake_id_.reset();

    transport_->close(net::transport::normal_closure, "Connection failed");

    // Before failing the handshake entry, so its handler sees a stale attempt.
    // A failed reconnect stays disconnected until the attempts run out.
    set_status(reconnecting_ ? connection_status::disconnected : connection_status::error);
    reconnecting_ = false;

    Json::Value meta;
    meta["url"] = config_.gateway_url;
    meta["error"] = error.what();
    log_.error("Failed to connect to gateway", meta);

    // Application calls need a connection, the handshake is the only entry
    if (handshake_id)
        pending_.fail(*handshake_id, error);
    resolve_waiters(error);
}

void rpc_client::resolve_waiters(const std::optional<gateway_error>& error)
{
    auto waiters = std::move(connect_waiters_);
    connect_waiters_.clear();

    for (auto& waiter : waiters)
    {
        try
        {
            waiter(error);
        }
        catch (const std::exception& e)
        {
            log_.error("Exception in connect handler", Json::Value(e.what()));
        }
    }
}

// ============================================================================
// Handshake
// ============================================================================

Json::Value rpc_client::handshake_params() const
{
    Json::Value params;
    params["minProtocol"] = config_.min_protocol;
    params["maxProtocol"] = config_.max_protocol;

    auto& client = params["client"];
    client["id"] = config_.identity.id;
    client["version"] = config_.identity.version;
    client["platform"] = config_.identity.platform;
    client["mode"] = config_.identity.mode;

    params["auth"]["token"] = config_.auth_token;
    return params;
}

void rpc_client::send_handshake()
{
    auto attempt = attempt_;
    std::string method(protocol::handshake_method);

    auto id = pending_.add(
        method,
        request_kind::handshake,
        config_.connection_timeout,
        [this, wptr = weak_from_this(), attempt](std::optional<gateway_error> error, Json::Value) {
            if (wptr.expired())
                return;

            if (attempt != attempt_ || status_ != connection_status::connecting)
                return;

            on_handshake_result(std::move(error));
        });

    handshake_id_ = id;

    protocol::request_frame req;
    req.id = std::move(id);
    req.method = method;
    req.params = handshake_params();
    transport_->send(protocol::encode(req));

    if (observer_)
        observer_->on_request_sent(method, pending_.size());
}

void rpc_client::on_handshake_result(std::optional<gateway_error> error)
{
    handshake_id_.reset();

    if (error)
    {
        if (error->kind() == error_kind::handshake_failed)
            return fail_attempt(*error);
        return fail_attempt(handshake_error(error->what()));
    }

    connect_timer_.cancel();
    reconnect_timer_.cancel();
    reconnect_scheduled_ = false;
    reconnect_.reset();
    reconnecting_ = false;

    set_status(connection_status::connected);

    Json::Value meta;
    meta["url"] = config_.gateway_url;
    log_.info("Connected to gateway", meta);

    resolve_waiters(std::nullopt);
}

// ============================================================================
// Reconnection
// ============================================================================

void rpc_client::schedule_reconnect()
{
    if (reconnect_scheduled_)
        return;

    if (reconnect_.exhausted())
    {
        Json::Value meta;
        meta["attempts"] = reconnect_.attempts();
        log_.error("Max reconnection attempts reached", meta);
        set_status(connection_status::error);
        return;
    }

    auto delay = reconnect_.next_delay();
    auto attempt = reconnect_.attempts() + 1;
    reconnect_scheduled_ = true;

    Json::Value meta;
    meta["attempt"] = attempt;
    meta["delayMs"] = static_cast<Json::Int64>(delay.count());
    log_.info("Scheduling reconnect", meta);

    if (observer_)
        observer_->on_reconnect_scheduled(attempt, delay);

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this, wptr = weak_from_this()](boost::system::error_code ec) {
        if (wptr.expired())
            return;

        if (ec)
        {
            if (ec != boost::asio::error::operation_aborted)
                log_.error("Reconnect timer failed", Json::Value(ec.message()));
            return;
        }

        reconnect_scheduled_ = false;
        reconnect_.record_attempt();
        reconnecting_ = status_ != connection_status::connecting;

        connect([this, wptr](std::optional<gateway_error> error) {
            if (wptr.expired() || !error)
                return;

            // disconnect() during the attempt
            if (error->kind() == error_kind::connection_closed)
                return;

            Json::Value meta;
            meta["attempt"] = reconnect_.attempts();
            meta["error"] = error->what();
            log_.warning("Reconnect attempt failed", meta);

            schedule_reconnect();
        });
    });
}

// ============================================================================
// Requests and inbound frames
// ============================================================================

void rpc_client::call(std::string method,
                      Json::Value params,
                      completion_handler<Json::Value> handler,
                      std::chrono::milliseconds timeout)
{
    if (status_ != connection_status::connected)
    {
        boost::asio::post(*io_context_, [handler = std::move(handler), log = log_] {
            if (!handler)
                return;
            try
            {
                handler(not_connected_error(), Json::Value{});
            }
            catch (const std::exception& e)
            {
                log.error("Exception in completion handler", Json::Value(e.what()));
            }
        });
        return;
    }

    protocol::request_frame req;
    req.method = method;
    if (!params.isNull())
        req.params = std::move(params);

    req.id = pending_.add(std::move(method), request_kind::application, timeout, std::move(handler));
    transport_->send(protocol::encode(req));

    if (observer_)
        observer_->on_request_sent(req.method, pending_.size());
}

subscription rpc_client::subscribe(std::string session_id, event_callback callback)
{
    return router_.subscribe(std::move(session_id), std::move(callback));
}

void rpc_client::on_message(std::string_view text)
{
    std::string error;
    auto frame = protocol::decode(text, error);

    if (auto* res = std::get_if<protocol::response_frame>(&frame))
        return on_response(std::move(*res));

    if (auto* evt = std::get_if<protocol::event_frame>(&frame))
        return on_event(std::move(*evt));

    if (std::holds_alternative<protocol::request_frame>(frame))
        error = "unexpected request frame from gateway";

    Json::Value meta;
    meta["error"] = error;
    log_.warning("Dropping inbound frame", meta);

    if (observer_)
        observer_->on_frame_dropped(error);
}

void rpc_client::on_response(protocol::response_frame&& res)
{
    if (pending_.complete(res))
        return;

    Json::Value meta;
    meta["id"] = res.id;
    log_.warning("Response for unknown request", meta);
}

void rpc_client::on_event(protocol::event_frame&& evt)
{
    if (evt.event == protocol::challenge_event)
    {
        if (status_ != connection_status::connecting)
            return;

        if (handshake_id_)
        {
            log_.warning("Ignoring repeated challenge");
            return;
        }

        send_handshake();
        return;
    }

    // Nothing but the challenge is meaningful before authentication
    if (status_ != connection_status::connected)
        return;

    auto event = make_session_event(evt);
    auto delivered = router_.dispatch(event);

    if (observer_)
        observer_->on_event_dispatched(event.type, delivered);
}

void rpc_client::set_status(connection_status status)
{
    if (status_ == status)
        return;

    auto previous = status_;
    status_ = status;

    if (observer_)
        observer_->on_status_change(previous, status);
}

} // namespace gwlink
