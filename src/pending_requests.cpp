#include <gwlink/pending_requests.hpp>

#include <fmt/core.h>

namespace gwlink
{

pending_request_table::pending_request_table(boost::asio::io_context* io_context, logger log)
  : log_(std::move(log))
{
    entries_ = std::make_shared<net::expirator<std::string, pending_request>>(
        io_context,
        [this](std::string id, pending_request entry) {
            auto error = timeout_error(entry.method, entry.timeout);

            Json::Value meta;
            meta["id"] = id;
            meta["method"] = entry.method;
            log_.warning(error.what(), meta);

            settle(id, entry, std::move(error), Json::Value{});
        });
}

pending_request_table::~pending_request_table()
{
    // The expirator may outlive us through its timer handler
    entries_->stop();
}

std::string pending_request_table::add(std::string method,
                                       request_kind kind,
                                       std::chrono::milliseconds timeout,
                                       completion_handler<Json::Value> handler)
{
    auto id = std::to_string(++last_id_);

    pending_request entry;
    entry.method = std::move(method);
    entry.kind = kind;
    entry.timeout = timeout;
    entry.sent_at = std::chrono::steady_clock::now();
    entry.handler = std::move(handler);

    entries_->add(id, timeout, std::move(entry));
    return id;
}

std::optional<request_kind> pending_request_table::complete(const protocol::response_frame& res)
{
    auto entry = entries_->take(res.id);
    if (!entry)
        return {};

    auto kind = entry->kind;

    if (res.ok)
    {
        settle(res.id, *entry, std::nullopt, res.payload.value_or(Json::Value{}));
        return kind;
    }

    std::string message = "Request failed";
    std::string code;
    Json::Value data;
    if (res.error)
    {
        if (!res.error->message.empty())
            message = res.error->message;
        code = res.error->code;
        data = res.error->data.value_or(Json::Value{});
    }

    settle(res.id, *entry, gateway_error(error_kind::remote_error, message, std::move(code), std::move(data)), Json::Value{});
    return kind;
}

bool pending_request_table::fail(const std::string& id, const gateway_error& error)
{
    auto entry = entries_->take(id);
    if (!entry)
        return false;

    settle(id, *entry, error, Json::Value{});
    return true;
}

size_t pending_request_table::fail_all(const gateway_error& error)
{
    // Drained before any handler runs, a handler may issue new requests
    auto drained = entries_->drain();
    for (auto& [id, entry] : drained)
        settle(id, entry, error, Json::Value{});
    return drained.size();
}

void pending_request_table::settle(const std::string& id,
                                   pending_request& entry,
                                   std::optional<gateway_error> error,
                                   Json::Value payload)
{
    if (settle_hook_)
        settle_hook_(id, entry, error);

    if (!entry.handler)
        return;

    try
    {
        entry.handler(std::move(error), std::move(payload));
    }
    catch (const std::exception& e)
    {
        Json::Value meta;
        meta["id"] = id;
        meta["method"] = entry.method;
        meta["error"] = e.what();
        log_.error("Exception in completion handler", meta);
    }
}

} // namespace gwlink
