#include <gwlink/event_router.hpp>

#include <chrono>
#include <utility>
#include <vector>

namespace gwlink
{

struct subscription::registry
{
    std::unordered_map<std::string, std::map<uint64_t, event_callback>> sessions;
    uint64_t next_token{0};
};

const char* to_string(event_type type)
{
    switch (type)
    {
        case event_type::progress:
            return "progress";
        case event_type::tool_call:
            return "tool_call";
        case event_type::thinking:
            return "thinking";
        case event_type::complete:
            return "complete";
        case event_type::error:
            return "error";
        case event_type::output:
            return "output";
    }
    return "progress";
}

event_type map_event_type(std::string_view event_name)
{
    if (event_name == "session.progress")
        return event_type::progress;
    if (event_name == "session.tool_call")
        return event_type::tool_call;
    if (event_name == "session.thinking")
        return event_type::thinking;
    if (event_name == "session.complete")
        return event_type::complete;
    if (event_name == "session.error")
        return event_type::error;
    if (event_name == "session.output")
        return event_type::output;
    return event_type::progress;
}

session_event make_session_event(const protocol::event_frame& evt)
{
    session_event event;
    event.type = map_event_type(evt.event);
    event.data = evt.payload.value_or(Json::Value{});
    event.seq = evt.seq;
    event.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();

    const auto& data = event.data;
    if (data.isObject())
    {
        if (data["sessionId"].isString())
            event.session_id = data["sessionId"].asString();
        else if (data["session_id"].isString())
            event.session_id = data["session_id"].asString();
    }

    return event;
}

// ============================================================================
// subscription
// ============================================================================

void subscription::unsubscribe()
{
    auto reg = registry_.lock();
    registry_.reset();
    if (!reg)
        return;

    auto it = reg->sessions.find(session_id_);
    if (it == reg->sessions.end())
        return;

    it->second.erase(token_);
    if (it->second.empty())
        reg->sessions.erase(it);
}

bool subscription::active() const
{
    auto reg = registry_.lock();
    if (!reg)
        return false;

    auto it = reg->sessions.find(session_id_);
    return it != reg->sessions.end() && it->second.count(token_) > 0;
}

// ============================================================================
// event_router
// ============================================================================

event_router::event_router(logger log)
  : registry_(std::make_shared<subscription::registry>())
  , log_(std::move(log))
{
}

subscription event_router::subscribe(std::string session_id, event_callback callback)
{
    auto token = ++registry_->next_token;
    registry_->sessions[session_id].emplace(token, std::move(callback));
    return subscription(registry_, std::move(session_id), token);
}

size_t event_router::dispatch(const session_event& event) const
{
    // Snapshot the keys, callbacks may subscribe or unsubscribe while we deliver
    std::vector<std::pair<std::string, uint64_t>> targets;

    auto collect = [&](const std::string& key) {
        auto it = registry_->sessions.find(key);
        if (it == registry_->sessions.end())
            return;
        for (const auto& [token, callback] : it->second)
            targets.emplace_back(key, token);
    };

    if (!event.session_id.empty() && event.session_id != wildcard_session)
        collect(event.session_id);
    collect(std::string(wildcard_session));

    size_t delivered = 0;
    for (const auto& [key, token] : targets)
    {
        auto session_it = registry_->sessions.find(key);
        if (session_it == registry_->sessions.end())
            continue;

        auto callback_it = session_it->second.find(token);
        if (callback_it == session_it->second.end())
            continue;

        // Copy, the callback may unsubscribe itself
        auto callback = callback_it->second;
        ++delivered;

        try
        {
            callback(event);
        }
        catch (const std::exception& e)
        {
            Json::Value meta;
            meta["sessionId"] = event.session_id;
            meta["subscription"] = key;
            meta["error"] = e.what();
            log_.error(key == wildcard_session ? "Wildcard event handler error" : "Event handler error", meta);
        }
        catch (...)
        {
            Json::Value meta;
            meta["sessionId"] = event.session_id;
            meta["subscription"] = key;
            log_.error("Unknown exception in event handler", meta);
        }
    }

    return delivered;
}

size_t event_router::subscriber_count(const std::string& session_id) const
{
    auto it = registry_->sessions.find(session_id);
    return it == registry_->sessions.end() ? 0 : it->second.size();
}

size_t event_router::session_count() const
{
    return registry_->sessions.size();
}

} // namespace gwlink
