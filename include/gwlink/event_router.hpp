#pragma once

#include <gwlink/logger.hpp>
#include <gwlink/protocol/frame.hpp>

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gwlink
{

enum class event_type
{
    progress,
    tool_call,
    thinking,
    complete,
    error,
    output
};

const char* to_string(event_type type);

// Total: unknown names are progress
event_type map_event_type(std::string_view event_name);

struct session_event
{
    event_type type{event_type::progress};
    std::string session_id;
    Json::Value data;
    int64_t timestamp{0};  // ms since epoch, stamped on receipt
    std::optional<int64_t> seq;
};

// Reads payload.sessionId (or payload.session_id); empty when absent
session_event make_session_event(const protocol::event_frame& evt);

using event_callback = std::function<void(const session_event&)>;

inline constexpr std::string_view wildcard_session{"*"};

class event_router;

// ============================================================================
// Subscription handle
// ============================================================================

class subscription
{
    friend class event_router;

    struct registry;

    std::weak_ptr<registry> registry_;
    std::string session_id_;
    uint64_t token_{0};

    subscription(std::weak_ptr<registry> reg, std::string session_id, uint64_t token)
      : registry_(std::move(reg))
      , session_id_(std::move(session_id))
      , token_(token)
    {
    }

public:
    subscription() = default;

    // Idempotent; harmless after the router is gone
    void unsubscribe();

    bool active() const;
    const std::string& session_id() const { return session_id_; }
};

// ============================================================================
// Event Router
// ============================================================================

class event_router
{
    std::shared_ptr<subscription::registry> registry_;
    logger log_;

public:
    explicit event_router(logger log = {});

    subscription subscribe(std::string session_id, event_callback callback);

    // Exact-session subscribers, then wildcard subscribers. Returns the
    // number of callbacks invoked.
    size_t dispatch(const session_event& event) const;

    size_t subscriber_count(const std::string& session_id) const;
    size_t session_count() const;
};

} // namespace gwlink
