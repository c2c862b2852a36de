#pragma once

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gwlink::protocol
{

// ============================================================================
// Wire Frames
// ============================================================================
//
//   {"type":"req","id":"7","method":"ping","params":{}}
//   {"type":"res","id":"7","ok":true,"payload":{...}}
//   {"type":"res","id":"7","ok":false,"error":{"code":"E","message":"..."}}
//   {"type":"event","event":"session.progress","payload":{...},"seq":12}
//

struct request_frame
{
    std::string id;
    std::string method;
    std::optional<Json::Value> params;  // omitted from the wire when empty
};

struct remote_error
{
    std::string code;
    std::string message;
    std::optional<Json::Value> data;
};

struct response_frame
{
    std::string id;
    bool ok{false};
    std::optional<Json::Value> payload;
    std::optional<remote_error> error;
};

struct event_frame
{
    std::string event;
    std::optional<Json::Value> payload;
    std::optional<int64_t> seq;
};

using frame = std::variant<std::monostate, request_frame, response_frame, event_frame>;

inline constexpr std::string_view challenge_event{"connect.challenge"};
inline constexpr std::string_view handshake_method{"connect"};

std::string encode(const request_frame& req);
std::string encode(const response_frame& res);
std::string encode(const event_frame& evt);

// Never throws. On malformed input returns std::monostate and fills error.
frame decode(std::string_view text, std::string& error);

} // namespace gwlink::protocol
