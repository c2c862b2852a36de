#pragma once

#include <json/json.h>

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gwlink
{

enum class error_kind
{
    not_connected,
    timeout,
    remote_error,
    connection_closed,
    handshake_failed
};

const char* to_string(error_kind kind);

// ============================================================================
// Gateway Error
// ============================================================================

class gateway_error : public std::runtime_error
{
    error_kind kind_;
    std::string remote_code_;
    Json::Value data_;

  public:
    gateway_error(error_kind kind,
                  const std::string& message,
                  std::string remote_code = {},
                  Json::Value data = Json::Value{})
      : std::runtime_error(message)
      , kind_(kind)
      , remote_code_(std::move(remote_code))
      , data_(std::move(data))
    {
    }

    error_kind kind() const { return kind_; }

    // Only set for remote_error
    const std::string& remote_code() const { return remote_code_; }
    const Json::Value& data() const { return data_; }
};

gateway_error not_connected_error();
gateway_error timeout_error(std::string_view method, std::chrono::milliseconds timeout);
gateway_error connection_closed_error(std::string_view reason = "Connection closed");
gateway_error handshake_error(std::string_view reason);

// Every asynchronous operation completes exactly once through one of these
template<typename T>
using completion_handler = std::function<void(std::optional<gateway_error>, T)>;

using connect_handler = std::function<void(std::optional<gateway_error>)>;

} // namespace gwlink
