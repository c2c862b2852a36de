#include <gwlink/error.hpp>

#include <fmt/core.h>

namespace gwlink
{

const char* to_string(error_kind kind)
{
    switch (kind)
    {
        case error_kind::not_connected:
            return "not_connected";
        case error_kind::timeout:
            return "timeout";
        case error_kind::remote_error:
            return "remote_error";
        case error_kind::connection_closed:
            return "connection_closed";
        case error_kind::handshake_failed:
            return "handshake_failed";
    }
    return "unknown";
}

gateway_error not_connected_error()
{
    return gateway_error(error_kind::not_connected, "Not connected to gateway");
}

gateway_error timeout_error(std::string_view method, std::chrono::milliseconds timeout)
{
    return gateway_error(error_kind::timeout,
                         fmt::format("RPC call '{}' timed out after {}ms", method, timeout.count()));
}

gateway_error connection_closed_error(std::string_view reason)
{
    return gateway_error(error_kind::connection_closed, std::string(reason));
}

gateway_error handshake_error(std::string_view reason)
{
    return gateway_error(error_kind::handshake_failed, fmt::format("Handshake failed: {}", reason));
}

} // namespace gwlink
