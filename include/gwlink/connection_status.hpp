#pragma once

namespace gwlink
{

enum class connection_status
{
    disconnected,
    connecting,
    connected,
    error
};

inline const char* to_string(connection_status status)
{
    switch (status)
    {
        case connection_status::disconnected:
            return "disconnected";
        case connection_status::connecting:
            return "connecting";
        case connection_status::connected:
            return "connected";
        case connection_status::error:
            return "error";
    }
    return "unknown";
}

} // namespace gwlink
