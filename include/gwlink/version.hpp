#pragma once

#include <string_view>

namespace gwlink
{
    inline constexpr int version_major       = 0;
    inline constexpr int version_minor       = 3;
    inline constexpr int version_patch       = 0;
    inline constexpr const char* version_tag = "";

    inline constexpr std::string_view version()
    {
        if constexpr (version_tag[0] == '\0')
        {
            return "0.3.0";
        }
        else
        {
            return "0.3.0-";
        }
    }

    inline constexpr std::string_view version_full()
    {
        return "gwlink v0.3.0 - agent gateway RPC client";
    }

    // Reported to the gateway as client.platform during the handshake
    inline constexpr std::string_view platform()
    {
#if defined(__linux__)
        return "linux";
#elif defined(__APPLE__)
        return "darwin";
#elif defined(_WIN32)
        return "win32";
#else
        return "unknown";
#endif
    }
} // namespace gwlink
