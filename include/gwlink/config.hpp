#pragma once

#include <gwlink/logger.hpp>
#include <gwlink/version.hpp>

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace gwlink
{

class client_observer;

// ============================================================================
// Client Configuration
// ============================================================================

struct reconnect_config
{
    bool enabled{true};
    uint32_t max_attempts{5};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
};

// Sent as params.client of the handshake request
struct client_identity
{
    std::string id{"gwlink"};
    std::string version{gwlink::version()};
    std::string platform{gwlink::platform()};
    std::string mode{"backend"};
};

struct client_config
{
    std::string gateway_url;
    std::string auth_token;
    reconnect_config reconnect;
    std::chrono::milliseconds connection_timeout{30000};

    client_identity identity;
    int min_protocol{3};
    int max_protocol{3};

    logger_fn logger;
    std::shared_ptr<client_observer> observer;

    bool is_valid() const
    {
        return has_websocket_scheme() &&
               connection_timeout.count() > 0 &&
               reconnect.initial_delay.count() > 0 &&
               reconnect.initial_delay <= reconnect.max_delay &&
               min_protocol <= max_protocol;
    }

    // Throws std::invalid_argument naming the first offending field
    void validate() const;

    bool is_secure() const
    {
        return gateway_url.rfind("wss://", 0) == 0;
    }

  private:
    bool has_websocket_scheme() const
    {
        return gateway_url.rfind("ws://", 0) == 0 || is_secure();
    }
};

// Keys follow the gateway's camelCase naming (gatewayUrl, reconnect.maxAttempts, ...)
client_config client_config_from_json(const Json::Value& root);

client_config load_client_config(const std::string& path);

} // namespace gwlink
