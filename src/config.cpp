#include <gwlink/config.hpp>

#include <fmt/core.h>

#include <fstream>
#include <stdexcept>

namespace gwlink
{

namespace
{
std::chrono::milliseconds read_millis(const Json::Value& node, const char* key, std::chrono::milliseconds fallback)
{
    if (!node.isMember(key))
        return fallback;

    const auto& value = node[key];
    if (!value.isIntegral() || value.asInt64() <= 0)
        throw std::invalid_argument(fmt::format("config: '{}' must be a positive integer", key));

    return std::chrono::milliseconds{value.asInt64()};
}

int read_int(const Json::Value& node, const char* key, int fallback)
{
    if (!node.isMember(key))
        return fallback;

    const auto& value = node[key];
    if (!value.isInt())
        throw std::invalid_argument(fmt::format("config: '{}' must be an integer", key));

    return value.asInt();
}

std::string read_string(const Json::Value& node, const char* key, const std::string& fallback)
{
    if (!node.isMember(key))
        return fallback;

    const auto& value = node[key];
    if (!value.isString())
        throw std::invalid_argument(fmt::format("config: '{}' must be a string", key));

    return value.asString();
}
} // namespace

void client_config::validate() const
{
    if (gateway_url.empty())
        throw std::invalid_argument("config: gatewayUrl is required");

    if (!has_websocket_scheme())
        throw std::invalid_argument(fmt::format("config: gatewayUrl must start with ws:// or wss://, got '{}'", gateway_url));

    if (connection_timeout.count() <= 0)
        throw std::invalid_argument("config: connectionTimeoutMs must be positive");

    if (reconnect.initial_delay.count() <= 0)
        throw std::invalid_argument("config: reconnect.initialDelayMs must be positive");

    if (reconnect.initial_delay > reconnect.max_delay)
        throw std::invalid_argument("config: reconnect.initialDelayMs exceeds reconnect.maxDelayMs");

    if (min_protocol > max_protocol)
        throw std::invalid_argument("config: minProtocol exceeds maxProtocol");
}

client_config client_config_from_json(const Json::Value& root)
{
    if (!root.isObject())
        throw std::invalid_argument("config: document root must be an object");

    client_config config;
    config.gateway_url = read_string(root, "gatewayUrl", "");
    config.auth_token = read_string(root, "authToken", "");
    config.connection_timeout = read_millis(root, "connectionTimeoutMs", config.connection_timeout);

    if (root.isMember("reconnect"))
    {
        const auto& node = root["reconnect"];
        if (!node.isObject())
            throw std::invalid_argument("config: 'reconnect' must be an object");

        if (node.isMember("enabled"))
        {
            if (!node["enabled"].isBool())
                throw std::invalid_argument("config: 'reconnect.enabled' must be a boolean");
            config.reconnect.enabled = node["enabled"].asBool();
        }

        if (node.isMember("maxAttempts"))
        {
            if (!node["maxAttempts"].isUInt())
                throw std::invalid_argument("config: 'reconnect.maxAttempts' must be a non-negative integer");
            config.reconnect.max_attempts = node["maxAttempts"].asUInt();
        }

        config.reconnect.initial_delay = read_millis(node, "initialDelayMs", config.reconnect.initial_delay);
        config.reconnect.max_delay = read_millis(node, "maxDelayMs", config.reconnect.max_delay);
    }

    if (root.isMember("client"))
    {
        const auto& node = root["client"];
        config.identity.id = read_string(node, "id", config.identity.id);
        config.identity.version = read_string(node, "version", config.identity.version);
        config.identity.platform = read_string(node, "platform", config.identity.platform);
        config.identity.mode = read_string(node, "mode", config.identity.mode);
    }

    config.min_protocol = read_int(root, "minProtocol", config.min_protocol);
    config.max_protocol = read_int(root, "maxProtocol", config.max_protocol);

    config.validate();
    return config;
}

client_config load_client_config(const std::string& path)
{
    std::ifstream stream(path);
    if (!stream)
        throw std::invalid_argument(fmt::format("config: cannot open '{}'", path));

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, stream, &root, &errors))
        throw std::invalid_argument(fmt::format("config: '{}' is not valid JSON: {}", path, errors));

    return client_config_from_json(root);
}

} // namespace gwlink
