#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gwlink::net
{

// ============================================================================
// Transport Handler Interface
// ============================================================================

class transport_handler
{
public:
    virtual ~transport_handler() = default;
    virtual void on_message(std::string_view text) = 0;

    // Remote close or I/O failure. Never called for a local close().
    virtual void on_close(std::optional<std::string> error) = 0;
};

// ============================================================================
// Transport Interface - one text-frame connection at a time
// ============================================================================

class transport
{
public:
    using open_handler = std::function<void(std::optional<std::string> error)>;

    static constexpr uint16_t normal_closure{1000};

    virtual ~transport() = default;

    virtual void set_handler(std::unique_ptr<transport_handler> handler) = 0;

    // Opens a fresh connection. The handler is dropped if close() is called first.
    virtual void async_open(const std::string& url, open_handler handler) = 0;

    // Queued; a failed write surfaces through transport_handler::on_close
    virtual void send(std::string text) = 0;

    virtual void close(uint16_t code, std::string_view reason) = 0;

    virtual bool is_open() const = 0;
};

} // namespace gwlink::net
