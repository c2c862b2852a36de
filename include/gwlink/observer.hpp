#pragma once

#include <gwlink/connection_status.hpp>
#include <gwlink/error.hpp>
#include <gwlink/event_router.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gwlink
{

// ============================================================================
// Client Observer - hooks for metrics, all no-ops by default
// ============================================================================

class client_observer
{
public:
    virtual ~client_observer() = default;

    virtual void on_status_change(connection_status /*from*/, connection_status /*to*/) {}
    virtual void on_request_sent(std::string_view /*method*/, size_t /*pending*/) {}

    // outcome is empty on success
    virtual void on_request_settled(std::string_view /*method*/,
                                    std::optional<error_kind> /*outcome*/,
                                    std::chrono::steady_clock::duration /*latency*/,
                                    size_t /*pending*/) {}

    virtual void on_event_dispatched(event_type /*type*/, size_t /*subscribers*/) {}
    virtual void on_reconnect_scheduled(uint32_t /*attempt*/, std::chrono::milliseconds /*delay*/) {}
    virtual void on_frame_dropped(std::string_view /*reason*/) {}
};

} // namespace gwlink
