// ============================================================================
// Prometheus client metrics
// ============================================================================
#pragma once

#include <gwlink/observer.hpp>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <array>
#include <map>
#include <memory>
#include <string>

namespace gwlink::monitoring
{

class prometheus_observer : public client_observer
{
public:
    using labels_type = std::map<std::string, std::string>;

    /// Registers the gwlink_* families in the given registry.
    /// @param constant_labels Added to every series (e.g. {"gateway", "prod"})
    /// @throws std::invalid_argument if a label name is invalid
    explicit prometheus_observer(std::shared_ptr<prometheus::Registry> registry,
                                 labels_type constant_labels = {});

    prometheus_observer(const prometheus_observer&) = delete;
    prometheus_observer& operator=(const prometheus_observer&) = delete;

    void on_status_change(connection_status from, connection_status to) override;
    void on_request_sent(std::string_view method, size_t pending) override;
    void on_request_settled(std::string_view method,
                            std::optional<error_kind> outcome,
                            std::chrono::steady_clock::duration latency,
                            size_t pending) override;
    void on_event_dispatched(event_type type, size_t subscribers) override;
    void on_reconnect_scheduled(uint32_t attempt, std::chrono::milliseconds delay) override;
    void on_frame_dropped(std::string_view reason) override;

    const std::shared_ptr<prometheus::Registry>& registry() const { return registry_; }

    /// @throws std::invalid_argument on an empty, reserved or malformed name
    static void validate_labels(const labels_type& labels);

private:
    std::shared_ptr<prometheus::Registry> registry_;
    labels_type constant_labels_;

    prometheus::Family<prometheus::Counter>& requests_;
    prometheus::Family<prometheus::Counter>& events_;
    prometheus::Family<prometheus::Gauge>& status_;
    prometheus::Counter& reconnect_attempts_;
    prometheus::Counter& frames_dropped_;
    prometheus::Gauge& pending_requests_;
    prometheus::Histogram& request_latency_;

    // One series per connection_status, 1 for the current one
    std::array<prometheus::Gauge*, 4> status_gauges_{};
};

} // namespace gwlink::monitoring
