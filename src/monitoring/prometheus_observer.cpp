#include <gwlink/monitoring/prometheus_observer.hpp>

#include <regex>
#include <stdexcept>
#include <utility>

namespace gwlink::monitoring
{

namespace
{
const prometheus::Histogram::BucketBoundaries latency_buckets{
    0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0};

prometheus::Family<prometheus::Counter>& build_counter(prometheus::Registry& registry,
                                                       const std::string& name,
                                                       const std::string& help,
                                                       const prometheus::Labels& labels)
{
    return prometheus::BuildCounter().Name(name).Help(help).Labels(labels).Register(registry);
}

prometheus::Family<prometheus::Gauge>& build_gauge(prometheus::Registry& registry,
                                                   const std::string& name,
                                                   const std::string& help,
                                                   const prometheus::Labels& labels)
{
    return prometheus::BuildGauge().Name(name).Help(help).Labels(labels).Register(registry);
}

prometheus::Labels validated(prometheus::Labels labels)
{
    prometheus_observer::validate_labels(labels);
    return labels;
}
} // namespace

prometheus_observer::prometheus_observer(std::shared_ptr<prometheus::Registry> registry, labels_type constant_labels)
  : registry_(registry ? std::move(registry) : throw std::invalid_argument("prometheus_observer: registry cannot be null"))
  , constant_labels_(validated(std::move(constant_labels)))
  , requests_(build_counter(*registry_, "gwlink_requests_total", "Settled gateway requests by outcome", constant_labels_))
  , events_(build_counter(*registry_, "gwlink_events_dispatched_total", "Gateway events dispatched by type", constant_labels_))
  , status_(build_gauge(*registry_, "gwlink_connection_status", "1 for the current connection status", constant_labels_))
  , reconnect_attempts_(build_counter(*registry_, "gwlink_reconnect_attempts_total", "Scheduled reconnect attempts", constant_labels_).Add({}))
  , frames_dropped_(build_counter(*registry_, "gwlink_frames_dropped_total", "Inbound frames dropped as malformed", constant_labels_).Add({}))
  , pending_requests_(build_gauge(*registry_, "gwlink_pending_requests", "Requests awaiting a response", constant_labels_).Add({}))
  , request_latency_(prometheus::BuildHistogram()
                         .Name("gwlink_request_latency_seconds")
                         .Help("Time from request to settlement")
                         .Labels(constant_labels_)
                         .Register(*registry_)
                         .Add({}, latency_buckets))
{
    for (auto status : {connection_status::disconnected, connection_status::connecting,
                        connection_status::connected, connection_status::error})
    {
        status_gauges_[static_cast<size_t>(status)] = &status_.Add({{"status", to_string(status)}});
    }

    status_gauges_[static_cast<size_t>(connection_status::disconnected)]->Set(1);
}

void prometheus_observer::on_status_change(connection_status from, connection_status to)
{
    status_gauges_[static_cast<size_t>(from)]->Set(0);
    status_gauges_[static_cast<size_t>(to)]->Set(1);
}

void prometheus_observer::on_request_sent(std::string_view, size_t pending)
{
    pending_requests_.Set(static_cast<double>(pending));
}

void prometheus_observer::on_request_settled(std::string_view,
                                             std::optional<error_kind> outcome,
                                             std::chrono::steady_clock::duration latency,
                                             size_t pending)
{
    requests_.Add({{"outcome", outcome ? to_string(*outcome) : "ok"}}).Increment();
    request_latency_.Observe(std::chrono::duration<double>(latency).count());
    pending_requests_.Set(static_cast<double>(pending));
}

void prometheus_observer::on_event_dispatched(event_type type, size_t)
{
    events_.Add({{"type", to_string(type)}}).Increment();
}

void prometheus_observer::on_reconnect_scheduled(uint32_t, std::chrono::milliseconds)
{
    reconnect_attempts_.Increment();
}

void prometheus_observer::on_frame_dropped(std::string_view)
{
    frames_dropped_.Increment();
}

void prometheus_observer::validate_labels(const labels_type& labels)
{
    static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

    for (const auto& [key, value] : labels)
    {
        if (key.empty())
            throw std::invalid_argument("Label name cannot be empty");

        if (key.size() >= 2 && key[0] == '_' && key[1] == '_')
            throw std::invalid_argument("Label name '" + key + "' is reserved");

        if (!std::regex_match(key, label_regex))
            throw std::invalid_argument("Invalid label name: " + key);
    }
}

} // namespace gwlink::monitoring
