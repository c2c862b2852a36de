#pragma once

#include <gwlink/error.hpp>
#include <gwlink/logger.hpp>
#include <gwlink/net/expirator.hpp>
#include <gwlink/protocol/frame.hpp>

#include <boost/asio.hpp>
#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gwlink
{

// The handshake's connect request shares the table with application calls
enum class request_kind
{
    handshake,
    application
};

struct pending_request
{
    std::string method;
    request_kind kind{request_kind::application};
    std::chrono::milliseconds timeout{0};
    std::chrono::steady_clock::time_point sent_at;
    completion_handler<Json::Value> handler;
};

// ============================================================================
// Pending Request Table
// ============================================================================

class pending_request_table
{
public:
    // Fired once per entry just before its handler, with the outcome
    using settle_hook = std::function<void(const std::string&, const pending_request&, const std::optional<gateway_error>&)>;

private:
    std::shared_ptr<net::expirator<std::string, pending_request>> entries_;
    uint64_t last_id_{0};
    logger log_;
    settle_hook settle_hook_;

public:
    explicit pending_request_table(boost::asio::io_context* io_context, logger log = {});

    pending_request_table(const pending_request_table&) = delete;
    pending_request_table& operator=(const pending_request_table&) = delete;
    ~pending_request_table();

    void set_settle_hook(settle_hook hook) { settle_hook_ = std::move(hook); }

    // Allocates the next correlation id and arms its timer
    std::string add(std::string method,
                    request_kind kind,
                    std::chrono::milliseconds timeout,
                    completion_handler<Json::Value> handler);

    // Resolves or rejects the matching entry. Returns its kind, or nullopt
    // when no entry is waiting for this id.
    std::optional<request_kind> complete(const protocol::response_frame& res);

    // Rejects one entry without waiting for its response
    bool fail(const std::string& id, const gateway_error& error);

    // Rejects every outstanding entry and clears the table
    size_t fail_all(const gateway_error& error);

    bool contains(const std::string& id) const { return entries_->contains(id); }
    size_t size() const { return entries_->size(); }
    bool empty() const { return entries_->empty(); }
    uint64_t last_id() const { return last_id_; }

private:
    void settle(const std::string& id, pending_request& entry, std::optional<gateway_error> error, Json::Value payload);
};

} // namespace gwlink
