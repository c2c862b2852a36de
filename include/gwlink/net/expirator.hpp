#pragma once

#include <utility>

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gwlink::net
{

// ============================================================================
// Expirator - keyed deadlines on a single steady_timer
// ============================================================================
//
// Entries leave the expirator exactly once: through take(), drain(), or the
// expiry handler. Must be owned by a shared_ptr (the timer handler keeps the
// expirator alive until it has observed a stop()).
//
template<typename Tkey, typename Tinfo>
class expirator : public std::enable_shared_from_this<expirator<Tkey, Tinfo>>
{
  public:
    using expiry_handler = std::function<void(Tkey, Tinfo)>;
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

  private:
    struct entry_data
    {
        time_point expiry;
        Tinfo info;
        typename std::multimap<time_point, Tkey>::iterator queue_iter;
    };

    boost::asio::steady_timer timer_;
    std::unordered_map<Tkey, entry_data> entries_;
    std::multimap<time_point, Tkey> expiry_queue_;
    const expiry_handler expiry_handler_;
    bool running_{false};

  public:
    expirator(boost::asio::io_context* io_context_ptr, expiry_handler handler)
      : timer_(*io_context_ptr)
      , expiry_handler_(std::move(handler))
    {
        if (!expiry_handler_)
            throw std::invalid_argument("expiry_handler cannot be null");
    }

    expirator(const expirator&) = delete;
    expirator& operator=(const expirator&) = delete;
    expirator(expirator&&) = delete;
    expirator& operator=(expirator&&) = delete;

    ~expirator()
    {
        stop();
    }

    void stop()
    {
        if (running_)
        {
            running_ = false;
            timer_.cancel();
        }
    }

    bool add(Tkey key, duration expiration_duration, Tinfo info)
    {
        if (entries_.find(key) != entries_.end())
            return false;

        time_point expiry = clock_type::now() + expiration_duration;
        auto queue_iter = expiry_queue_.emplace(expiry, key);
        entries_.emplace(std::move(key), entry_data{expiry, std::move(info), queue_iter});

        // Earliest deadline changed, re-arm
        if (!running_ || queue_iter == expiry_queue_.begin())
        {
            running_ = true;
            schedule_next();
        }

        return true;
    }

    // Removes the entry and hands its info back to the caller
    std::optional<Tinfo> take(const Tkey& key)
    {
        auto entry_it = entries_.find(key);
        if (entry_it == entries_.end())
            return {};

        Tinfo info = std::move(entry_it->second.info);
        expiry_queue_.erase(entry_it->second.queue_iter);
        entries_.erase(entry_it);

        if (entries_.empty())
            stop();

        return info;
    }

    // Removes every entry without invoking the expiry handler
    std::vector<std::pair<Tkey, Tinfo>> drain()
    {
        std::vector<std::pair<Tkey, Tinfo>> drained;
        drained.reserve(entries_.size());

        // Deadline order, so callers see the oldest requests first
        for (const auto& [expiry, key] : expiry_queue_)
        {
            auto entry_it = entries_.find(key);
            drained.emplace_back(key, std::move(entry_it->second.info));
        }

        entries_.clear();
        expiry_queue_.clear();
        stop();

        return drained;
    }

    const Tinfo* find(const Tkey& key) const
    {
        auto it = entries_.find(key);
        return it != entries_.end() ? &it->second.info : nullptr;
    }

    bool contains(const Tkey& key) const
    {
        return entries_.find(key) != entries_.end();
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool is_running() const { return running_; }

  private:
    void schedule_next()
    {
        if (expiry_queue_.empty())
        {
            running_ = false;
            return;
        }

        timer_.expires_at(expiry_queue_.begin()->first);
        timer_.async_wait([self = this->shared_from_this()](const boost::system::error_code& ec) {
            // Cancelled by a reschedule or stop()
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (!self->running_ || ec)
                return;

            self->process_expired();

            if (self->running_)
                self->schedule_next();
        });
    }

    void process_expired()
    {
        time_point now = clock_type::now();

        // Collect first, the handler may add or take entries
        std::vector<Tkey> expired_keys;
        for (auto it = expiry_queue_.begin(); it != expiry_queue_.end() && it->first <= now; ++it)
            expired_keys.push_back(it->second);

        for (const auto& key : expired_keys)
        {
            auto entry_it = entries_.find(key);
            if (entry_it == entries_.end())
                continue;

            Tinfo info = std::move(entry_it->second.info);
            expiry_queue_.erase(entry_it->second.queue_iter);
            entries_.erase(entry_it);

            expiry_handler_(key, std::move(info));
        }

        if (expiry_queue_.empty())
            running_ = false;
    }
};

} // namespace gwlink::net
