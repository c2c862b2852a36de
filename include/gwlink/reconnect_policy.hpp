#pragma once

#include <gwlink/config.hpp>

#include <chrono>
#include <cstdint>

namespace gwlink
{

// ============================================================================
// Reconnect Policy - bounded exponential backoff
// ============================================================================

class reconnect_policy
{
    reconnect_config config_;
    uint32_t attempts_{0};

public:
    explicit reconnect_policy(const reconnect_config& config)
      : config_(config)
    {
    }

    bool enabled() const { return config_.enabled; }
    bool exhausted() const { return attempts_ >= config_.max_attempts; }
    uint32_t attempts() const { return attempts_; }
    uint32_t max_attempts() const { return config_.max_attempts; }

    // min(initial_delay * 2^attempt, max_delay)
    std::chrono::milliseconds delay_for(uint32_t attempt) const
    {
        auto delay = config_.initial_delay;
        for (uint32_t i = 0; i < attempt && delay < config_.max_delay; ++i)
            delay *= 2;
        return delay < config_.max_delay ? delay : config_.max_delay;
    }

    std::chrono::milliseconds next_delay() const { return delay_for(attempts_); }

    void record_attempt() { ++attempts_; }
    void reset() { attempts_ = 0; }
};

} // namespace gwlink
