#pragma once

#include <json/json.h>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace gwlink
{

enum class log_level
{
    info,
    warning,
    error
};

const char* to_string(log_level level);

// meta carries structured context (url, method, id, attempt, error, ...)
using logger_fn = std::function<void(log_level, std::string_view, const Json::Value&)>;

// ============================================================================
// Console Sink
// ============================================================================

class console_sink
{
  public:
    static console_sink& instance()
    {
        static console_sink inst;
        return inst;
    }

    void write(log_level level, std::string_view message, const Json::Value& meta);

  private:
    console_sink() = default;
    std::mutex mutex_;
};

// Writes "[LEVEL] message {meta}" lines to stderr
logger_fn console_logger();

logger_fn null_logger();

// ============================================================================
// Logger - thin front for a logger_fn
// ============================================================================

class logger
{
    logger_fn fn_;

  public:
    logger() = default;

    explicit logger(logger_fn fn)
      : fn_(std::move(fn))
    {
    }

    void info(std::string_view message, const Json::Value& meta = Json::Value{}) const
    {
        log(log_level::info, message, meta);
    }

    void warning(std::string_view message, const Json::Value& meta = Json::Value{}) const
    {
        log(log_level::warning, message, meta);
    }

    void error(std::string_view message, const Json::Value& meta = Json::Value{}) const
    {
        log(log_level::error, message, meta);
    }

    void log(log_level level, std::string_view message, const Json::Value& meta) const
    {
        if (fn_)
            fn_(level, message, meta);
    }
};

} // namespace gwlink
