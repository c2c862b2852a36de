#include <gwlink/logger.hpp>

#include <fmt/core.h>

#include <cstdio>

namespace gwlink
{

const char* to_string(log_level level)
{
    switch (level)
    {
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
    }
    return "UNKNOWN";
}

void console_sink::write(log_level level, std::string_view message, const Json::Value& meta)
{
    std::string meta_text;
    if (!meta.isNull() && !(meta.isObject() && meta.empty()))
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        meta_text = Json::writeString(builder, meta);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (meta_text.empty())
        fmt::print(stderr, "[{}] {}\n", to_string(level), message);
    else
        fmt::print(stderr, "[{}] {} {}\n", to_string(level), message, meta_text);
}

logger_fn console_logger()
{
    return [](log_level level, std::string_view message, const Json::Value& meta) {
        console_sink::instance().write(level, message, meta);
    };
}

logger_fn null_logger()
{
    return [](log_level, std::string_view, const Json::Value&) {};
}

} // namespace gwlink
