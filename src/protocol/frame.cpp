#include <gwlink/protocol/frame.hpp>

#include <fmt/core.h>

#include <memory>

namespace gwlink::protocol
{

namespace
{
const Json::StreamWriterBuilder& compact_writer()
{
    static const Json::StreamWriterBuilder builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"] = true;
        return b;
    }();
    return builder;
}

// Accepts string ids and, for tolerance towards older gateways, integral ones
bool read_id(const Json::Value& root, std::string& id)
{
    const auto& value = root["id"];
    if (value.isString())
    {
        id = value.asString();
        return !id.empty();
    }
    if (value.isIntegral())
    {
        id = value.asString();
        return true;
    }
    return false;
}

frame decode_request(const Json::Value& root, std::string& error)
{
    request_frame req;
    if (!read_id(root, req.id))
    {
        error = "request frame without a valid id";
        return {};
    }
    if (!root["method"].isString())
    {
        error = "request frame without a method";
        return {};
    }
    req.method = root["method"].asString();
    if (root.isMember("params"))
        req.params = root["params"];
    return req;
}

frame decode_response(const Json::Value& root, std::string& error)
{
    response_frame res;
    if (!read_id(root, res.id))
    {
        error = "response frame without a valid id";
        return {};
    }
    if (!root["ok"].isBool())
    {
        error = fmt::format("response frame {} without a boolean 'ok'", res.id);
        return {};
    }
    res.ok = root["ok"].asBool();

    if (root.isMember("payload"))
        res.payload = root["payload"];

    if (root.isMember("error"))
    {
        const auto& node = root["error"];
        if (!node.isObject())
        {
            error = fmt::format("response frame {} with a non-object error", res.id);
            return {};
        }

        remote_error err;
        if (node["code"].isString() || node["code"].isNumeric())
            err.code = node["code"].asString();
        if (node["message"].isString())
            err.message = node["message"].asString();
        if (node.isMember("data"))
            err.data = node["data"];
        res.error = std::move(err);
    }
    return res;
}

frame decode_event(const Json::Value& root, std::string& error)
{
    event_frame evt;
    if (!root["event"].isString())
    {
        error = "event frame without an event name";
        return {};
    }
    evt.event = root["event"].asString();

    if (root.isMember("payload"))
        evt.payload = root["payload"];

    if (root.isMember("seq"))
    {
        if (!root["seq"].isInt64())
        {
            error = fmt::format("event frame '{}' with a seq that is not a 64-bit integer", evt.event);
            return {};
        }
        evt.seq = root["seq"].asInt64();
    }
    return evt;
}
} // namespace

std::string encode(const request_frame& req)
{
    Json::Value root(Json::objectValue);
    root["type"] = "req";
    root["id"] = req.id;
    root["method"] = req.method;
    if (req.params)
        root["params"] = *req.params;
    return Json::writeString(compact_writer(), root);
}

std::string encode(const response_frame& res)
{
    Json::Value root(Json::objectValue);
    root["type"] = "res";
    root["id"] = res.id;
    root["ok"] = res.ok;
    if (res.payload)
        root["payload"] = *res.payload;
    if (res.error)
    {
        Json::Value err(Json::objectValue);
        err["code"] = res.error->code;
        err["message"] = res.error->message;
        if (res.error->data)
            err["data"] = *res.error->data;
        root["error"] = std::move(err);
    }
    return Json::writeString(compact_writer(), root);
}

std::string encode(const event_frame& evt)
{
    Json::Value root(Json::objectValue);
    root["type"] = "event";
    root["event"] = evt.event;
    if (evt.payload)
        root["payload"] = *evt.payload;
    if (evt.seq)
        root["seq"] = Json::Int64{*evt.seq};
    return Json::writeString(compact_writer(), root);
}

frame decode(std::string_view text, std::string& error)
{
    error.clear();

    Json::Value root;
    std::string parse_errors;
    try
    {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors))
        {
            error = fmt::format("unparseable frame: {}", parse_errors);
            return {};
        }
    }
    catch (const std::exception& e)
    {
        error = fmt::format("unparseable frame: {}", e.what());
        return {};
    }

    if (!root.isObject())
    {
        error = "frame is not a JSON object";
        return {};
    }
    if (!root["type"].isString())
    {
        error = "frame without a type";
        return {};
    }

    const auto type = root["type"].asString();
    try
    {
        if (type == "req")
            return decode_request(root, error);
        if (type == "res")
            return decode_response(root, error);
        if (type == "event")
            return decode_event(root, error);
    }
    catch (const Json::Exception& e)
    {
        error = fmt::format("malformed {} frame: {}", type, e.what());
        return {};
    }

    error = fmt::format("unknown frame type '{}'", type);
    return {};
}

} // namespace gwlink::protocol
