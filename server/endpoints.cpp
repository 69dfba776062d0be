#include "endpoints.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

namespace json = boost::json;

Endpoints::Endpoints(const Bridge& br, BridgeMetrics& metrics)
    : bridge(br)
    , mts(metrics)
{
}

void Endpoints::install(Router& router) const
{
    router.register_handler(http::verb::get, "/health",
                            [this](const Router::Request& req) { return handle_health(req); });
    router.register_handler(http::verb::post, "/decode",
                            [this](const Router::Request& req) { return handle_decode(req); });
    router.register_handler(http::verb::post, "/encode",
                            [this](const Router::Request& req) { return handle_encode(req); });
}

Router::Response Endpoints::handle_health(const Router::Request& req) const
{
    return Router::json_response(req, http::status::ok, Bridge::health());
}

Router::Response Endpoints::handle_decode(const Router::Request& req) const
{
    auto body = bridge.parse(req.body());
    if (!body)
    {
        mts.decodes_failed++;
        return Router::json_response(req, http::status::ok,
            json_utils::error_msg(Bridge::describe(body.error(), Bridge::Direction::Decode)));
    }

    const auto* obj = body->if_object();
    auto hex_text = obj ? json_utils::extract_str(*obj, "hex")
                        : std::expected<std::string, std::string>(std::unexpected("not an object"));
    if (!hex_text)
    {
        LOG_DEBUG("decode request rejected: {}", hex_text.error());
        mts.decodes_failed++;
        return Router::json_response(req, http::status::ok, json_utils::error_msg("Missing \"hex\" field"));
    }

    return Router::json_response(req, http::status::ok, bridge.decode_envelope(*hex_text));
}

Router::Response Endpoints::handle_encode(const Router::Request& req) const
{
    auto body = bridge.parse(req.body());
    if (!body)
    {
        mts.encodes_failed++;
        return Router::json_response(req, http::status::ok,
            json_utils::error_msg(Bridge::describe(body.error(), Bridge::Direction::Encode)));
    }

    const auto* obj = body->if_object();
    const json::value* value = obj ? obj->if_contains("value") : nullptr;
    if (!value)
    {
        mts.encodes_failed++;
        return Router::json_response(req, http::status::ok, json_utils::error_msg("Missing \"value\" field"));
    }

    return Router::json_response(req, http::status::ok, bridge.encode_envelope(*value));
}
