#include "router.hpp"
#include "bridge/bridge.hpp"

#include <format>

namespace json = boost::json;

std::string Router::route_key(http::verb verb, std::string_view path)
{
    return std::format("{} {}", static_cast<unsigned>(verb), path);
}

void Router::register_handler(http::verb verb, std::string_view path, Handler hdl)
{
    handlers[route_key(verb, path)] = std::move(hdl);
}

Router::Response Router::route(const Request& req) const
{
    std::string_view target(req.target().data(), req.target().size());
    target = target.substr(0, target.find('?'));

    if (auto it = handlers.find(route_key(req.method(), target)); it != handlers.end())
    {
        return it->second(req);
    }
    return json_response(req, http::status::not_found, json::object{{"error", "Not found"}});
}

Router::Response Router::json_response(const Request& req, http::status status, const json::value& body)
{
    Response res{status, req.version()};
    res.set(http::field::server, std::format("{}/{}", library_name, library_version));
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}
