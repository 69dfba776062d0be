#pragma once
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace http = boost::beast::http;

class Router
{
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using Handler = std::function<Response(const Request&)>;

    void register_handler(http::verb verb, std::string_view path, Handler hdl);

    // Unmatched method/path pairs get 404 {"error":"Not found"}
    [[nodiscard]] Response route(const Request& req) const;

    [[nodiscard]] static Response json_response(const Request& req, http::status status, const boost::json::value& body);

private:
    static std::string route_key(http::verb verb, std::string_view path);

    std::unordered_map<std::string, Handler> handlers;
};
