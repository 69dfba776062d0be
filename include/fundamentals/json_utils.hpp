#pragma once
#include "fundamentals/errors.hpp"

#include <boost/json.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <expected>
#include <format>

namespace json_utils
{

inline boost::json::object error_msg(std::string_view err)
{
    return boost::json::object{
        {"success", false},
        {"error", err}
    };
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

// Strict RFC 8259 parse with a nesting bound
inline std::expected<boost::json::value, BridgeError> parse(std::string_view text, size_t max_depth)
{
    boost::json::parse_options opts;
    opts.max_depth = max_depth;

    boost::system::error_code ec;
    auto jv = boost::json::parse(text, ec, {}, opts);
    if (ec)
    {
        return std::unexpected(BridgeError::malformed_json(ec.message()));
    }
    return jv;
}

} // namespace json_utils
