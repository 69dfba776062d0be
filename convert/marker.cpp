#include "convert/marker.hpp"
#include "convert/converter.hpp"
#include "fundamentals/hex.hpp"

#include <cmath>
#include <limits>

namespace json = boost::json;

namespace convert::marker
{

json::object make_bytes(std::span<const std::byte> data)
{
    return json::object{{bytes_key, hex::encode(data)}};
}

json::object make_float(double d)
{
    std::string_view text = std::isnan(d) ? nan_text : (d > 0 ? infinity_text : neg_infinity_text);
    return json::object{{float_key, text}};
}

json::object make_tag(uint64_t number, json::value content)
{
    json::object obj;
    obj[tag_key] = number;
    obj[value_key] = std::move(content);
    return obj;
}

std::optional<cbor::Value> match_bytes(const json::object& obj)
{
    auto payload = obj.if_contains(bytes_key);
    if (!payload || !payload->is_string())
    {
        return std::nullopt;
    }
    auto decoded = hex::decode(payload->get_string());
    if (!decoded)
    {
        return std::nullopt;
    }
    return cbor::Value::bytes(std::move(*decoded));
}

std::optional<cbor::Value> match_float(const json::object& obj)
{
    auto payload = obj.if_contains(float_key);
    if (!payload || !payload->is_string())
    {
        return std::nullopt;
    }
    std::string_view text = payload->get_string();
    if (text == nan_text)
    {
        return cbor::Value::floating(std::numeric_limits<double>::quiet_NaN());
    }
    if (text == infinity_text)
    {
        return cbor::Value::floating(std::numeric_limits<double>::infinity());
    }
    if (text == neg_infinity_text)
    {
        return cbor::Value::floating(-std::numeric_limits<double>::infinity());
    }
    return cbor::Value::null();
}

std::optional<cbor::Value> match_tag(const json::object& obj)
{
    auto number = obj.if_contains(tag_key);
    auto content = obj.if_contains(value_key);
    if (!number || !content)
    {
        return std::nullopt;
    }

    uint64_t tag = 0;
    if (number->is_uint64())
    {
        tag = number->get_uint64();
    }
    else if (number->is_int64() && number->get_int64() >= 0)
    {
        tag = static_cast<uint64_t>(number->get_int64());
    }
    else
    {
        return std::nullopt;
    }
    return cbor::Value::tag(tag, from_json(*content));
}

std::optional<cbor::Value> match_undefined(const json::object& obj)
{
    if (!obj.contains(undefined_key))
    {
        return std::nullopt;
    }
    return cbor::Value::null();
}

} // namespace convert::marker
