#include "convert/converter.hpp"
#include "convert/marker.hpp"
#include "fundamentals/hex.hpp"

#include <cmath>
#include <string>

namespace json = boost::json;

namespace convert
{

namespace
{

json::value integer_to_json(const cbor::Integer& i)
{
    if (auto n = i.to_int64(); n && *n >= -max_safe_integer && *n <= max_safe_integer)
    {
        return json::value(*n);
    }
    return json::value(i.to_string());
}

struct ToJson
{
    json::value operator()(std::nullptr_t) const { return nullptr; }
    json::value operator()(bool b) const { return b; }
    json::value operator()(const cbor::Integer& i) const { return integer_to_json(i); }

    json::value operator()(double d) const
    {
        if (!std::isfinite(d))
        {
            return marker::make_float(d);
        }
        return d;
    }

    json::value operator()(const cbor::Bytes& b) const { return marker::make_bytes(b); }
    json::value operator()(const std::string& s) const { return json::string(s); }

    json::value operator()(const cbor::Array& a) const
    {
        json::array arr;
        arr.reserve(a.size());
        for (const auto& item : a)
        {
            arr.push_back(to_json(item));
        }
        return arr;
    }

    json::value operator()(const cbor::Map& m) const
    {
        json::object obj;
        obj.reserve(m.size());
        for (const auto& [key, value] : m)
        {
            obj[key_string(key)] = to_json(value);
        }
        return obj;
    }

    json::value operator()(const cbor::Tag& t) const
    {
        return marker::make_tag(t.number(), to_json(t.content()));
    }

    // No JSON image
    json::value operator()(const cbor::Undefined&) const { return nullptr; }
    json::value operator()(const cbor::Simple&) const { return nullptr; }
};

cbor::Value object_from_json(const json::object& obj)
{
    for (auto match : marker::priority)
    {
        if (auto v = match(obj))
        {
            return std::move(*v);
        }
    }

    cbor::Map entries;
    entries.reserve(obj.size());
    for (const auto& kv : obj)
    {
        entries.push_back(cbor::MapEntry{
            cbor::Value::text(std::string(kv.key())),
            from_json(kv.value())
        });
    }
    return cbor::Value::map(std::move(entries));
}

} // namespace

std::string key_string(const cbor::Value& key)
{
    switch (key.kind())
    {
        case cbor::Value::Kind::Text:
            return key.as_text();
        case cbor::Value::Kind::Integer:
            return key.as_integer().to_string();
        case cbor::Value::Kind::Bytes:
            return hex::encode(key.as_bytes());
        default:
            return cbor::to_diagnostic(key);
    }
}

json::value to_json(const cbor::Value& v)
{
    return std::visit(ToJson{}, v.storage());
}

cbor::Value from_json(const json::value& jv)
{
    switch (jv.kind())
    {
        case json::kind::null:
            return cbor::Value::null();
        case json::kind::bool_:
            return cbor::Value::boolean(jv.get_bool());
        case json::kind::int64:
            return cbor::Value::integer(jv.get_int64());
        case json::kind::uint64:
            // Above int64 max a bare number is read as a float
            return cbor::Value::floating(static_cast<double>(jv.get_uint64()));
        case json::kind::double_:
            return cbor::Value::floating(jv.get_double());
        case json::kind::string:
        {
            std::string_view s = jv.get_string();
            if (auto i = cbor::Integer::parse(s))
            {
                return cbor::Value::integer(*i);
            }
            return cbor::Value::text(std::string(s));
        }
        case json::kind::array:
        {
            const auto& arr = jv.get_array();
            cbor::Array items;
            items.reserve(arr.size());
            for (const auto& item : arr)
            {
                items.push_back(from_json(item));
            }
            return cbor::Value::array(std::move(items));
        }
        case json::kind::object:
            return object_from_json(jv.get_object());
    }
    return cbor::Value::null();
}

} // namespace convert
