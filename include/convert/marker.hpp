#pragma once
#include "cbor/value.hpp"

#include <boost/json.hpp>
#include <array>
#include <optional>
#include <span>
#include <string_view>

namespace convert::marker
{

// Reserved keys. An ordinary map that uses one of them is read back as a marker.
constexpr std::string_view bytes_key     = "__cbor_bytes__";
constexpr std::string_view float_key     = "__cbor_float__";
constexpr std::string_view tag_key       = "__cbor_tag__";
constexpr std::string_view value_key     = "__cbor_value__";
constexpr std::string_view undefined_key = "__cbor_undefined__";

constexpr std::string_view nan_text          = "NaN";
constexpr std::string_view infinity_text     = "Infinity";
constexpr std::string_view neg_infinity_text = "-Infinity";

boost::json::object make_bytes(std::span<const std::byte> data);
// d must be NaN or infinite
boost::json::object make_float(double d);
boost::json::object make_tag(uint64_t number, boost::json::value content);

// Yields the value the object stands for; nullopt lets the next matcher try
using Matcher = std::optional<cbor::Value> (*)(const boost::json::object&);

std::optional<cbor::Value> match_bytes(const boost::json::object& obj);
std::optional<cbor::Value> match_float(const boost::json::object& obj);
std::optional<cbor::Value> match_tag(const boost::json::object& obj);
std::optional<cbor::Value> match_undefined(const boost::json::object& obj);

// First match wins
constexpr std::array<Matcher, 4> priority = {
    match_bytes,
    match_float,
    match_tag,
    match_undefined
};

} // namespace convert::marker
