#pragma once
#include "cbor/value.hpp"

#include <boost/json.hpp>
#include <cstdint>

namespace convert
{

// Integers beyond +/-(2^53-1) are emitted as decimal strings
constexpr int64_t max_safe_integer = 9007199254740991;

// Never fails; undefined and simple values become null
boost::json::value to_json(const cbor::Value& v);

// Never fails; malformed markers are read as ordinary maps
cbor::Value from_json(const boost::json::value& jv);

// Map key rendering used by to_json
std::string key_string(const cbor::Value& key);

} // namespace convert
