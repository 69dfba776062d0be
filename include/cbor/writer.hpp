#pragma once
#include "cbor/value.hpp"
#include "fundamentals/errors.hpp"

#include <expected>

namespace cbor
{

// Shortest heads, definite lengths, narrowest exact float
[[nodiscard]] std::expected<bytes::buffer_t, BridgeError> write(const Value& v);

} // namespace cbor
