#pragma once
#include "fundamentals/bytes.hpp"
#include "fundamentals/errors.hpp"

#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace hex
{

// Lowercase, two characters per byte
std::string encode(std::span<const std::byte> data);

// Accepts mixed case; fails on odd length or a non-hex character
std::expected<bytes::buffer_t, BridgeError> decode(std::string_view text);

} // namespace hex
