#pragma once
#include "cbor/value.hpp"
#include "fundamentals/errors.hpp"

#include <cstddef>
#include <expected>
#include <span>

namespace cbor
{

struct ReadOptions
{
    size_t max_depth = 512;
};

[[nodiscard]] std::expected<Value, BridgeError> read(std::span<const std::byte> data,
                                                     const ReadOptions& opts = {});

} // namespace cbor
