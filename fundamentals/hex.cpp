#include "fundamentals/hex.hpp"

#include <array>
#include <format>

namespace
{

constexpr std::array<char, 16> digits = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

constexpr int nibble(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

} // namespace

namespace hex
{

std::string encode(std::span<const std::byte> data)
{
    std::string ret;
    ret.reserve(data.size() * 2);
    for (auto b : data)
    {
        auto v = std::to_integer<uint8_t>(b);
        ret.push_back(digits[v >> 4]);
        ret.push_back(digits[v & 0x0F]);
    }
    return ret;
}

std::expected<bytes::buffer_t, BridgeError> decode(std::string_view text)
{
    if (text.size() % 2 != 0)
    {
        return std::unexpected(BridgeError::invalid_hex(
            std::format("odd number of digits ({})", text.size())));
    }

    bytes::buffer_t ret;
    ret.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2)
    {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0)
        {
            size_t bad = hi < 0 ? i : i + 1;
            return std::unexpected(BridgeError::invalid_hex(
                std::format("invalid character at index {}", bad)));
        }
        ret.push_back(bytes::int2byte(static_cast<uint8_t>((hi << 4) | lo)));
    }
    return ret;
}

} // namespace hex
