#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bytes
{

using buffer_t = std::vector<std::byte>;

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

// Network order on the wire, native order in memory
constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

template<std::integral Ty = uint32_t>
Ty to_int(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<class To, std::integral From>
void from_int(std::span<To> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

// Appends the big-endian image of val
template<std::integral Ty>
void append_int(buffer_t& out, Ty val)
{
    const auto pos = out.size();
    out.resize(pos + sizeof(Ty));
    from_int<std::byte>(std::span{out}.subspan(pos), val);
}

inline buffer_t to_bytes(std::string_view sv)
{
    buffer_t ret;
    ret.reserve(sv.size());
    for (char ch : sv)
    {
        ret.push_back(int2byte(static_cast<uint8_t>(ch)));
    }
    return ret;
}

inline std::string to_string(std::span<const std::byte> data)
{
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace bytes
