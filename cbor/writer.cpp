#include "cbor/writer.hpp"
#include "cbor/major.hpp"

#include <bit>
#include <cmath>
#include <format>
#include <optional>

namespace cbor
{

namespace
{

void write_head(bytes::buffer_t& out, MajorType major, uint64_t arg)
{
    if (arg < ai_one_byte)
    {
        out.push_back(bytes::int2byte(make_initial(major, static_cast<uint8_t>(arg))));
    }
    else if (arg <= 0xFF)
    {
        out.push_back(bytes::int2byte(make_initial(major, ai_one_byte)));
        bytes::append_int(out, static_cast<uint8_t>(arg));
    }
    else if (arg <= 0xFFFF)
    {
        out.push_back(bytes::int2byte(make_initial(major, ai_two_bytes)));
        bytes::append_int(out, static_cast<uint16_t>(arg));
    }
    else if (arg <= 0xFFFFFFFF)
    {
        out.push_back(bytes::int2byte(make_initial(major, ai_four_bytes)));
        bytes::append_int(out, static_cast<uint32_t>(arg));
    }
    else
    {
        out.push_back(bytes::int2byte(make_initial(major, ai_eight_bytes)));
        bytes::append_int(out, arg);
    }
}

// Half-precision image of f when the conversion is exact
std::optional<uint16_t> exact_half(float f)
{
    auto bits = std::bit_cast<uint32_t>(f);
    auto sign = static_cast<uint16_t>((bits >> 16) & 0x8000);
    int exp = static_cast<int>((bits >> 23) & 0xFF);
    uint32_t mant = bits & 0x7FFFFF;

    if (exp == 0xFF)
    {
        if (mant != 0)
        {
            return std::nullopt;
        }
        return static_cast<uint16_t>(sign | 0x7C00);
    }
    if (exp == 0)
    {
        // Single-precision subnormals are far below the half range
        if (mant != 0)
        {
            return std::nullopt;
        }
        return sign;
    }

    int e = exp - 127;
    if (e >= -14 && e <= 15)
    {
        if ((mant & 0x1FFF) != 0)
        {
            return std::nullopt;
        }
        return static_cast<uint16_t>(sign | ((e + 15) << 10) | (mant >> 13));
    }
    if (e >= -24 && e < -14)
    {
        uint32_t full = 0x800000 | mant;
        int shift = -e - 1;
        if ((full & ((1u << shift) - 1)) != 0)
        {
            return std::nullopt;
        }
        return static_cast<uint16_t>(sign | (full >> shift));
    }
    return std::nullopt;
}

void write_float(bytes::buffer_t& out, double d)
{
    auto initial = [](uint8_t info) { return bytes::int2byte(make_initial(MajorType::SimpleOrFloat, info)); };

    if (std::isnan(d))
    {
        out.push_back(initial(ai_two_bytes));
        bytes::append_int(out, static_cast<uint16_t>(0x7E00));
        return;
    }

    auto f = static_cast<float>(d);
    if (static_cast<double>(f) != d)
    {
        out.push_back(initial(ai_eight_bytes));
        bytes::append_int(out, std::bit_cast<uint64_t>(d));
        return;
    }

    if (auto half = exact_half(f))
    {
        out.push_back(initial(ai_two_bytes));
        bytes::append_int(out, *half);
        return;
    }

    out.push_back(initial(ai_four_bytes));
    bytes::append_int(out, std::bit_cast<uint32_t>(f));
}

class Writer
{
public:
    std::optional<BridgeError> write(const Value& v)
    {
        return std::visit(*this, v.storage());
    }

    std::optional<BridgeError> operator()(std::nullptr_t)
    {
        write_simple(simple_null);
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(bool b)
    {
        write_simple(b ? simple_true : simple_false);
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Integer& i)
    {
        write_head(out, i.negative ? MajorType::Negative : MajorType::Unsigned, i.argument);
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(double d)
    {
        write_float(out, d);
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Bytes& b)
    {
        write_head(out, MajorType::ByteString, b.size());
        out.insert(out.end(), b.begin(), b.end());
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const std::string& s)
    {
        if (!valid_utf8(s))
        {
            return BridgeError::codec_error("text string is not valid UTF-8");
        }
        write_head(out, MajorType::TextString, s.size());
        auto raw = bytes::to_bytes(s);
        out.insert(out.end(), raw.begin(), raw.end());
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Array& a)
    {
        write_head(out, MajorType::Array, a.size());
        for (const auto& item : a)
        {
            if (auto err = write(item))
            {
                return err;
            }
        }
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Map& m)
    {
        write_head(out, MajorType::Map, m.size());
        for (const auto& [key, value] : m)
        {
            if (auto err = write(key))
            {
                return err;
            }
            if (auto err = write(value))
            {
                return err;
            }
        }
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Tag& t)
    {
        write_head(out, MajorType::Tag, t.number());
        return write(t.content());
    }

    std::optional<BridgeError> operator()(const Undefined&)
    {
        write_simple(simple_undefined);
        return std::nullopt;
    }

    std::optional<BridgeError> operator()(const Simple& s)
    {
        if (s.value >= ai_one_byte && s.value < 32)
        {
            return BridgeError::codec_error(std::format("simple value {} is reserved", s.value));
        }
        write_simple(s.value);
        return std::nullopt;
    }

    bytes::buffer_t take() { return std::move(out); }

private:
    bytes::buffer_t out;

    void write_simple(uint8_t v)
    {
        if (v < ai_one_byte)
        {
            out.push_back(bytes::int2byte(make_initial(MajorType::SimpleOrFloat, v)));
        }
        else
        {
            out.push_back(bytes::int2byte(make_initial(MajorType::SimpleOrFloat, ai_one_byte)));
            out.push_back(bytes::int2byte(v));
        }
    }
};

} // namespace

std::expected<bytes::buffer_t, BridgeError> write(const Value& v)
{
    Writer w;
    if (auto err = w.write(v))
    {
        return std::unexpected(std::move(*err));
    }
    return w.take();
}

} // namespace cbor
