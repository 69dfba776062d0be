#include "cbor/reader.hpp"
#include "cbor/major.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <string>

namespace cbor
{

namespace
{

using result_t = std::expected<Value, BridgeError>;

class Reader
{
public:
    Reader(std::span<const std::byte> data, const ReadOptions& opts)
        : buf(data)
        , max_depth(opts.max_depth)
    {
    }

    result_t read_top()
    {
        auto v = read_item(0);
        if (!v)
        {
            return v;
        }
        if (pos != buf.size())
        {
            return fail(std::format("{} trailing byte(s) after top-level item", buf.size() - pos));
        }
        return v;
    }

private:
    struct Head
    {
        MajorType major;
        uint8_t info;
        uint64_t argument;   // meaningless when indefinite
        bool indefinite;
    };

    std::span<const std::byte> buf;
    size_t pos = 0;
    size_t max_depth;

    std::unexpected<BridgeError> fail(std::string_view what) const
    {
        return std::unexpected(BridgeError::codec_error(std::format("{} at offset {}", what, pos)));
    }

    size_t remaining() const { return buf.size() - pos; }

    std::optional<uint8_t> peek() const
    {
        if (pos >= buf.size())
        {
            return std::nullopt;
        }
        return std::to_integer<uint8_t>(buf[pos]);
    }

    template<std::integral Ty>
    std::optional<Ty> take_int()
    {
        if (remaining() < sizeof(Ty))
        {
            return std::nullopt;
        }
        Ty v = bytes::to_int<Ty>(buf.subspan(pos, sizeof(Ty)));
        pos += sizeof(Ty);
        return v;
    }

    std::expected<Head, BridgeError> read_head()
    {
        auto initial = take_int<uint8_t>();
        if (!initial)
        {
            return fail("unexpected end of input");
        }

        Head h{major_of(*initial), info_of(*initial), 0, false};
        std::optional<uint64_t> arg;
        switch (h.info)
        {
            case ai_one_byte:    arg = take_int<uint8_t>(); break;
            case ai_two_bytes:   arg = take_int<uint16_t>(); break;
            case ai_four_bytes:  arg = take_int<uint32_t>(); break;
            case ai_eight_bytes: arg = take_int<uint64_t>(); break;
            case 28:
            [[fallthrough]];
            case 29:
            [[fallthrough]];
            case 30:
                --pos;
                return fail(std::format("reserved additional information {}", h.info));
            case ai_indefinite:
                h.indefinite = true;
                return h;
            default:
                arg = h.info;
                break;
        }
        if (!arg)
        {
            return fail("unexpected end of input");
        }
        h.argument = *arg;
        return h;
    }

    std::expected<Bytes, BridgeError> read_chunk(uint64_t len)
    {
        if (len > remaining())
        {
            return fail(std::format("string length {} exceeds remaining input", len));
        }
        auto chunk = buf.subspan(pos, static_cast<size_t>(len));
        pos += static_cast<size_t>(len);
        return Bytes(chunk.begin(), chunk.end());
    }

    // Byte and text strings share the chunking rules
    std::expected<Bytes, BridgeError> read_string_body(const Head& h)
    {
        if (!h.indefinite)
        {
            return read_chunk(h.argument);
        }

        Bytes out;
        while (true)
        {
            auto next = peek();
            if (!next)
            {
                return fail("unterminated indefinite-length string");
            }
            if (*next == break_byte)
            {
                ++pos;
                return out;
            }
            auto chunk_head = read_head();
            if (!chunk_head)
            {
                return std::unexpected(chunk_head.error());
            }
            if (chunk_head->major != h.major || chunk_head->indefinite)
            {
                return fail("invalid chunk inside indefinite-length string");
            }
            auto chunk = read_chunk(chunk_head->argument);
            if (!chunk)
            {
                return chunk;
            }
            out.insert(out.end(), chunk->begin(), chunk->end());
        }
    }

    bool at_break()
    {
        if (auto next = peek(); next && *next == break_byte)
        {
            ++pos;
            return true;
        }
        return false;
    }

    result_t read_array(const Head& h, size_t depth)
    {
        Array items;
        if (!h.indefinite)
        {
            // Every item takes at least one byte
            if (h.argument > remaining())
            {
                return fail(std::format("array length {} exceeds remaining input", h.argument));
            }
            items.reserve(static_cast<size_t>(h.argument));
            for (uint64_t i = 0; i < h.argument; ++i)
            {
                auto item = read_item(depth + 1);
                if (!item)
                {
                    return item;
                }
                items.push_back(std::move(*item));
            }
            return Value::array(std::move(items));
        }

        while (!at_break())
        {
            if (!peek())
            {
                return fail("unterminated indefinite-length array");
            }
            auto item = read_item(depth + 1);
            if (!item)
            {
                return item;
            }
            items.push_back(std::move(*item));
        }
        return Value::array(std::move(items));
    }

    result_t read_map(const Head& h, size_t depth)
    {
        Map entries;
        auto read_entry = [&]() -> std::optional<BridgeError>
        {
            auto key = read_item(depth + 1);
            if (!key)
            {
                return key.error();
            }
            auto val = read_item(depth + 1);
            if (!val)
            {
                return val.error();
            }
            entries.push_back(MapEntry{std::move(*key), std::move(*val)});
            return std::nullopt;
        };

        if (!h.indefinite)
        {
            if (h.argument > remaining() / 2)
            {
                return fail(std::format("map length {} exceeds remaining input", h.argument));
            }
            entries.reserve(static_cast<size_t>(h.argument));
            for (uint64_t i = 0; i < h.argument; ++i)
            {
                if (auto err = read_entry())
                {
                    return std::unexpected(std::move(*err));
                }
            }
            return Value::map(std::move(entries));
        }

        while (!at_break())
        {
            if (!peek())
            {
                return fail("unterminated indefinite-length map");
            }
            if (auto err = read_entry())
            {
                return std::unexpected(std::move(*err));
            }
        }
        return Value::map(std::move(entries));
    }

    static double half_to_double(uint16_t half)
    {
        int exp = (half >> 10) & 0x1F;
        int mant = half & 0x3FF;
        double val;
        if (exp == 0)
        {
            val = std::ldexp(mant, -24);
        }
        else if (exp != 31)
        {
            val = std::ldexp(mant + 1024, exp - 25);
        }
        else
        {
            val = mant == 0 ? std::numeric_limits<double>::infinity()
                            : std::numeric_limits<double>::quiet_NaN();
        }
        return (half & 0x8000) ? -val : val;
    }

    result_t read_simple_or_float(const Head& h)
    {
        if (h.indefinite)
        {
            --pos;
            return fail("unexpected break");
        }
        switch (h.info)
        {
            case simple_false:     return Value::boolean(false);
            case simple_true:      return Value::boolean(true);
            case simple_null:      return Value::null();
            case simple_undefined: return Value::undefined();
            case ai_one_byte:
                if (h.argument < 32)
                {
                    return fail(std::format("simple value {} must use the short form", h.argument));
                }
                return Value::simple(static_cast<uint8_t>(h.argument));
            case ai_two_bytes:
                return Value::floating(half_to_double(static_cast<uint16_t>(h.argument)));
            case ai_four_bytes:
                return Value::floating(std::bit_cast<float>(static_cast<uint32_t>(h.argument)));
            case ai_eight_bytes:
                return Value::floating(std::bit_cast<double>(h.argument));
            default:
                return Value::simple(h.info);
        }
    }

    result_t read_item(size_t depth)
    {
        if (depth > max_depth)
        {
            return fail(std::format("nesting depth exceeds limit of {}", max_depth));
        }

        auto head = read_head();
        if (!head)
        {
            return std::unexpected(head.error());
        }
        const Head& h = *head;

        switch (h.major)
        {
            case MajorType::Unsigned:
            [[fallthrough]];
            case MajorType::Negative:
                if (h.indefinite)
                {
                    return fail("indefinite length not allowed for integers");
                }
                return Value::integer(Integer{h.major == MajorType::Negative, h.argument});

            case MajorType::ByteString:
            {
                auto body = read_string_body(h);
                if (!body)
                {
                    return std::unexpected(body.error());
                }
                return Value::bytes(std::move(*body));
            }

            case MajorType::TextString:
            {
                auto body = read_string_body(h);
                if (!body)
                {
                    return std::unexpected(body.error());
                }
                auto text = bytes::to_string(*body);
                if (!valid_utf8(text))
                {
                    return fail("text string is not valid UTF-8");
                }
                return Value::text(std::move(text));
            }

            case MajorType::Array:
                return read_array(h, depth);

            case MajorType::Map:
                return read_map(h, depth);

            case MajorType::Tag:
            {
                if (h.indefinite)
                {
                    return fail("indefinite length not allowed for tags");
                }
                auto content = read_item(depth + 1);
                if (!content)
                {
                    return content;
                }
                return Value::tag(h.argument, std::move(*content));
            }

            case MajorType::SimpleOrFloat:
                return read_simple_or_float(h);
        }
        return fail("unknown major type");
    }
};

} // namespace

std::expected<Value, BridgeError> read(std::span<const std::byte> data, const ReadOptions& opts)
{
    if (data.empty())
    {
        return std::unexpected(BridgeError::codec_error("empty input"));
    }
    return Reader(data, opts).read_top();
}

} // namespace cbor
