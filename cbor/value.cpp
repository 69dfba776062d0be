#include "cbor/value.hpp"
#include "fundamentals/hex.hpp"

#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace cbor
{

Integer Integer::from_int64(int64_t v)
{
    if (v >= 0)
    {
        return Integer{false, static_cast<uint64_t>(v)};
    }
    return Integer{true, static_cast<uint64_t>(-(v + 1))};
}

std::optional<Integer> Integer::parse(std::string_view text)
{
    bool neg = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+'))
    {
        neg = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos)
    {
        return std::nullopt;
    }

    uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude);
    if (ec == std::errc::result_out_of_range)
    {
        // -2^64 is the one magnitude past uint64 that still has a wire form
        auto digits = text.substr(std::min(text.find_first_not_of('0'), text.size()));
        if (neg && digits == "18446744073709551616")
        {
            return Integer{true, std::numeric_limits<uint64_t>::max()};
        }
        return std::nullopt;
    }
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }

    if (!neg || magnitude == 0)
    {
        return Integer{false, magnitude};
    }
    return Integer{true, magnitude - 1};
}

std::optional<int64_t> Integer::to_int64() const
{
    if (argument > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        return std::nullopt;
    }
    auto v = static_cast<int64_t>(argument);
    return negative ? -1 - v : v;
}

std::string Integer::to_string() const
{
    if (!negative)
    {
        return std::to_string(argument);
    }
    if (argument == std::numeric_limits<uint64_t>::max())
    {
        return "-18446744073709551616";
    }
    return "-" + std::to_string(argument + 1);
}

Tag::Tag(uint64_t number, Value content)
    : num(number)
    , inner(std::make_unique<Value>(std::move(content)))
{
}

Tag::Tag(const Tag& other)
    : num(other.num)
    , inner(std::make_unique<Value>(*other.inner))
{
}

Tag::Tag(Tag&& other) noexcept = default;

Tag& Tag::operator=(const Tag& other)
{
    if (this != &other)
    {
        num = other.num;
        inner = std::make_unique<Value>(*other.inner);
    }
    return *this;
}

Tag& Tag::operator=(Tag&& other) noexcept = default;

Tag::~Tag() = default;

bool Tag::operator==(const Tag& other) const
{
    return num == other.num && *inner == *other.inner;
}

Value Value::tag(uint64_t number, Value content)
{
    return Value{storage_t{Tag{number, std::move(content)}}};
}

bool Value::operator==(const Value& other) const
{
    if (data.index() != other.data.index())
    {
        return false;
    }
    if (auto lhs = std::get_if<double>(&data))
    {
        double rhs = std::get<double>(other.data);
        if (std::isnan(*lhs) || std::isnan(rhs))
        {
            return std::isnan(*lhs) && std::isnan(rhs);
        }
        return std::bit_cast<uint64_t>(*lhs) == std::bit_cast<uint64_t>(rhs);
    }
    return data == other.data;
}

bool valid_utf8(std::string_view s)
{
    size_t i = 0;
    while (i < s.size())
    {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size())
        {
            return false;
        }
        for (size_t k = 1; k < len; ++k)
        {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        constexpr uint32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_cp[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        {
            return false;
        }
        i += len;
    }
    return true;
}

namespace
{

std::string quote(std::string_view s)
{
    std::string ret = "\"";
    for (unsigned char ch : s)
    {
        switch (ch)
        {
            case '"':  ret += "\\\""; break;
            case '\\': ret += "\\\\"; break;
            case '\n': ret += "\\n"; break;
            case '\r': ret += "\\r"; break;
            case '\t': ret += "\\t"; break;
            default:
                if (ch < 0x20)
                {
                    ret += std::format("\\u{:04x}", ch);
                }
                else
                {
                    ret.push_back(static_cast<char>(ch));
                }
        }
    }
    ret.push_back('"');
    return ret;
}

std::string float_diag(double d)
{
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";

    auto s = std::format("{}", d);
    if (s.find_first_of(".e") == std::string::npos)
    {
        s += ".0";
    }
    return s;
}

struct DiagVisitor
{
    std::string operator()(std::nullptr_t) const { return "null"; }
    std::string operator()(bool b) const { return b ? "true" : "false"; }
    std::string operator()(const Integer& i) const { return i.to_string(); }
    std::string operator()(double d) const { return float_diag(d); }
    std::string operator()(const Bytes& b) const { return "h'" + hex::encode(b) + "'"; }
    std::string operator()(const std::string& s) const { return quote(s); }
    std::string operator()(const Undefined&) const { return "undefined"; }
    std::string operator()(const Simple& s) const { return std::format("simple({})", s.value); }

    std::string operator()(const Array& a) const
    {
        std::string ret = "[";
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (i) ret += ", ";
            ret += to_diagnostic(a[i]);
        }
        return ret + "]";
    }

    std::string operator()(const Map& m) const
    {
        std::string ret = "{";
        for (size_t i = 0; i < m.size(); ++i)
        {
            if (i) ret += ", ";
            ret += to_diagnostic(m[i].key) + ": " + to_diagnostic(m[i].value);
        }
        return ret + "}";
    }

    std::string operator()(const Tag& t) const
    {
        return std::format("{}({})", t.number(), to_diagnostic(t.content()));
    }
};

} // namespace

std::string to_diagnostic(const Value& v)
{
    return std::visit(DiagVisitor{}, v.storage());
}

} // namespace cbor
