#pragma once
#include "fundamentals/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cbor
{

class Value;
struct MapEntry;

using Bytes = bytes::buffer_t;
using Array = std::vector<Value>;
using Map = std::vector<MapEntry>;  // pair order is significant, keys of any kind

// Sign and 64-bit argument as on the wire: value is argument or -1 - argument
struct Integer
{
    bool negative = false;
    uint64_t argument = 0;

    static Integer from_int64(int64_t v);
    static Integer from_uint64(uint64_t v) { return Integer{false, v}; }

    // Parses an optional sign followed by decimal digits; nullopt on bad syntax or overflow
    static std::optional<Integer> parse(std::string_view text);

    [[nodiscard]] std::optional<int64_t> to_int64() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Integer&) const = default;
};

struct Undefined
{
    bool operator==(const Undefined&) const = default;
};

// Simple values other than false/true/null/undefined
struct Simple
{
    uint8_t value = 0;

    bool operator==(const Simple&) const = default;
};

class Tag
{
public:
    Tag(uint64_t number, Value content);
    Tag(const Tag& other);
    Tag(Tag&& other) noexcept;
    Tag& operator=(const Tag& other);
    Tag& operator=(Tag&& other) noexcept;
    ~Tag();

    [[nodiscard]] uint64_t number() const { return num; }
    [[nodiscard]] const Value& content() const { return *inner; }

    bool operator==(const Tag& other) const;

private:
    uint64_t num;
    std::unique_ptr<Value> inner;
};

class Value
{
public:
    // Alternative order matches Kind
    using storage_t = std::variant<std::nullptr_t, bool, Integer, double, Bytes,
                                   std::string, Array, Map, Tag, Undefined, Simple>;

    enum class Kind : uint8_t
    {
        Null,
        Bool,
        Integer,
        Float,
        Bytes,
        Text,
        Array,
        Map,
        Tag,
        Undefined,
        Simple
    };

    Value() : data(nullptr) {}

    static Value null() { return Value{}; }
    static Value boolean(bool b) { return Value{storage_t{b}}; }
    static Value integer(int64_t v) { return Value{storage_t{Integer::from_int64(v)}}; }
    static Value integer(Integer v) { return Value{storage_t{v}}; }
    static Value floating(double d) { return Value{storage_t{d}}; }
    static Value bytes(Bytes b) { return Value{storage_t{std::move(b)}}; }
    static Value text(std::string s) { return Value{storage_t{std::move(s)}}; }
    static Value array(Array a) { return Value{storage_t{std::move(a)}}; }
    static Value map(Map m) { return Value{storage_t{std::move(m)}}; }
    static Value tag(uint64_t number, Value content);
    static Value undefined() { return Value{storage_t{Undefined{}}}; }
    static Value simple(uint8_t v) { return Value{storage_t{Simple{v}}}; }

    [[nodiscard]] Kind kind() const { return static_cast<Kind>(data.index()); }

    [[nodiscard]] bool is_null() const { return kind() == Kind::Null; }
    [[nodiscard]] bool is_bool() const { return kind() == Kind::Bool; }
    [[nodiscard]] bool is_integer() const { return kind() == Kind::Integer; }
    [[nodiscard]] bool is_float() const { return kind() == Kind::Float; }
    [[nodiscard]] bool is_bytes() const { return kind() == Kind::Bytes; }
    [[nodiscard]] bool is_text() const { return kind() == Kind::Text; }
    [[nodiscard]] bool is_array() const { return kind() == Kind::Array; }
    [[nodiscard]] bool is_map() const { return kind() == Kind::Map; }
    [[nodiscard]] bool is_tag() const { return kind() == Kind::Tag; }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data); }
    [[nodiscard]] const Integer& as_integer() const { return std::get<Integer>(data); }
    [[nodiscard]] double as_float() const { return std::get<double>(data); }
    [[nodiscard]] const Bytes& as_bytes() const { return std::get<Bytes>(data); }
    [[nodiscard]] const std::string& as_text() const { return std::get<std::string>(data); }
    [[nodiscard]] const Array& as_array() const { return std::get<Array>(data); }
    [[nodiscard]] const Map& as_map() const { return std::get<Map>(data); }
    [[nodiscard]] const Tag& as_tag() const { return std::get<Tag>(data); }

    [[nodiscard]] const storage_t& storage() const { return data; }

    // Structural; NaN compares equal to NaN
    bool operator==(const Value& other) const;

private:
    explicit Value(storage_t s) : data(std::move(s)) {}

    storage_t data;
};

struct MapEntry
{
    Value key;
    Value value;

    bool operator==(const MapEntry&) const = default;
};

// Well-formed UTF-8 without surrogates or overlong forms
bool valid_utf8(std::string_view s);

// RFC 8949 section 8 diagnostic notation, e.g. [1, h'00ff', 6("x")]
std::string to_diagnostic(const Value& v);

} // namespace cbor
