#include <catch2/catch_test_macros.hpp>

#include "convert/converter.hpp"
#include "convert/marker.hpp"
#include "cbor/value.hpp"

#include <boost/json.hpp>
#include <cmath>
#include <limits>

namespace json = boost::json;
using cbor::Value;

TEST_CASE("to_json maps plain kinds to native JSON")
{
    CHECK(convert::to_json(Value::null()).is_null());
    CHECK(convert::to_json(Value::boolean(true)) == json::value(true));
    CHECK(convert::to_json(Value::integer(42)) == json::value(42));
    CHECK(convert::to_json(Value::integer(-42)) == json::value(-42));
    CHECK(convert::to_json(Value::floating(2.5)) == json::value(2.5));
    CHECK(convert::to_json(Value::text("hi")) == json::value("hi"));

    auto arr = convert::to_json(Value::array({Value::integer(1), Value::text("x"), Value::null()}));
    CHECK(arr == json::parse(R"([1,"x",null])"));
}

TEST_CASE("to_json keeps integers inside the safe envelope as numbers")
{
    constexpr int64_t safe = convert::max_safe_integer;

    auto top = convert::to_json(Value::integer(safe));
    REQUIRE(top.is_int64());
    CHECK(top.get_int64() == safe);

    auto bottom = convert::to_json(Value::integer(-safe));
    REQUIRE(bottom.is_int64());
    CHECK(bottom.get_int64() == -safe);

    CHECK(convert::to_json(Value::integer(safe + 1)) == json::value("9007199254740992"));
    CHECK(convert::to_json(Value::integer(-safe - 1)) == json::value("-9007199254740992"));
    CHECK(convert::to_json(Value::integer(cbor::Integer{false, std::numeric_limits<uint64_t>::max()}))
          == json::value("18446744073709551615"));
    CHECK(convert::to_json(Value::integer(cbor::Integer{true, std::numeric_limits<uint64_t>::max()}))
          == json::value("-18446744073709551616"));
}

TEST_CASE("to_json writes markers for non-JSON kinds")
{
    auto bytes = convert::to_json(Value::bytes({std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}}));
    CHECK(bytes == json::parse(R"({"__cbor_bytes__":"deadbeef"})"));

    CHECK(convert::to_json(Value::floating(std::numeric_limits<double>::quiet_NaN()))
          == json::parse(R"({"__cbor_float__":"NaN"})"));
    CHECK(convert::to_json(Value::floating(std::numeric_limits<double>::infinity()))
          == json::parse(R"({"__cbor_float__":"Infinity"})"));
    CHECK(convert::to_json(Value::floating(-std::numeric_limits<double>::infinity()))
          == json::parse(R"({"__cbor_float__":"-Infinity"})"));

    auto tag = convert::to_json(Value::tag(1, Value::integer(1363896240)));
    REQUIRE(tag.is_object());
    CHECK(tag.as_object().at("__cbor_tag__").to_number<uint64_t>() == 1);
    CHECK(tag.as_object().at("__cbor_value__") == json::value(1363896240));

    CHECK(convert::to_json(Value::undefined()).is_null());
    CHECK(convert::to_json(Value::simple(16)).is_null());
}

TEST_CASE("to_json stringifies map keys")
{
    CHECK(convert::key_string(Value::text("k")) == "k");
    CHECK(convert::key_string(Value::integer(-3)) == "-3");
    CHECK(convert::key_string(Value::bytes({std::byte{0x01}, std::byte{0x02}})) == "0102");
    CHECK(convert::key_string(Value::boolean(true)) == "true");
    CHECK(convert::key_string(Value::null()) == "null");
    CHECK(convert::key_string(Value::floating(1.5)) == "1.5");
    CHECK(convert::key_string(Value::array({Value::integer(1), Value::integer(2)})) == "[1, 2]");

    cbor::Map m;
    m.push_back({Value::integer(1), Value::text("first")});
    m.push_back({Value::boolean(false), Value::text("flag")});
    auto obj = convert::to_json(Value::map(std::move(m)));
    CHECK(obj == json::parse(R"({"1":"first","false":"flag"})"));
}

TEST_CASE("to_json keeps the last value for colliding keys")
{
    cbor::Map m;
    m.push_back({Value::integer(1), Value::text("a")});
    m.push_back({Value::text("1"), Value::text("b")});
    auto obj = convert::to_json(Value::map(std::move(m)));

    REQUIRE(obj.is_object());
    CHECK(obj.as_object().size() == 1);
    CHECK(obj.as_object().at("1") == json::value("b"));
}

TEST_CASE("from_json maps native JSON")
{
    CHECK(convert::from_json(json::value(nullptr)) == Value::null());
    CHECK(convert::from_json(json::value(false)) == Value::boolean(false));
    CHECK(convert::from_json(json::value(42)) == Value::integer(42));
    CHECK(convert::from_json(json::value(-1)) == Value::integer(-1));
    CHECK(convert::from_json(json::value(1.5)) == Value::floating(1.5));
    CHECK(convert::from_json(json::value("hello")) == Value::text("hello"));

    auto uint_literal = convert::from_json(json::parse("18446744073709551615"));
    REQUIRE(uint_literal.is_float());
    CHECK(uint_literal.as_float() == 18446744073709551615.0);

    auto obj = convert::from_json(json::parse(R"({"b":1,"a":[true]})"));
    REQUIRE(obj.is_map());
    const auto& entries = obj.as_map();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].key == Value::text("b"));
    CHECK(entries[1].key == Value::text("a"));
    CHECK(entries[1].value == Value::array({Value::boolean(true)}));
}

TEST_CASE("from_json reads decimal strings as integers")
{
    CHECK(convert::from_json(json::value("9007199254740992")) == Value::integer(9007199254740992));
    CHECK(convert::from_json(json::value("42")) == Value::integer(42));
    CHECK(convert::from_json(json::value("-18446744073709551616"))
          == Value::integer(cbor::Integer{true, std::numeric_limits<uint64_t>::max()}));

    CHECK(convert::from_json(json::value("18446744073709551616")) == Value::text("18446744073709551616"));
    CHECK(convert::from_json(json::value("1.5")) == Value::text("1.5"));
    CHECK(convert::from_json(json::value("")) == Value::text(""));
    CHECK(convert::from_json(json::value("12ab")) == Value::text("12ab"));
}

TEST_CASE("from_json recognises markers")
{
    auto bytes = convert::from_json(json::parse(R"({"__cbor_bytes__":"DEADbeef"})"));
    REQUIRE(bytes.is_bytes());
    CHECK(bytes.as_bytes().size() == 4);

    auto nan = convert::from_json(json::parse(R"({"__cbor_float__":"NaN"})"));
    REQUIRE(nan.is_float());
    CHECK(std::isnan(nan.as_float()));
    CHECK(convert::from_json(json::parse(R"({"__cbor_float__":"Infinity"})"))
          == Value::floating(std::numeric_limits<double>::infinity()));
    CHECK(convert::from_json(json::parse(R"({"__cbor_float__":"-Infinity"})"))
          == Value::floating(-std::numeric_limits<double>::infinity()));
    CHECK(convert::from_json(json::parse(R"({"__cbor_float__":"huge"})")) == Value::null());

    auto tag = convert::from_json(json::parse(R"({"__cbor_tag__":32,"__cbor_value__":"http://a"})"));
    CHECK(tag == Value::tag(32, Value::text("http://a")));

    auto big_tag = convert::from_json(json::parse(R"({"__cbor_tag__":18446744073709551615,"__cbor_value__":null})"));
    REQUIRE(big_tag.is_tag());
    CHECK(big_tag.as_tag().number() == std::numeric_limits<uint64_t>::max());

    CHECK(convert::from_json(json::parse(R"({"__cbor_undefined__":true})")) == Value::null());
}

TEST_CASE("from_json applies marker priority")
{
    auto v = convert::from_json(json::parse(R"({"__cbor_float__":"NaN","__cbor_bytes__":"00"})"));
    CHECK(v.is_bytes());

    auto f = convert::from_json(json::parse(R"({"__cbor_undefined__":1,"__cbor_float__":"Infinity"})"));
    CHECK(f.is_float());

    auto t = convert::from_json(json::parse(R"({"__cbor_undefined__":1,"__cbor_tag__":2,"__cbor_value__":0})"));
    CHECK(t.is_tag());
}

TEST_CASE("from_json falls back to a plain map for malformed markers")
{
    auto bad_hex = convert::from_json(json::parse(R"({"__cbor_bytes__":"zz"})"));
    REQUIRE(bad_hex.is_map());
    REQUIRE(bad_hex.as_map().size() == 1);
    CHECK(bad_hex.as_map()[0].key == Value::text("__cbor_bytes__"));
    CHECK(bad_hex.as_map()[0].value == Value::text("zz"));

    auto not_string = convert::from_json(json::parse(R"({"__cbor_bytes__":5})"));
    REQUIRE(not_string.is_map());
    CHECK(not_string.as_map()[0].value == Value::integer(5));

    CHECK(convert::from_json(json::parse(R"({"__cbor_tag__":-1,"__cbor_value__":0})")).is_map());
    CHECK(convert::from_json(json::parse(R"({"__cbor_tag__":1.5,"__cbor_value__":0})")).is_map());
    CHECK(convert::from_json(json::parse(R"({"__cbor_tag__":1})")).is_map());
    CHECK(convert::from_json(json::parse(R"({"__cbor_float__":0})")).is_map());
}

TEST_CASE("JSON survives from_json then to_json")
{
    auto original = json::parse(R"({
        "n": 1,
        "neg": -9007199254740991,
        "f": 0.25,
        "s": "text",
        "list": [null, true, false, [], {}],
        "bin": {"__cbor_bytes__": "00ff"},
        "inf": {"__cbor_float__": "-Infinity"},
        "big": "9007199254740993"
    })");

    CHECK(convert::to_json(convert::from_json(original)) == original);
}

TEST_CASE("Values survive to_json then from_json")
{
    auto round_trip = [](const Value& v)
    {
        CHECK(convert::from_json(convert::to_json(v)) == v);
    };

    constexpr int64_t safe = convert::max_safe_integer;

    SECTION("integers on both sides of the safe envelope")
    {
        round_trip(Value::integer(0));
        round_trip(Value::integer(safe));
        round_trip(Value::integer(-safe));
        round_trip(Value::integer(safe + 1));
        round_trip(Value::integer(-safe - 1));
        round_trip(Value::integer(std::numeric_limits<int64_t>::max()));
        round_trip(Value::integer(std::numeric_limits<int64_t>::min()));
        round_trip(Value::integer(cbor::Integer{false, std::numeric_limits<uint64_t>::max()}));
        round_trip(Value::integer(cbor::Integer{true, uint64_t{1} << 63}));
        round_trip(Value::integer(cbor::Integer{true, std::numeric_limits<uint64_t>::max()}));
    }

    SECTION("floats")
    {
        round_trip(Value::floating(2.0));
        round_trip(Value::floating(-0.0));
        round_trip(Value::floating(0.1));
        round_trip(Value::floating(-1.5e300));
        round_trip(Value::floating(std::numeric_limits<double>::denorm_min()));
        round_trip(Value::floating(std::numeric_limits<double>::quiet_NaN()));
        round_trip(Value::floating(std::numeric_limits<double>::infinity()));
        round_trip(Value::floating(-std::numeric_limits<double>::infinity()));
    }

    SECTION("scalars and strings")
    {
        round_trip(Value::null());
        round_trip(Value::boolean(false));
        round_trip(Value::text("plain text"));
        round_trip(Value::text(""));
        round_trip(Value::bytes({}));
        round_trip(Value::bytes({std::byte{0x00}, std::byte{0x7F}, std::byte{0xFF}}));
    }

    SECTION("tags around nested containers")
    {
        cbor::Map inner;
        inner.push_back({Value::text("z"), Value::array({Value::integer(1), Value::bytes({std::byte{0xAB}})})});
        inner.push_back({Value::text("a"), Value::floating(2.5)});

        round_trip(Value::tag(32, Value::text("http://example.com")));
        round_trip(Value::tag(std::numeric_limits<uint64_t>::max(), Value::map(std::move(inner))));
        round_trip(Value::tag(1, Value::tag(2, Value::array({}))));
    }

    SECTION("text-keyed maps keep pair order")
    {
        cbor::Map m;
        m.push_back({Value::text("b"), Value::integer(safe + 10)});
        m.push_back({Value::text("a"), Value::array({Value::null(), Value::boolean(true)})});
        m.push_back({Value::text("c"), Value::map({})});
        round_trip(Value::map(std::move(m)));
    }
}

TEST_CASE("marker::priority lists the matchers in order")
{
    CHECK((convert::marker::priority[0] == &convert::marker::match_bytes));
    CHECK((convert::marker::priority[1] == &convert::marker::match_float));
    CHECK((convert::marker::priority[2] == &convert::marker::match_tag));
    CHECK((convert::marker::priority[3] == &convert::marker::match_undefined));
}
