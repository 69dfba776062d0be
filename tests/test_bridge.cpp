#include <catch2/catch_test_macros.hpp>

#include "bridge/bridge.hpp"
#include "logger/metrics.hpp"

#include <boost/json.hpp>
#include <string>
#include <tuple>

namespace json = boost::json;

namespace
{

std::string error_of(const json::object& env)
{
    REQUIRE(env.at("success") == json::value(false));
    return std::string(env.at("error").as_string());
}

bool starts_with(std::string_view s, std::string_view prefix)
{
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

TEST_CASE("Bridge::decode_envelope wraps the decoded value")
{
    Bridge bridge;
    auto env = bridge.decode_envelope("182a");

    CHECK(env.at("success") == json::value(true));
    CHECK(env.at("result") == json::value(42));
    CHECK(env.at("duration_ms").is_double());
    CHECK(env.at("duration_ms").as_double() >= 0.0);
}

TEST_CASE("Bridge::decode_envelope uses the requested field")
{
    Bridge bridge;
    auto env = bridge.decode_envelope("44deadbeef", "value");

    CHECK(env.at("value") == json::parse(R"({"__cbor_bytes__":"deadbeef"})"));
    CHECK(!env.contains("result"));
}

TEST_CASE("Bridge::decode_envelope reports hex errors")
{
    Bridge bridge;
    CHECK(error_of(bridge.decode_envelope("abc")) == "Invalid hex: odd number of digits (3)");
    CHECK(error_of(bridge.decode_envelope("zz")) == "Invalid hex: invalid character at index 0");
}

TEST_CASE("Bridge::decode_envelope reports codec errors")
{
    Bridge bridge;
    auto env = bridge.decode_envelope("ff");

    CHECK(error_of(env) == "CBOR decode error: unexpected break at offset 0");
    CHECK(env.contains("duration_ms"));
    CHECK(!env.contains("result"));

    CHECK(starts_with(error_of(bridge.decode_envelope("")), "CBOR decode error: "));
}

TEST_CASE("Bridge honours the nesting limit")
{
    Bridge bridge(Bridge::Limits{2});

    CHECK(bridge.decode("818100").has_value());
    auto deep = bridge.decode("81818100");
    REQUIRE(!deep.has_value());
    CHECK(deep.error().code == BridgeError::errc::codec_error);

    CHECK(bridge.parse("[1]").has_value());
    auto deep_json = bridge.parse("[[[[1]]]]");
    REQUIRE(!deep_json.has_value());
    CHECK(deep_json.error().code == BridgeError::errc::malformed_json);
}

TEST_CASE("Bridge::encode_envelope produces lowercase hex")
{
    Bridge bridge;

    auto env = bridge.encode_envelope(json::value(42));
    CHECK(env.at("success") == json::value(true));
    CHECK(env.at("hex") == json::value("182a"));
    CHECK(env.contains("duration_ms"));

    auto bytes = bridge.encode_envelope(json::parse(R"({"__cbor_bytes__":"DEADBEEF"})"), "result");
    CHECK(bytes.at("result") == json::value("44deadbeef"));
}

TEST_CASE("Bridge::encode_envelope reports codec errors")
{
    Bridge bridge;
    auto env = bridge.encode_envelope(json::value(json::string("\xff")));

    CHECK(error_of(env) == "CBOR encode error: text string is not valid UTF-8");
}

TEST_CASE("Bridge::encode then decode")
{
    Bridge bridge;
    auto input = json::parse(R"({"a":[1,-2,{"__cbor_float__":"NaN"}],"t":{"__cbor_tag__":0,"__cbor_value__":"2013-03-21T20:04:00Z"}})");

    auto hex = bridge.encode(input);
    REQUIRE(hex.has_value());

    auto back = bridge.decode(*hex);
    REQUIRE(back.has_value());
    CHECK(back->as_object().at("a") == input.as_object().at("a"));
    CHECK(back->as_object().at("t").as_object().at("__cbor_value__") == json::value("2013-03-21T20:04:00Z"));
}

TEST_CASE("Bridge::parse reports malformed JSON")
{
    Bridge bridge;
    auto parsed = bridge.parse("{\"value\":");

    REQUIRE(!parsed.has_value());
    CHECK(parsed.error().code == BridgeError::errc::malformed_json);
    CHECK(starts_with(Bridge::describe(parsed.error(), Bridge::Direction::Encode), "Invalid JSON: "));
}

TEST_CASE("Bridge::describe prefixes by kind and direction")
{
    CHECK(Bridge::describe(BridgeError::invalid_hex("x"), Bridge::Direction::Decode) == "Invalid hex: x");
    CHECK(Bridge::describe(BridgeError::malformed_json("x"), Bridge::Direction::Decode) == "Invalid JSON: x");
    CHECK(Bridge::describe(BridgeError::codec_error("x"), Bridge::Direction::Decode) == "CBOR decode error: x");
    CHECK(Bridge::describe(BridgeError::codec_error("x"), Bridge::Direction::Encode) == "CBOR encode error: x");
}

TEST_CASE("Bridge::health")
{
    auto h = Bridge::health();

    CHECK(h.at("status") == json::value("ok"));
    CHECK(h.at("library") == json::value("cbor-bridge"));
    CHECK(h.at("version") == json::value(library_version));
    CHECK(h.at("language") == json::value("cpp"));
}

TEST_CASE("Bridge counts conversions")
{
    BridgeMetrics mts;
    Bridge bridge({}, &mts);

    std::ignore = bridge.decode_envelope("00");
    std::ignore = bridge.decode_envelope("0");
    std::ignore = bridge.encode_envelope(json::value(1));

    CHECK(mts.decodes_ok.load() == 1);
    CHECK(mts.decodes_failed.load() == 1);
    CHECK(mts.encodes_ok.load() == 1);
    CHECK(mts.encodes_failed.load() == 0);

    mts.reset();
    CHECK(mts.decodes_ok.load() == 0);
}
