#include "bridge/bridge.hpp"
#include "cbor/reader.hpp"
#include "cbor/writer.hpp"
#include "convert/converter.hpp"
#include "fundamentals/hex.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <chrono>
#include <format>

namespace json = boost::json;

namespace
{

double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Bridge::Bridge(Limits limits, BridgeMetrics* metrics)
    : lim(limits)
    , mts(metrics)
{
}

std::expected<json::value, BridgeError> Bridge::decode(std::string_view hex_text) const
{
    auto raw = hex::decode(hex_text);
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    auto value = cbor::read(*raw, cbor::ReadOptions{lim.max_depth});
    if (!value)
    {
        return std::unexpected(value.error());
    }
    return convert::to_json(*value);
}

std::expected<std::string, BridgeError> Bridge::encode(const json::value& value) const
{
    auto raw = cbor::write(convert::from_json(value));
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    return hex::encode(*raw);
}

std::expected<json::value, BridgeError> Bridge::parse(std::string_view text) const
{
    return json_utils::parse(text, lim.max_depth);
}

json::object Bridge::decode_envelope(std::string_view hex_text, std::string_view field) const
{
    auto start = std::chrono::steady_clock::now();
    auto result = decode(hex_text);

    json::object env;
    if (!result)
    {
        LOG_DEBUG("decode failed ({}): {}", errc_name(result.error().code), result.error().message);
        if (mts)
        {
            mts->decodes_failed++;
        }
        env = json_utils::error_msg(describe(result.error(), Direction::Decode));
    }
    else
    {
        if (mts)
        {
            mts->decodes_ok++;
        }
        env["success"] = true;
        env[field] = std::move(*result);
    }
    env["duration_ms"] = elapsed_ms(start);
    return env;
}

json::object Bridge::encode_envelope(const json::value& value, std::string_view field) const
{
    auto start = std::chrono::steady_clock::now();
    auto result = encode(value);

    json::object env;
    if (!result)
    {
        LOG_DEBUG("encode failed ({}): {}", errc_name(result.error().code), result.error().message);
        if (mts)
        {
            mts->encodes_failed++;
        }
        env = json_utils::error_msg(describe(result.error(), Direction::Encode));
    }
    else
    {
        if (mts)
        {
            mts->encodes_ok++;
        }
        env["success"] = true;
        env[field] = *result;
    }
    env["duration_ms"] = elapsed_ms(start);
    return env;
}

json::object Bridge::health()
{
    return json::object{
        {"status", "ok"},
        {"library", library_name},
        {"version", library_version},
        {"language", library_language}
    };
}

std::string Bridge::describe(const BridgeError& err, Direction dir)
{
    switch (err.code)
    {
        case BridgeError::errc::invalid_hex:
            return std::format("Invalid hex: {}", err.message);
        case BridgeError::errc::malformed_json:
            return std::format("Invalid JSON: {}", err.message);
        case BridgeError::errc::codec_error:
            return std::format("CBOR {} error: {}", dir == Direction::Decode ? "decode" : "encode", err.message);
    }
    return err.message;
}
