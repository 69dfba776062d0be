#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

struct BridgeError
{
    enum class errc : uint8_t
    {
        invalid_hex = 1,
        malformed_json = 2,
        codec_error = 3
    };

    errc code;
    std::string message;

    static BridgeError invalid_hex(std::string msg) { return {errc::invalid_hex, std::move(msg)}; }
    static BridgeError malformed_json(std::string msg) { return {errc::malformed_json, std::move(msg)}; }
    static BridgeError codec_error(std::string msg) { return {errc::codec_error, std::move(msg)}; }
};

constexpr std::string_view errc_name(BridgeError::errc code)
{
    switch (code)
    {
        case BridgeError::errc::invalid_hex:    return "InvalidHex";
        case BridgeError::errc::malformed_json: return "MalformedJson";
        case BridgeError::errc::codec_error:    return "CodecError";
    }
    return "Unknown";
}
