#pragma once
#include "fundamentals/errors.hpp"
#include "logger/metrics.hpp"

#include <boost/json.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

constexpr std::string_view library_name    = "cbor-bridge";
constexpr std::string_view library_version = "1.0.0";
constexpr std::string_view library_language = "cpp";

// hex -> CBOR -> JSON with markers, and back. Shared by the HTTP and CLI front-ends.
class Bridge
{
public:
    enum class Direction { Decode, Encode };

    struct Limits
    {
        size_t max_depth = 512;
    };

    explicit Bridge(Limits limits = {}, BridgeMetrics* metrics = nullptr);

    [[nodiscard]] std::expected<boost::json::value, BridgeError> decode(std::string_view hex_text) const;
    [[nodiscard]] std::expected<std::string, BridgeError> encode(const boost::json::value& value) const;
    [[nodiscard]] std::expected<boost::json::value, BridgeError> parse(std::string_view text) const;

    // Envelopes carry duration_ms; field names the success payload
    [[nodiscard]] boost::json::object decode_envelope(std::string_view hex_text, std::string_view field = "result") const;
    [[nodiscard]] boost::json::object encode_envelope(const boost::json::value& value, std::string_view field = "hex") const;

    [[nodiscard]] static boost::json::object health();
    [[nodiscard]] static std::string describe(const BridgeError& err, Direction dir);

private:
    Limits lim;
    BridgeMetrics* mts;
};
