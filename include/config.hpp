#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Bridge configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct ServerCfg
    {
        uint16_t port = 8080;
        std::string bind_address = "0.0.0.0";
        size_t io_threads = 0;
        size_t max_body_size = 16 * 1024 * 1024;
    };

    struct LimitsCfg
    {
        size_t max_nesting_depth = 512;
    };

    struct TimeoutsCfg
    {
        std::chrono::seconds read_timeout{30};
        std::chrono::seconds write_timeout{30};
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, std::optional<uint16_t> cli_port = std::nullopt);
    [[nodiscard]] static Config load_defaults(std::optional<uint16_t> cli_port = std::nullopt);
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath, std::optional<uint16_t> cli_port = std::nullopt);

    // Parses a PORT-style value: decimal, 1..65535
    [[nodiscard]] static std::optional<uint16_t> parse_port(std::string_view text);

    [[nodiscard]] const ServerCfg& server() const { return srv; }
    [[nodiscard]] const LimitsCfg& limits() const { return lim; }
    [[nodiscard]] const TimeoutsCfg& timeouts() const { return to; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    // Resolved worker count: io_threads, or hardware concurrency when 0
    [[nodiscard]] size_t io_thread_count() const;

private:
    ServerCfg srv;
    LimitsCfg lim;
    TimeoutsCfg to;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
