#include "config.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <format>
#include <thread>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().get_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return &it->value().as_object();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath, std::optional<uint16_t> cli_port)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    auto result = parse(jv);
    if (result && cli_port.has_value())
    {
        result->srv.port = *cli_port;
    }
    return result;
}

Config Config::load_defaults(std::optional<uint16_t> cli_port)
{
    Config cfg{};
    if (cli_port.has_value())
    {
        cfg.srv.port = *cli_port;
    }
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath, std::optional<uint16_t> cli_port)
{
    auto result = load(filepath, cli_port);
    if (result)
    {
        return *result;
    }
    return load_defaults(cli_port);
}

std::optional<uint16_t> Config::parse_port(std::string_view text)
{
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0)
    {
        return std::nullopt;
    }
    return port;
}

size_t Config::io_thread_count() const
{
    if (srv.io_threads != 0)
    {
        return srv.io_threads;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto srv = section(root, "server"))
    {
        if (auto port = get_uint<uint16_t>(*srv, "port", 1, 65535, 8080); port)
        {
            config.srv.port = *port;
        }
        else
        {
            return std::unexpected(port.error());
        }
        config.srv.bind_address = get_string(*srv, "bind_address", "0.0.0.0");
        if (auto threads = get_uint<size_t>(*srv, "io_threads", 0, 256, 0); threads)
        {
            config.srv.io_threads = *threads;
        }
        else
        {
            return std::unexpected(threads.error());
        }
        if (auto max_body = get_uint<size_t>(*srv, "max_body_size", 1024, 1024 * 1024 * 1024, 16 * 1024 * 1024); max_body)
        {
            config.srv.max_body_size = *max_body;
        }
        else
        {
            return std::unexpected(max_body.error());
        }
    }
    if (auto lim = section(root, "limits"))
    {
        if (auto depth = get_uint<size_t>(*lim, "max_nesting_depth", 1, 10000, 512); depth)
        {
            config.lim.max_nesting_depth = *depth;
        }
        else
        {
            return std::unexpected(depth.error());
        }
    }
    if (auto to = section(root, "timeouts"))
    {
        if (auto read_to = get_uint<uint64_t>(*to, "read_timeout_sec", 1, 3600, 30); read_to)
        {
            config.to.read_timeout = std::chrono::seconds(*read_to);
        }
        else
        {
            return std::unexpected(read_to.error());
        }
        if (auto write_to = get_uint<uint64_t>(*to, "write_timeout_sec", 1, 3600, 30); write_to)
        {
            config.to.write_timeout = std::chrono::seconds(*write_to);
        }
        else
        {
            return std::unexpected(write_to.error());
        }
    }
    if (auto log = section(root, "logging"))
    {
        config.log.level = get_string(*log, "level", "info");
        config.log.file = get_string(*log, "file", "");
        if (auto max_size = get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*log, "enable_console", true);
    }
    return config;
}
