#pragma once

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <cstdint>
#include <format>

#include "bridge/bridge.hpp"
#include "endpoints.hpp"
#include "logger/metrics.hpp"
#include "router.hpp"

class Config;

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

class Server
{
public:
    Server(net::io_context& io, const Config& config);
    ~Server();

    void start();
    void stop();

    [[nodiscard]] uint16_t local_port() const { return acceptor.local_endpoint().port(); }

    [[nodiscard]] BridgeMetrics& metrics() { return mts; }
    [[nodiscard]] const BridgeMetrics& metrics() const { return mts; }

    [[nodiscard]] const Router& router() const { return rtr; }
    [[nodiscard]] const Config& config() const { return cfg; }

private:
    net::awaitable<void> do_accept();
    void wait_shutdown_signal();
    void wait_metrics_signal();

    net::io_context& io_ctx;
    tcp::acceptor acceptor;
    net::signal_set signals;
    net::signal_set metrics_signals;
    const Config& cfg;
    BridgeMetrics mts;
    Bridge bridge;
    Endpoints endpoints;
    Router rtr;
};

// Serves keep-alive requests in order until EOF, timeout or Connection: close
class Session : public std::enable_shared_from_this<Session>
{
public:
    Session(tcp::socket sock, Server& srv, std::string conn_id);
    ~Session() noexcept;

    void start();

private:
    net::awaitable<void> serve();
    net::awaitable<bool> send(Router::Response res);
    void shutdown() noexcept;

    beast::tcp_stream stream;
    Server& server;
    std::string id;
    beast::flat_buffer buffer;
};

template<>
struct std::formatter<tcp::socket>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const tcp::socket& socket, std::format_context& fc) const
    {
        boost::system::error_code ec;
        auto ep = socket.remote_endpoint(ec);
        if (ec)
        {
            return std::format_to(fc.out(), "<unknown>");
        }
        return std::format_to(fc.out(), "{}:{}", ep.address().to_string(), ep.port());
    }
};
