#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>

Server::Server(net::io_context& io, const Config& config)
    : io_ctx(io)
    , acceptor(io, tcp::endpoint(net::ip::make_address(config.server().bind_address), config.server().port))
    , signals(io, SIGINT, SIGTERM)
    , metrics_signals(io, SIGUSR1)
    , cfg(config)
    , bridge(Bridge::Limits{config.limits().max_nesting_depth}, &mts)
    , endpoints(bridge, mts)
{
    acceptor.set_option(net::socket_base::reuse_address(true));
    endpoints.install(rtr);
}

Server::~Server()
{
    LOG_INFO("{}", mts);
}

void Server::start()
{
    net::co_spawn(io_ctx, do_accept(), net::detached);
    wait_shutdown_signal();
    wait_metrics_signal();
}

void Server::stop()
{
    boost::system::error_code ec;
    acceptor.close(ec);
    signals.cancel(ec);
    metrics_signals.cancel(ec);
    io_ctx.stop();
}

void Server::wait_shutdown_signal()
{
    signals.async_wait([this](boost::system::error_code ec, int sig)
    {
        if (ec)
        {
            return;
        }
        LOG_WARN("Received signal {}, shutting down...", sig);
        stop();
    });
}

void Server::wait_metrics_signal()
{
    metrics_signals.async_wait([this](boost::system::error_code ec, int sig)
    {
        if (ec || sig != SIGUSR1)
        {
            return;
        }
        LOG_INFO("{}", mts);
        wait_metrics_signal();
    });
}

net::awaitable<void> Server::do_accept()
{
    LOG_DEBUG("do_accept: starting loop");
    while (acceptor.is_open())
    {
        // Each session runs on its own strand
        auto [ec, sock] = co_await acceptor.async_accept(net::make_strand(io_ctx), net::as_tuple(net::use_awaitable));

        if (ec == net::error::operation_aborted)
        {
            co_return;
        }
        if (ec)
        {
            LOG_ERROR("Accept error: {}", ec.message());
            mts.errors++;
            continue;
        }

        mts.connections_accepted++;
        tcp::socket socket(std::move(sock));
        std::string id = std::format("{}", socket);
        LOG_DEBUG("do_accept: accepted {}", id);
        std::make_shared<Session>(std::move(socket), *this, std::move(id))->start();
    }
}
