#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "fundamentals/json_utils.hpp"

#include <exception>
#include <tuple>

namespace json = boost::json;

Session::Session(tcp::socket sock, Server& srv, std::string conn_id)
    : stream(std::move(sock))
    , server(srv)
    , id(std::move(conn_id))
{
    LOG_DEBUG("Session opened with id = {}", id);
}

Session::~Session() noexcept
{
    LOG_DEBUG("Session closed with id = {}", id);
}

void Session::start()
{
    net::co_spawn(stream.get_executor(),
        [self = shared_from_this()]() -> net::awaitable<void>
        {
            co_await self->serve();
        },
        [conn_id = id](std::exception_ptr ep)
        {
            if (!ep)
            {
                return;
            }
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& e)
            {
                LOG_ERROR("Session {}: {}", conn_id, e.what());
            }
        });
}

net::awaitable<void> Session::serve()
{
    const auto& cfg = server.config();
    auto& mts = server.metrics();

    while (true)
    {
        http::request_parser<http::string_body> parser;
        parser.body_limit(cfg.server().max_body_size);

        stream.expires_after(cfg.timeouts().read_timeout);
        auto [ec, n] = co_await http::async_read(stream, buffer, parser, net::as_tuple(net::use_awaitable));
        mts.bytes_received += n;

        if (ec == http::error::end_of_stream)
        {
            break;
        }
        if (ec == beast::error::timeout)
        {
            LOG_DEBUG("Session {}: read timeout", id);
            mts.timeouts++;
            break;
        }
        if (ec == http::error::body_limit)
        {
            LOG_WARN("Session {}: request body exceeds {} bytes", id, cfg.server().max_body_size);
            mts.errors++;
            Router::Request head{parser.get().method(), parser.get().target(), parser.get().version()};
            head.keep_alive(false);
            std::ignore = co_await send(Router::json_response(head, http::status::payload_too_large,
                                                              json_utils::error_msg("Request body too large")));
            break;
        }
        if (ec)
        {
            if (ec != net::error::operation_aborted && ec != net::error::connection_reset)
            {
                LOG_WARN("Session {}: read error: {}", id, ec.message());
                mts.errors++;
            }
            break;
        }

        mts.requests++;
        auto req = parser.release();
        LOG_DEBUG("Session {}: {} {}", id, std::string_view(req.method_string()), std::string_view(req.target()));

        auto res = server.router().route(req);
        if (res.result() == http::status::not_found)
        {
            mts.not_found++;
        }

        bool keep_alive = res.keep_alive();
        if (!co_await send(std::move(res)) || !keep_alive)
        {
            break;
        }
    }

    shutdown();
}

net::awaitable<bool> Session::send(Router::Response res)
{
    stream.expires_after(server.config().timeouts().write_timeout);
    auto [ec, n] = co_await http::async_write(stream, res, net::as_tuple(net::use_awaitable));
    server.metrics().bytes_sent += n;

    if (ec == beast::error::timeout)
    {
        LOG_DEBUG("Session {}: write timeout", id);
        server.metrics().timeouts++;
        co_return false;
    }
    if (ec)
    {
        LOG_WARN("Session {}: write error: {}", id, ec.message());
        server.metrics().errors++;
        co_return false;
    }
    co_return true;
}

void Session::shutdown() noexcept
{
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.socket().close(ec);
}
