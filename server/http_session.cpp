#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"

HttpSession::HttpSession(tcp::socket sock, ssl::context& tls, Server& srv, Router& rt, const Config& config, std::string conn_id)
    : stream(std::move(sock), tls)
    , server(srv)
    , router(rt)
    , cfg(config)
    , id(std::move(conn_id))
{
    LOG_DEBUG("Connection accepted from {}", id);
}

HttpSession::~HttpSession() noexcept
{
    LOG_DEBUG("Disconnected {}", id);
}

void HttpSession::start()
{
    net::co_spawn(stream.get_executor(),
        [self = shared_from_this()]() -> net::awaitable<void>
        {
            co_await self->run();
        },
        net::detached);
}

void HttpSession::stop()
{
    net::dispatch(stream.get_executor(), [self = shared_from_this()]
    {
        self->stopping = true;
        if (self->idle)
        {
            beast::get_lowest_layer(self->stream).cancel();
        }
    });
}

void HttpSession::abort()
{
    net::dispatch(stream.get_executor(), [self = shared_from_this()]
    {
        self->stopping = true;
        beast::get_lowest_layer(self->stream).close();
    });
}

net::awaitable<void> HttpSession::run()
{
    if (co_await handshake())
    {
        co_await serve();
        co_await close();
    }
    server.remove_connection(id);
}

net::awaitable<bool> HttpSession::handshake()
{
    auto& metrics = server.metrics();

    beast::get_lowest_layer(stream).expires_after(cfg.timeouts().handshake_timeout);
    auto [ec] = co_await stream.async_handshake(ssl::stream_base::server, net::as_tuple(net::use_awaitable));
    beast::get_lowest_layer(stream).expires_never();

    if (ec)
    {
        if (ec == beast::error::timeout)
        {
            metrics.timeouts++;
            LOG_INFO("TLS handshake with {} timed out", id);
        }
        else
        {
            LOG_INFO("TLS handshake with {} failed: {}", id, ec.message());
        }
        metrics.handshakes_failed++;
        co_return false;
    }

    metrics.handshakes_completed++;
    co_return true;
}

net::awaitable<void> HttpSession::serve()
{
    auto& metrics = server.metrics();

    while (!stopping)
    {
        idle = true;

        http::request_parser<http::string_body> parser;
        parser.body_limit(cfg.server().max_body_size);

        beast::get_lowest_layer(stream).expires_after(cfg.timeouts().read_timeout);
        auto [ec, n] = co_await http::async_read(stream, buffer, parser, net::as_tuple(net::use_awaitable));
        std::ignore = n;

        if (ec)
        {
            if (ec == http::error::end_of_stream || ec == net::error::operation_aborted || ec == net::ssl::error::stream_truncated)
            {
                co_return;
            }
            if (ec == beast::error::timeout)
            {
                metrics.timeouts++;
                LOG_DEBUG("Connection {} idle for too long", id);
                co_return;
            }
            if (ec == http::error::body_limit)
            {
                Request head;
                head.version(11);
                head.keep_alive(false);
                auto res = make_error_response(head, http::status::payload_too_large, "Request body too large");
                co_await send(res);
                co_return;
            }

            LOG_DEBUG("Read from {} failed: {}", id, ec.message());
            if (parser.is_header_done() || buffer.size() > 0)
            {
                Request head;
                head.version(11);
                head.keep_alive(false);
                auto res = make_error_response(head, http::status::bad_request, "Malformed request");
                co_await send(res);
            }
            co_return;
        }

        idle = false;
        Request req = parser.release();

        Response res = co_await router.dispatch(req, id);
        if (stopping)
        {
            res.keep_alive(false);
        }

        if (!co_await send(res) || !res.keep_alive())
        {
            co_return;
        }
    }
}

net::awaitable<bool> HttpSession::send(Response& res)
{
    beast::get_lowest_layer(stream).expires_after(cfg.timeouts().write_timeout);
    auto [ec, n] = co_await http::async_write(stream, res, net::as_tuple(net::use_awaitable));
    std::ignore = n;

    if (ec)
    {
        if (ec == beast::error::timeout)
        {
            server.metrics().timeouts++;
        }
        LOG_DEBUG("Write to {} failed: {}", id, ec.message());
        co_return false;
    }
    co_return true;
}

net::awaitable<void> HttpSession::close()
{
    auto& lowest = beast::get_lowest_layer(stream);
    if (!lowest.socket().is_open())
    {
        co_return;
    }

    lowest.expires_after(cfg.timeouts().write_timeout);
    auto [ec] = co_await stream.async_shutdown(net::as_tuple(net::use_awaitable));
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof)
    {
        LOG_DEBUG("TLS shutdown with {} failed: {}", id, ec.message());
    }

    boost::system::error_code sec;
    lowest.socket().shutdown(tcp::socket::shutdown_both, sec);
    lowest.close();
}
