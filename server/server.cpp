#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <ranges>

void ConnectionsMap::insert(std::string id, std::shared_ptr<HttpSession> conn)
{
    std::unique_lock lock(mtx);
    conns.insert_or_assign(std::move(id), std::move(conn));
}

void ConnectionsMap::erase(std::string_view id)
{
    std::unique_lock lock(mtx);
    conns.erase(std::string(id));
}

std::shared_ptr<HttpSession> ConnectionsMap::find(std::string_view id) const
{
    std::shared_lock lock(mtx);
    auto it = conns.find(std::string(id));
    return (it != conns.end()) ? it->second : nullptr;
}

std::vector<std::shared_ptr<HttpSession>> ConnectionsMap::snapshot() const
{
    std::shared_lock lock(mtx);
    return conns | std::views::values | std::ranges::to<std::vector>();
}

size_t ConnectionsMap::size() const
{
    std::shared_lock lock(mtx);
    return conns.size();
}


Server::Server(net::io_context& io, const Config& config, ssl::context& tls, Router& rt, ServerMetrics& metrics)
    : io_ctx(io)
    , strand(net::make_strand(io))
    , acceptor(strand)
    , signals(strand, SIGINT, SIGTERM)
    , metrics_signals(strand, SIGUSR1)
    , grace_timer(strand)
    , cfg(config)
    , tls_ctx(tls)
    , router(rt)
    , mts(metrics)
{
}

Server::~Server()
{
    boost::system::error_code ec;
    acceptor.close(ec);
}

std::expected<void, std::string> Server::start()
{
    const auto& srv = cfg.server();

    boost::system::error_code ec;
    auto addr = net::ip::make_address(srv.bind_address, ec);
    if (ec)
    {
        return std::unexpected(std::format("Invalid bind address '{}': {}", srv.bind_address, ec.message()));
    }
    tcp::endpoint ep(addr, srv.port);

    if (acceptor.open(ep.protocol(), ec); ec)
    {
        return std::unexpected(std::format("Failed to open acceptor: {}", ec.message()));
    }
    if (acceptor.set_option(net::socket_base::reuse_address(true), ec); ec)
    {
        return std::unexpected(std::format("Failed to set SO_REUSEADDR: {}", ec.message()));
    }
    if (acceptor.bind(ep, ec); ec)
    {
        return std::unexpected(std::format("Failed to bind {}:{}: {}", srv.bind_address, srv.port, ec.message()));
    }
    if (acceptor.listen(net::socket_base::max_listen_connections, ec); ec)
    {
        return std::unexpected(std::format("Failed to listen: {}", ec.message()));
    }

    net::co_spawn(strand, do_accept(), net::detached);
    wait_shutdown_signal();
    wait_metrics_signal();

    LOG_INFO("Listening on https://{}:{}", srv.bind_address, local_port());
    return {};
}

uint16_t Server::local_port() const
{
    boost::system::error_code ec;
    auto ep = acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void Server::stop()
{
    net::dispatch(strand, [this] { begin_shutdown(); });
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
        begin_shutdown();
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
        // Every connection gets its own strand.
        auto [ec, accepted] = co_await acceptor.async_accept(net::make_strand(io_ctx), net::as_tuple(net::use_awaitable));

        if (ec == net::error::operation_aborted || is_stopping())
        {
            break;
        }
        if (ec)
        {
            LOG_ERROR("Accept error: {}", ec.message());
            mts.errors++;
            continue;
        }

        mts.connections_accepted++;
        tcp::socket sock(std::move(accepted));
        std::string id = std::format("{}", sock);
        auto conn = std::make_shared<HttpSession>(std::move(sock), tls_ctx, *this, router, cfg, id);
        connections.insert(id, conn);
        conn->start();
    }
    LOG_DEBUG("do_accept: loop finished");
}

void Server::remove_connection(std::string_view id)
{
    if (!connections.find(id))
    {
        return;
    }
    connections.erase(id);
    mts.connections_closed++;

    if (is_stopping() && connections.size() == 0)
    {
        net::post(strand, [this] { grace_timer.cancel(); });
    }
}

void Server::begin_shutdown()
{
    if (stopping.exchange(true))
    {
        return;
    }

    boost::system::error_code ec;
    acceptor.close(ec);
    signals.cancel(ec);
    metrics_signals.cancel(ec);

    auto live = connections.snapshot();
    LOG_INFO("Closing acceptor, draining {} connection(s) within {}s",
             live.size(), cfg.server().shutdown_grace.count());
    for (auto& conn : live)
    {
        conn->stop();
    }

    if (connections.size() == 0)
    {
        return;
    }

    grace_timer.expires_after(cfg.server().shutdown_grace);
    grace_timer.async_wait([this](boost::system::error_code) { finish_shutdown(); });
}

void Server::finish_shutdown()
{
    auto left = connections.snapshot();
    if (left.empty())
    {
        LOG_INFO("All connections drained");
        return;
    }

    LOG_WARN("Grace period over, aborting {} connection(s)", left.size());
    for (auto& conn : left)
    {
        conn->abort();
        connections.erase(conn->get_id());
        mts.connections_closed++;
    }
}
