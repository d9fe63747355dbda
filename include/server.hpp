#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <format>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "logger/metrics.hpp"
#include "router.hpp"

class Config;

namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

class HttpSession;
class Server;

class ConnectionsMap
{
public:
    void insert(std::string id, std::shared_ptr<HttpSession> conn);
    void erase(std::string_view id);
    [[nodiscard]] std::shared_ptr<HttpSession> find(std::string_view id) const;
    [[nodiscard]] std::vector<std::shared_ptr<HttpSession>> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<HttpSession>> conns;
};

/**
 * TLS acceptor plus the set of live connections.
 *
 * Acceptor, signal sets and the grace timer live on one strand. On SIGINT or
 * SIGTERM the acceptor closes, idle connections close at once and busy ones
 * after their current response; whatever is still open when
 * server.shutdown_grace_sec runs out is aborted.
 */
class Server
{
public:
    Server(net::io_context& io, const Config& config, ssl::context& tls, Router& router, ServerMetrics& metrics);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    [[nodiscard]] std::expected<void, std::string> start();
    void stop();
    void remove_connection(std::string_view id);

    [[nodiscard]] ServerMetrics& metrics() { return mts; }
    [[nodiscard]] const ServerMetrics& metrics() const { return mts; }
    [[nodiscard]] size_t connection_count() const { return connections.size(); }
    [[nodiscard]] bool is_stopping() const { return stopping.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_accepting() const { return acceptor.is_open(); }
    // Port actually bound; differs from the configured one when that was 0.
    [[nodiscard]] uint16_t local_port() const;

private:
    net::awaitable<void> do_accept();
    void wait_shutdown_signal();
    void wait_metrics_signal();
    void begin_shutdown();
    void finish_shutdown();

    net::io_context& io_ctx;
    net::strand<net::io_context::executor_type> strand;
    tcp::acceptor acceptor;
    net::signal_set signals;
    net::signal_set metrics_signals;
    net::steady_timer grace_timer;
    ConnectionsMap connections;
    const Config& cfg;
    ssl::context& tls_ctx;
    Router& router;
    ServerMetrics& mts;
    std::atomic<bool> stopping{false};
};

class HttpSession : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket sock, ssl::context& tls, Server& srv, Router& router, const Config& config, std::string id);
    ~HttpSession() noexcept;

    void start();

    // Closes once the in-flight request, if any, has been answered.
    void stop();
    // Drops the connection immediately.
    void abort();

    [[nodiscard]] std::string_view get_id() const { return id; }

private:
    net::awaitable<void> run();
    net::awaitable<bool> handshake();
    net::awaitable<void> serve();
    net::awaitable<bool> send(Response& res);
    net::awaitable<void> close();

    beast::ssl_stream<beast::tcp_stream> stream;
    beast::flat_buffer buffer;
    Server& server;
    Router& router;
    const Config& cfg;
    std::string id;

    // Touched on the session strand only.
    bool idle = true;
    bool stopping = false;
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
            return std::format_to(fc.out(), "<disconnected>");
        }
        return std::format_to(fc.out(), "{}:{}", ep.address().to_string(), ep.port());
    }
};
