#pragma once

#include "http_types.hpp"
#include "static_files.hpp"
#include "auth/account.hpp"
#include "auth/auth_service.hpp"
#include "logger/metrics.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace net = boost::asio;

// What a route demands of the session cookie before its handler runs.
enum class Access : uint8_t
{
    Public,     // cookie ignored
    Optional,   // identity attached when the cookie checks out
    Required,   // 401 without a valid session
};

struct RequestContext
{
    const Request& req;
    std::string client;
    std::optional<auth::Identity> identity;
    std::string token;
    bool clear_cookie = false;
    ServerMetrics& metrics;
};

class Router
{
public:
    using Handler = std::function<net::awaitable<Response>(RequestContext&)>;

    Router(std::shared_ptr<auth::AuthService> auth, StaticFiles files, ServerMetrics& metrics);

    void add(http::verb method, std::string path, Access access, Handler handler);

    // Never throws; every failure becomes a response.
    [[nodiscard]] net::awaitable<Response> dispatch(const Request& req, std::string client);

    [[nodiscard]] auth::AuthService& auth() { return *auth_svc; }
    [[nodiscard]] const StaticFiles& static_files() const { return files; }

private:
    struct Route
    {
        Access access;
        Handler handler;
    };

    // nullopt when the request may proceed, otherwise the response to send instead.
    std::optional<Response> authenticate(RequestContext& ctx, Access access);
    net::awaitable<Response> run_route(const Route& route, RequestContext& ctx);
    Response serve_static(const Request& req);

    std::shared_ptr<auth::AuthService> auth_svc;
    StaticFiles files;
    std::reference_wrapper<ServerMetrics> mts;
    std::unordered_map<std::string, std::map<http::verb, Route>> routes;
};
