#include "router.hpp"
#include "fundamentals/cookies.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <exception>

namespace json = boost::json;

Response make_json_response(const Request& req, http::status status, const json::object& body)
{
    Response res{status, req.version()};
    res.set(http::field::server, DNDSERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

Response make_error_response(const Request& req, http::status status, std::string_view msg)
{
    return make_json_response(req, status, json_utils::status_msg("Error", msg));
}

Router::Router(std::shared_ptr<auth::AuthService> auth, StaticFiles static_files, ServerMetrics& metrics)
    : auth_svc(std::move(auth))
    , files(std::move(static_files))
    , mts(metrics)
{
}

void Router::add(http::verb method, std::string path, Access access, Handler handler)
{
    routes[std::move(path)].insert_or_assign(method, Route{access, std::move(handler)});
}

std::optional<Response> Router::authenticate(RequestContext& ctx, Access access)
{
    if (access == Access::Public)
    {
        return std::nullopt;
    }

    auto header = ctx.req[http::field::cookie];
    auto token = cookies::find(std::string_view(header.data(), header.size()), cookies::login_token);
    if (token && !token->empty())
    {
        auto id = auth_svc->authenticate(*token);
        if (id)
        {
            ctx.identity = std::move(*id);
            ctx.token = std::string(*token);
        }
        else if (id.error() == auth::AuthError::StorageUnavailable)
        {
            mts.get().errors++;
            return make_error_response(ctx.req, http::status::internal_server_error, "Internal server error");
        }
        else
        {
            LOG_DEBUG("Client {} presented a stale session ({})", ctx.client, auth::to_string(id.error()));
            mts.get().sessions_rejected++;
            ctx.clear_cookie = true;
        }
    }

    if (access == Access::Required && !ctx.identity)
    {
        auto res = make_error_response(ctx.req, http::status::unauthorized, "Unauthorized");
        if (ctx.clear_cookie)
        {
            res.set(http::field::set_cookie, cookies::make_clear(cookies::login_token));
        }
        return res;
    }
    return std::nullopt;
}

net::awaitable<Response> Router::run_route(const Route& route, RequestContext& ctx)
{
    if (auto denied = authenticate(ctx, route.access))
    {
        co_return std::move(*denied);
    }

    Response res = co_await route.handler(ctx);
    if (ctx.clear_cookie && res.find(http::field::set_cookie) == res.end())
    {
        res.set(http::field::set_cookie, cookies::make_clear(cookies::login_token));
    }
    co_return res;
}

Response Router::serve_static(const Request& req)
{
    if (req.method() != http::verb::get && req.method() != http::verb::head)
    {
        auto res = make_error_response(req, http::status::method_not_allowed, "Method not allowed");
        res.set(http::field::allow, "GET, HEAD");
        return res;
    }

    if (auto res = files.serve(req))
    {
        mts.get().static_served++;
        return std::move(*res);
    }

    Response res{http::status::not_found, req.version()};
    res.set(http::field::server, DNDSERVER_NAME);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = "Not Found";
    res.prepare_payload();
    if (req.method() == http::verb::head)
    {
        res.body().clear();
    }
    return res;
}

net::awaitable<Response> Router::dispatch(const Request& req, std::string client)
{
    mts.get().requests++;

    auto target = req.target();
    std::string path(target.data(), target.size());
    path = path.substr(0, path.find('?'));

    LOG_DEBUG("{} {} from {}", std::string_view(req.method_string().data(), req.method_string().size()), path, client);

    try
    {
        auto it = routes.find(path);
        if (it != routes.end())
        {
            auto rit = it->second.find(req.method());
            if (rit == it->second.end())
            {
                std::string allow;
                for (const auto& [verb, _] : it->second)
                {
                    if (!allow.empty())
                    {
                        allow += ", ";
                    }
                    auto name = http::to_string(verb);
                    allow.append(name.data(), name.size());
                }
                auto res = make_error_response(req, http::status::method_not_allowed, "Method not allowed");
                res.set(http::field::allow, allow);
                co_return res;
            }

            RequestContext ctx{req, std::move(client), std::nullopt, {}, false, mts.get()};
            co_return co_await run_route(rit->second, ctx);
        }

        if (path == "/v1" || path.starts_with("/v1/"))
        {
            co_return make_error_response(req, http::status::not_found, "Not found");
        }

        co_return serve_static(req);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Handler for {} failed: {}", path, e.what());
        mts.get().errors++;
    }
    co_return make_error_response(req, http::status::internal_server_error, "Internal server error");
}
