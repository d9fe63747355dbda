#include "handlers.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/cookies.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

namespace json = boost::json;
using json_utils::status_msg;

namespace handlers
{

namespace {

// Accepts both {"username","password"} and the older {"name","pass"}.
std::expected<std::string, std::string> field(const json::object& body, std::string_view key, std::string_view legacy)
{
    if (body.contains(key))
    {
        return json_utils::extract_str(body, key);
    }
    return json_utils::extract_str(body, legacy);
}

}

void install_routes(Router& router)
{
    auto& auth = router.auth();

    router.add(http::verb::post, "/v1/auth/login", Access::Optional,
        [&auth](RequestContext& ctx) { return handle_login(ctx, auth); });

    router.add(http::verb::post, "/v1/auth/logout", Access::Optional,
        [&auth](RequestContext& ctx) { return handle_logout(ctx, auth); });

    router.add(http::verb::get, "/v1/auth/whoami", Access::Required, handle_whoami);
    router.add(http::verb::get, "/v1/version", Access::Public, handle_version);
}

net::awaitable<Response> handle_login(RequestContext& ctx, auth::AuthService& auth)
{
    if (ctx.identity)
    {
        LOG_DEBUG("Client {} already holds a valid session for '{}'", ctx.client, ctx.identity->username);
        co_return make_json_response(ctx.req, http::status::ok, json::object{
            {"status", "Success"},
            {"message", "Already logged in"},
            {"name", ctx.identity->username},
            {"role", auth::to_string(ctx.identity->role)},
        });
    }

    auto parsed = json_utils::parse_object(ctx.req.body());
    if (!parsed)
    {
        LOG_DEBUG("Rejecting login body from {}: {}", ctx.client, parsed.error());
        co_return make_error_response(ctx.req, http::status::bad_request, "Malformed request body");
    }
    const auto& body = *parsed;

    auto username = field(body, "username", "name");
    if (!username)
    {
        co_return make_error_response(ctx.req, http::status::bad_request, username.error());
    }
    auto password = field(body, "password", "pass");
    if (!password)
    {
        co_return make_error_response(ctx.req, http::status::bad_request, password.error());
    }

    auto result = co_await auth.login(*username, std::move(*password));
    crypto::secure_clear(*password);

    if (!result)
    {
        switch (result.error())
        {
            case auth::AuthError::InvalidCredentials:
                ctx.metrics.logins_failed++;
                LOG_INFO("Client {} failed to log in as '{}'", ctx.client, *username);
                co_return make_error_response(ctx.req, http::status::unauthorized, "Invalid credentials");
            default:
                ctx.metrics.errors++;
                LOG_ERROR("Login of '{}' failed: {}", *username, auth::to_string(result.error()));
                co_return make_error_response(ctx.req, http::status::internal_server_error, "Internal server error");
        }
    }

    ctx.metrics.logins_successful++;
    LOG_INFO("Client {} logged in as '{}' ({})", ctx.client, result->identity.username, auth::to_string(result->identity.role));

    auto res = make_json_response(ctx.req, http::status::ok, json::object{
        {"status", "Success"},
        {"message", "Logged in"},
        {"name", result->identity.username},
        {"role", auth::to_string(result->identity.role)},
    });
    res.set(http::field::set_cookie, cookies::make_session(cookies::login_token, result->token, auth.session_ttl()));
    co_return res;
}

net::awaitable<Response> handle_logout(RequestContext& ctx, auth::AuthService& auth)
{
    if (ctx.identity && auth.logout(ctx.token))
    {
        LOG_INFO("Client {} logged out '{}'", ctx.client, ctx.identity->username);
    }

    auto res = make_json_response(ctx.req, http::status::ok, status_msg("Success", "Logged out"));
    res.set(http::field::set_cookie, cookies::make_clear(cookies::login_token));
    co_return res;
}

net::awaitable<Response> handle_whoami(RequestContext& ctx)
{
    co_return make_json_response(ctx.req, http::status::ok, json::object{
        {"name", ctx.identity->username},
        {"role", auth::to_string(ctx.identity->role)},
    });
}

net::awaitable<Response> handle_version(RequestContext& ctx)
{
    co_return make_json_response(ctx.req, http::status::ok, json::object{
        {"name", DNDSERVER_NAME},
        {"version", DNDSERVER_VERSION},
    });
}

}
