#pragma once

#include "router.hpp"

namespace handlers
{

// Registers the /v1 API on `router`.
void install_routes(Router& router);

net::awaitable<Response> handle_login(RequestContext& ctx, auth::AuthService& auth);
net::awaitable<Response> handle_logout(RequestContext& ctx, auth::AuthService& auth);
net::awaitable<Response> handle_whoami(RequestContext& ctx);
net::awaitable<Response> handle_version(RequestContext& ctx);

}
