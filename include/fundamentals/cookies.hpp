#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cookies
{

inline constexpr std::string_view login_token = "login-token";

// Value of cookie `name` in a Cookie request header, if present.
[[nodiscard]] std::optional<std::string_view> find(std::string_view header, std::string_view name);

// Set-Cookie value for a host-only, TLS-only, script-invisible session cookie.
[[nodiscard]] std::string make_session(std::string_view name, std::string_view value, std::chrono::seconds max_age);

[[nodiscard]] std::string make_clear(std::string_view name);

} // namespace cookies
