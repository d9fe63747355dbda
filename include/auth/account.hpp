#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <optional>

namespace auth
{

enum class Role : uint8_t
{
    Player = 1,
    Root = 10,
};

[[nodiscard]] constexpr std::string_view to_string(Role r)
{
    switch (r)
    {
        case Role::Root:   return "root";
        case Role::Player: return "player";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Role> role_from_int(int64_t v)
{
    switch (v)
    {
        case static_cast<int64_t>(Role::Root):   return Role::Root;
        case static_cast<int64_t>(Role::Player): return Role::Player;
        default:                                 return std::nullopt;
    }
}

struct Account
{
    std::string username;
    std::string password_hash;
    Role role = Role::Player;
    int64_t created_at = 0;
    int64_t last_login = 0;
};

// Who a request is acting as once its session checked out.
struct Identity
{
    std::string username;
    Role role = Role::Player;
};

}
