#pragma once

#include "auth/credential_store.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace auth
{

inline constexpr std::string_view root_account_name = "root";

enum class BootstrapOutcome : uint8_t
{
    Created,
    AlreadyPresent,
};

/**
 * Makes sure a root account exists before the server accepts anything.
 *
 * Once an account named "root" exists (whatever its role) the descriptor is
 * ignored and a missing one is only a warning. Otherwise the descriptor must
 * parse and the account it names is created with the root role; any error
 * means the server must not start. Existing accounts are never modified.
 */
[[nodiscard]] std::expected<BootstrapOutcome, std::string> bootstrap_root(CredentialStore& store,
                                                                          const std::filesystem::path& descriptor);

}
