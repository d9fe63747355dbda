#include "auth/bootstrap.hpp"
#include "auth/argon2_hasher.hpp"
#include "auth/root_descriptor.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <format>

namespace fs = std::filesystem;

namespace auth
{

namespace {

void warn_if_exposed(const fs::path& descriptor)
{
    std::error_code ec;
    auto st = fs::status(descriptor, ec);
    if (ec)
    {
        return;
    }
    constexpr auto exposed = fs::perms::group_read | fs::perms::group_write
                           | fs::perms::others_read | fs::perms::others_write;
    if ((st.permissions() & exposed) != fs::perms::none)
    {
        LOG_WARN("Root descriptor {} is accessible by group or others; restrict it to mode 0600", descriptor.string());
    }
}

// Called once the root account is known to exist; the descriptor is not read.
void report_present(const Account& acc, const fs::path& descriptor)
{
    if (acc.role != Role::Root)
    {
        LOG_WARN("Account '{}' exists with role {}; leaving it unchanged", acc.username, to_string(acc.role));
    }

    std::error_code ec;
    if (!fs::exists(descriptor, ec))
    {
        LOG_WARN("Root descriptor {} not found; account '{}' already exists, continuing", descriptor.string(), acc.username);
        return;
    }
    warn_if_exposed(descriptor);
    LOG_INFO("Account '{}' present; {} is no longer needed and may be deleted", acc.username, descriptor.string());
}

}

std::expected<BootstrapOutcome, std::string> bootstrap_root(CredentialStore& store, const fs::path& descriptor)
{
    auto existing = store.get_account(root_account_name);
    if (!existing)
    {
        return std::unexpected(std::format("Failed to query accounts: {}", to_string(existing.error())));
    }
    if (existing->has_value())
    {
        report_present(**existing, descriptor);
        return BootstrapOutcome::AlreadyPresent;
    }

    LOG_INFO("No '{}' account found, bootstrapping from {}", root_account_name, descriptor.string());
    warn_if_exposed(descriptor);

    auto desc = load_root_descriptor(descriptor);
    if (!desc)
    {
        // A descriptor naming someone else may have been used before and deleted since.
        auto has_root = store.has_role(Role::Root);
        if (has_root && *has_root)
        {
            LOG_WARN("{}; a root account already exists, continuing", desc.error());
            return BootstrapOutcome::AlreadyPresent;
        }
        return std::unexpected(desc.error());
    }

    if (desc->name != root_account_name)
    {
        LOG_WARN("Root descriptor names '{}' rather than '{}'", desc->name, root_account_name);
        auto named = store.get_account(desc->name);
        if (!named)
        {
            crypto::secure_clear(desc->pass);
            return std::unexpected(std::format("Failed to query accounts: {}", to_string(named.error())));
        }
        if (named->has_value())
        {
            crypto::secure_clear(desc->pass);
            report_present(**named, descriptor);
            return BootstrapOutcome::AlreadyPresent;
        }
    }

    auto hashed = Argon2Hasher::hash(desc->pass);
    crypto::secure_clear(desc->pass);
    if (!hashed)
    {
        return std::unexpected(std::format("Failed to hash root password: {}", hashed.error()));
    }

    if (auto ret = store.create_account(desc->name, *hashed, Role::Root); !ret)
    {
        if (ret.error() == StoreError::Conflict)
        {
            LOG_INFO("Account '{}' was created concurrently; descriptor ignored", desc->name);
            return BootstrapOutcome::AlreadyPresent;
        }
        return std::unexpected(std::format("Failed to create root account '{}': {}", desc->name, to_string(ret.error())));
    }

    LOG_INFO("Created root account '{}'; {} may now be deleted", desc->name, descriptor.string());
    return BootstrapOutcome::Created;
}

}
