#include "auth/auth_service.hpp"
#include "auth/argon2_hasher.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <array>

namespace auth
{

std::string_view to_string(AuthError e)
{
    switch (e)
    {
        case AuthError::InvalidCredentials: return "invalid credentials";
        case AuthError::SessionInvalid:     return "session invalid";
        case AuthError::SessionExpired:     return "session expired";
        case AuthError::StorageUnavailable: return "storage unavailable";
        case AuthError::Internal:           return "internal error";
    }
    return "unknown";
}

std::expected<std::shared_ptr<AuthService>, std::string> AuthService::create(
    std::shared_ptr<CredentialStore> store,
    std::shared_ptr<const crypto::SessionCodec> codec,
    ThreadPool& tp,
    std::chrono::seconds session_ttl
)
{
    if (!store || !codec)
    {
        return std::unexpected("AuthService needs a credential store and a session codec");
    }
    if (session_ttl.count() <= 0)
    {
        return std::unexpected("Session TTL must be positive");
    }

    // Hash of a random secret nobody knows; verified against when the user does not exist.
    std::array<uint8_t, 32> secret{};
    if (!crypto::random_bytes(secret))
    {
        return std::unexpected("RAND_bytes failed while preparing dummy hash");
    }
    auto secret_hex = crypto::to_hex(secret);
    auto dummy = Argon2Hasher::hash(secret_hex);
    crypto::secure_clear(secret_hex);
    crypto::secure_clear(secret);
    if (!dummy)
    {
        return std::unexpected(dummy.error());
    }

    return std::make_shared<AuthService>(Private{}, std::move(store), std::move(codec), tp,
                                         session_ttl, std::move(*dummy));
}

AuthService::AuthService(Private,
                         std::shared_ptr<CredentialStore> store,
                         std::shared_ptr<const crypto::SessionCodec> codec_,
                         ThreadPool& tp,
                         std::chrono::seconds session_ttl,
                         std::string dummy)
    : cred_store(std::move(store))
    , codec(std::move(codec_))
    , cpu_pool(tp)
    , ttl(session_ttl)
    , dummy_hash(std::move(dummy))
{
}

net::awaitable<std::expected<LoginResult, AuthError>> AuthService::login(
    std::string username,
    std::string password
)
{
    auto acc = cred_store->get_account(username);
    if (!acc)
    {
        crypto::secure_clear(password);
        co_return std::unexpected(AuthError::StorageUnavailable);
    }

    const bool known = acc->has_value();
    std::string stored = known ? (*acc)->password_hash : dummy_hash;

    auto verified = co_await cpu_pool.get().async_submit([&password, &stored]() -> bool
    {
        return Argon2Hasher::verify(password, stored);
    });

    if (!verified)
    {
        LOG_ERROR("Password verification could not run: {}", verified.error());
        crypto::secure_clear(password);
        co_return std::unexpected(AuthError::Internal);
    }
    if (!*verified || !known)
    {
        crypto::secure_clear(password);
        co_return std::unexpected(AuthError::InvalidCredentials);
    }

    const Account& account = **acc;

    if (auto ret = cred_store->update_last_login(account.username); !ret)
    {
        LOG_WARN("Failed to record last login of '{}': {}", account.username, to_string(ret.error()));
    }

    if (Argon2Hasher::needs_rehash(stored))
    {
        co_await upgrade_hash(account.username, std::move(password));
    }
    crypto::secure_clear(password);

    auto token = codec->issue(account.username, static_cast<uint8_t>(account.role), ttl);
    if (!token)
    {
        LOG_ERROR("Failed to issue session token: {}", token.error());
        co_return std::unexpected(AuthError::Internal);
    }

    co_return LoginResult{Identity{account.username, account.role}, std::move(*token)};
}

net::awaitable<void> AuthService::upgrade_hash(const std::string& username, std::string password)
{
    auto rehashed = co_await cpu_pool.get().async_submit([&password]()
    {
        return Argon2Hasher::hash(password);
    });
    crypto::secure_clear(password);

    if (!rehashed || !*rehashed)
    {
        LOG_WARN("Failed to upgrade password hash of '{}'", username);
        co_return;
    }
    if (auto ret = cred_store->update_password(username, **rehashed); !ret)
    {
        LOG_WARN("Failed to store upgraded hash of '{}': {}", username, to_string(ret.error()));
        co_return;
    }
    LOG_INFO("Upgraded password hash parameters of '{}'", username);
}

std::expected<Identity, AuthError> AuthService::authenticate(std::string_view token)
{
    auto claims = codec->validate(token);
    if (!claims)
    {
        return std::unexpected(claims.error() == crypto::TokenError::Expired
                               ? AuthError::SessionExpired
                               : AuthError::SessionInvalid);
    }

    if (revoked.contains(claims->jti))
    {
        return std::unexpected(AuthError::SessionInvalid);
    }

    auto role = role_from_int(claims->role);
    if (!role)
    {
        return std::unexpected(AuthError::SessionInvalid);
    }

    auto acc = cred_store->get_account(claims->subject);
    if (!acc)
    {
        return std::unexpected(AuthError::StorageUnavailable);
    }
    if (!acc->has_value() || (*acc)->role != *role)
    {
        LOG_DEBUG("Session for '{}' no longer matches an account", claims->subject);
        return std::unexpected(AuthError::SessionInvalid);
    }

    return Identity{std::move(claims->subject), *role};
}

bool AuthService::logout(std::string_view token)
{
    auto claims = codec->validate(token);
    if (!claims)
    {
        return false;
    }
    revoked.revoke(claims->jti, claims->expires_at, codec->now_sec());
    LOG_INFO("Session of '{}' revoked", claims->subject);
    return true;
}

}
