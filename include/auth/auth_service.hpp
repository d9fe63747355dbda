#pragma once

#include "auth/account.hpp"
#include "auth/credential_store.hpp"
#include "auth/revocation_list.hpp"
#include "crypto/session_codec.hpp"
#include "threadpool/threadpool.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace net = boost::asio;

namespace auth
{

enum class AuthError : uint8_t
{
    InvalidCredentials,
    SessionInvalid,
    SessionExpired,
    StorageUnavailable,
    Internal,
};

[[nodiscard]] std::string_view to_string(AuthError e);

struct LoginResult
{
    Identity identity;
    std::string token;
};

class AuthService
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    [[nodiscard]] static std::expected<std::shared_ptr<AuthService>, std::string> create(
        std::shared_ptr<CredentialStore> store,
        std::shared_ptr<const crypto::SessionCodec> codec,
        ThreadPool& tp,
        std::chrono::seconds session_ttl
    );

    // Unknown user and wrong password are indistinguishable, in result and in cost.
    [[nodiscard]] net::awaitable<std::expected<LoginResult, AuthError>> login(
        std::string username,
        std::string password
    );

    [[nodiscard]] std::expected<Identity, AuthError> authenticate(std::string_view token);

    // Revokes the token until it expires. False if the token was not valid to begin with.
    bool logout(std::string_view token);

    [[nodiscard]] std::chrono::seconds session_ttl() const { return ttl; }
    [[nodiscard]] CredentialStore& store() { return *cred_store; }
    [[nodiscard]] const RevocationList& revocations() const { return revoked; }

    // Only reachable through create().
    AuthService(Private,
                std::shared_ptr<CredentialStore> store,
                std::shared_ptr<const crypto::SessionCodec> codec,
                ThreadPool& tp,
                std::chrono::seconds session_ttl,
                std::string dummy_hash);

private:
    net::awaitable<void> upgrade_hash(const std::string& username, std::string password);

    std::shared_ptr<CredentialStore> cred_store;
    std::shared_ptr<const crypto::SessionCodec> codec;
    std::reference_wrapper<ThreadPool> cpu_pool;
    std::chrono::seconds ttl;
    std::string dummy_hash;
    RevocationList revoked;
};

}
