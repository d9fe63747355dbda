#include "auth/argon2_hasher.hpp"
#include "logger.hpp"

#include <sodium.h>
#include <array>
#include <cstring>
#include <string>

namespace auth
{

namespace {

bool ensure_sodium()
{
    static const bool ready = sodium_init() >= 0;
    return ready;
}

}

std::expected<std::string, std::string> Argon2Hasher::hash(std::string_view password)
{
    if (!ensure_sodium())
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    std::array<char, crypto_pwhash_STRBYTES> encoded{};
    int result = crypto_pwhash_str_alg(
        encoded.data(),
        password.data(), password.size(),
        ops_limit,
        mem_limit,
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0)
    {
        return std::unexpected("Failed to hash password (out of memory?)");
    }

    return std::string(encoded.data());
}

bool Argon2Hasher::verify(std::string_view password, std::string_view encoded_hash)
{
    if (!ensure_sodium())
    {
        return false;
    }

    // libsodium wants a NUL-terminated string that fits its fixed buffer
    if (encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES)
    {
        LOG_WARN("Rejecting malformed password hash ({} bytes)", encoded_hash.size());
        return false;
    }
    std::array<char, crypto_pwhash_STRBYTES> stored{};
    std::memcpy(stored.data(), encoded_hash.data(), encoded_hash.size());

    int result = crypto_pwhash_str_verify(
        stored.data(),
        password.data(), password.size()
    );
    return result == 0;
}

bool Argon2Hasher::needs_rehash(std::string_view encoded_hash)
{
    if (!ensure_sodium() || encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES)
    {
        return false;
    }
    std::array<char, crypto_pwhash_STRBYTES> stored{};
    std::memcpy(stored.data(), encoded_hash.data(), encoded_hash.size());

    // -1 means the string is not one of ours; leave it alone
    return crypto_pwhash_str_needs_rehash(stored.data(), ops_limit, mem_limit) == 1;
}

bool check_password(std::string_view password)
{
    return password.size() >= 8;
}

}
