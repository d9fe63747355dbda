#include <catch2/catch_test_macros.hpp>

#include "auth/argon2_hasher.hpp"

#include <sodium.h>
#include <array>
#include <string>

using auth::Argon2Hasher;

TEST_CASE("Argon2Hasher hash then verify succeeds")
{
    auto hash = Argon2Hasher::hash("correct horse battery staple");

    REQUIRE(hash.has_value());
    CHECK(hash->starts_with("$argon2id$"));
    CHECK(Argon2Hasher::verify("correct horse battery staple", *hash));
}

TEST_CASE("Argon2Hasher rejects any single-byte change of the password")
{
    const std::string password = "s3cr3t-passw0rd";
    auto hash = Argon2Hasher::hash(password);
    REQUIRE(hash.has_value());

    for (size_t i = 0; i < password.size(); ++i)
    {
        auto altered = password;
        altered[i] = static_cast<char>(altered[i] ^ 0x01);
        CHECK(!Argon2Hasher::verify(altered, *hash));
    }

    CHECK(!Argon2Hasher::verify(password + "x", *hash));
    CHECK(!Argon2Hasher::verify(password.substr(1), *hash));
    CHECK(!Argon2Hasher::verify("", *hash));
}

TEST_CASE("Argon2Hasher salts every hash")
{
    auto a = Argon2Hasher::hash("same password");
    auto b = Argon2Hasher::hash("same password");

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a != *b);
    CHECK(Argon2Hasher::verify("same password", *a));
    CHECK(Argon2Hasher::verify("same password", *b));
}

TEST_CASE("Argon2Hasher treats malformed hashes as a failed verification")
{
    CHECK(!Argon2Hasher::verify("password", ""));
    CHECK(!Argon2Hasher::verify("password", "not-a-hash"));
    CHECK(!Argon2Hasher::verify("password", "$argon2id$v=19$m=65536,t=3,p=1$garbage"));
    CHECK(!Argon2Hasher::verify("password", std::string(512, 'x')));
}

TEST_CASE("Argon2Hasher::needs_rehash only flags weaker parameters")
{
    auto current = Argon2Hasher::hash("password123");
    REQUIRE(current.has_value());
    CHECK(!Argon2Hasher::needs_rehash(*current));

    REQUIRE(sodium_init() >= 0);
    std::array<char, crypto_pwhash_STRBYTES> weak{};
    const std::string password = "password123";
    REQUIRE(crypto_pwhash_str_alg(weak.data(), password.data(), password.size(),
                                  1, 8 * 1024 * 1024, crypto_pwhash_ALG_ARGON2ID13) == 0);
    CHECK(Argon2Hasher::needs_rehash(weak.data()));
    CHECK(Argon2Hasher::verify(password, weak.data()));
    CHECK(!Argon2Hasher::needs_rehash("not-a-hash"));
}

TEST_CASE("check_password enforces the minimum length")
{
    CHECK(!auth::check_password(""));
    CHECK(!auth::check_password("1234567"));
    CHECK(auth::check_password("12345678"));
}
