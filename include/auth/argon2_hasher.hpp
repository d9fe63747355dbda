#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <cstdint>
#include <cstddef>

namespace auth
{

class Argon2Hasher
{
public:
    // Argon2id with a fresh salt per call; the result embeds algorithm, cost and salt.
    [[nodiscard]] static std::expected<std::string, std::string> hash(std::string_view password);

    // Constant-time with respect to the stored digest. Malformed hashes verify as false.
    [[nodiscard]] static bool verify(std::string_view password, std::string_view encoded_hash);

    [[nodiscard]] static bool needs_rehash(std::string_view encoded_hash);

private:
    static constexpr unsigned long long ops_limit = 3;
    static constexpr size_t mem_limit = 64 * 1024 * 1024;
};

[[nodiscard]] bool check_password(std::string_view password);

}
