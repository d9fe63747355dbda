#pragma once
#include <openssl/evp.h>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <cstdint>
#include <memory>

namespace crypto
{

class AES256GCM
{
public:
    static constexpr size_t key_sz = 32;
    static constexpr size_t nonce_sz = 12;
    static constexpr size_t tag_sz = 16;

    using key_t = std::array<uint8_t, key_sz>;
    using nonce_t = std::array<uint8_t, nonce_sz>;
    using tag_t = std::array<uint8_t, tag_sz>;
    using data_t = std::vector<uint8_t>;

    struct ciphertext_t
    {
        data_t data;
        tag_t tag;
    };

    [[nodiscard]] static std::optional<ciphertext_t> encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {}
    );

    // Returns nullopt unless the tag verifies; no plaintext escapes before that.
    [[nodiscard]] static std::optional<data_t> decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> tag,
        std::span<const uint8_t> aad = {}
    );

private:
    using ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    static bool chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce);
    static ctx_ptr make_ctx();
};

} // namespace crypto
