#include "crypto/aesgcm256.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <algorithm>

namespace crypto
{

bool AES256GCM::chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce)
{
    return key.size() == key_sz && nonce.size() == nonce_sz;
}

AES256GCM::ctx_ptr AES256GCM::make_ctx()
{
    return ctx_ptr(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

std::optional<AES256GCM::ciphertext_t> AES256GCM::encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = make_ctx();
    if (!ctx
        || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()
        && EVP_EncryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    ciphertext_t result;
    result.data.resize(plaintext.size());

    if (!plaintext.empty()
        && EVP_EncryptUpdate(ctx.get(), result.data.data(), std::addressof(len), plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), result.data.data() + len, std::addressof(final_len)) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(result.tag.size()), result.tag.data()) != 1)
    {
        return std::nullopt;
    }

    return result;
}

std::optional<AES256GCM::data_t> AES256GCM::decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce) || tag.size() != tag_sz)
    {
        return std::nullopt;
    }

    auto ctx = make_ctx();
    if (!ctx
        || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()
        && EVP_DecryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    data_t plaintext(ciphertext.size());
    if (!ciphertext.empty()
        && EVP_DecryptUpdate(ctx.get(), plaintext.data(), std::addressof(len), ciphertext.data(), static_cast<int>(ciphertext.size())) != 1)
    {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    tag_t expected_tag{};
    std::copy(tag.begin(), tag.end(), expected_tag.begin());
    int final_len = 0;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(expected_tag.size()), expected_tag.data()) != 1
        || EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, std::addressof(final_len)) != 1)
    {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    return plaintext;
}

} // namespace crypto
