#pragma once
#include "crypto/aesgcm256.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace crypto
{

struct SessionClaims
{
    std::string subject;
    uint8_t role = 0;
    int64_t issued_at = 0;
    int64_t expires_at = 0;
    std::string jti;
};

enum class TokenError : uint8_t
{
    Invalid,
    Expired,
};

/**
 * Stateless session tokens sealed with AES-256-GCM under a process-held key.
 *
 * Wire form: base64url(version || nonce || ciphertext || tag), the version byte
 * being bound as AAD. validate() authenticates the whole envelope before a
 * single claim is parsed.
 *
 * Immutable after construction, safe to share between threads.
 */
class SessionCodec
{
public:
    using key_t = AES256GCM::key_t;
    using clock_fn = std::function<std::chrono::system_clock::time_point()>;

    static constexpr uint8_t version = 1;
    static constexpr size_t jti_sz = 16;

    explicit SessionCodec(const key_t& key,
                          std::chrono::seconds clock_skew = std::chrono::seconds{60},
                          clock_fn clock = {});
    ~SessionCodec();

    SessionCodec(const SessionCodec&) = delete;
    SessionCodec& operator=(const SessionCodec&) = delete;

    [[nodiscard]] static std::expected<key_t, std::string> generate_key();

    // Reads a hex key from `path`, or creates the file (mode 0600) with a fresh key.
    [[nodiscard]] static std::expected<key_t, std::string> load_or_create_key(const std::filesystem::path& path);

    [[nodiscard]] std::expected<std::string, std::string> issue(std::string_view subject,
                                                                uint8_t role,
                                                                std::chrono::seconds ttl) const;

    [[nodiscard]] std::expected<SessionClaims, TokenError> validate(std::string_view token) const;

    // Unix seconds according to the codec's clock.
    [[nodiscard]] int64_t now_sec() const;

private:
    key_t key_;
    std::chrono::seconds skew;
    clock_fn clock;
};

} // namespace crypto
