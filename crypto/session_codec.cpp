#include "crypto/session_codec.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/base64url.hpp"

#include <boost/json.hpp>
#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace crypto
{

namespace {

constexpr size_t header_sz = 1 + AES256GCM::nonce_sz;
constexpr size_t min_token_sz = header_sz + AES256GCM::tag_sz;

std::optional<SessionClaims> parse_claims(std::string_view text)
{
    json::error_code ec;
    auto jv = json::parse(text, ec);
    if (ec || !jv.is_object())
    {
        return std::nullopt;
    }
    const auto& obj = jv.as_object();

    auto sub = obj.if_contains("sub");
    auto role = obj.if_contains("role");
    auto iat = obj.if_contains("iat");
    auto exp = obj.if_contains("exp");
    auto jti = obj.if_contains("jti");
    if (!sub || !sub->is_string() || !role || !role->is_int64()
        || !iat || !iat->is_int64() || !exp || !exp->is_int64()
        || !jti || !jti->is_string())
    {
        return std::nullopt;
    }
    if (role->as_int64() < 0 || role->as_int64() > 0xFF)
    {
        return std::nullopt;
    }

    SessionClaims claims;
    claims.subject = std::string(sub->as_string());
    claims.role = static_cast<uint8_t>(role->as_int64());
    claims.issued_at = iat->as_int64();
    claims.expires_at = exp->as_int64();
    claims.jti = std::string(jti->as_string());
    return claims;
}

} // namespace

SessionCodec::SessionCodec(const key_t& key, std::chrono::seconds clock_skew, clock_fn clk)
    : key_(key)
    , skew(clock_skew)
    , clock(clk ? std::move(clk) : clock_fn([] { return std::chrono::system_clock::now(); }))
{
}

SessionCodec::~SessionCodec()
{
    secure_clear(key_);
}

std::expected<SessionCodec::key_t, std::string> SessionCodec::generate_key()
{
    key_t key{};
    if (!random_bytes(key))
    {
        return std::unexpected("RAND_bytes failed while generating session key");
    }
    return key;
}

std::expected<SessionCodec::key_t, std::string> SessionCodec::load_or_create_key(const fs::path& path)
{
    std::error_code ec;
    if (fs::exists(path, ec))
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(std::format("Failed to open session key file: {}", path.string()));
        }
        std::string text;
        file >> text;
        auto raw = from_hex(text);
        secure_clear(text);
        if (!raw || raw->size() != std::tuple_size_v<key_t>)
        {
            return std::unexpected(std::format("Session key file {} must hold {} hex characters",
                                               path.string(), 2 * std::tuple_size_v<key_t>));
        }
        key_t key{};
        std::ranges::copy(*raw, key.begin());
        secure_clear(*raw);
        return key;
    }

    auto key = generate_key();
    if (!key)
    {
        return key;
    }

    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
    }
    {
        std::ofstream touch(path, std::ios::trunc);
        if (!touch.is_open())
        {
            return std::unexpected(std::format("Failed to create session key file: {}", path.string()));
        }
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to restrict permissions of {}: {}", path.string(), ec.message()));
    }

    std::ofstream file(path, std::ios::trunc);
    auto hex = to_hex(*key);
    file << hex << "\n";
    secure_clear(hex);
    if (!file)
    {
        return std::unexpected(std::format("Failed to write session key file: {}", path.string()));
    }
    return key;
}

int64_t SessionCodec::now_sec() const
{
    return std::chrono::duration_cast<std::chrono::seconds>(clock().time_since_epoch()).count();
}

std::expected<std::string, std::string> SessionCodec::issue(std::string_view subject,
                                                            uint8_t role,
                                                            std::chrono::seconds ttl) const
{
    std::array<uint8_t, jti_sz> jti{};
    AES256GCM::nonce_t nonce{};
    if (!random_bytes(jti) || !random_bytes(nonce))
    {
        return std::unexpected("RAND_bytes failed while issuing session token");
    }

    auto iat = now_sec();
    json::object claims{
        {"sub", subject},
        {"role", role},
        {"iat", iat},
        {"exp", iat + ttl.count()},
        {"jti", to_hex(jti)},
    };
    auto plaintext = json::serialize(claims);

    const std::array<uint8_t, 1> aad{version};
    auto ct = AES256GCM::encrypt(key_, nonce,
                                 std::span(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()),
                                 aad);
    secure_clear(plaintext);
    if (!ct)
    {
        return std::unexpected("AES-256-GCM encryption of session token failed");
    }

    std::vector<uint8_t> envelope;
    envelope.reserve(header_sz + ct->data.size() + ct->tag.size());
    envelope.push_back(version);
    std::ranges::copy(nonce, std::back_inserter(envelope));
    std::ranges::copy(ct->data, std::back_inserter(envelope));
    std::ranges::copy(ct->tag, std::back_inserter(envelope));

    return base64url::encode(envelope);
}

std::expected<SessionClaims, TokenError> SessionCodec::validate(std::string_view token) const
{
    auto raw = base64url::decode(token);
    if (!raw || raw->size() < min_token_sz || (*raw)[0] != version)
    {
        return std::unexpected(TokenError::Invalid);
    }

    std::span<const uint8_t> envelope(*raw);
    auto nonce = envelope.subspan(1, AES256GCM::nonce_sz);
    auto body = envelope.subspan(header_sz, envelope.size() - min_token_sz);
    auto tag = envelope.subspan(envelope.size() - AES256GCM::tag_sz);

    const std::array<uint8_t, 1> aad{version};
    auto plaintext = AES256GCM::decrypt(key_, nonce, body, tag, aad);
    if (!plaintext)
    {
        return std::unexpected(TokenError::Invalid);
    }

    auto claims = parse_claims(std::string_view(reinterpret_cast<const char*>(plaintext->data()), plaintext->size()));
    secure_clear(*plaintext);
    if (!claims || claims->subject.empty() || claims->expires_at < claims->issued_at)
    {
        return std::unexpected(TokenError::Invalid);
    }

    auto now = now_sec();
    if (claims->issued_at > now + skew.count())
    {
        return std::unexpected(TokenError::Invalid);
    }
    if (now > claims->expires_at)
    {
        return std::unexpected(TokenError::Expired);
    }
    return std::move(*claims);
}

} // namespace crypto
