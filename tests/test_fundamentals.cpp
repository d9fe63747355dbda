#include <catch2/catch_test_macros.hpp>

#include "fundamentals/base64url.hpp"
#include "fundamentals/cookies.hpp"
#include "fundamentals/json_utils.hpp"
#include "crypto/utils.hpp"

#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(std::string_view s)
{
    return {s.begin(), s.end()};
}

}

TEST_CASE("base64url::encode matches RFC 4648 vectors without padding")
{
    CHECK(base64url::encode(bytes_of("")).empty());
    CHECK(base64url::encode(bytes_of("f")) == "Zg");
    CHECK(base64url::encode(bytes_of("fo")) == "Zm8");
    CHECK(base64url::encode(bytes_of("foo")) == "Zm9v");
    CHECK(base64url::encode(bytes_of("foobar")) == "Zm9vYmFy");
}

TEST_CASE("base64url uses the URL-safe alphabet")
{
    std::vector<uint8_t> data{0xFB, 0xFF};

    auto text = base64url::encode(data);

    CHECK(text == "-_8");
    auto back = base64url::decode(text);
    REQUIRE(back.has_value());
    CHECK(*back == data);
}

TEST_CASE("base64url::decode rejects foreign characters and bad lengths")
{
    CHECK(!base64url::decode("Zm9v=").has_value());
    CHECK(!base64url::decode("Zm+v").has_value());
    CHECK(!base64url::decode("Zm/v").has_value());
    CHECK(!base64url::decode("Zm9 v").has_value());
    CHECK(!base64url::decode("Zm9vY").has_value());
}

TEST_CASE("base64url::decode rejects non-canonical trailing bits")
{
    REQUIRE(base64url::decode("Zg").has_value());
    CHECK(!base64url::decode("Zh").has_value());
    CHECK(!base64url::decode("Zm9").has_value());
}

TEST_CASE("crypto hex helpers")
{
    std::vector<uint8_t> data{0x00, 0x7F, 0xAB, 0xFF};

    CHECK(crypto::to_hex(data) == "007fabff");

    auto back = crypto::from_hex("007FabFF");
    REQUIRE(back.has_value());
    CHECK(*back == data);

    CHECK(!crypto::from_hex("abc").has_value());
    CHECK(!crypto::from_hex("zz").has_value());
}

TEST_CASE("cookies::find extracts a named cookie")
{
    std::string_view header = "theme=dark; login-token=abc_DEF-123; lang=en";

    auto token = cookies::find(header, cookies::login_token);
    REQUIRE(token.has_value());
    CHECK(*token == "abc_DEF-123");

    CHECK(cookies::find(header, "theme") == "dark");
    CHECK(!cookies::find(header, "missing").has_value());
    CHECK(!cookies::find("", cookies::login_token).has_value());
}

TEST_CASE("cookies::find does not match on name prefixes")
{
    std::string_view header = "xlogin-token=nope;login-token-old=nope";

    CHECK(!cookies::find(header, cookies::login_token).has_value());
}

TEST_CASE("cookies::find tolerates whitespace and quoted values")
{
    CHECK(cookies::find("  login-token = \"quoted\" ", cookies::login_token) == "quoted");
    CHECK(cookies::find("flag; login-token=v", cookies::login_token) == "v");
}

TEST_CASE("cookies::make_session sets the hardening attributes")
{
    auto cookie = cookies::make_session(cookies::login_token, "TOKEN", std::chrono::seconds{21600});

    CHECK(cookie.starts_with("login-token=TOKEN;"));
    CHECK(cookie.find("Path=/") != std::string::npos);
    CHECK(cookie.find("Max-Age=21600") != std::string::npos);
    CHECK(cookie.find("Secure") != std::string::npos);
    CHECK(cookie.find("HttpOnly") != std::string::npos);
    CHECK(cookie.find("SameSite=Strict") != std::string::npos);
    CHECK(cookie.find("Domain") == std::string::npos);
}

TEST_CASE("cookies::make_clear expires the cookie")
{
    auto cookie = cookies::make_clear(cookies::login_token);

    CHECK(cookie.starts_with("login-token=;"));
    CHECK(cookie.find("Max-Age=0") != std::string::npos);
    CHECK(cookie.find("Expires=Thu, 01 Jan 1970 00:00:00 GMT") != std::string::npos);
}

TEST_CASE("json_utils::parse_object and extract_str")
{
    auto obj = json_utils::parse_object(R"({"name":"root","n":1})");
    REQUIRE(obj.has_value());

    CHECK(json_utils::extract_str(*obj, "name") == "root");
    CHECK(!json_utils::extract_str(*obj, "n").has_value());
    CHECK(!json_utils::extract_str(*obj, "missing").has_value());

    CHECK(!json_utils::parse_object("[1,2]").has_value());
    CHECK(!json_utils::parse_object("{").has_value());
}
