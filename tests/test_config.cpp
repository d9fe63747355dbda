#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "test_support.hpp"

using test_support::TempDir;

TEST_CASE("Config::load_defaults returns valid config with defaults")
{
    auto cfg = Config::load_defaults();

    CHECK(cfg.server().port == 4200);
    CHECK(cfg.server().bind_address == "0.0.0.0");
    CHECK(cfg.server().io_threads == 2);
    CHECK(cfg.server().cpu_threads == 0);
    CHECK(cfg.server().client_path == "./client");
    CHECK(cfg.server().max_body_size == 64 * 1024);
    CHECK(cfg.server().shutdown_grace == std::chrono::seconds{10});
    CHECK(cfg.tls().cert_file == "config/cert.pem");
    CHECK(cfg.tls().key_file == "config/key.pem");
    CHECK(cfg.storage().db_path == "data/data.db");
    CHECK(cfg.auth().root_credentials == "config/root.toml");
    CHECK(cfg.auth().session_ttl == std::chrono::minutes{360});
    CHECK(cfg.auth().clock_skew == std::chrono::seconds{60});
    CHECK(cfg.auth().session_key_file.empty());
    CHECK(cfg.timeouts().handshake_timeout == std::chrono::seconds{10});
    CHECK(cfg.logging().level == "info");
    CHECK(cfg.logging().enable_console == true);
}

TEST_CASE("Config::load parses valid JSON file")
{
    TempDir dir;
    auto file = dir.write("config.json", R"({
        "server": {
            "port": 7777,
            "bind_address": "127.0.0.1",
            "io_threads": 4,
            "cpu_threads": 3,
            "client_path": "/srv/client",
            "max_body_size": 2048,
            "shutdown_grace_sec": 5
        },
        "tls": {
            "cert_file": "/etc/dnd/cert.pem",
            "key_file": "/etc/dnd/key.pem"
        },
        "storage": {
            "db_path": "/var/lib/dnd/data.db"
        },
        "auth": {
            "root_credentials": "/etc/dnd/root.toml",
            "session_ttl_sec": 3600,
            "clock_skew_sec": 30,
            "session_key_file": "/etc/dnd/session.key"
        },
        "timeouts": {
            "handshake_timeout_sec": 15,
            "read_timeout_sec": 60,
            "write_timeout_sec": 10
        },
        "logging": {
            "level": "debug",
            "file": "/var/log/test.log",
            "max_size_mb": 50,
            "enable_console": false
        }
    })");

    auto result = Config::load(file.string());

    REQUIRE(result.has_value());
    CHECK(result->server().port == 7777);
    CHECK(result->server().bind_address == "127.0.0.1");
    CHECK(result->server().io_threads == 4);
    CHECK(result->effective_cpu_threads() == 3);
    CHECK(result->server().client_path == "/srv/client");
    CHECK(result->server().max_body_size == 2048);
    CHECK(result->server().shutdown_grace == std::chrono::seconds{5});
    CHECK(result->tls().cert_file == "/etc/dnd/cert.pem");
    CHECK(result->storage().db_path == "/var/lib/dnd/data.db");
    CHECK(result->auth().root_credentials == "/etc/dnd/root.toml");
    CHECK(result->auth().session_ttl == std::chrono::seconds{3600});
    CHECK(result->auth().clock_skew == std::chrono::seconds{30});
    CHECK(result->auth().session_key_file == "/etc/dnd/session.key");
    CHECK(result->timeouts().read_timeout == std::chrono::seconds{60});
    CHECK(result->logging().level == "debug");
    CHECK(result->logging().file == "/var/log/test.log");
    CHECK(result->logging().enable_console == false);
}

TEST_CASE("Config::load returns error for missing file")
{
    auto result = Config::load("/nonexistent/path/config.json");

    REQUIRE(!result.has_value());
}

TEST_CASE("Config::load returns error for invalid JSON")
{
    TempDir dir;
    auto file = dir.write("config.json", "{ invalid json }");

    auto result = Config::load(file.string());

    REQUIRE(!result.has_value());
}

TEST_CASE("Config::load returns error for port out of range")
{
    TempDir dir;
    auto file = dir.write("config.json", R"({"server": {"port": 99999}})");

    auto result = Config::load(file.string());

    REQUIRE(!result.has_value());
}

TEST_CASE("Config::load rejects session TTL outside its bounds")
{
    TempDir dir;

    auto too_short = dir.write("short.json", R"({"auth": {"session_ttl_sec": 5}})");
    CHECK(!Config::load(too_short.string()).has_value());

    auto negative = dir.write("negative.json", R"({"auth": {"session_ttl_sec": -1}})");
    CHECK(!Config::load(negative.string()).has_value());
}

TEST_CASE("Config::load rejects wrongly typed values")
{
    TempDir dir;

    auto bad_path = dir.write("path.json", R"({"storage": {"db_path": 42}})");
    CHECK(!Config::load(bad_path.string()).has_value());

    auto bad_threads = dir.write("threads.json", R"({"server": {"io_threads": "many"}})");
    CHECK(!Config::load(bad_threads.string()).has_value());
}

TEST_CASE("Config::load_or_defaults uses defaults when file missing")
{
    auto cfg = Config::load_or_defaults("/nonexistent/config.json");

    CHECK(cfg.server().port == 4200);
    CHECK(cfg.logging().level == "info");
}

TEST_CASE("Config::load applies defaults for missing sections")
{
    TempDir dir;
    auto file = dir.write("config.json", R"({"server": {"port": 6000}})");

    auto result = Config::load(file.string());

    REQUIRE(result.has_value());
    CHECK(result->server().port == 6000);
    CHECK(result->server().bind_address == "0.0.0.0");
    CHECK(result->storage().db_path == "data/data.db");
    CHECK(result->logging().level == "info");
}

TEST_CASE("Config::load handles empty JSON object")
{
    TempDir dir;
    auto file = dir.write("config.json", "{}");

    auto result = Config::load(file.string());

    REQUIRE(result.has_value());
    CHECK(result->server().port == 4200);
    CHECK(result->auth().session_ttl == std::chrono::seconds{21600});
}

TEST_CASE("Command line overrides win over file values")
{
    TempDir dir;
    auto file = dir.write("config.json", R"({"server": {"port": 6000}, "storage": {"db_path": "file.db"}})");

    Config::Overrides cli;
    cli.port = 9443;
    cli.db_path = "cli.db";
    cli.root_credentials = "cli-root.toml";
    cli.log_level = "debug";

    auto result = Config::load(file.string(), cli);

    REQUIRE(result.has_value());
    CHECK(result->server().port == 9443);
    CHECK(result->storage().db_path == "cli.db");
    CHECK(result->auth().root_credentials == "cli-root.toml");
    CHECK(result->logging().level == "debug");

    auto defaults = Config::load_defaults(cli);
    CHECK(defaults.server().port == 9443);
    CHECK(defaults.server().client_path == "./client");
}

TEST_CASE("Config::effective_cpu_threads never drops below two")
{
    auto cfg = Config::load_defaults();

    CHECK(cfg.effective_cpu_threads() >= 2);
}
