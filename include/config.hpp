#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Server configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 * Command line flags arrive as Overrides and win over file values.
 */
class Config
{
public:
    struct ServerCfg
    {
        uint16_t port = 4200;
        std::string bind_address = "0.0.0.0";
        size_t io_threads = 2;
        size_t cpu_threads = 0;
        std::string client_path = "./client";
        size_t max_body_size = 64 * 1024;
        std::chrono::seconds shutdown_grace{10};
    };

    struct TlsCfg
    {
        std::string cert_file = "config/cert.pem";
        std::string key_file = "config/key.pem";
    };

    struct StorageCfg
    {
        std::string db_path = "data/data.db";
    };

    struct AuthCfg
    {
        std::string root_credentials = "config/root.toml";
        std::chrono::seconds session_ttl{360 * 60};
        std::chrono::seconds clock_skew{60};
        std::string session_key_file = "";
    };

    struct TimeoutsCfg
    {
        std::chrono::seconds handshake_timeout{10};
        std::chrono::seconds read_timeout{30};
        std::chrono::seconds write_timeout{30};
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    struct Overrides
    {
        std::optional<uint16_t> port;
        std::optional<std::string> client_path;
        std::optional<std::string> db_path;
        std::optional<std::string> cert_file;
        std::optional<std::string> key_file;
        std::optional<std::string> root_credentials;
        std::optional<std::string> log_level;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, const Overrides& cli = {});
    [[nodiscard]] static Config load_defaults(const Overrides& cli = {});
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath, const Overrides& cli = {});

    [[nodiscard]] const ServerCfg& server() const { return srv; }
    [[nodiscard]] const TlsCfg& tls() const { return tl; }
    [[nodiscard]] const StorageCfg& storage() const { return sto; }
    [[nodiscard]] const AuthCfg& auth() const { return au; }
    [[nodiscard]] const TimeoutsCfg& timeouts() const { return to; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    // Worker count for password hashing: explicit value, else what the I/O threads leave over (at least 2).
    [[nodiscard]] size_t effective_cpu_threads() const;

private:
    ServerCfg srv;
    TlsCfg tl;
    StorageCfg sto;
    AuthCfg au;
    TimeoutsCfg to;
    LoggingCfg log;

    void apply(const Overrides& cli);
    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
