#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>
#include <thread>
#include <algorithm>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::chrono::seconds, std::string> get_seconds(const json::object& obj, std::string_view key,
                                                             uint64_t min_val, uint64_t max_val,
                                                             std::chrono::seconds default_val)
{
    auto val = get_uint<uint64_t>(obj, key, min_val, max_val, static_cast<uint64_t>(default_val.count()));
    if (!val)
    {
        return std::unexpected(val.error());
    }
    return std::chrono::seconds(*val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return std::addressof(it->value().as_object());
}

} // namespace

// Assigns `expr` (an expected) into `dst` or bails out of parse() with its error.
#define CFG_ASSIGN(dst, expr)                            \
    if (auto res_ = (expr); res_)                        \
    {                                                    \
        dst = *res_;                                     \
    }                                                    \
    else                                                 \
    {                                                    \
        return std::unexpected(res_.error());            \
    }

std::expected<Config, std::string> Config::load(const std::string& filepath, const Overrides& cli)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::error_code ec;
    json::value jv = json::parse(buffer.str(), ec);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error: {}", ec.message()));
    }
    auto result = parse(jv);
    if (result)
    {
        result->apply(cli);
    }
    return result;
}

Config Config::load_defaults(const Overrides& cli)
{
    Config cfg{};
    cfg.apply(cli);
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath, const Overrides& cli)
{
    auto result = load(filepath, cli);
    if (result)
    {
        return *result;
    }
    return load_defaults(cli);
}

void Config::apply(const Overrides& cli)
{
    if (cli.port) srv.port = *cli.port;
    if (cli.client_path) srv.client_path = *cli.client_path;
    if (cli.db_path) sto.db_path = *cli.db_path;
    if (cli.cert_file) tl.cert_file = *cli.cert_file;
    if (cli.key_file) tl.key_file = *cli.key_file;
    if (cli.root_credentials) au.root_credentials = *cli.root_credentials;
    if (cli.log_level) log.level = *cli.log_level;
}

size_t Config::effective_cpu_threads() const
{
    if (srv.cpu_threads != 0)
    {
        return srv.cpu_threads;
    }

    size_t hw = std::thread::hardware_concurrency();
    if (hw <= srv.io_threads)
    {
        return 2;
    }
    return std::max<size_t>(2, hw - srv.io_threads);
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (const auto* srv = section(root, "server"))
    {
        CFG_ASSIGN(config.srv.port, get_uint<uint16_t>(*srv, "port", 1, 65535, 4200));
        CFG_ASSIGN(config.srv.bind_address, get_string(*srv, "bind_address", "0.0.0.0"));
        CFG_ASSIGN(config.srv.io_threads, get_uint<size_t>(*srv, "io_threads", 1, 256, 2));
        CFG_ASSIGN(config.srv.cpu_threads, get_uint<size_t>(*srv, "cpu_threads", 0, 256, 0));
        CFG_ASSIGN(config.srv.client_path, get_string(*srv, "client_path", "./client"));
        CFG_ASSIGN(config.srv.max_body_size, get_uint<size_t>(*srv, "max_body_size", 1024, 16 * 1024 * 1024, 64 * 1024));
        CFG_ASSIGN(config.srv.shutdown_grace, get_seconds(*srv, "shutdown_grace_sec", 0, 600, std::chrono::seconds{10}));
    }
    if (const auto* tls = section(root, "tls"))
    {
        CFG_ASSIGN(config.tl.cert_file, get_string(*tls, "cert_file", "config/cert.pem"));
        CFG_ASSIGN(config.tl.key_file, get_string(*tls, "key_file", "config/key.pem"));
    }
    if (const auto* sto = section(root, "storage"))
    {
        CFG_ASSIGN(config.sto.db_path, get_string(*sto, "db_path", "data/data.db"));
    }
    if (const auto* au = section(root, "auth"))
    {
        CFG_ASSIGN(config.au.root_credentials, get_string(*au, "root_credentials", "config/root.toml"));
        CFG_ASSIGN(config.au.session_ttl, get_seconds(*au, "session_ttl_sec", 60, 86400 * 30, std::chrono::seconds{360 * 60}));
        CFG_ASSIGN(config.au.clock_skew, get_seconds(*au, "clock_skew_sec", 0, 3600, std::chrono::seconds{60}));
        CFG_ASSIGN(config.au.session_key_file, get_string(*au, "session_key_file", ""));
    }
    if (const auto* to = section(root, "timeouts"))
    {
        CFG_ASSIGN(config.to.handshake_timeout, get_seconds(*to, "handshake_timeout_sec", 1, 300, std::chrono::seconds{10}));
        CFG_ASSIGN(config.to.read_timeout, get_seconds(*to, "read_timeout_sec", 1, 3600, std::chrono::seconds{30}));
        CFG_ASSIGN(config.to.write_timeout, get_seconds(*to, "write_timeout_sec", 1, 300, std::chrono::seconds{30}));
    }
    if (const auto* log = section(root, "logging"))
    {
        CFG_ASSIGN(config.log.level, get_string(*log, "level", "info"));
        CFG_ASSIGN(config.log.file, get_string(*log, "file", ""));
        CFG_ASSIGN(config.log.max_size_mb, get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100));
        config.log.enable_console = get_bool(*log, "enable_console", true);
    }
    return config;
}

#undef CFG_ASSIGN
