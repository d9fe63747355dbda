#include "server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "handlers.hpp"
#include "tls.hpp"
#include "auth/auth_service.hpp"
#include "auth/bootstrap.hpp"
#include "auth/credential_store.hpp"
#include "crypto/session_codec.hpp"
#include "crypto/utils.hpp"
#include "threadpool/threadpool.hpp"

#include <print>
#include <charconv>
#include <filesystem>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace {

constexpr std::string_view default_config = "server_config.json";

struct CliArgs
{
    std::optional<std::string> config_path;
    Config::Overrides overrides;
    bool help = false;
};

void print_usage(const char* prog)
{
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  --config <file>            JSON configuration (default: {})", default_config);
    std::println("  --port <n>                 Port to listen on");
    std::println("  --client-path <dir>        Directory with the client files");
    std::println("  --data-path <file>         SQLite database file");
    std::println("  --cert <file>              PEM certificate chain");
    std::println("  --key <file>               PEM private key");
    std::println("  --root-credentials <file>  Root account descriptor (TOML)");
    std::println("  -v, --verbose              Log at debug level");
    std::println("  -h, --help                 Show this help");
}

std::expected<CliArgs, std::string> parse_args(int argc, char** argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::expected<std::string, std::string>
        {
            if (i + 1 >= argc)
            {
                return std::unexpected(std::format("{} needs a value", arg));
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help")
        {
            args.help = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            args.overrides.log_level = "debug";
        }
        else if (arg == "--port")
        {
            auto v = value();
            if (!v)
            {
                return std::unexpected(v.error());
            }
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), port);
            if (ec != std::errc{} || ptr != v->data() + v->size() || port == 0)
            {
                return std::unexpected(std::format("Invalid port: {}", *v));
            }
            args.overrides.port = port;
        }
        else if (arg == "--config" || arg == "--client-path" || arg == "--data-path"
                 || arg == "--cert" || arg == "--key" || arg == "--root-credentials")
        {
            auto v = value();
            if (!v)
            {
                return std::unexpected(v.error());
            }
            if (arg == "--config")                 args.config_path = std::move(*v);
            else if (arg == "--client-path")       args.overrides.client_path = std::move(*v);
            else if (arg == "--data-path")         args.overrides.db_path = std::move(*v);
            else if (arg == "--cert")              args.overrides.cert_file = std::move(*v);
            else if (arg == "--key")               args.overrides.key_file = std::move(*v);
            else                                   args.overrides.root_credentials = std::move(*v);
        }
        else
        {
            return std::unexpected(std::format("Unknown option: {}", arg));
        }
    }
    return args;
}

// Objects are torn down in reverse order of construction: sessions, server, router, auth, codec, store, pool.
int run_server(const Config& config)
{
    ThreadPool pool(config.effective_cpu_threads());
    LOG_INFO("ThreadPool initialized with {} threads", pool.size());

    const auto& db_path = config.storage().db_path;
    if (auto parent = std::filesystem::path(db_path).parent_path(); !parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    auto store = auth::CredentialStore::open(db_path);
    if (!store)
    {
        LOG_ERROR("{}", store.error());
        return 1;
    }

    if (auto boot = auth::bootstrap_root(**store, config.auth().root_credentials); !boot)
    {
        LOG_ERROR("Bootstrap failed: {}", boot.error());
        return 1;
    }

    const auto& key_file = config.auth().session_key_file;
    auto key = key_file.empty()
        ? crypto::SessionCodec::generate_key()
        : crypto::SessionCodec::load_or_create_key(key_file);
    if (!key)
    {
        LOG_ERROR("{}", key.error());
        return 1;
    }
    if (key_file.empty())
    {
        LOG_INFO("Using an ephemeral session key; sessions end with this process");
    }
    auto codec = std::make_shared<const crypto::SessionCodec>(*key, config.auth().clock_skew);
    crypto::secure_clear(*key);

    auto auth_svc = auth::AuthService::create(*store, codec, pool, config.auth().session_ttl);
    if (!auth_svc)
    {
        LOG_ERROR("{}", auth_svc.error());
        return 1;
    }

    auto tls = make_tls_context(config.tls());
    if (!tls)
    {
        LOG_ERROR("TLS configuration error: {}", tls.error());
        return 1;
    }

    ServerMetrics metrics;
    Router router(*auth_svc, StaticFiles(config.server().client_path), metrics);
    handlers::install_routes(router);

    net::io_context ic(static_cast<int>(config.server().io_threads));
    Server svr(ic, config, *tls, router, metrics);

    if (auto started = svr.start(); !started)
    {
        LOG_ERROR("{}", started.error());
        return 1;
    }

    {
        std::vector<std::jthread> threads;
        threads.reserve(config.server().io_threads - 1);
        for (size_t i = 1; i < config.server().io_threads; ++i)
        {
            threads.emplace_back([&ic] { ic.run(); });
        }
        ic.run();
    }

    pool.stop();
    LOG_INFO("{}", metrics);
    return 0;
}

}

int main(int argc, char** argv)
{
    auto args = parse_args(argc, argv);
    if (!args)
    {
        std::println(stderr, "{}", args.error());
        print_usage(argv[0]);
        return 1;
    }
    if (args->help)
    {
        print_usage(argv[0]);
        return 0;
    }

    // An explicit --config must load; the default file may be absent.
    std::string config_path = args->config_path.value_or(std::string(default_config));
    bool using_defaults = false;
    Config config;
    if (args->config_path || std::filesystem::exists(config_path))
    {
        auto loaded = Config::load(config_path, args->overrides);
        if (!loaded)
        {
            std::println(stderr, "Failed to load config: {}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }
    else
    {
        config = Config::load_defaults(args->overrides);
        using_defaults = true;
    }

    const auto& log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }
    if (using_defaults)
    {
        LOG_WARN("Config file {} not found, using defaults", config_path);
    }

    LOG_INFO("{} v{} starting", DNDSERVER_NAME, DNDSERVER_VERSION);

    int rc = 1;
    try
    {
        rc = run_server(config);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
    }

    LOG_INFO("Server exiting...");
    Logger::shutdown();
    return rc;
}
