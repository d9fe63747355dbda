#include "tls.hpp"
#include "logger.hpp"

#include <openssl/ssl.h>
#include <filesystem>
#include <format>

std::expected<ssl::context, std::string> make_tls_context(const Config::TlsCfg& cfg)
{
    namespace fs = std::filesystem;

    std::error_code fec;
    if (!fs::is_regular_file(cfg.cert_file, fec))
    {
        return std::unexpected(std::format("TLS certificate not found: {}", cfg.cert_file));
    }
    if (!fs::is_regular_file(cfg.key_file, fec))
    {
        return std::unexpected(std::format("TLS private key not found: {}", cfg.key_file));
    }

    ssl::context ctx(ssl::context::tls_server);

    boost::system::error_code ec;
    ctx.set_options(ssl::context::default_workarounds
                    | ssl::context::no_sslv2
                    | ssl::context::no_sslv3
                    | ssl::context::no_tlsv1
                    | ssl::context::no_tlsv1_1
                    | ssl::context::single_dh_use, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to set TLS options: {}", ec.message()));
    }

    if (SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION) != 1)
    {
        return std::unexpected("Failed to pin minimum TLS version");
    }

    ctx.use_certificate_chain_file(cfg.cert_file, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to load certificate chain {}: {}", cfg.cert_file, ec.message()));
    }

    ctx.use_private_key_file(cfg.key_file, ssl::context::pem, ec);
    if (ec)
    {
        return std::unexpected(std::format("Failed to load private key {}: {}", cfg.key_file, ec.message()));
    }

    if (SSL_CTX_check_private_key(ctx.native_handle()) != 1)
    {
        return std::unexpected(std::format("Private key {} does not match certificate {}", cfg.key_file, cfg.cert_file));
    }

    LOG_INFO("TLS context ready (cert: {})", cfg.cert_file);
    return ctx;
}
