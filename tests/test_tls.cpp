#include <catch2/catch_test_macros.hpp>

#include "auth/auth_service.hpp"
#include "auth/credential_store.hpp"
#include "config.hpp"
#include "crypto/session_codec.hpp"
#include "handlers.hpp"
#include "router.hpp"
#include "server.hpp"
#include "static_files.hpp"
#include "tls.hpp"
#include "test_support.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <boost/json.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using test_support::TempDir;
namespace fs = std::filesystem;

namespace {

using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

pkey_ptr make_key()
{
    return pkey_ptr(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"), &EVP_PKEY_free);
}

x509_ptr make_self_signed(EVP_PKEY* key)
{
    x509_ptr cert(X509_new(), &X509_free);
    if (!cert)
    {
        return cert;
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key);

    auto* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key, EVP_sha256()) == 0)
    {
        cert.reset();
    }
    return cert;
}

bool write_cert(const fs::path& path, X509* cert)
{
    bio_ptr bio(BIO_new_file(path.string().c_str(), "w"), &BIO_free);
    return bio && PEM_write_bio_X509(bio.get(), cert) == 1;
}

bool write_key(const fs::path& path, EVP_PKEY* key)
{
    bio_ptr bio(BIO_new_file(path.string().c_str(), "w"), &BIO_free);
    return bio && PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) == 1;
}

// Self-signed P-256 pair for "localhost" written as PEM into dir.
Config::TlsCfg make_pem_pair(const TempDir& dir)
{
    auto key = make_key();
    REQUIRE(key);
    auto cert = make_self_signed(key.get());
    REQUIRE(cert);

    Config::TlsCfg cfg;
    cfg.cert_file = (dir / "cert.pem").string();
    cfg.key_file = (dir / "key.pem").string();
    REQUIRE(write_cert(cfg.cert_file, cert.get()));
    REQUIRE(write_key(cfg.key_file, key.get()));
    return cfg;
}

Config make_config(const TempDir& dir, const Config::TlsCfg& tls)
{
    auto path = dir.write("server_config.json", boost::json::serialize(boost::json::object{
        {"server", {{"bind_address", "127.0.0.1"}, {"io_threads", 1}, {"shutdown_grace_sec", 5}}},
        {"timeouts", {{"handshake_timeout_sec", 5}, {"read_timeout_sec", 5}, {"write_timeout_sec", 5}}},
        {"logging", {{"level", "warn"}}},
    }));

    Config::Overrides cli;
    cli.port = 0;
    cli.cert_file = tls.cert_file;
    cli.key_file = tls.key_file;
    cli.client_path = (dir / "client").string();
    cli.db_path = (dir / "data.db").string();

    auto cfg = Config::load(path.string(), cli);
    REQUIRE(cfg.has_value());
    return *cfg;
}

using client_stream = beast::ssl_stream<beast::tcp_stream>;

net::awaitable<Response> get_version(client_stream& stream, uint16_t port)
{
    co_await beast::get_lowest_layer(stream).async_connect(
        tcp::endpoint(net::ip::address_v4::loopback(), port), net::use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    Request req{http::verb::get, "/v1/version", 11};
    req.set(http::field::host, "localhost");
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buf;
    Response res;
    co_await http::async_read(stream, buf, res, net::use_awaitable);
    co_return res;
}

// Router, auth and store behind a live Server on an ephemeral loopback port.
struct LiveServer
{
    TempDir dir;
    Config::TlsCfg tls_cfg = make_pem_pair(dir);
    Config cfg = make_config(dir, tls_cfg);
    ThreadPool pool{1};
    ServerMetrics metrics;
    std::shared_ptr<auth::AuthService> auth_svc;
    std::unique_ptr<Router> router;
    std::unique_ptr<ssl::context> tls;

    LiveServer()
    {
        auto store = auth::CredentialStore::open(cfg.storage().db_path);
        REQUIRE(store.has_value());
        auto key = crypto::SessionCodec::generate_key();
        REQUIRE(key.has_value());
        auto svc = auth::AuthService::create(*store, std::make_shared<const crypto::SessionCodec>(*key), pool, 3600s);
        REQUIRE(svc.has_value());
        auth_svc = *svc;

        router = std::make_unique<Router>(auth_svc, StaticFiles(cfg.server().client_path), metrics);
        handlers::install_routes(*router);

        auto ctx = make_tls_context(cfg.tls());
        REQUIRE(ctx.has_value());
        tls = std::make_unique<ssl::context>(std::move(*ctx));
    }
};

ssl::context make_client_context()
{
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
}

}

TEST_CASE("make_tls_context accepts a matching PEM pair")
{
    TempDir dir;
    auto cfg = make_pem_pair(dir);

    auto ctx = make_tls_context(cfg);

    REQUIRE(ctx.has_value());
    CHECK(SSL_CTX_get_min_proto_version(ctx->native_handle()) == TLS1_2_VERSION);
}

TEST_CASE("make_tls_context rejects missing files")
{
    TempDir dir;
    auto cfg = make_pem_pair(dir);

    auto no_cert = cfg;
    no_cert.cert_file = (dir / "absent.pem").string();
    auto r1 = make_tls_context(no_cert);
    REQUIRE(!r1.has_value());
    CHECK(r1.error().find("not found") != std::string::npos);

    auto no_key = cfg;
    no_key.key_file = (dir / "absent.pem").string();
    CHECK(!make_tls_context(no_key).has_value());
}

TEST_CASE("make_tls_context rejects garbage PEM")
{
    TempDir dir;
    auto cfg = make_pem_pair(dir);

    auto bad_cert = cfg;
    bad_cert.cert_file = dir.write("garbage_cert.pem", "-----BEGIN CERTIFICATE-----\nnot base64 at all\n-----END CERTIFICATE-----\n").string();
    CHECK(!make_tls_context(bad_cert).has_value());

    auto bad_key = cfg;
    bad_key.key_file = dir.write("garbage_key.pem", "hello").string();
    CHECK(!make_tls_context(bad_key).has_value());
}

TEST_CASE("make_tls_context rejects a key that does not belong to the certificate")
{
    TempDir dir;
    auto cfg = make_pem_pair(dir);

    auto other = make_key();
    REQUIRE(other);
    auto other_path = dir / "other_key.pem";
    REQUIRE(write_key(other_path, other.get()));

    auto mismatched = cfg;
    mismatched.key_file = other_path.string();
    CHECK(!make_tls_context(mismatched).has_value());
}

TEST_CASE("Server answers over TLS and drains on stop")
{
    LiveServer live;
    net::io_context ic;
    Server srv(ic, live.cfg, *live.tls, *live.router, live.metrics);
    REQUIRE(srv.start().has_value());
    CHECK(srv.is_accepting());
    auto port = srv.local_port();
    REQUIRE(port != 0);

    auto client_tls = make_client_context();
    Response res;
    std::exception_ptr failure;

    net::co_spawn(ic, [&]() -> net::awaitable<void>
    {
        client_stream stream(co_await net::this_coro::executor, client_tls);
        res = co_await get_version(stream, port);

        auto [ec] = co_await stream.async_shutdown(net::as_tuple(net::use_awaitable));
        std::ignore = ec;
        beast::get_lowest_layer(stream).close();

        srv.stop();
    }, [&](std::exception_ptr e) { failure = e; });

    ic.run_for(20s);

    CHECK(!failure);
    CHECK(ic.stopped());
    CHECK(res.result() == http::status::ok);
    CHECK(boost::json::parse(res.body()).as_object().at("name").as_string() == DNDSERVER_NAME);
    CHECK(!srv.is_accepting());
    CHECK(srv.connection_count() == 0);
    CHECK(live.metrics.handshakes_completed == 1);
    CHECK(live.metrics.connections_accepted == 1);
    CHECK(live.metrics.connections_closed == 1);
}

TEST_CASE("Server closes idle keep-alive connections on stop")
{
    LiveServer live;
    net::io_context ic;
    Server srv(ic, live.cfg, *live.tls, *live.router, live.metrics);
    REQUIRE(srv.start().has_value());
    auto port = srv.local_port();

    auto client_tls = make_client_context();
    Response res;
    boost::system::error_code after_stop;
    std::exception_ptr failure;

    net::co_spawn(ic, [&]() -> net::awaitable<void>
    {
        client_stream stream(co_await net::this_coro::executor, client_tls);
        res = co_await get_version(stream, port);
        CHECK(res.keep_alive());

        // Connection is idle and kept alive; stopping must close it from the server side.
        srv.stop();

        beast::flat_buffer buf;
        Response more;
        auto [ec, n] = co_await http::async_read(stream, buf, more, net::as_tuple(net::use_awaitable));
        std::ignore = n;
        after_stop = ec;

        auto [sec] = co_await stream.async_shutdown(net::as_tuple(net::use_awaitable));
        std::ignore = sec;
        beast::get_lowest_layer(stream).close();
    }, [&](std::exception_ptr e) { failure = e; });

    ic.run_for(20s);

    CHECK(!failure);
    CHECK(ic.stopped());
    CHECK(res.result() == http::status::ok);
    CHECK(after_stop);
    CHECK(!srv.is_accepting());
    CHECK(srv.connection_count() == 0);
    CHECK(live.metrics.connections_closed == 1);
}
