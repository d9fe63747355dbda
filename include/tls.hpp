#pragma once

#include "config.hpp"
#include <boost/asio/ssl.hpp>
#include <expected>
#include <string>

namespace ssl = boost::asio::ssl;

// Server-side TLS context from the configured PEM chain and key. TLS 1.2 and newer only.
[[nodiscard]] std::expected<ssl::context, std::string> make_tls_context(const Config::TlsCfg& cfg);
