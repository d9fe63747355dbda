#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

[[nodiscard]] Response make_json_response(const Request& req, http::status status, const boost::json::object& body);

// {"status":"Error","message":msg}
[[nodiscard]] Response make_error_response(const Request& req, http::status status, std::string_view msg);
