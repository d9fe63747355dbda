#pragma once
#include <boost/json.hpp>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace json_utils
{

inline boost::json::object status_msg(std::string_view status, std::string_view msg)
{
    return boost::json::object{
        {"status", status},
        {"message", msg}
    };
}

// Request bodies must be a single JSON object.
inline std::expected<boost::json::object, std::string> parse_object(std::string_view text)
{
    boost::json::error_code ec;
    auto jv = boost::json::parse(text, ec);
    if (ec)
    {
        return std::unexpected(std::format("Malformed JSON: {}", ec.message()));
    }
    if (!jv.is_object())
    {
        return std::unexpected(std::string("JSON object expected"));
    }
    return std::move(jv.as_object());
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return std::string(it->value().as_string());
}

} // namespace json_utils
