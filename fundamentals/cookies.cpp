#include "fundamentals/cookies.hpp"

#include <format>

namespace cookies
{

namespace {

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }
    return s;
}

}

std::optional<std::string_view> find(std::string_view header, std::string_view name)
{
    while (!header.empty())
    {
        auto semi = header.find(';');
        auto pair = trim(header.substr(0, semi));
        header = semi == std::string_view::npos ? std::string_view{} : header.substr(semi + 1);

        auto eq = pair.find('=');
        if (eq == std::string_view::npos)
        {
            continue;
        }
        if (trim(pair.substr(0, eq)) != name)
        {
            continue;
        }

        auto value = trim(pair.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return std::nullopt;
}

std::string make_session(std::string_view name, std::string_view value, std::chrono::seconds max_age)
{
    return std::format("{}={}; Path=/; Max-Age={}; Secure; HttpOnly; SameSite=Strict", name, value, max_age.count());
}

std::string make_clear(std::string_view name)
{
    return std::format("{}=; Path=/; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT; Secure; HttpOnly; SameSite=Strict", name);
}

} // namespace cookies
