#include "auth/root_descriptor.hpp"
#include "crypto/utils.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <optional>

namespace auth
{

namespace {

constexpr std::string_view credentials_table = "credentials";

std::string_view trim(std::string_view s)
{
    constexpr std::string_view ws = " \t\r";
    auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos)
    {
        return {};
    }
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool is_bare_key(std::string_view key)
{
    if (key.empty())
    {
        return false;
    }
    for (char c : key)
    {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

// Anything after the closing quote may only be whitespace or a comment.
bool only_comment_left(std::string_view rest)
{
    rest = trim(rest);
    return rest.empty() || rest.front() == '#';
}

std::expected<std::string, std::string> parse_string(std::string_view v)
{
    if (v.empty())
    {
        return std::unexpected("missing value");
    }

    if (v.front() == '\'')
    {
        auto close = v.find('\'', 1);
        if (close == std::string_view::npos)
        {
            return std::unexpected("unterminated literal string");
        }
        if (!only_comment_left(v.substr(close + 1)))
        {
            return std::unexpected("unexpected text after string");
        }
        return std::string(v.substr(1, close - 1));
    }

    if (v.front() != '"')
    {
        return std::unexpected("value must be a string");
    }

    std::string out;
    for (size_t i = 1; i < v.size(); ++i)
    {
        char c = v[i];
        if (c == '"')
        {
            if (!only_comment_left(v.substr(i + 1)))
            {
                return std::unexpected("unexpected text after string");
            }
            return out;
        }
        if (c != '\\')
        {
            out.push_back(c);
            continue;
        }
        if (++i >= v.size())
        {
            break;
        }
        switch (v[i])
        {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case 'r':  out.push_back('\r'); break;
            default:
                return std::unexpected(std::format("unsupported escape '\\{}'", v[i]));
        }
    }
    return std::unexpected("unterminated string");
}

} // namespace

std::expected<RootDescriptor, std::string> parse_root_descriptor(std::string_view text)
{
    std::optional<std::string> name;
    std::optional<std::string> pass;
    std::string table;
    size_t line_no = 0;

    while (!text.empty())
    {
        auto nl = text.find('\n');
        auto line = trim(text.substr(0, nl));
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
        ++line_no;

        if (line.empty() || line.front() == '#')
        {
            continue;
        }

        if (line.front() == '[')
        {
            auto close = line.find(']');
            if (close == std::string_view::npos || !only_comment_left(line.substr(close + 1)))
            {
                return std::unexpected(std::format("line {}: malformed table header", line_no));
            }
            auto header = trim(line.substr(1, close - 1));
            if (!is_bare_key(header))
            {
                return std::unexpected(std::format("line {}: unsupported table name", line_no));
            }
            table = std::string(header);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos)
        {
            return std::unexpected(std::format("line {}: expected key = value", line_no));
        }
        auto key = trim(line.substr(0, eq));
        if (!is_bare_key(key))
        {
            return std::unexpected(std::format("line {}: invalid key", line_no));
        }

        auto value = parse_string(trim(line.substr(eq + 1)));
        if (!value)
        {
            return std::unexpected(std::format("line {}: {}", line_no, value.error()));
        }

        if (table != credentials_table)
        {
            continue;
        }

        std::optional<std::string>* slot = nullptr;
        if (key == "name")
        {
            slot = &name;
        }
        else if (key == "pass")
        {
            slot = &pass;
        }
        else
        {
            continue;
        }

        if (slot->has_value())
        {
            return std::unexpected(std::format("line {}: duplicate key '{}'", line_no, key));
        }
        *slot = std::move(*value);
    }

    if (!name || name->empty())
    {
        return std::unexpected("missing credentials.name");
    }
    if (!pass || pass->empty())
    {
        return std::unexpected("missing credentials.pass");
    }

    return RootDescriptor{std::move(*name), std::move(*pass)};
}

std::expected<RootDescriptor, std::string> load_root_descriptor(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open root descriptor: {}", path.string()));
    }

    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        crypto::secure_clear(text);
        return std::unexpected(std::format("Failed to read root descriptor: {}", path.string()));
    }

    auto desc = parse_root_descriptor(text);
    crypto::secure_clear(text);
    if (!desc)
    {
        return std::unexpected(std::format("Malformed root descriptor {}: {}", path.string(), desc.error()));
    }
    return desc;
}

}
