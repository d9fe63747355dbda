#include "fundamentals/base64url.hpp"

#include <openssl/evp.h>
#include <algorithm>

namespace base64url
{

std::string encode(std::span<const uint8_t> data)
{
    if (data.empty())
    {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(n));

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    std::ranges::replace(out, '+', '-');
    std::ranges::replace(out, '/', '_');
    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 == 1)
    {
        return std::nullopt;
    }

    std::string std_b64;
    std_b64.reserve(text.size() + 3);
    for (char c : text)
    {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
        {
            std_b64.push_back(c);
        }
        else if (c == '-')
        {
            std_b64.push_back('+');
        }
        else if (c == '_')
        {
            std_b64.push_back('/');
        }
        else
        {
            return std::nullopt;
        }
    }

    size_t pad = (4 - text.size() % 4) % 4;
    std_b64.append(pad, '=');

    std::vector<uint8_t> out(std_b64.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(std_b64.data()), static_cast<int>(std_b64.size()));
    if (n < 0 || static_cast<size_t>(n) < pad)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(n) - pad);

    if (encode(out) != text)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace base64url
