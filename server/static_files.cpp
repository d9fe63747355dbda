#include "static_files.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(std::string_view in)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] != '%')
        {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
        {
            return std::nullopt;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

bool is_below(const fs::path& root, const fs::path& p)
{
    auto [r, q] = std::mismatch(root.begin(), root.end(), p.begin(), p.end());
    return r == root.end();
}

}

StaticFiles::StaticFiles(const fs::path& root)
{
    std::error_code ec;
    base = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec)
    {
        base = root;
    }
    if (!fs::is_directory(base, ec))
    {
        LOG_WARN("Client directory {} does not exist; static files will 404", base.string());
    }
}

std::optional<fs::path> StaticFiles::resolve(std::string_view target) const
{
    target = target.substr(0, target.find_first_of("?#"));
    if (target.empty() || target.front() != '/')
    {
        return std::nullopt;
    }

    auto decoded = percent_decode(target);
    if (!decoded || decoded->find('\0') != std::string::npos || decoded->find('\\') != std::string::npos)
    {
        return std::nullopt;
    }

    fs::path rel;
    std::string_view rest = *decoded;
    while (!rest.empty())
    {
        auto slash = rest.find('/');
        auto seg = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

        if (seg.empty() || seg == ".")
        {
            continue;
        }
        if (seg == "..")
        {
            return std::nullopt;
        }
        rel /= std::string(seg);
    }

    std::error_code ec;
    fs::path full = base / rel;
    if (fs::is_directory(full, ec))
    {
        full /= "index.html";
    }

    // Symlinks must not lead out of the root either.
    auto canon = fs::weakly_canonical(full, ec);
    if (ec || !is_below(base, canon) || canon == base)
    {
        return std::nullopt;
    }
    if (!fs::is_regular_file(canon, ec))
    {
        return std::nullopt;
    }
    return canon;
}

std::optional<Response> StaticFiles::serve(const Request& req) const
{
    auto path = resolve(req.target());
    if (!path)
    {
        return std::nullopt;
    }

    std::ifstream file(*path, std::ios::binary);
    if (!file.is_open())
    {
        LOG_WARN("Failed to open static file {}", path->string());
        return std::nullopt;
    }
    std::string body{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    Response res{http::status::ok, req.version()};
    res.set(http::field::server, DNDSERVER_NAME);
    res.set(http::field::content_type, mime_type(*path));
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();

    if (req.method() == http::verb::head)
    {
        auto len = res.body().size();
        res.body().clear();
        res.content_length(len);
    }
    return res;
}

std::string_view StaticFiles::mime_type(const fs::path& path)
{
    static const std::unordered_map<std::string, std::string_view> types{
        {".html", "text/html; charset=utf-8"},
        {".htm",  "text/html; charset=utf-8"},
        {".css",  "text/css; charset=utf-8"},
        {".js",   "text/javascript; charset=utf-8"},
        {".mjs",  "text/javascript; charset=utf-8"},
        {".json", "application/json"},
        {".txt",  "text/plain; charset=utf-8"},
        {".svg",  "image/svg+xml"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".webp", "image/webp"},
        {".ico",  "image/vnd.microsoft.icon"},
        {".woff", "font/woff"},
        {".woff2","font/woff2"},
        {".ttf",  "font/ttf"},
        {".wasm", "application/wasm"},
        {".map",  "application/json"},
    };

    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}
