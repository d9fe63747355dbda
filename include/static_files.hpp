#pragma once

#include "http_types.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

/**
 * Read-only view of the client directory.
 * Only regular files strictly below the root are ever served.
 */
class StaticFiles
{
public:
    explicit StaticFiles(const std::filesystem::path& root);

    // Maps a request target to a file below the root, nullopt when missing or escaping.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view target) const;

    // GET and HEAD only; nullopt means 404.
    [[nodiscard]] std::optional<Response> serve(const Request& req) const;

    [[nodiscard]] static std::string_view mime_type(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& root() const { return base; }

private:
    std::filesystem::path base;
};
