#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace auth
{

// First-run credentials of the root account, as written by the setup script:
//
//   [credentials]
//   name="root"
//   pass="<64 hex characters>"
struct RootDescriptor
{
    std::string name;
    std::string pass;
};

// Understands the TOML subset the descriptor needs: comments, table headers,
// basic strings with the common escapes and literal strings.
[[nodiscard]] std::expected<RootDescriptor, std::string> parse_root_descriptor(std::string_view text);

[[nodiscard]] std::expected<RootDescriptor, std::string> load_root_descriptor(const std::filesystem::path& path);

}
