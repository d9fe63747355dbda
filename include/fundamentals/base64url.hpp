#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// RFC 4648 section 5 alphabet, no padding. Cookie-safe.
namespace base64url
{

[[nodiscard]] std::string encode(std::span<const uint8_t> data);

// Rejects characters outside the alphabet, impossible lengths and
// non-canonical trailing bits, so every accepted text has exactly one encoding.
[[nodiscard]] std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace base64url
