#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace auth
{

/**
 * Token ids that were logged out before they expired.
 * Entries drop out once the token would have expired anyway; the sweep runs on insert.
 */
class RevocationList
{
public:
    void revoke(std::string_view jti, int64_t until, int64_t now);
    [[nodiscard]] bool contains(std::string_view jti) const;
    [[nodiscard]] size_t size() const;

    size_t sweep(int64_t now);

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, int64_t> entries;
};

}
