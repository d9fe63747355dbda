#include "auth/revocation_list.hpp"

namespace auth
{

void RevocationList::revoke(std::string_view jti, int64_t until, int64_t now)
{
    std::lock_guard lock(mtx);
    std::erase_if(entries, [now](const auto& kv) { return kv.second < now; });
    if (until >= now)
    {
        entries.insert_or_assign(std::string(jti), until);
    }
}

bool RevocationList::contains(std::string_view jti) const
{
    std::lock_guard lock(mtx);
    return entries.contains(std::string(jti));
}

size_t RevocationList::size() const
{
    std::lock_guard lock(mtx);
    return entries.size();
}

size_t RevocationList::sweep(int64_t now)
{
    std::lock_guard lock(mtx);
    return std::erase_if(entries, [now](const auto& kv) { return kv.second < now; });
}

}
