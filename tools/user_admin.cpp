#include "auth/credential_store.hpp"
#include "auth/argon2_hasher.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <print>
#include <string>
#include <string_view>
#include <vector>
#include <ctime>

namespace {

constexpr std::string_view default_db = "data/data.db";

void print_usage(const char* prog)
{
    std::println("Usage: {} [--data-path <db>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  add <username> <password> [root]  Create new account");
    std::println("  list                              List all accounts");
    std::println("  remove <username>                 Delete account");
    std::println("  reset <username> <password>       Reset password");
}

std::string format_time(int64_t t)
{
    if (t == 0)
    {
        return "never";
    }
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%SZ", &tm);
    return buf;
}

int cmd_add(auth::CredentialStore& db, std::string_view user, std::string pass, auth::Role role)
{
    if (!auth::check_password(pass))
    {
        std::println(stderr, "Password too short (min 8 chars)");
        return 1;
    }

    auto hash_res = auth::Argon2Hasher::hash(pass);
    crypto::secure_clear(pass);
    if (!hash_res)
    {
        std::println(stderr, "Failed to hash password: {}", hash_res.error());
        return 1;
    }

    if (auto ret = db.create_account(user, *hash_res, role); !ret)
    {
        std::println(stderr, "Failed to create account '{}': {}", user, auth::to_string(ret.error()));
        return 1;
    }

    std::println("Account '{}' created ({})", user, auth::to_string(role));
    return 0;
}

int cmd_list(auth::CredentialStore& db)
{
    auto accounts = db.list_accounts();
    if (!accounts)
    {
        std::println(stderr, "Failed to list accounts: {}", auth::to_string(accounts.error()));
        return 1;
    }
    if (accounts->empty())
    {
        std::println("No accounts found");
        return 0;
    }

    std::println("{:<20} {:<8} {:<22} {}", "Username", "Role", "Created", "Last Login");
    std::println("{}", std::string(74, '-'));

    for (const auto& acc : *accounts)
    {
        std::println("{:<20} {:<8} {:<22} {}", acc.username, auth::to_string(acc.role),
                     format_time(acc.created_at), format_time(acc.last_login));
    }

    return 0;
}

int cmd_remove(auth::CredentialStore& db, std::string_view user)
{
    if (auto ret = db.remove_account(user); !ret)
    {
        std::println(stderr, "Failed to remove account '{}': {}", user, auth::to_string(ret.error()));
        return 1;
    }

    std::println("Account '{}' removed", user);
    return 0;
}

int cmd_reset(auth::CredentialStore& db, std::string_view user, std::string pass)
{
    if (!auth::check_password(pass))
    {
        std::println(stderr, "Password too short (min 8 chars)");
        return 1;
    }

    auto hash_res = auth::Argon2Hasher::hash(pass);
    crypto::secure_clear(pass);
    if (!hash_res)
    {
        std::println(stderr, "Failed to hash password: {}", hash_res.error());
        return 1;
    }

    if (auto ret = db.update_password(user, *hash_res); !ret)
    {
        std::println(stderr, "Failed to reset password of '{}': {}", user, auth::to_string(ret.error()));
        return 1;
    }

    std::println("Password reset for '{}'", user);
    return 0;
}

}

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string db_path(default_db);

    if (args.size() >= 2 && args[0] == "--data-path")
    {
        db_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    if (auto res = Logger::init("warn", "", 1, true); !res)
    {
        std::println(stderr, "Failed to initialize logger: {}", res.error());
        return 1;
    }

    auto store = auth::CredentialStore::open(db_path);
    if (!store)
    {
        std::println(stderr, "Failed to open {}: {}", db_path, store.error());
        return 1;
    }
    auto& db = **store;

    const auto& cmd = args[0];
    int rc = 1;
    if (cmd == "add" && (args.size() == 3 || (args.size() == 4 && args[3] == "root")))
    {
        rc = cmd_add(db, args[1], args[2], args.size() == 4 ? auth::Role::Root : auth::Role::Player);
    }
    else if (cmd == "list" && args.size() == 1)
    {
        rc = cmd_list(db);
    }
    else if (cmd == "remove" && args.size() == 2)
    {
        rc = cmd_remove(db, args[1]);
    }
    else if (cmd == "reset" && args.size() == 3)
    {
        rc = cmd_reset(db, args[1], args[2]);
    }
    else
    {
        print_usage(argv[0]);
    }

    for (auto& a : args)
    {
        crypto::secure_clear(a);
    }
    Logger::shutdown();
    return rc;
}
