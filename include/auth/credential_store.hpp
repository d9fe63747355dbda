#pragma once

#include "auth/account.hpp"
#include <sqlite3.h>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

enum class StoreError : uint8_t
{
    Conflict,
    NotFound,
    InvalidArgument,
    StorageUnavailable,
};

[[nodiscard]] std::string_view to_string(StoreError e);

/**
 * Sole owner of the accounts table.
 *
 * One SQLite connection behind one mutex: every call, read or write, holds
 * the gate for its whole duration, so operations on the same connection are
 * totally ordered. Every mutation runs as a single IMMEDIATE transaction and
 * is rolled back on any failure.
 */
class CredentialStore
{
    struct Private
    {
        explicit Private() = default;
    };

public:
    [[nodiscard]] static std::expected<std::shared_ptr<CredentialStore>, std::string> open(std::string_view db_path);
    // Only reachable through open().
    CredentialStore(Private, sqlite3* db);
    ~CredentialStore();

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    [[nodiscard]] std::expected<void, StoreError> create_account(std::string_view username,
                                                                 std::string_view password_hash,
                                                                 Role role = Role::Player);
    [[nodiscard]] std::expected<std::optional<Account>, StoreError> get_account(std::string_view username);
    [[nodiscard]] std::expected<bool, StoreError> has_role(Role role);
    [[nodiscard]] std::expected<std::vector<Account>, StoreError> list_accounts();

    [[nodiscard]] std::expected<void, StoreError> update_last_login(std::string_view username);
    [[nodiscard]] std::expected<void, StoreError> update_password(std::string_view username, std::string_view password_hash);
    [[nodiscard]] std::expected<void, StoreError> remove_account(std::string_view username);

private:
    using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    [[nodiscard]] bool init_schema();
    [[nodiscard]] bool exec(const char* sql);
    [[nodiscard]] stmt_ptr prepare(const char* sql);

    template<class Fn>
    std::expected<void, StoreError> in_transaction(Fn&& body);

    // Runs a single-row UPDATE/DELETE keyed by ?1 = username; bind_rest fills ?2 onwards.
    // NotFound when no row matched.
    template<class Bind>
    std::expected<void, StoreError> modify_one(const char* sql, std::string_view username, Bind&& bind_rest);

    sqlite3* db;
    std::mutex mtx;
};

}
