#include "auth/credential_store.hpp"
#include "logger.hpp"

#include <ctime>
#include <format>
#include <tuple>

namespace auth
{

namespace {

constexpr int busy_timeout_ms = 5000;

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view text)
{
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return txt ? std::string(txt, static_cast<size_t>(sqlite3_column_bytes(stmt, col))) : std::string{};
}

std::optional<Account> read_account(sqlite3_stmt* stmt)
{
    auto role = role_from_int(sqlite3_column_int64(stmt, 2));
    if (!role)
    {
        LOG_ERROR("Account '{}' carries unknown role {}", column_text(stmt, 0), sqlite3_column_int64(stmt, 2));
        return std::nullopt;
    }

    Account acc;
    acc.username = column_text(stmt, 0);
    acc.password_hash = column_text(stmt, 1);
    acc.role = *role;
    acc.created_at = sqlite3_column_int64(stmt, 3);
    acc.last_login = sqlite3_column_int64(stmt, 4);
    return acc;
}

}

std::string_view to_string(StoreError e)
{
    switch (e)
    {
        case StoreError::Conflict:           return "conflict";
        case StoreError::NotFound:           return "not found";
        case StoreError::InvalidArgument:    return "invalid argument";
        case StoreError::StorageUnavailable: return "storage unavailable";
    }
    return "unknown";
}

std::expected<std::shared_ptr<CredentialStore>, std::string> CredentialStore::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(std::string(db_path).c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return std::unexpected(std::format("Failed to open database '{}': {}", db_path, err));
    }

    auto store = std::make_shared<CredentialStore>(Private{}, handle);

    sqlite3_busy_timeout(handle, busy_timeout_ms);
    if (!store->exec("PRAGMA journal_mode=WAL;")
        || !store->exec("PRAGMA synchronous=NORMAL;")
        || !store->exec("PRAGMA foreign_keys=ON;"))
    {
        return std::unexpected(std::format("Failed to configure database '{}'", db_path));
    }

    if (!store->init_schema())
    {
        return std::unexpected(std::format("Failed to initialize schema of '{}'", db_path));
    }

    LOG_INFO("Credential store opened at {}", db_path);
    return store;
}

CredentialStore::CredentialStore(Private, sqlite3* handle)
    : db(handle)
{
}

CredentialStore::~CredentialStore()
{
    std::lock_guard lock(mtx);
    if (db)
    {
        sqlite3_close_v2(db);
        db = nullptr;
    }
}

bool CredentialStore::exec(const char* sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK)
    {
        LOG_ERROR("SQLite exec failed ({}): {}", rc, err ? err : sqlite3_errmsg(db));
        sqlite3_free(err);
        return false;
    }
    return true;
}

CredentialStore::stmt_ptr CredentialStore::prepare(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        LOG_ERROR("SQLite prepare failed: {}", sqlite3_errmsg(db));
        sqlite3_finalize(stmt);
        return stmt_ptr(nullptr, &sqlite3_finalize);
    }
    return stmt_ptr(stmt, &sqlite3_finalize);
}

bool CredentialStore::init_schema()
{
    std::lock_guard lock(mtx);
    return exec(R"(
        CREATE TABLE IF NOT EXISTS accounts (
            username TEXT PRIMARY KEY NOT NULL CHECK (length(username) > 0),
            password_hash TEXT NOT NULL,
            role INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            last_login INTEGER NOT NULL DEFAULT 0
        ) WITHOUT ROWID;

        CREATE INDEX IF NOT EXISTS idx_accounts_role ON accounts(role);
    )");
}

// Caller holds mtx.
template<class Fn>
std::expected<void, StoreError> CredentialStore::in_transaction(Fn&& body)
{
    if (!exec("BEGIN IMMEDIATE;"))
    {
        return std::unexpected(StoreError::StorageUnavailable);
    }

    std::expected<void, StoreError> result = body();
    if (!result)
    {
        std::ignore = exec("ROLLBACK;");
        return result;
    }

    if (!exec("COMMIT;"))
    {
        std::ignore = exec("ROLLBACK;");
        return std::unexpected(StoreError::StorageUnavailable);
    }
    return {};
}

std::expected<void, StoreError> CredentialStore::create_account(std::string_view username,
                                                                std::string_view password_hash,
                                                                Role role)
{
    if (username.empty() || password_hash.empty())
    {
        return std::unexpected(StoreError::InvalidArgument);
    }

    std::lock_guard lock(mtx);
    return in_transaction([&]() -> std::expected<void, StoreError>
    {
        auto stmt = prepare("INSERT INTO accounts (username, password_hash, role, created_at) VALUES (?, ?, ?, ?);");
        if (!stmt)
        {
            return std::unexpected(StoreError::StorageUnavailable);
        }

        bind_text(stmt.get(), 1, username);
        bind_text(stmt.get(), 2, password_hash);
        sqlite3_bind_int64(stmt.get(), 3, static_cast<int64_t>(role));
        sqlite3_bind_int64(stmt.get(), 4, static_cast<int64_t>(std::time(nullptr)));

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
        {
            LOG_DEBUG("Account '{}' already exists", username);
            return std::unexpected(StoreError::Conflict);
        }
        if (rc != SQLITE_DONE)
        {
            LOG_ERROR("Failed to insert account '{}': {}", username, sqlite3_errmsg(db));
            return std::unexpected(StoreError::StorageUnavailable);
        }
        return {};
    });
}

std::expected<std::optional<Account>, StoreError> CredentialStore::get_account(std::string_view username)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare("SELECT username, password_hash, role, created_at, last_login FROM accounts WHERE username = ?;");
    if (!stmt)
    {
        return std::unexpected(StoreError::StorageUnavailable);
    }

    bind_text(stmt.get(), 1, username);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::optional<Account>{};
    }
    if (rc != SQLITE_ROW)
    {
        LOG_ERROR("Failed to look up account '{}': {}", username, sqlite3_errmsg(db));
        return std::unexpected(StoreError::StorageUnavailable);
    }

    auto acc = read_account(stmt.get());
    if (!acc)
    {
        return std::unexpected(StoreError::StorageUnavailable);
    }
    return acc;
}

std::expected<bool, StoreError> CredentialStore::has_role(Role role)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare("SELECT 1 FROM accounts WHERE role = ? LIMIT 1;");
    if (!stmt)
    {
        return std::unexpected(StoreError::StorageUnavailable);
    }

    sqlite3_bind_int64(stmt.get(), 1, static_cast<int64_t>(role));

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    {
        LOG_ERROR("Failed to query role {}: {}", to_string(role), sqlite3_errmsg(db));
        return std::unexpected(StoreError::StorageUnavailable);
    }
    return rc == SQLITE_ROW;
}

std::expected<std::vector<Account>, StoreError> CredentialStore::list_accounts()
{
    std::lock_guard lock(mtx);
    auto stmt = prepare("SELECT username, password_hash, role, created_at, last_login FROM accounts ORDER BY username;");
    if (!stmt)
    {
        return std::unexpected(StoreError::StorageUnavailable);
    }

    std::vector<Account> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        if (auto acc = read_account(stmt.get()))
        {
            out.push_back(std::move(*acc));
        }
    }
    if (rc != SQLITE_DONE)
    {
        LOG_ERROR("Failed to list accounts: {}", sqlite3_errmsg(db));
        return std::unexpected(StoreError::StorageUnavailable);
    }
    return out;
}

template<class Bind>
std::expected<void, StoreError> CredentialStore::modify_one(const char* sql, std::string_view username, Bind&& bind_rest)
{
    std::lock_guard lock(mtx);
    return in_transaction([&]() -> std::expected<void, StoreError>
    {
        auto stmt = prepare(sql);
        if (!stmt)
        {
            return std::unexpected(StoreError::StorageUnavailable);
        }

        bind_text(stmt.get(), 1, username);
        bind_rest(stmt.get());

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            LOG_ERROR("Failed to modify account '{}': {}", username, sqlite3_errmsg(db));
            return std::unexpected(StoreError::StorageUnavailable);
        }
        if (sqlite3_changes(db) == 0)
        {
            return std::unexpected(StoreError::NotFound);
        }
        return {};
    });
}

std::expected<void, StoreError> CredentialStore::update_last_login(std::string_view username)
{
    auto now = static_cast<int64_t>(std::time(nullptr));
    return modify_one("UPDATE accounts SET last_login = ?2 WHERE username = ?1;", username,
                      [now](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 2, now); });
}

std::expected<void, StoreError> CredentialStore::update_password(std::string_view username, std::string_view password_hash)
{
    if (password_hash.empty())
    {
        return std::unexpected(StoreError::InvalidArgument);
    }
    return modify_one("UPDATE accounts SET password_hash = ?2 WHERE username = ?1;", username,
                      [password_hash](sqlite3_stmt* stmt) { bind_text(stmt, 2, password_hash); });
}

std::expected<void, StoreError> CredentialStore::remove_account(std::string_view username)
{
    return modify_one("DELETE FROM accounts WHERE username = ?1;", username, [](sqlite3_stmt*) {});
}

}
