#include <catch2/catch_test_macros.hpp>

#include "auth/argon2_hasher.hpp"
#include "auth/bootstrap.hpp"
#include "auth/credential_store.hpp"
#include "auth/root_descriptor.hpp"
#include "logger.hpp"
#include "test_support.hpp"

#include <fstream>
#include <iterator>
#include <string>

using namespace auth;
using test_support::TempDir;

namespace {

constexpr std::string_view setup_script_output =
    "[credentials]\n"
    "name=\"root\"\n"
    "pass=\"0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef\"\n";

}

TEST_CASE("parse_root_descriptor reads the setup script format")
{
    auto desc = parse_root_descriptor(setup_script_output);

    REQUIRE(desc.has_value());
    CHECK(desc->name == "root");
    CHECK(desc->pass == "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef");
}

TEST_CASE("parse_root_descriptor handles comments, spacing and literal strings")
{
    auto desc = parse_root_descriptor(
        "# generated\r\n"
        "\n"
        "[other]\n"
        "name = \"ignored\"\n"
        "\n"
        "  [ credentials ]  # the one that matters\n"
        "  name = 'admin'   # literal\n"
        "  pass = \"a\\\"b\\\\c\\td\"\n"
        "  extra = \"ok\"\n");

    REQUIRE(desc.has_value());
    CHECK(desc->name == "admin");
    CHECK(desc->pass == "a\"b\\c\td");
}

TEST_CASE("parse_root_descriptor keeps '#' inside strings")
{
    auto desc = parse_root_descriptor("[credentials]\nname=\"root\"\npass=\"ab#cd\" # trailing\n");

    REQUIRE(desc.has_value());
    CHECK(desc->pass == "ab#cd");
}

TEST_CASE("parse_root_descriptor rejects malformed input")
{
    CHECK(!parse_root_descriptor("").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=\"root\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("name=\"root\"\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials\nname=\"root\"\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=root\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=\"root\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=\"root\" junk\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=\"\"\npass=\"x\"\n").has_value());
    CHECK(!parse_root_descriptor("[credentials]\nname=\"a\\qb\"\npass=\"x\"\n").has_value());
}

TEST_CASE("parse_root_descriptor rejects duplicate keys and names the line")
{
    auto desc = parse_root_descriptor("[credentials]\nname=\"a\"\nname=\"b\"\npass=\"x\"\n");

    REQUIRE(!desc.has_value());
    CHECK(desc.error().find("line 3") != std::string::npos);
}

TEST_CASE("load_root_descriptor reports a missing file")
{
    auto desc = load_root_descriptor("/nonexistent/root.toml");

    CHECK(!desc.has_value());
}

TEST_CASE("bootstrap_root creates the root account from the descriptor")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    auto descriptor = dir.write("root.toml", setup_script_output);

    auto outcome = bootstrap_root(**store, descriptor);

    REQUIRE(outcome.has_value());
    CHECK(*outcome == BootstrapOutcome::Created);

    auto acc = (*store)->get_account("root");
    REQUIRE(acc.has_value());
    REQUIRE(acc->has_value());
    CHECK((*acc)->role == Role::Root);
    CHECK(Argon2Hasher::verify("0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef", (*acc)->password_hash));
}

TEST_CASE("bootstrap_root twice: no duplicate, no error")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    auto descriptor = dir.write("root.toml", setup_script_output);

    auto first = bootstrap_root(**store, descriptor);
    auto second = bootstrap_root(**store, descriptor);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == BootstrapOutcome::Created);
    CHECK(*second == BootstrapOutcome::AlreadyPresent);
    CHECK((*store)->list_accounts()->size() == 1);
}

TEST_CASE("bootstrap_root ignores the descriptor once the root account exists")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    REQUIRE((*store)->create_account("root", "existing-hash", Role::Root).has_value());

    auto missing = bootstrap_root(**store, dir / "absent.toml");
    REQUIRE(missing.has_value());
    CHECK(*missing == BootstrapOutcome::AlreadyPresent);

    auto garbage = dir.write("garbage.toml", "this is not toml");
    auto malformed = bootstrap_root(**store, garbage);
    REQUIRE(malformed.has_value());
    CHECK(*malformed == BootstrapOutcome::AlreadyPresent);

    auto descriptor = dir.write("root.toml", setup_script_output);
    REQUIRE(bootstrap_root(**store, descriptor).has_value());

    CHECK((*store)->list_accounts()->size() == 1);
    CHECK((*(*store)->get_account("root"))->password_hash == "existing-hash");
}

TEST_CASE("bootstrap_root fails without a root account and without a usable descriptor")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());

    CHECK(!bootstrap_root(**store, dir / "absent.toml").has_value());

    auto garbage = dir.write("garbage.toml", "[credentials]\nname=\"root\"\n");
    CHECK(!bootstrap_root(**store, garbage).has_value());

    CHECK(!(*store)->has_role(Role::Root).value());
}

TEST_CASE("bootstrap_root leaves an existing player account named root alone")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    REQUIRE((*store)->create_account("root", "player-hash", Role::Player).has_value());
    auto descriptor = dir.write("root.toml", setup_script_output);

    auto outcome = bootstrap_root(**store, descriptor);
    REQUIRE(outcome.has_value());
    CHECK(*outcome == BootstrapOutcome::AlreadyPresent);

    auto missing = bootstrap_root(**store, dir / "absent.toml");
    REQUIRE(missing.has_value());
    CHECK(*missing == BootstrapOutcome::AlreadyPresent);

    auto acc = (*store)->get_account("root");
    REQUIRE(acc.has_value());
    REQUIRE(acc->has_value());
    CHECK((*acc)->role == Role::Player);
    CHECK((*acc)->password_hash == "player-hash");
    CHECK((*store)->list_accounts()->size() == 1);
}

TEST_CASE("bootstrap_root with a descriptor naming another account")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    auto descriptor = dir.write("root.toml",
        "[credentials]\nname=\"dungeon-master\"\npass=\"0123456789abcdef0123456789abcdef\"\n");

    auto first = bootstrap_root(**store, descriptor);
    REQUIRE(first.has_value());
    CHECK(*first == BootstrapOutcome::Created);
    CHECK((*(*store)->get_account("dungeon-master"))->role == Role::Root);

    auto second = bootstrap_root(**store, descriptor);
    REQUIRE(second.has_value());
    CHECK(*second == BootstrapOutcome::AlreadyPresent);

    // Descriptor deleted after the first run.
    auto third = bootstrap_root(**store, dir / "absent.toml");
    REQUIRE(third.has_value());
    CHECK(*third == BootstrapOutcome::AlreadyPresent);

    CHECK((*store)->list_accounts()->size() == 1);
}

TEST_CASE("bootstrap_root warns when the descriptor is gone")
{
    TempDir dir;
    auto store = CredentialStore::open((dir / "data.db").string());
    REQUIRE(store.has_value());
    REQUIRE((*store)->create_account("root", "existing-hash", Role::Root).has_value());

    auto log_file = dir / "bootstrap.log";
    REQUIRE(Logger::init("warn", log_file.string(), 1, false).has_value());
    auto outcome = bootstrap_root(**store, dir / "absent.toml");
    Logger::shutdown();
    REQUIRE(Logger::init("info", "", 100, true).has_value());

    REQUIRE(outcome.has_value());
    CHECK(*outcome == BootstrapOutcome::AlreadyPresent);

    std::ifstream in(log_file);
    std::string log{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    CHECK(log.find("[WARN]") != std::string::npos);
    CHECK(log.find("absent.toml") != std::string::npos);
}
