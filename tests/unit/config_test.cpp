#include <catch2/catch.hpp>
#include <replica/config.hpp>
#include <replica/core/platform_utils.hpp>

#include <cstdlib>

using namespace replica;

static void set_env(const char* k, const char* v) {
#if defined(_WIN32)
    _putenv_s(k, v);
#else
    setenv(k, v, 1);
#endif
}

static void unset_env(const char* k) {
#if defined(_WIN32)
    _putenv_s(k, "");
#else
    unsetenv(k);
#endif
}

TEST_CASE("store config defaults", "[config]") {
    StoreConfig c;
    REQUIRE(c.name == "store");
    REQUIRE_FALSE(c.verbose);
    REQUIRE(c.verify_order);
    REQUIRE(c.paging_limit == 25);
    REQUIRE(validate(c).has_value());
}

TEST_CASE("validate rejects unusable configs", "[config]") {
    StoreConfig c;
    c.paging_limit = 0;
    auto r = validate(c);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::config_invalid);
    REQUIRE(r.error().component == "config.validate");

    StoreConfig unnamed;
    unnamed.name.clear();
    REQUIRE_FALSE(validate(unnamed).has_value());
}

TEST_CASE("environment overrides", "[config]") {
    set_env("REPLICA_STORE_VERBOSE", "TRUE");
    set_env("REPLICA_VERIFY_ORDER", "0");
    set_env("REPLICA_PAGING_LIMIT", "50");
    auto c = config_from_env("orders");
    REQUIRE(c.name == "orders");
    REQUIRE(c.verbose);
    REQUIRE_FALSE(c.verify_order);
    REQUIRE(c.paging_limit == 50);

    SECTION("unparsable values are ignored") {
        set_env("REPLICA_STORE_VERBOSE", "maybe");
        set_env("REPLICA_PAGING_LIMIT", "-3");
        auto d = config_from_env();
        REQUIRE_FALSE(d.verbose);
        REQUIRE(d.paging_limit == 25);
        REQUIRE_FALSE(d.verify_order);
    }

    SECTION("empty values count as unset") {
        set_env("REPLICA_PAGING_LIMIT", "");
        REQUIRE(config_from_env().paging_limit == 25);
    }

    unset_env("REPLICA_STORE_VERBOSE");
    unset_env("REPLICA_VERIFY_ORDER");
    unset_env("REPLICA_PAGING_LIMIT");
}

TEST_CASE("boolean parsing", "[config]") {
    using core::parse_bool_ci;
    REQUIRE(parse_bool_ci("1") == true);
    REQUIRE(parse_bool_ci("False") == false);
    REQUIRE_FALSE(parse_bool_ci("yes").has_value());
    REQUIRE_FALSE(parse_bool_ci("").has_value());
}

TEST_CASE("environment lookup", "[config]") {
    unset_env("REPLICA_TEST_UNSET");
    REQUIRE_FALSE(core::safe_getenv("REPLICA_TEST_UNSET").has_value());
    REQUIRE_FALSE(core::safe_getenv("").has_value());

    set_env("REPLICA_TEST_VALUE", "abc");
    REQUIRE(core::safe_getenv("REPLICA_TEST_VALUE") == std::optional<std::string>{"abc"});
    REQUIRE(core::getenv_nonempty("REPLICA_TEST_VALUE") == std::optional<std::string>{"abc"});
    unset_env("REPLICA_TEST_VALUE");
    REQUIRE_FALSE(core::getenv_nonempty("REPLICA_TEST_VALUE").has_value());
}
