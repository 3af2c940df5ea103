#include <catch2/catch_test_macros.hpp>

#include "core/types/Host.hpp"

using namespace mping::core;

TEST_CASE("Host validation", "[Host]") {
    SECTION("Valid host") {
        Host host{"192.168.1.1", "router"};
        REQUIRE(host.isValid());
    }

    SECTION("Valid host without description") {
        Host host{"example.com", ""};
        REQUIRE(host.isValid());
    }

    SECTION("Invalid host - empty address") {
        Host host{"", "router"};
        REQUIRE_FALSE(host.isValid());
    }

    SECTION("Invalid host - whitespace address") {
        Host host{" \t  ", "router"};
        REQUIRE_FALSE(host.isValid());
    }
}

TEST_CASE("Host trimming", "[Host]") {
    Host host{"  10.0.0.1\t", "  core switch  "};
    auto trimmed = host.trimmed();

    REQUIRE(trimmed.address == "10.0.0.1");
    REQUIRE(trimmed.description == "core switch");
    REQUIRE(host.address == "  10.0.0.1\t");
}

TEST_CASE("String helpers", "[Host]") {
    SECTION("trim") {
        REQUIRE(trim("") == "");
        REQUIRE(trim("   ") == "");
        REQUIRE(trim(" a b ") == "a b");
        REQUIRE(trim("\r\nx\n") == "x");
    }

    SECTION("toLower") {
        REQUIRE(toLower("Example.COM") == "example.com");
        REQUIRE(toLower("10.0.0.1") == "10.0.0.1");
    }
}

TEST_CASE("Host equality", "[Host]") {
    Host a{"a.example", "A"};
    Host b{"a.example", "A"};
    Host c{"a.example", "other"};

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
}
