// Unit tests for string parsing utilities
#include <catch2/catch.hpp>
#include "util/string_parsing.hpp"

using namespace walletsync::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("1", 1, 100000) == 1);
        REQUIRE(SafeParseInt("100000", 1, 100000) == 100000);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4 2", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("0", 1, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 1, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseHash", "[util][string_parsing]") {
    const std::string hex = "000000000000000000000000000000000000000000000000000000000000002a";

    SECTION("Valid hash") {
        auto hash = SafeParseHash(hex);
        REQUIRE(hash.has_value());
        REQUIRE(hash->GetHex() == hex);
    }

    SECTION("Invalid hashes") {
        REQUIRE_FALSE(SafeParseHash("").has_value());
        REQUIRE_FALSE(SafeParseHash("2a").has_value());
        REQUIRE_FALSE(SafeParseHash(hex + "00").has_value());
        REQUIRE_FALSE(SafeParseHash("not_synced").has_value());
    }
}

TEST_CASE("SplitCommaList", "[util][string_parsing]") {
    REQUIRE(SplitCommaList("wallet,chain") == std::vector<std::string>{"wallet", "chain"});
    REQUIRE(SplitCommaList("wallet") == std::vector<std::string>{"wallet"});
    REQUIRE(SplitCommaList("a,,b,") == std::vector<std::string>{"a", "b"});
    REQUIRE(SplitCommaList("").empty());
}
