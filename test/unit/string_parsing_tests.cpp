// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace bacnet::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Priority range bounds") {
        CHECK(SafeParseInt("1", 1, 16) == 1);
        CHECK(SafeParseInt("16", 1, 16) == 16);
        CHECK(SafeParseInt("8", 1, 16) == 8);
    }

    SECTION("Negative values") {
        CHECK(SafeParseInt("-50", -100, 100) == -50);
    }

    SECTION("Leading plus sign") {
        CHECK(SafeParseInt("+7", 0, 10) == 7);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    CHECK_FALSE(SafeParseInt("", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt(" 5", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("5 ", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("42x", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("0x10", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("1.5", 0, 100).has_value());
    CHECK_FALSE(SafeParseInt("0", 1, 16).has_value());
    CHECK_FALSE(SafeParseInt("17", 1, 16).has_value());
    CHECK_FALSE(SafeParseInt("abc", 0, 100).has_value());
}

TEST_CASE("SafeParseInt64 - wide values", "[util][string_parsing]") {
    SECTION("Object instance range") {
        CHECK(SafeParseInt64("4194303", 0, 0x3FFFFF) == 4194303);
        CHECK_FALSE(SafeParseInt64("4194304", 0, 0x3FFFFF).has_value());
    }

    SECTION("Millisecond timeouts") {
        CHECK(SafeParseInt64("3600000", 1, 3600000) == 3600000);
        CHECK_FALSE(SafeParseInt64("0", 1, 3600000).has_value());
    }

    SECTION("Overflow is rejected, not wrapped") {
        CHECK_FALSE(SafeParseInt64("99999999999999999999", 0,
                                   std::numeric_limits<int64_t>::max())
                        .has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    CHECK(SafeParsePort("47808") == uint16_t{47808});
    CHECK(SafeParsePort("1") == uint16_t{1});
    CHECK(SafeParsePort("65535") == uint16_t{65535});

    CHECK_FALSE(SafeParsePort("0").has_value());
    CHECK_FALSE(SafeParsePort("65536").has_value());
    CHECK_FALSE(SafeParsePort("-1").has_value());
    CHECK_FALSE(SafeParsePort("").has_value());
    CHECK_FALSE(SafeParsePort("bac0").has_value());
}

TEST_CASE("SplitCommaList", "[util][string_parsing]") {
    CHECK(SplitCommaList("net") == std::vector<std::string>{"net"});
    CHECK(SplitCommaList("net,codec,disc") ==
          std::vector<std::string>{"net", "codec", "disc"});
    CHECK(SplitCommaList("net,,codec,") == std::vector<std::string>{"net", "codec"});
    CHECK(SplitCommaList("").empty());
    CHECK(SplitCommaList(",,").empty());
}
