// xref_core hashing tests

#include <catch2/catch_test_macros.hpp>
#include <xref_engine/core/hash.hpp>
#include <string>

using namespace xref_core;

TEST_CASE("FNV-1a hashing", "[core][hash]") {
    SECTION("empty string is the offset basis") {
        REQUIRE(fnv1a_hash(std::string()) == detail::FNV_OFFSET_BASIS);
    }

    SECTION("compile-time evaluation") {
        constexpr auto h = detail::fnv1a_hash("a", 1);
        STATIC_REQUIRE(h == 0xaf63dc4c8601ec8cULL);
    }

    SECTION("seed changes the result") {
        REQUIRE(detail::fnv1a_hash("tick", 4, 1) != detail::fnv1a_hash("tick", 4));
    }
}

TEST_CASE("String pair hashing", "[core][hash]") {
    SECTION("pair separator distinguishes splits") {
        REQUIRE(hash_string_pair("ab", "c") != hash_string_pair("a", "bc"));
    }

    SECTION("stable and order sensitive") {
        REQUIRE(hash_string_pair("tick", "Npc") == hash_string_pair("tick", "Npc"));
        REQUIRE(hash_string_pair("tick", "Npc") != hash_string_pair("Npc", "tick"));
    }
}
