#include <catch2/catch_test_macros.hpp>
#include <statq/core/string_hash.hpp>
#include <string>
#include <unordered_set>

using namespace statq::core;

TEST_CASE("StringHash compile-time checks", "[core][hash]") {
    constexpr auto strength = "Strength"_sh;
    constexpr auto damage = "Damage"_sh;
    static_assert(strength != damage, "Different strings should have different hashes");
    static_assert(strength == StringHash(std::string_view("Strength")), "Same strings should hash equal");
    static_assert(StringHash().empty(), "Default hash is empty");

    SECTION("Runtime hash matches literal") {
        StringHash runtime_hash(std::string("Strength"));
        REQUIRE(runtime_hash == strength);
        REQUIRE(runtime_hash.value() == hash_string("Strength"));
    }

    SECTION("Empty string is the invalid hash") {
        StringHash empty_hash(std::string(""));
        REQUIRE(empty_hash.empty());
        REQUIRE_FALSE(static_cast<bool>(empty_hash));
    }

    SECTION("Round trip through raw value") {
        REQUIRE(StringHash::from_hash(strength.value()) == strength);
    }
}

TEST_CASE("StringHash in unordered containers", "[core][hash]") {
    std::unordered_set<StringHash> set;
    set.insert("Fire"_sh);
    set.insert("Water"_sh);
    set.insert("Fire"_sh);

    REQUIRE(set.size() == 2);
    REQUIRE(set.count(StringHash(std::string("Water"))) == 1);
}
