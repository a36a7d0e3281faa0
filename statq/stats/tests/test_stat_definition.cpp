#include <catch2/catch_test_macros.hpp>
#include <statq/stats/stat_definition.hpp>
#include <unordered_map>
#include <vector>

using namespace statq::stats;

TEST_CASE("StatId identity", "[stats][definition]") {
    constexpr StatId strength = "Strength"_stat;
    static_assert(strength.valid(), "Named stat id is valid");
    static_assert(!StatId().valid(), "Default stat id is invalid");

    REQUIRE(strength == StatId::from_name("Strength"));
    REQUIRE(strength != "Damage"_stat);

    std::unordered_map<StatId, int> map;
    map["Strength"_stat] = 1;
    map["Damage"_stat] = 2;
    REQUIRE(map.at(StatId::from_name("Strength")) == 1);
}

TEST_CASE("ValueKind names", "[stats][definition]") {
    REQUIRE(parse_value_kind("int") == ValueKind::Int);
    REQUIRE(parse_value_kind("Float") == ValueKind::Float);
    REQUIRE(parse_value_kind("float_additive") == ValueKind::FloatAdditive);
    REQUIRE(parse_value_kind("int_percent") == ValueKind::IntPercent);
    REQUIRE(parse_value_kind("BOOL") == ValueKind::Bool);
    REQUIRE_FALSE(parse_value_kind("string").has_value());

    REQUIRE(std::string(value_kind_name(ValueKind::IntPercent)) == "int_percent");
    REQUIRE(is_integer_kind(ValueKind::Int));
    REQUIRE(is_integer_kind(ValueKind::IntPercent));
    REQUIRE_FALSE(is_integer_kind(ValueKind::Float));
}

TEST_CASE("StatRegistry stat registration", "[stats][definition]") {
    StatRegistry registry;
    auto strength = StatDefinition::make("Strength", ValueKind::Int);

    SECTION("Register and look up") {
        REQUIRE(registry.register_stat(strength));
        REQUIRE(registry.is_registered("Strength"_stat));

        const auto* by_id = registry.find("Strength"_stat);
        const auto* by_name = registry.find(std::string("Strength"));
        REQUIRE(by_id != nullptr);
        REQUIRE(by_id == by_name);
        REQUIRE(by_id->kind == ValueKind::Int);
        REQUIRE(registry.stat_name("Strength"_stat) == "Strength");
    }

    SECTION("Identical re-registration is a no-op") {
        REQUIRE(registry.register_stat(strength));
        REQUIRE(registry.register_stat(strength));
        REQUIRE(registry.stat_count() == 1);
    }

    SECTION("Same name with another kind is rejected") {
        REQUIRE(registry.register_stat(strength));
        REQUIRE_FALSE(registry.register_stat(StatDefinition::make("Strength", ValueKind::Float)));
        REQUIRE(registry.find("Strength"_stat)->kind == ValueKind::Int);
    }

    SECTION("Id that does not match the name is rejected") {
        StatDefinition forged = strength;
        forged.id = "Damage"_stat;
        REQUIRE_FALSE(registry.register_stat(forged));
        REQUIRE_FALSE(registry.register_stat(StatDefinition::make("", ValueKind::Int)));
    }

    SECTION("Unknown stats") {
        REQUIRE(registry.find("Luck"_stat) == nullptr);
        REQUIRE(registry.find(std::string("Luck")) == nullptr);
        REQUIRE(registry.stat_name("Luck"_stat).rfind("stat#", 0) == 0);
    }

    SECTION("All stats sorted by name") {
        registry.register_stat(StatDefinition::make("Strength", ValueKind::Int));
        registry.register_stat(StatDefinition::make("Damage", ValueKind::Float));
        registry.register_stat(StatDefinition::make("Armor", ValueKind::Int));

        auto all = registry.all_stats();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].name == "Armor");
        REQUIRE(all[1].name == "Damage");
        REQUIRE(all[2].name == "Strength");
    }
}

TEST_CASE("StatRegistry qualifier names", "[stats][definition]") {
    StatRegistry registry;
    REQUIRE(registry.register_qualifier("Fire", 0));
    REQUIRE(registry.register_qualifier("Magic", 5));

    SECTION("Lookup") {
        REQUIRE(registry.qualifier_bit("Magic") == 5u);
        REQUIRE(registry.qualifier_flag("Magic") == (QualifierFlags{1} << 5));
        REQUIRE(registry.qualifier_name(0) == "Fire");
        REQUIRE(registry.qualifier_name(1).empty());
        REQUIRE(registry.qualifier_count() == 2);
    }

    SECTION("Conflicts are rejected") {
        REQUIRE(registry.register_qualifier("Fire", 0));
        REQUIRE_FALSE(registry.register_qualifier("Fire", 1));
        REQUIRE_FALSE(registry.register_qualifier("Ice", 0));
        REQUIRE_FALSE(registry.register_qualifier("Ice", 64));
        REQUIRE(registry.qualifier_count() == 2);
    }

    SECTION("Parse and describe flag sets") {
        std::vector<std::string> unknown;
        auto flags = registry.parse_qualifier_flags({"Fire", "Magic", "Ice"}, unknown);
        REQUIRE(flags == ((QualifierFlags{1} << 0) | (QualifierFlags{1} << 5)));
        REQUIRE(unknown == std::vector<std::string>{"Ice"});

        REQUIRE(registry.describe_flags(flags) == "Fire|Magic");
        REQUIRE(registry.describe_flags(QualifierFlags{1} << 7) == "bit7");
        REQUIRE(registry.describe_flags(0) == "()");
    }
}
