#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <statq/data/json_loader.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace statq::data;
using Catch::Matchers::WithinAbs;

namespace {

struct TestEntry {
    std::string name;
    int bit = 0;
};

std::optional<TestEntry> deserialize_entry(const nlohmann::json& j, std::string& out_error) {
    if (!json_helpers::require_string(j, "name", out_error)) return std::nullopt;
    if (!json_helpers::require_int(j, "bit", out_error)) return std::nullopt;
    return TestEntry{json_helpers::get_string(j, "name"), json_helpers::get_int(j, "bit")};
}

} // anonymous namespace

TEST_CASE("parse_json_text", "[data][json]") {
    SECTION("Valid document") {
        auto j = parse_json_text(R"({"a": 1})");
        REQUIRE(j.has_value());
        REQUIRE((*j)["a"] == 1);
    }

    SECTION("Malformed document") {
        REQUIRE_FALSE(parse_json_text("{ not json").has_value());
    }
}

TEST_CASE("load_json_array from object key", "[data][json]") {
    auto root = nlohmann::json::parse(R"({
        "qualifiers": [
            {"name": "Fire", "bit": 0},
            {"name": "Ice"},
            42,
            {"name": "Magic", "bit": 2}
        ]
    })");

    auto result = load_json_array<TestEntry>(root, deserialize_entry, "qualifiers");

    REQUIRE(result.total_processed == 4);
    REQUIRE(result.loaded_count() == 2);
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.warnings.size() == 1);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.items[0].name == "Fire");
    REQUIRE(result.items[1].bit == 2);
    REQUIRE(result.errors[0] == "Item 1: Missing required field 'bit'");
}

TEST_CASE("load_json_array missing sections", "[data][json]") {
    auto root = nlohmann::json::parse(R"({"other": []})");

    SECTION("Required key reports an error") {
        auto result = load_json_array<TestEntry>(root, deserialize_entry, "qualifiers");
        REQUIRE_FALSE(result.success());
    }

    SECTION("Optional key is an empty success") {
        auto result = load_json_array<TestEntry>(root, deserialize_entry, "qualifiers", false);
        REQUIRE(result.success());
        REQUIRE(result.items.empty());
    }

    SECTION("Root that is not an array") {
        auto result = load_json_array<TestEntry>(root, deserialize_entry);
        REQUIRE(result.errors.size() == 1);
    }
}

TEST_CASE("load_json_array_file", "[data][json]") {
    SECTION("Missing file") {
        auto result = load_json_array_file<TestEntry>("does_not_exist_statq.json", deserialize_entry);
        REQUIRE_FALSE(result.success());
    }

    SECTION("Root array file") {
        const std::string path = "statq_test_entries.json";
        {
            std::ofstream out(path);
            out << R"([{"name": "Fire", "bit": 0}, {"name": "Ice", "bit": 1}])";
        }
        auto result = load_json_array_file<TestEntry>(path, deserialize_entry);
        std::remove(path.c_str());

        REQUIRE(result.success());
        REQUIRE(result.loaded_count() == 2);
    }
}

TEST_CASE("json_helpers defaults", "[data][json]") {
    auto j = nlohmann::json::parse(R"({"s": "text", "i": 3, "f": 1.5, "b": true, "arr": ["x", 1, "y"]})");

    REQUIRE(json_helpers::get_string(j, "s") == "text");
    REQUIRE(json_helpers::get_string(j, "i", "fallback") == "fallback");
    REQUIRE(json_helpers::get_int(j, "i") == 3);
    REQUIRE_THAT(json_helpers::get_double(j, "f"), WithinAbs(1.5, 1e-9));
    REQUIRE(json_helpers::get_bool(j, "b"));
    REQUIRE(json_helpers::get_string_array(j, "arr").size() == 2);

    REQUIRE(json_helpers::get_optional_number(j, "i").value() == 3.0);
    REQUIRE(json_helpers::get_optional_number(j, "b").value() == 1.0);
    REQUIRE_FALSE(json_helpers::get_optional_number(j, "s").has_value());
    REQUIRE_FALSE(json_helpers::get_optional_number(j, "missing").has_value());
}
