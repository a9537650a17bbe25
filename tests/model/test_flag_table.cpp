// marshal_model FlagTable tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/model/flag_table.hpp>

using namespace marshal_model;

TEST_CASE("FlagTable default layers", "[model][flags]") {
    auto table = FlagTable::default_layers();

    REQUIRE(table.name() == "LayerMask");
    REQUIRE(table.named_count() == 5);
    REQUIRE(table.bit_name(0) == "Default");
    REQUIRE(table.bit_name(2) == "Ignore Raycast");
    REQUIRE(table.bit_name(3).empty());
    REQUIRE(table.bit_name(40).empty());
}

TEST_CASE("FlagTable resolve", "[model][flags]") {
    auto table = FlagTable::default_layers();

    SECTION("names are case and space insensitive") {
        REQUIRE(table.resolve("UI") == (1u << 5));
        REQUIRE(table.resolve("ui") == (1u << 5));
        REQUIRE(table.resolve("ignoreraycast") == (1u << 2));
        REQUIRE(table.resolve(" Ignore Raycast ") == (1u << 2));
    }

    SECTION("aliases") {
        REQUIRE(table.resolve("Nothing") == 0u);
        REQUIRE(table.resolve("everything") == 0xFFFFFFFFu);
    }

    SECTION("bit index tokens") {
        REQUIRE(table.resolve("3") == (1u << 3));
        REQUIRE_FALSE(table.resolve("32").has_value());
    }

    SECTION("unknown") {
        REQUIRE_FALSE(table.resolve("Enemies").has_value());
        REQUIRE_FALSE(table.resolve("").has_value());
    }
}

TEST_CASE("FlagTable decode", "[model][flags]") {
    auto table = FlagTable::default_layers();

    REQUIRE(table.decode(0).empty());
    REQUIRE(table.decode(33) == std::vector<std::string>{"Default", "UI"});
    REQUIRE(table.decode((1u << 3) | 1u) == std::vector<std::string>{"Default", "3"});
}

TEST_CASE("FlagTable custom names", "[model][flags]") {
    FlagTable table("Physics");
    REQUIRE(table.named_count() == 0);

    REQUIRE(table.set_bit_name(8, "Enemies").is_ok());
    REQUIRE(table.resolve("enemies") == (1u << 8));

    auto result = table.set_bit_name(32, "TooFar");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == marshal_core::ErrorCode::OutOfRange);

    table.add_alias("Hostile", (1u << 8) | (1u << 9));
    REQUIRE(table.resolve("HOSTILE") == ((1u << 8) | (1u << 9)));
}

TEST_CASE("FlagTable normalize", "[model][flags]") {
    REQUIRE(FlagTable::normalize("Ignore Raycast") == "ignoreraycast");
    REQUIRE(FlagTable::normalize("  UI\t") == "ui");
}
