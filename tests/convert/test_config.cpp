// marshal_convert configuration tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/convert/config.hpp>
#include <marshal/model/flag_table.hpp>
#include <filesystem>
#include <fstream>

using namespace marshal_convert;

TEST_CASE("ConverterConfig defaults", "[convert][config]") {
    ConverterConfig config;

    REQUIRE(config.asset_roots == std::vector<std::string>{"Assets/", "Packages/"});
    REQUIRE(config.log_unconverted);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.is_asset_path("Assets/Materials/Red.mat"));
    REQUIRE(config.is_asset_path("Packages/com.example/icon.png"));
    REQUIRE_FALSE(config.is_asset_path("Parent/Child"));
    REQUIRE_FALSE(config.is_asset_path("assets/lower.mat"));

    auto table = config.layer_table();
    REQUIRE(table->bit_name(0) == "Default");
    REQUIRE(table->bit_name(5) == "UI");
}

TEST_CASE("ConfigLoader::parse_string", "[convert][config]") {
    SECTION("full document") {
        auto result = ConfigLoader::parse_string(R"(
[convert]
asset_roots = ["Content/"]
log_unconverted = false
log_level = "debug"

[layers]
0 = "Default"
8 = "Enemies"
)");
        REQUIRE(result.is_ok());
        const auto& config = *result;
        REQUIRE(config.asset_roots == std::vector<std::string>{"Content/"});
        REQUIRE_FALSE(config.log_unconverted);
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.layers.size() == 2);
        REQUIRE(config.layers.at(8) == "Enemies");

        auto table = config.layer_table();
        REQUIRE(table->resolve("enemies") == (1u << 8));
        REQUIRE(table->bit_name(5).empty());
    }

    SECTION("empty document keeps defaults") {
        auto result = ConfigLoader::parse_string("");
        REQUIRE(result.is_ok());
        REQUIRE(result->asset_roots.size() == 2);
        REQUIRE(result->layers.empty());
    }

    SECTION("syntax error") {
        auto result = ConfigLoader::parse_string("[convert\nlog_level = ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == marshal_core::ErrorCode::ParseError);
    }

    SECTION("invalid entries") {
        REQUIRE(ConfigLoader::parse_string("[convert]\nlog_level = \"loud\"").is_err());
        REQUIRE(ConfigLoader::parse_string("[convert]\nasset_roots = [1, 2]").is_err());
        REQUIRE(ConfigLoader::parse_string("[layers]\n40 = \"Far\"").is_err());
        REQUIRE(ConfigLoader::parse_string("[layers]\nname = \"Bad\"").is_err());
        REQUIRE(ConfigLoader::parse_string("[layers]\n3 = 7").is_err());
    }
}

TEST_CASE("ConfigLoader::load", "[convert][config]") {
    auto dir = std::filesystem::temp_directory_path() / "marshal_config_test";
    std::filesystem::create_directories(dir);
    auto file = dir / "marshal.toml";
    {
        std::ofstream out(file);
        out << "[convert]\nlog_level = \"warn\"\n";
    }

    auto loaded = ConfigLoader::load(file);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded->log_level == "warn");

    auto missing = ConfigLoader::load(dir / "missing.toml");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == marshal_core::ErrorCode::IOError);

    std::filesystem::remove_all(dir);
}
