// marshal_convert StructConverter tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <marshal/convert/conversion_manager.hpp>
#include <marshal/convert/constants.hpp>
#include <marshal/convert/struct_converter.hpp>

#include <algorithm>
#include <limits>

using namespace marshal_convert;
using namespace marshal_model;
using marshal_value::Value;

namespace {

TypeDescriptorPtr st(StructKind kind) {
    return TypeDescriptor::structure(kind);
}

} // anonymous namespace

TEST_CASE("StructConverter vectors", "[convert][struct]") {
    ConversionManager manager;

    SECTION("map input") {
        auto v = manager.convert(Value::object({{"x", 1.0}, {"y", 2.0}, {"z", 3.0}}), st(StructKind::Vec3));
        REQUIRE(v.get<Vec3>() == Vec3(1, 2, 3));
    }

    SECTION("serialized as a map of floats") {
        auto out = manager.serialize(TypedValue(Vec3(1, 2, 3)));
        REQUIRE(out == Value::object({{"x", 1.0}, {"y", 2.0}, {"z", 3.0}}));
        REQUIRE(out["x"].is_float());
    }

    SECTION("missing fields use zero") {
        auto v = manager.convert(Value::object({{"y", 5}}), st(StructKind::Vec3));
        REQUIRE(v.get<Vec3>() == Vec3(0, 5, 0));
    }

    SECTION("positional list") {
        auto v = manager.convert(Value::array({1, 2}), st(StructKind::Vec3));
        REQUIRE(v.get<Vec3>() == Vec3(1, 2, 0));

        auto too_long = manager.try_convert(Value::array({1, 2, 3, 4}), st(StructKind::Vec3));
        REQUIRE_FALSE(too_long.success);
        REQUIRE(too_long.failures[0].error.code() == marshal_core::ErrorCode::InvalidArgument);
    }

    SECTION("non-numeric field") {
        REQUIRE_FALSE(manager.try_convert(Value::object({{"x", "one"}}), st(StructKind::Vec2)).success);
    }

    SECTION("integer vectors truncate and range-check") {
        auto v = manager.convert(Value::array({1.7, -2.2, 3}), st(StructKind::Vec3Int));
        REQUIRE(v.get<Vec3Int>() == Vec3Int(1, -2, 3));
        REQUIRE_FALSE(manager.try_convert(Value::array({1e12, 0}), st(StructKind::Vec2Int)).success);
    }

    SECTION("quaternion defaults to identity") {
        auto v = manager.convert(Value::empty_object(), st(StructKind::Quat));
        REQUIRE(v.get<Quat>() == Quat::identity());
    }
}

TEST_CASE("StructConverter colors", "[convert][struct]") {
    ConversionManager manager;

    SECTION("missing channels default to one") {
        auto v = manager.convert(Value::object({{"r", 0.5}}), st(StructKind::Color));
        REQUIRE(v.get<Color>() == Color(0.5f, 1, 1, 1));
    }

    SECTION("named constants, case-insensitive") {
        REQUIRE(manager.convert(Value("red"), st(StructKind::Color)).get<Color>() == Color::red());
        REQUIRE(manager.convert(Value("Blue"), st(StructKind::Color)).get<Color>() == Color::blue());
        REQUIRE(manager.convert(Value("clear"), st(StructKind::Color)).get<Color>() == Color::clear());
    }

    SECTION("unknown constant throws") {
        REQUIRE_THROWS_AS(manager.convert(Value("teal"), st(StructKind::Color)), marshal_core::ConversionException);
    }

    SECTION("Color32 channels are bytes") {
        auto v = manager.convert(Value::array({255, 128, 0}), st(StructKind::Color32));
        REQUIRE(v.get<Color32>() == Color32(255, 128, 0, 255));
        REQUIRE(manager.convert(Value("white"), st(StructKind::Color32)).get<Color32>() == Color32(255, 255, 255, 255));

        auto r = manager.try_convert(Value::array({256, 0, 0}), st(StructKind::Color32));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.failures[0].error.code() == marshal_core::ErrorCode::OutOfRange);
    }

    SECTION("Color32 serializes integers") {
        auto out = manager.serialize(TypedValue(Color32(1, 2, 3, 4)));
        REQUIRE(out == Value::object({{"r", 1}, {"g", 2}, {"b", 3}, {"a", 4}}));
    }
}

TEST_CASE("StructConverter rectangles and bounds", "[convert][struct]") {
    ConversionManager manager;

    auto rect = manager.convert(Value::object({{"x", 1}, {"y", 2}, {"width", 10}, {"height", 20}}),
                                st(StructKind::Rect));
    REQUIRE(rect.get<Rect>() == Rect(1, 2, 10, 20));

    SECTION("bounds from a map") {
        auto v = manager.convert(Value::object({
            {"center", Value::object({{"x", 1}, {"y", 2}, {"z", 3}})},
            {"size", Value::array({2, 2, 2})},
        }), st(StructKind::Bounds));
        const auto& b = v.get<Bounds>();
        REQUIRE(b.center == Vec3(1, 2, 3));
        REQUIRE(b.extents() == Vec3(1, 1, 1));
    }

    SECTION("bounds from a pair") {
        auto v = manager.convert(Value::array({Value::array({0, 0, 0}), Value::array({4, 4, 4})}),
                                 st(StructKind::Bounds));
        REQUIRE(v.get<Bounds>().size == Vec3(4, 4, 4));
    }

    SECTION("bounds serialize to center and size") {
        auto out = manager.serialize(TypedValue(Bounds(Vec3(1, 2, 3), Vec3(4, 5, 6))));
        REQUIRE(out["center"]["z"].as_float() == Catch::Approx(3.0));
        REQUIRE(out["size"]["x"].as_float() == Catch::Approx(4.0));
    }
}

TEST_CASE("Struct constants", "[convert][struct]") {
    SECTION("supported names") {
        auto names = constants::supported(StructKind::Vec3);
        REQUIRE(std::find(names.begin(), names.end(), "forward") != names.end());
        REQUIRE(constants::supported(StructKind::Rect).empty());
        REQUIRE(StructConverter::supported_constants(StructKind::Quat) == std::vector<std::string>{"identity"});
    }

    SECTION("infinity constants") {
        auto v = constants::lookup(StructKind::Vec2, "positiveInfinity");
        REQUIRE(v.has_value());
        REQUIRE(v->get<Vec2>().x == std::numeric_limits<float>::infinity());
    }

    SECTION("nearest color name") {
        REQUIRE(constants::nearest_color_name(Color::red()) == "red");
        REQUIRE(constants::nearest_color_name(Color(0.5f, 0.5f, 0.5f, 1)) == "gray");
        REQUIRE_FALSE(constants::nearest_color_name(Color(0.3f, 0.6f, 0.1f, 1)).has_value());
    }
}

TEST_CASE("StructConverter serialize ignores other values", "[convert][struct]") {
    REQUIRE_FALSE(StructConverter::serialize(TypedValue(1.0f)).has_value());
    REQUIRE(StructConverter::serialize(TypedValue(Vec2(1, 2))).has_value());
}

TEST_CASE("StructConverter serialized values convert back", "[convert][struct]") {
    ConversionManager manager;

    const std::vector<std::pair<StructKind, TypedValue>> samples{
        {StructKind::Vec2, TypedValue(Vec2(0.25f, -8))},
        {StructKind::Vec3, TypedValue(Vec3(1.5f, 2, -3))},
        {StructKind::Vec4, TypedValue(Vec4(1, 2, 3, 4))},
        {StructKind::Vec2Int, TypedValue(Vec2Int(-4, 9))},
        {StructKind::Vec3Int, TypedValue(Vec3Int(1, 2, 3))},
        {StructKind::Quat, TypedValue(Quat(0, 0.7071f, 0, 0.7071f))},
        {StructKind::Color, TypedValue(Color(0.1f, 0.2f, 0.3f, 0.4f))},
        {StructKind::Color32, TypedValue(Color32(10, 20, 30, 40))},
        {StructKind::Rect, TypedValue(Rect(0, 0, 1920, 1080))},
        {StructKind::RectInt, TypedValue(RectInt(-1, -1, 2, 2))},
        {StructKind::Bounds, TypedValue(Bounds(Vec3(0, 1, 0), Vec3(2, 2, 2)))},
    };

    for (const auto& [kind, value] : samples) {
        auto back = manager.convert(manager.serialize(value), st(kind));
        REQUIRE(back == value);
    }
}
