// marshal_convert CollectionConverter tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/convert/conversion_manager.hpp>
#include <marshal/convert/collection_converter.hpp>

using namespace marshal_convert;
using namespace marshal_model;
using marshal_value::Value;

namespace {

TypeDescriptorPtr vec3_array() {
    return TypeDescriptor::collection(TypeDescriptor::structure(StructKind::Vec3), CollectionArity::Fixed);
}

TypeDescriptorPtr int_list() {
    return TypeDescriptor::collection(TypeDescriptor::primitive(PrimitiveType::I32), CollectionArity::Growable);
}

} // anonymous namespace

TEST_CASE("CollectionConverter arrays", "[convert][collection]") {
    ConversionManager manager;

    SECTION("vector elements") {
        auto v = manager.convert(Value::array({
            Value::object({{"x", 1}, {"y", 2}, {"z", 3}}),
            Value::object({{"x", 4}, {"y", 5}, {"z", 6}}),
        }), vec3_array());

        const auto& c = v.get<CollectionValue>();
        REQUIRE(c.arity == CollectionArity::Fixed);
        REQUIRE(c.items.size() == 2);
        REQUIRE(c.items[0].get<Vec3>() == Vec3(1, 2, 3));
        REQUIRE(c.items[1].get<Vec3>() == Vec3(4, 5, 6));
    }

    SECTION("null and empty") {
        REQUIRE(manager.convert(Value(), int_list()).get<CollectionValue>().items.empty());
        REQUIRE(manager.convert(Value::empty_array(), int_list()).get<CollectionValue>().items.empty());
    }

    SECTION("non-list input") {
        auto r = manager.try_convert(Value(5), int_list());
        REQUIRE_FALSE(r.success);
        REQUIRE(r.failures[0].path.empty());
    }
}

TEST_CASE("CollectionConverter element failures", "[convert][collection]") {
    ConversionManager manager;

    SECTION("length is preserved and failed slots hold defaults") {
        auto r = manager.try_convert(Value::array({1, "two", 3}), int_list());
        REQUIRE_FALSE(r.success);
        REQUIRE(r.failures.size() == 1);
        REQUIRE(r.failures[0].path == "[1]");

        const auto& items = r.value.get<CollectionValue>().items;
        REQUIRE(items.size() == 3);
        REQUIRE(items[0].get<std::int32_t>() == 1);
        REQUIRE(items[1].get<std::int32_t>() == 0);
        REQUIRE(items[2].get<std::int32_t>() == 3);
    }

    SECTION("convert keeps going past non-caller failures") {
        auto v = manager.convert(Value::array({1, "two"}), int_list());
        REQUIRE(v.get<CollectionValue>().items.size() == 2);
    }

    SECTION("caller errors in elements throw with their path") {
        auto colors = TypeDescriptor::collection(TypeDescriptor::structure(StructKind::Color),
                                                 CollectionArity::Growable);
        try {
            (void)manager.convert(Value::array({"red", "teal"}), colors);
            FAIL("expected ConversionException");
        } catch (const marshal_core::ConversionException& e) {
            REQUIRE(e.error().get_context("path") != nullptr);
            REQUIRE(*e.error().get_context("path") == "[1]");
        }
    }

    SECTION("nested collections") {
        auto grid = TypeDescriptor::collection(int_list(), CollectionArity::Growable);
        auto r = manager.try_convert(Value::array({Value::array({1}), Value::array({2, "x"})}), grid);
        REQUIRE(r.failures.size() == 1);
        REQUIRE(r.failures[0].path == "[1][1]");
    }
}

TEST_CASE("CollectionConverter serialize", "[convert][collection]") {
    ConversionManager manager;
    auto v = manager.convert(Value::array({3, 4}), int_list());
    REQUIRE(manager.serialize(v) == Value::array({3, 4}));
}
