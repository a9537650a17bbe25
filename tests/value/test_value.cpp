// marshal_value Value tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <marshal/value/value.hpp>
#include <stdexcept>
#include <variant>

using namespace marshal_value;

TEST_CASE("Value type discrimination", "[value][value]") {
    SECTION("scalars") {
        REQUIRE(Value().is_null());
        REQUIRE(Value(nullptr).type() == ValueType::Null);
        REQUIRE(Value(true).is_bool());
        REQUIRE(Value(3).is_int());
        REQUIRE(Value(3.5).is_float());
        REQUIRE(Value(2.5f).is_float());
        REQUIRE(Value("text").is_string());
        REQUIRE(Value(std::string("text")).type() == ValueType::String);
    }

    SECTION("containers") {
        REQUIRE(Value::empty_array().is_array());
        REQUIRE(Value::empty_object().is_object());
        REQUIRE(Value::array({1, 2}).size() == 2);
        REQUIRE(Value::object({{"a", 1}}).size() == 1);
        REQUIRE(Value(1).size() == 0);
    }

    SECTION("type names") {
        REQUIRE(std::string(Value().type_name()) == "null");
        REQUIRE(std::string(Value(1).type_name()) == "int");
        REQUIRE(std::string(Value::empty_object().type_name()) == "object");
    }
}

TEST_CASE("Value numeric accessors", "[value][value]") {
    Value i(42);
    Value f(1.5);

    REQUIRE(i.as_int() == 42);
    REQUIRE(i.as_number() == Catch::Approx(42.0));
    REQUIRE(f.as_float() == Catch::Approx(1.5));
    REQUIRE(f.as_number() == Catch::Approx(1.5));

    REQUIRE(i.try_int() == 42);
    REQUIRE_FALSE(i.try_float().has_value());
    REQUIRE(i.try_number().has_value());
    REQUIRE_FALSE(Value("x").try_number().has_value());
    REQUIRE(Value("x").try_string() != nullptr);
    REQUIRE(i.try_string() == nullptr);

    REQUIRE_THROWS_AS(i.as_string(), std::bad_variant_access);
}

TEST_CASE("ValueObject keeps insertion order", "[value][object]") {
    ValueObject obj;
    obj.set("z", 1);
    obj.set("a", 2);
    obj.set("m", 3);

    auto keys = obj.keys();
    REQUIRE(keys == std::vector<std::string>{"z", "a", "m"});

    SECTION("re-insert replaces in place") {
        obj.set("a", 20);
        REQUIRE(obj.size() == 3);
        REQUIRE(obj.keys()[1] == "a");
        REQUIRE(obj.at("a").as_int() == 20);
    }

    SECTION("lookup and erase") {
        REQUIRE(obj.contains("m"));
        REQUIRE(obj.find("missing") == nullptr);
        REQUIRE_THROWS_AS(obj.at("missing"), std::out_of_range);
        REQUIRE(obj.erase("m"));
        REQUIRE_FALSE(obj.erase("m"));
        REQUIRE(obj.size() == 2);
    }

    SECTION("subscript inserts null") {
        obj["new"];
        REQUIRE(obj.size() == 4);
        REQUIRE(obj.at("new").is_null());
    }
}

TEST_CASE("ValueObject equality ignores order", "[value][object]") {
    ValueObject a{{"x", 1}, {"y", 2}};
    ValueObject b{{"y", 2}, {"x", 1}};
    ValueObject c{{"x", 1}, {"y", 3}};

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(Value(a) == Value(b));
}

TEST_CASE("Value container access", "[value][value]") {
    Value obj = Value::object({{"name", "Player"}, {"hp", 10}});

    REQUIRE(obj["name"].as_string() == "Player");
    REQUIRE(obj.contains("hp"));
    REQUIRE(obj.get("hp") != nullptr);
    REQUIRE(obj.get("missing") == nullptr);

    obj["speed"] = 2.5;
    REQUIRE(obj.size() == 3);

    Value arr = Value::empty_array();
    arr.push_back(1);
    arr.push_back("two");
    REQUIRE(arr.size() == 2);
    REQUIRE(arr[1].as_string() == "two");

    const Value& carr = arr;
    REQUIRE_THROWS(carr[5]);
    REQUIRE_THROWS(Value(1).push_back(2));
}
