// marshal_model TypedValue tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/model/typed_value.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <marshal/model/object.hpp>

using namespace marshal_model;

TEST_CASE("TypedValue alternatives", "[model][typed_value]") {
    SECTION("absent") {
        TypedValue v;
        REQUIRE(v.is_absent());
        REQUIRE(TypedValue::absent() == v);
    }

    SECTION("exact widths are kept") {
        TypedValue f(1.5f);
        TypedValue d(1.5);
        REQUIRE(f.is<float>());
        REQUIRE(d.is<double>());
        REQUIRE(f != d);
        REQUIRE(TypedValue(std::int32_t{3}).is<std::int32_t>());
        REQUIRE(TypedValue(std::uint8_t{3}).is<std::uint8_t>());
    }

    SECTION("string from literal") {
        TypedValue s("hello");
        REQUIRE(s.is<std::string>());
        REQUIRE(s.get<std::string>() == "hello");
    }

    SECTION("try_get") {
        TypedValue v(Vec3{1, 2, 3});
        REQUIRE(v.try_get<Vec3>() != nullptr);
        REQUIRE(v.try_get<Vec2>() == nullptr);
        REQUIRE(v.try_get<Vec3>()->y == 2.0f);
    }
}

TEST_CASE("TypedValue type names", "[model][typed_value]") {
    REQUIRE(TypedValue(1.0f).type_name() == "float");
    REQUIRE(TypedValue(std::int32_t{1}).type_name() == "int");
    REQUIRE(TypedValue(Vec3{}).type_name() == "Vector3");
    REQUIRE(TypedValue(Color::red()).type_name() == "Color");

    auto mode = TypeDescriptor::enumeration("Mode", {{"None", 0}, {"First", 1}});
    REQUIRE(TypedValue(EnumValue{mode, 1}).type_name() == "Mode");
}

TEST_CASE("EnumValue", "[model][typed_value]") {
    auto mode = TypeDescriptor::enumeration("Mode", {{"None", 0}, {"First", 1}, {"Second", 2}});

    REQUIRE(EnumValue{mode, 2}.name() == "Second");
    REQUIRE(EnumValue{mode, 7}.name().empty());

    auto same_name = TypeDescriptor::enumeration("Mode", {{"None", 0}});
    REQUIRE(EnumValue{mode, 1} == EnumValue{same_name, 1});
    REQUIRE_FALSE(EnumValue{mode, 1} == EnumValue{mode, 2});
}

TEST_CASE("MaskValue names", "[model][typed_value]") {
    auto table = std::make_shared<const FlagTable>(FlagTable::default_layers());
    MaskValue mask{table, 33};
    REQUIRE(mask.names() == std::vector<std::string>{"Default", "UI"});
    REQUIRE(mask == MaskValue{nullptr, 33});
}

TEST_CASE("ObjectRef ownership", "[model][typed_value]") {
    SECTION("hierarchy references do not keep nodes alive") {
        auto node = Node::create("Temp");
        auto ref = ObjectRef::from_hierarchy(node);
        REQUIRE(ref.origin() == RefOrigin::Hierarchy);
        REQUIRE(ref.get() == node);
        REQUIRE(ref.get_as<Node>() == node);

        node.reset();
        REQUIRE(ref.is_absent());
    }

    SECTION("asset references keep the asset") {
        auto ref = ObjectRef::from_asset(Asset::create("Material", "Assets/Red.mat"));
        REQUIRE(ref.origin() == RefOrigin::Asset);
        REQUIRE_FALSE(ref.is_absent());
        REQUIRE(ref.get_as<Asset>()->asset_path() == "Assets/Red.mat");
    }

    SECTION("identity comparison") {
        auto a = Node::create("A");
        auto b = Node::create("A");
        REQUIRE(ObjectRef::from_hierarchy(a) == ObjectRef::from_hierarchy(a));
        REQUIRE_FALSE(ObjectRef::from_hierarchy(a) == ObjectRef::from_hierarchy(b));
        REQUIRE(ObjectRef{} == ObjectRef::from_hierarchy(nullptr));
    }
}

TEST_CASE("CompositeValue fields", "[model][typed_value]") {
    CompositeValue value;
    value.set("speed", TypedValue(2.0f));
    value.set("name", TypedValue("runner"));
    value.set("speed", TypedValue(3.0f));

    REQUIRE(value.fields.size() == 2);
    REQUIRE(value.fields[0].first == "speed");
    REQUIRE(value.get("speed")->get<float>() == 3.0f);
    REQUIRE(value.get("missing") == nullptr);
}
