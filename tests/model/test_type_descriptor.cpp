// marshal_model TypeDescriptor tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <marshal/model/object.hpp>

using namespace marshal_model;

TEST_CASE("TypeDescriptor factories", "[model][descriptor]") {
    SECTION("primitive and struct names") {
        REQUIRE(TypeDescriptor::primitive(PrimitiveType::F32)->name == "float");
        REQUIRE(TypeDescriptor::primitive(PrimitiveType::U8)->name == "byte");
        REQUIRE(TypeDescriptor::structure(StructKind::Vec3)->name == "Vector3");
        REQUIRE(TypeDescriptor::structure(StructKind::Quat)->is(TypeKind::Struct));
    }

    SECTION("collection names follow arity") {
        auto vec3 = TypeDescriptor::structure(StructKind::Vec3);
        REQUIRE(TypeDescriptor::collection(vec3, CollectionArity::Fixed)->name == "Vector3[]");
        REQUIRE(TypeDescriptor::collection(vec3, CollectionArity::Growable)->name == "List<Vector3>");
    }

    SECTION("mask without table gets the default layers") {
        auto mask = TypeDescriptor::mask("LayerMask", nullptr);
        REQUIRE(mask->flag_table != nullptr);
        REQUIRE(mask->flag_table->bit_name(5) == "UI");
    }

    SECTION("reference") {
        auto ref = TypeDescriptor::reference("Rigidbody", ReferenceTarget::Component);
        REQUIRE(ref->name == "Rigidbody");
        REQUIRE(ref->referenced_type == "Rigidbody");
        REQUIRE(ref->reference_target == ReferenceTarget::Component);
    }
}

TEST_CASE("TypeDescriptor member lookup", "[model][descriptor]") {
    auto mode = TypeDescriptor::enumeration("Mode", {{"None", 0}, {"First", 1}, {"Second", 2}});

    REQUIRE(mode->find_member("second")->value == 2);
    REQUIRE(mode->find_member("SECOND")->value == 2);
    REQUIRE(mode->find_member("Third") == nullptr);
    REQUIRE(mode->find_member(std::int64_t{1})->name == "First");
    REQUIRE(mode->find_member(std::int64_t{9}) == nullptr);
}

TEST_CASE("default_value per kind", "[model][descriptor]") {
    SECTION("primitives") {
        REQUIRE(default_value(TypeDescriptor::primitive(PrimitiveType::F32)) == TypedValue(0.0f));
        REQUIRE(default_value(TypeDescriptor::primitive(PrimitiveType::String)) == TypedValue(std::string{}));
        REQUIRE(default_value(TypeDescriptor::primitive(PrimitiveType::Bool)) == TypedValue(false));
    }

    SECTION("structs") {
        REQUIRE(default_value(TypeDescriptor::structure(StructKind::Vec3)) == TypedValue(Vec3::zero()));
        REQUIRE(default_value(TypeDescriptor::structure(StructKind::Quat)) == TypedValue(Quat::identity()));
        REQUIRE(default_value(TypeDescriptor::structure(StructKind::Color)) == TypedValue(Color::clear()));
    }

    SECTION("enum default is value zero even when unnamed") {
        auto level = TypeDescriptor::enumeration("Level", {{"Low", 1}, {"High", 2}});
        auto v = default_value(level);
        REQUIRE(v.get<EnumValue>().value == 0);
        REQUIRE(v.get<EnumValue>().name().empty());
    }

    SECTION("reference, mask and collection") {
        REQUIRE(default_value(TypeDescriptor::reference("Node", ReferenceTarget::Node))
                    .get<ObjectRef>().is_absent());
        REQUIRE(default_value(TypeDescriptor::mask("LayerMask", nullptr)).get<MaskValue>().bits == 0);
        auto list = TypeDescriptor::collection(TypeDescriptor::primitive(PrimitiveType::I32),
                                               CollectionArity::Growable);
        REQUIRE(default_value(list).get<CollectionValue>().items.empty());
    }

    SECTION("composite uses field defaults") {
        auto spawn = TypeDescriptor::composite("Spawn", {
            FieldDescriptor("position", TypeDescriptor::structure(StructKind::Vec3)),
            FieldDescriptor("count", TypeDescriptor::primitive(PrimitiveType::I32), TypedValue(std::int32_t{4})),
        });
        auto v = default_value(spawn);
        const auto& composite = v.get<CompositeValue>();
        REQUIRE(composite.fields.size() == 2);
        REQUIRE(composite.get("count")->get<std::int32_t>() == 4);
        REQUIRE(composite.get("position")->get<Vec3>() == Vec3::zero());
    }

    SECTION("null descriptor") {
        REQUIRE(default_value(nullptr).is_absent());
    }
}

TEST_CASE("matches", "[model][descriptor]") {
    auto f32 = TypeDescriptor::primitive(PrimitiveType::F32);
    REQUIRE(matches(TypedValue(1.0f), *f32));
    REQUIRE_FALSE(matches(TypedValue(1.0), *f32));

    auto mode = TypeDescriptor::enumeration("Mode", {{"None", 0}});
    auto other = TypeDescriptor::enumeration("Other", {{"None", 0}});
    REQUIRE(matches(TypedValue(EnumValue{mode, 0}), *mode));
    REQUIRE_FALSE(matches(TypedValue(EnumValue{other, 0}), *mode));

    SECTION("references check category and type") {
        auto body = TypeDescriptor::composite("Rigidbody", {});
        auto node = Node::create("Player");
        auto component = node->add_component(body);

        auto node_ref = TypeDescriptor::reference("Node", ReferenceTarget::Node);
        auto body_ref = TypeDescriptor::reference("Rigidbody", ReferenceTarget::Component);

        REQUIRE(matches(TypedValue(ObjectRef::from_hierarchy(node)), *node_ref));
        REQUIRE_FALSE(matches(TypedValue(ObjectRef::from_hierarchy(node)), *body_ref));
        REQUIRE(matches(TypedValue(ObjectRef::from_hierarchy(component)), *body_ref));
        REQUIRE(matches(TypedValue(ObjectRef{}), *body_ref));
    }
}

TEST_CASE("iequals", "[model][descriptor]") {
    REQUIRE(iequals("Second", "sECOND"));
    REQUIRE_FALSE(iequals("Second", "Seconds"));
}
