// marshal_model World, object and AssetDatabase tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/model/world.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <filesystem>
#include <fstream>

using namespace marshal_model;

// =============================================================================
// Node / Component
// =============================================================================

TEST_CASE("Node hierarchy", "[model][object]") {
    auto root = Node::create("Parent");
    auto child = root->add_child("Child");
    auto grandchild = child->add_child("Leaf");

    REQUIRE(child->parent() == root);
    REQUIRE(root->find_child("Child") == child);
    REQUIRE(root->find_child("child") == nullptr);
    REQUIRE(grandchild->hierarchy_path() == "Parent/Child/Leaf");

    SECTION("activation is inherited but lookups ignore it") {
        child->set_active(false);
        REQUIRE_FALSE(grandchild->is_active_in_hierarchy());
        REQUIRE(grandchild->is_active());
        REQUIRE(root->find_child("Child") == child);
    }

    SECTION("reparenting") {
        auto other = Node::create("Other");
        other->add_child(grandchild);
        REQUIRE(child->children().empty());
        REQUIRE(grandchild->hierarchy_path() == "Other/Leaf");
    }

    SECTION("remove_child detaches") {
        REQUIRE(root->remove_child(*child));
        REQUIRE(child->parent() == nullptr);
        REQUIRE_FALSE(root->remove_child(*child));
    }
}

TEST_CASE("Component properties", "[model][object]") {
    auto mover = TypeDescriptor::composite("Mover", {
        FieldDescriptor("speed", TypeDescriptor::primitive(PrimitiveType::F32), TypedValue(1.0f)),
        FieldDescriptor("direction", TypeDescriptor::structure(StructKind::Vec3)),
    });
    auto node = Node::create("Player");
    auto component = node->add_component(mover);

    REQUIRE(component->name() == "Player");
    REQUIRE(component->type_name() == "Mover");
    REQUIRE(component->owner() == node);
    REQUIRE(component->hierarchy_path() == "Player");
    REQUIRE(component->get_property("speed")->get<float>() == 1.0f);

    SECTION("lookup by type") {
        REQUIRE(node->get_component("Mover") == component);
        REQUIRE(node->get_component("Component") == component);
        REQUIRE(node->get_component("Rigidbody") == nullptr);
        REQUIRE(component->is_a("Object"));
    }

    SECTION("set_property validates name and type") {
        REQUIRE(component->set_property("speed", TypedValue(5.0f)).is_ok());
        REQUIRE(component->get_property("speed")->get<float>() == 5.0f);

        auto unknown = component->set_property("mass", TypedValue(1.0f));
        REQUIRE(unknown.is_err());
        REQUIRE(unknown.error().code() == marshal_core::ErrorCode::NotFound);

        auto wrong = component->set_property("speed", TypedValue(5.0));
        REQUIRE(wrong.is_err());
        REQUIRE(wrong.error().code() == marshal_core::ErrorCode::TypeMismatch);
    }
}

// =============================================================================
// World
// =============================================================================

TEST_CASE("World scenes", "[model][world]") {
    World world;
    auto& main = world.create_scene("Main");
    auto& extra = world.create_scene("Extra", false);
    main.create_root("Player");
    extra.create_root("Hidden");

    REQUIRE(world.scene_count() == 2);
    REQUIRE(&world.create_scene("Main") == &main);

    SECTION("only loaded scenes contribute roots") {
        auto roots = world.root_nodes();
        REQUIRE(roots.size() == 1);
        REQUIRE(roots[0]->name() == "Player");

        REQUIRE(world.set_scene_loaded("Extra", true));
        REQUIRE(world.root_nodes().size() == 2);
        REQUIRE_FALSE(world.set_scene_loaded("Nope", true));
    }

    SECTION("inactive roots are still enumerated") {
        main.find_root("Player")->set_active(false);
        REQUIRE(world.root_nodes().size() == 1);
    }

    SECTION("scene root management") {
        auto adopted = Node::create("Adopted");
        auto parent = main.create_root("Holder");
        parent->add_child(adopted);

        main.add_root(adopted);
        REQUIRE(adopted->parent() == nullptr);
        REQUIRE(main.find_root("Adopted") == adopted);
        REQUIRE(main.remove_root(*adopted));
        REQUIRE(main.find_root("Adopted") == nullptr);
    }

    SECTION("object model defaults use the node API") {
        const ObjectModel& model = world;
        auto player = main.find_root("Player");
        auto child = player->add_child("Weapon");
        REQUIRE(model.find_child(*player, "Weapon") == child);
        REQUIRE(model.find_component(*player, "Mover") == nullptr);
    }
}

// =============================================================================
// AssetDatabase
// =============================================================================

TEST_CASE("AssetDatabase in memory", "[model][assets]") {
    AssetDatabase db;
    auto material = db.create("Material", "Assets/Materials/Red.mat");

    REQUIRE(material->name() == "Red");
    REQUIRE(db.exists("Assets/Materials/Red.mat"));
    REQUIRE(db.exists("./Assets\\Materials\\Red.mat"));

    SECTION("load checks the type") {
        REQUIRE(db.load("Assets/Materials/Red.mat", "Material").is_ok());
        REQUIRE(db.load("Assets/Materials/Red.mat", "").is_ok());
        REQUIRE(db.load("Assets/Materials/Red.mat", "Asset").is_ok());

        auto wrong = db.load("Assets/Materials/Red.mat", "Texture");
        REQUIRE(wrong.is_err());
        REQUIRE(wrong.error().code() == marshal_core::ErrorCode::TypeMismatch);
    }

    SECTION("missing without a root") {
        auto missing = db.load("Assets/None.mat", "");
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == marshal_core::ErrorCode::NotFound);
    }

    SECTION("remove") {
        REQUIRE(db.remove("Assets/Materials/Red.mat"));
        REQUIRE(db.memory_count() == 0);
    }
}

TEST_CASE("AssetDatabase on disk", "[model][assets]") {
    auto root = std::filesystem::temp_directory_path() / "marshal_asset_db_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "Assets");

    {
        std::ofstream out(root / "Assets" / "Blue.mat");
        out << R"({"type": "Material", "data": {"color": "blue"}})";
    }
    {
        std::ofstream out(root / "Assets" / "Broken.mat");
        out << "{ not json";
    }

    World world(root);

    SECTION("reads the document") {
        auto loaded = world.load_asset("Assets/Blue.mat", "Material");
        REQUIRE(loaded.is_ok());
        REQUIRE((*loaded)->type_name() == "Material");
        REQUIRE((*loaded)->data()["color"].as_string() == "blue");
    }

    SECTION("no caching between lookups") {
        REQUIRE(world.load_asset("Assets/Blue.mat", "").is_ok());
        std::filesystem::remove(root / "Assets" / "Blue.mat");
        REQUIRE(world.load_asset("Assets/Blue.mat", "").is_err());
    }

    SECTION("malformed documents") {
        auto broken = world.load_asset("Assets/Broken.mat", "");
        REQUIRE(broken.is_err());
        REQUIRE(broken.error().code() == marshal_core::ErrorCode::ParseError);
    }

    std::filesystem::remove_all(root);
}

TEST_CASE("AssetDatabase path normalization", "[model][assets]") {
    REQUIRE(AssetDatabase::normalize_path("./Assets\\a.mat") == "Assets/a.mat");
    REQUIRE(AssetDatabase::normalize_path("/Assets/a.mat") == "Assets/a.mat");
}
