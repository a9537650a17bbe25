/// @file main.cpp
/// @brief Conversion Demo
///
/// Converts a JSON payload into a typed wave definition against a small
/// in-memory world, then prints the serialized result.
///
/// Usage: marshal_demo [config.toml] [payload.json]

#include <marshal/convert/convert.hpp>
#include <marshal/core/core.hpp>
#include <marshal/model/model.hpp>
#include <marshal/value/value_all.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace {

const char* k_default_payload = R"({
    "name": "opening",
    "mode": "Burst",
    "spawn_point": {"x": 4, "y": 0, "z": -2},
    "tint": "red",
    "layers": "Default, UI",
    "spawner": "Arena/Spawner",
    "material": {"$ref": "Assets/Materials/Red.mat"},
    "waypoints": [[0, 0, 0], {"x": 10, "z": 5}, "up"]
})";

using namespace marshal_model;

TypeDescriptorPtr wave_type(const marshal_convert::ConverterConfig& config) {
    auto mode = TypeDescriptor::enumeration("SpawnMode", {{"Trickle", 0}, {"Burst", 1}, {"Swarm", 2}});
    return TypeDescriptor::composite("Wave", {
        FieldDescriptor("name", TypeDescriptor::primitive(PrimitiveType::String)),
        FieldDescriptor("mode", mode),
        FieldDescriptor("spawn_point", TypeDescriptor::structure(StructKind::Vec3)),
        FieldDescriptor("tint", TypeDescriptor::structure(StructKind::Color)),
        FieldDescriptor("layers", TypeDescriptor::mask("LayerMask", config.layer_table())),
        FieldDescriptor("spawner", TypeDescriptor::reference("Spawner", ReferenceTarget::Component)),
        FieldDescriptor("material", TypeDescriptor::reference("Material", ReferenceTarget::Any)),
        FieldDescriptor("waypoints", TypeDescriptor::collection(
            TypeDescriptor::structure(StructKind::Vec3), CollectionArity::Growable)),
    });
}

std::shared_ptr<World> build_world() {
    auto world = std::make_shared<World>();
    auto& scene = world->create_scene("Main");
    auto arena = scene.create_root("Arena");
    auto spawner = arena->add_child("Spawner");
    spawner->add_component(TypeDescriptor::composite("Spawner", {
        FieldDescriptor("rate", TypeDescriptor::primitive(PrimitiveType::F32), TypedValue(1.0f)),
    }));
    world->assets().create("Material", "Assets/Materials/Red.mat",
                           marshal_value::Value::object({{"color", "red"}}));
    return world;
}

marshal_core::Result<marshal_convert::ConverterConfig> load_config(int argc, char* argv[]) {
    if (argc < 2) {
        return marshal_convert::ConverterConfig{};
    }
    return marshal_convert::ConfigLoader::load(argv[1]);
}

marshal_core::Result<marshal_value::Value> load_payload(int argc, char* argv[]) {
    if (argc < 3) {
        return marshal_value::json::parse(k_default_payload, "<builtin>");
    }
    return marshal_value::json::load_file(argv[2]);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto config = load_config(argc, argv);
        if (!config) {
            MARSHAL_LOG_ERROR("Failed to load config: {}", config.error().message());
            return EXIT_FAILURE;
        }

        marshal_core::LogConfig log_config;
        log_config.level = marshal_core::parse_log_level(config->log_level).value_or(spdlog::level::info);
        marshal_core::configure_logging(log_config);
        marshal_core::set_logger_level("marshal_convert", log_config.level);

        auto payload = load_payload(argc, argv);
        if (!payload) {
            MARSHAL_LOG_ERROR("Failed to load payload: {}", payload.error().message());
            return EXIT_FAILURE;
        }

        marshal_convert::ConversionManager manager(*config);
        manager.set_object_model(build_world());

        auto wave = wave_type(*config);
        marshal_convert::ConversionResult result;
        {
            MARSHAL_LOG_SCOPE("convert " + wave->name);
            result = manager.try_convert(*payload, wave);
        }
        for (const auto& failure : result.failures) {
            MARSHAL_LOG_WARN("{}: {}", failure.path.empty() ? "<root>" : failure.path,
                             marshal_core::build_error_chain(failure.error));
        }
        MARSHAL_LOG_INFO("Converted {} with {} failure(s)", wave->name, result.failures.size());
        marshal_core::flush_all_loggers();

        std::cout << marshal_value::json::dump(manager.serialize(result.value), 2) << std::endl;

        marshal_core::shutdown_logging();
        return result.success ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        MARSHAL_LOG_ERROR("FATAL EXCEPTION: {}", e.what());
        marshal_core::flush_all_loggers();
        return EXIT_FAILURE;
    }
}
