/// @file reference_converter.cpp
/// @brief ReferenceConverter implementation

#include <marshal/convert/reference_converter.hpp>
#include <marshal/convert/config.hpp>
#include <marshal/convert/context.hpp>
#include <marshal/core/log.hpp>
#include <marshal/model/object.hpp>

namespace marshal_convert {

using marshal_core::ConversionError;
using marshal_core::Err;
using marshal_core::Result;
using marshal_model::ObjectRef;
using marshal_model::ReferenceTarget;
using marshal_model::TypedValue;
using marshal_value::Value;

namespace {

/// Keys checked, in order, after the explicit markers
constexpr const char* k_path_keys[] = {"path", "nodePath", "objectPath", "target", "reference"};

std::string joined_keys(const marshal_value::ValueObject& map) {
    std::string keys;
    for (const auto& key : map.keys()) {
        if (!keys.empty()) {
            keys += ", ";
        }
        keys += key;
    }
    return keys;
}

bool wants_node(ReferenceTarget target) {
    return target == ReferenceTarget::Node || target == ReferenceTarget::Any;
}

bool wants_component(ReferenceTarget target) {
    return target == ReferenceTarget::Component || target == ReferenceTarget::Any;
}

ObjectRef select_on_node(const marshal_model::ObjectModel& model,
                         const marshal_model::NodePtr& node,
                         const marshal_model::TypeDescriptor& target) {
    if (wants_node(target.reference_target) && node->is_a(target.referenced_type)) {
        return ObjectRef::from_hierarchy(node);
    }
    if (wants_component(target.reference_target)) {
        if (auto component = model.find_component(*node, target.referenced_type)) {
            return ObjectRef::from_hierarchy(component);
        }
    }
    return {};
}

} // anonymous namespace

// =============================================================================
// Conversion
// =============================================================================

bool ReferenceConverter::can_convert(const marshal_model::TypeDescriptor& target) const {
    return target.is(marshal_model::TypeKind::Reference);
}

Result<TypedValue> ReferenceConverter::convert(const Value& value,
                                               const marshal_model::TypeDescriptorPtr& target,
                                               ConversionContext& ctx) const {
    if (value.is_null()) {
        return TypedValue(ObjectRef{});
    }

    std::string path;
    bool from_marker = false;

    if (const auto* s = value.try_string()) {
        path = *s;
    } else if (const auto* map = value.try_object()) {
        auto extracted = extract_path(*map);
        if (!extracted) {
            marshal_core::convert_logger()->warn(
                "[ReferenceConverter] No reference marker in map for {} (keys: {})",
                target->name, joined_keys(*map));
            return TypedValue(ObjectRef{});
        }
        path = std::move(*extracted);
        from_marker = map->contains("$ref");
    } else {
        return Err<TypedValue>(ConversionError::invalid_input(target->name,
            std::string("expected a path string or reference map, got ") + value.type_name()));
    }

    if (path.empty()) {
        return TypedValue(ObjectRef{});
    }

    const auto* model = ctx.object_model();
    if (!model) {
        marshal_core::convert_logger()->warn("[ReferenceConverter] No object model; '{}' left unresolved", path);
        return TypedValue(ObjectRef{});
    }

    const auto& descriptor = *target;
    if (descriptor.reference_target == ReferenceTarget::Asset || ctx.config().is_asset_path(path)) {
        return TypedValue(resolve_asset(*model, path, descriptor));
    }

    // An explicit $ref may still name an asset outside the configured roots
    if (from_marker && descriptor.reference_target == ReferenceTarget::Any) {
        auto asset = resolve_asset(*model, path, descriptor);
        if (!asset.is_absent()) {
            return TypedValue(std::move(asset));
        }
    }

    return TypedValue(resolve_hierarchy(*model, path, descriptor));
}

std::optional<std::string> ReferenceConverter::extract_path(const marshal_value::ValueObject& map) {
    const Value* type = map.find("$type");
    if (type && type->is_string() && type->as_string() == "reference") {
        if (const Value* p = map.find("$path"); p && p->is_string()) {
            return p->as_string();
        }
    }

    for (const char* marker : {"$ref", "_nodePath"}) {
        if (const Value* p = map.find(marker); p && p->is_string()) {
            return p->as_string();
        }
    }

    for (const char* key : k_path_keys) {
        if (const Value* p = map.find(key); p && p->is_string()) {
            return p->as_string();
        }
    }

    if (map.size() == 1) {
        const Value& single = map.begin()->second;
        if (single.is_string()) {
            return single.as_string();
        }
    }

    return std::nullopt;
}

// =============================================================================
// Resolution
// =============================================================================

std::vector<std::string> ReferenceConverter::split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        auto end = slash == std::string::npos ? path.size() : slash;
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

ObjectRef ReferenceConverter::resolve_hierarchy(const marshal_model::ObjectModel& model,
                                                const std::string& path,
                                                const marshal_model::TypeDescriptor& target) {
    auto logger = marshal_core::convert_logger();

    if (target.reference_target == ReferenceTarget::Asset) {
        return {};
    }

    auto segments = split_path(path);
    if (segments.empty()) {
        return {};
    }

    marshal_model::NodePtr node;
    for (const auto& root : model.root_nodes()) {
        if (root->name() == segments.front()) {
            node = root;
            break;
        }
    }
    if (!node) {
        logger->debug("[ReferenceConverter] No root named '{}' for '{}'", segments.front(), path);
        return {};
    }

    for (std::size_t i = 1; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        auto child = model.find_child(*node, segments[i]);
        if (child && !last) {
            node = std::move(child);
            continue;
        }
        if (child) {
            auto ref = select_on_node(model, child, target);
            if (!ref.is_absent()) {
                return ref;
            }
        }

        // "Parent/ComponentType": the last segment names a component on the parent,
        // also when a child node of that name exists but does not match
        if (last && wants_component(target.reference_target)) {
            auto component = model.find_component(*node, segments[i]);
            if (component && component->is_a(target.referenced_type)) {
                return ObjectRef::from_hierarchy(component);
            }
        }

        if (child) {
            logger->debug("[ReferenceConverter] '{}' has no {}", path, target.name);
        } else {
            logger->debug("[ReferenceConverter] '{}' not found under '{}'", segments[i], node->hierarchy_path());
        }
        return {};
    }

    auto ref = select_on_node(model, node, target);
    if (ref.is_absent()) {
        logger->debug("[ReferenceConverter] '{}' has no {}", path, target.name);
    }
    return ref;
}

ObjectRef ReferenceConverter::resolve_asset(const marshal_model::ObjectModel& model,
                                            const std::string& path,
                                            const marshal_model::TypeDescriptor& target) {
    if (target.reference_target == ReferenceTarget::Node ||
        target.reference_target == ReferenceTarget::Component) {
        return {};
    }

    auto asset = model.load_asset(path, target.referenced_type);
    if (!asset) {
        marshal_core::convert_logger()->debug("[ReferenceConverter] Asset '{}' unresolved: {}",
            path, asset.error().message());
        return {};
    }
    return ObjectRef::from_asset(std::move(asset).unwrap());
}

// =============================================================================
// Serialization
// =============================================================================

Value ReferenceConverter::serialize(const ObjectRef& ref) {
    auto object = ref.get();
    if (!object) {
        return Value::null();
    }

    if (ref.origin() == marshal_model::RefOrigin::Asset) {
        if (auto asset = std::dynamic_pointer_cast<marshal_model::Asset>(object)) {
            return Value::object({{"$ref", asset->asset_path()}});
        }
    }

    if (auto node = std::dynamic_pointer_cast<marshal_model::Node>(object)) {
        return Value(node->hierarchy_path());
    }
    if (auto component = std::dynamic_pointer_cast<marshal_model::Component>(object)) {
        return Value(component->hierarchy_path());
    }
    return Value(object->name());
}

} // namespace marshal_convert
