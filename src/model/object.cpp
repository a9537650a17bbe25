/// @file object.cpp
/// @brief Node, Component and Asset implementation

#include <marshal/model/object.hpp>
#include <marshal/model/type_descriptor.hpp>
#include <algorithm>

namespace marshal_model {

namespace {

const std::string k_node_type = "Node";

} // anonymous namespace

// =============================================================================
// Object
// =============================================================================

bool Object::is_a(std::string_view type) const {
    return type.empty() || type == "Object" || type == type_name();
}

// =============================================================================
// Node
// =============================================================================

NodePtr Node::create(std::string name) {
    return std::make_shared<Node>(std::move(name));
}

const std::string& Node::type_name() const {
    return k_node_type;
}

bool Node::is_a(std::string_view type) const {
    return Object::is_a(type);
}

bool Node::is_active_in_hierarchy() const {
    if (!m_active) {
        return false;
    }
    auto p = parent();
    return p ? p->is_active_in_hierarchy() : true;
}

NodePtr Node::add_child(std::string name) {
    auto child = Node::create(std::move(name));
    add_child(child);
    return child;
}

void Node::add_child(const NodePtr& child) {
    if (!child || child.get() == this) {
        return;
    }
    if (auto previous = child->parent()) {
        previous->remove_child(*child);
    }
    child->m_parent = std::static_pointer_cast<Node>(shared_from_this());
    m_children.push_back(child);
}

bool Node::remove_child(const Node& child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [&child](const NodePtr& n) { return n.get() == &child; });
    if (it == m_children.end()) {
        return false;
    }
    (*it)->m_parent.reset();
    m_children.erase(it);
    return true;
}

NodePtr Node::find_child(std::string_view name) const {
    for (const auto& child : m_children) {
        if (child->name() == name) {
            return child;
        }
    }
    return nullptr;
}

std::string Node::hierarchy_path() const {
    std::vector<const Node*> chain;
    for (const Node* n = this; n != nullptr;) {
        chain.push_back(n);
        auto p = n->m_parent.lock();
        n = p.get();
    }

    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!path.empty()) {
            path += '/';
        }
        path += (*it)->name();
    }
    return path;
}

ComponentPtr Node::add_component(TypeDescriptorPtr type) {
    auto self = std::static_pointer_cast<Node>(shared_from_this());
    auto component = std::make_shared<Component>(std::move(type), self);
    m_components.push_back(component);
    return component;
}

ComponentPtr Node::get_component(std::string_view type) const {
    for (const auto& component : m_components) {
        if (component->is_a(type)) {
            return component;
        }
    }
    return nullptr;
}

// =============================================================================
// Component
// =============================================================================

Component::Component(TypeDescriptorPtr type, const NodePtr& owner)
    : Object(owner ? owner->name() : std::string{})
    , m_type(std::move(type))
    , m_owner(owner)
{
    if (m_type) {
        auto defaults = default_value(m_type);
        if (auto* composite = defaults.try_get<CompositeValue>()) {
            m_properties = std::move(*composite);
        }
    }
}

const std::string& Component::type_name() const {
    static const std::string k_untyped = "Component";
    return m_type ? m_type->name : k_untyped;
}

bool Component::is_a(std::string_view type) const {
    return type == "Component" || Object::is_a(type);
}

const TypedValue* Component::get_property(std::string_view name) const {
    return m_properties.get(name);
}

marshal_core::Result<void> Component::set_property(std::string_view name, TypedValue value) {
    const FieldDescriptor* field = m_type ? m_type->find_field(name) : nullptr;
    if (!field) {
        return marshal_core::Err(marshal_core::Error(marshal_core::ErrorCode::NotFound,
            "Property '" + std::string(name) + "' not found on " + type_name()));
    }
    if (!matches(value, *field->type)) {
        return marshal_core::Err(marshal_core::Error(
            marshal_core::TypeRegistryError::type_mismatch(field->type->name, value.type_name())));
    }
    m_properties.set(field->name, std::move(value));
    return marshal_core::Ok();
}

std::string Component::hierarchy_path() const {
    auto node = owner();
    return node ? node->hierarchy_path() : std::string{};
}

// =============================================================================
// Asset
// =============================================================================

namespace {

std::string stem_of(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string filename = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = filename.find_last_of('.');
    return (dot == std::string::npos || dot == 0) ? filename : filename.substr(0, dot);
}

} // anonymous namespace

Asset::Asset(std::string asset_type, std::string path, marshal_value::Value data)
    : Object(stem_of(path))
    , m_type(std::move(asset_type))
    , m_path(std::move(path))
    , m_data(std::move(data))
{
}

AssetPtr Asset::create(std::string asset_type, std::string path, marshal_value::Value data) {
    return std::make_shared<Asset>(std::move(asset_type), std::move(path), std::move(data));
}

bool Asset::is_a(std::string_view type) const {
    return type == "Asset" || Object::is_a(type);
}

} // namespace marshal_model
