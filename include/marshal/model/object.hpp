#pragma once

/// @file object.hpp
/// @brief Host objects: scene nodes, attached components and persisted assets

#include "fwd.hpp"
#include "type_kind.hpp"
#include "typed_value.hpp"
#include <marshal/core/error.hpp>
#include <marshal/value/value.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace marshal_model {

// =============================================================================
// Object
// =============================================================================

/// Base of everything a reference can point at
class Object : public std::enable_shared_from_this<Object> {
public:
    virtual ~Object() = default;

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    void set_name(std::string name) { m_name = std::move(name); }

    /// Concrete type name (component or asset type, "Node" for nodes)
    [[nodiscard]] virtual const std::string& type_name() const = 0;

    /// Which reference family this object belongs to
    [[nodiscard]] virtual ReferenceTarget category() const noexcept = 0;

    /// True for an empty name, "Object", or the concrete type name
    [[nodiscard]] virtual bool is_a(std::string_view type) const;

protected:
    explicit Object(std::string name) : m_name(std::move(name)) {}

private:
    std::string m_name;
};

// =============================================================================
// Node
// =============================================================================

/// Scene node. Children are owned; the parent link is weak.
/// Nodes must be owned by a shared_ptr (use Node::create).
class Node : public Object {
public:
    explicit Node(std::string name) : Object(std::move(name)) {}

    [[nodiscard]] static NodePtr create(std::string name);

    [[nodiscard]] const std::string& type_name() const override;
    [[nodiscard]] ReferenceTarget category() const noexcept override { return ReferenceTarget::Node; }
    [[nodiscard]] bool is_a(std::string_view type) const override;

    // -------------------------------------------------------------------------
    // Activation
    // -------------------------------------------------------------------------

    [[nodiscard]] bool is_active() const noexcept { return m_active; }
    void set_active(bool active) noexcept { m_active = active; }

    /// Active only if this node and every ancestor are active
    [[nodiscard]] bool is_active_in_hierarchy() const;

    // -------------------------------------------------------------------------
    // Hierarchy
    // -------------------------------------------------------------------------

    [[nodiscard]] NodePtr parent() const { return m_parent.lock(); }
    [[nodiscard]] const std::vector<NodePtr>& children() const noexcept { return m_children; }

    /// Create and attach a new child
    NodePtr add_child(std::string name);

    /// Attach an existing node, detaching it from its previous parent
    void add_child(const NodePtr& child);

    bool remove_child(const Node& child);

    /// First direct child with exactly this name (inactive children included)
    [[nodiscard]] NodePtr find_child(std::string_view name) const;

    /// Slash-joined names from the root down to this node
    [[nodiscard]] std::string hierarchy_path() const;

    // -------------------------------------------------------------------------
    // Components
    // -------------------------------------------------------------------------

    /// Attach a component whose properties start at the type's defaults
    ComponentPtr add_component(TypeDescriptorPtr type);

    /// First component of the given type
    [[nodiscard]] ComponentPtr get_component(std::string_view type) const;

    [[nodiscard]] const std::vector<ComponentPtr>& components() const noexcept { return m_components; }

private:
    bool m_active = true;
    std::weak_ptr<Node> m_parent;
    std::vector<NodePtr> m_children;
    std::vector<ComponentPtr> m_components;
};

// =============================================================================
// Component
// =============================================================================

/// Behavior attached to a node; its properties form a composite value
class Component : public Object {
public:
    Component(TypeDescriptorPtr type, const NodePtr& owner);

    [[nodiscard]] const std::string& type_name() const override;
    [[nodiscard]] ReferenceTarget category() const noexcept override { return ReferenceTarget::Component; }
    [[nodiscard]] bool is_a(std::string_view type) const override;

    [[nodiscard]] const TypeDescriptorPtr& descriptor() const noexcept { return m_type; }
    [[nodiscard]] NodePtr owner() const { return m_owner.lock(); }

    [[nodiscard]] const CompositeValue& properties() const noexcept { return m_properties; }

    [[nodiscard]] const TypedValue* get_property(std::string_view name) const;

    /// Assign a declared property; the value must match the field type
    marshal_core::Result<void> set_property(std::string_view name, TypedValue value);

    /// Owner's hierarchy path
    [[nodiscard]] std::string hierarchy_path() const;

private:
    TypeDescriptorPtr m_type;
    std::weak_ptr<Node> m_owner;
    CompositeValue m_properties;
};

// =============================================================================
// Asset
// =============================================================================

/// Persisted object identified by its storage path
class Asset : public Object {
public:
    Asset(std::string asset_type, std::string path, marshal_value::Value data);

    [[nodiscard]] static AssetPtr create(std::string asset_type, std::string path,
                                         marshal_value::Value data = marshal_value::Value::empty_object());

    [[nodiscard]] const std::string& type_name() const override { return m_type; }
    [[nodiscard]] ReferenceTarget category() const noexcept override { return ReferenceTarget::Asset; }
    [[nodiscard]] bool is_a(std::string_view type) const override;

    [[nodiscard]] const std::string& asset_path() const noexcept { return m_path; }
    [[nodiscard]] const marshal_value::Value& data() const noexcept { return m_data; }

private:
    std::string m_type;
    std::string m_path;
    marshal_value::Value m_data;
};

} // namespace marshal_model
