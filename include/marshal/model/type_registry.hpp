#pragma once

/// @file type_registry.hpp
/// @brief Name -> TypeDescriptor registry

#include "fwd.hpp"
#include "type_descriptor.hpp"
#include <marshal/core/error.hpp>
#include <map>
#include <string>
#include <vector>

namespace marshal_model {

// =============================================================================
// TypeRegistry
// =============================================================================

/// Descriptors by name. A default-constructed registry already holds the
/// primitives, the built-in value types and `LayerMask`.
class TypeRegistry {
public:
    TypeRegistry();

    /// Register a descriptor under its name (AlreadyRegistered if taken)
    marshal_core::Result<void> register_type(TypeDescriptorPtr type);

    /// Register, replacing any descriptor with the same name
    TypeRegistry& register_or_replace(TypeDescriptorPtr type);

    /// Lookup by name (nullptr if not registered)
    [[nodiscard]] TypeDescriptorPtr get_by_name(const std::string& name) const;

    /// Lookup by name with error reporting
    [[nodiscard]] marshal_core::Result<TypeDescriptorPtr> get_result_by_name(const std::string& name) const;

    [[nodiscard]] bool contains_name(const std::string& name) const {
        return m_by_name.find(name) != m_by_name.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_by_name.size(); }

    /// Registered names in sorted order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Drop everything, including built-ins
    void clear() { m_by_name.clear(); }

    /// Re-add the built-in descriptors
    void register_builtins();

private:
    std::map<std::string, TypeDescriptorPtr> m_by_name;
};

} // namespace marshal_model
