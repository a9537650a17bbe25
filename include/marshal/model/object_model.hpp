#pragma once

/// @file object_model.hpp
/// @brief Query facility the reference converter resolves against

#include "fwd.hpp"
#include "object.hpp"
#include <marshal/core/error.hpp>
#include <string_view>
#include <vector>

namespace marshal_model {

// =============================================================================
// ObjectModel
// =============================================================================

/// Live hierarchy and persisted asset lookup
class ObjectModel {
public:
    virtual ~ObjectModel() = default;

    /// Roots of every loaded scene, inactive nodes included
    [[nodiscard]] virtual std::vector<NodePtr> root_nodes() const = 0;

    /// Direct child by exact name
    [[nodiscard]] virtual NodePtr find_child(const Node& parent, std::string_view name) const {
        return parent.find_child(name);
    }

    /// Attached component by type name
    [[nodiscard]] virtual ComponentPtr find_component(const Node& node, std::string_view type) const {
        return node.get_component(type);
    }

    /// Load a persisted asset by exact path, checking it is of `type`
    [[nodiscard]] virtual marshal_core::Result<AssetPtr> load_asset(std::string_view path,
                                                                    std::string_view type) const = 0;
};

} // namespace marshal_model
