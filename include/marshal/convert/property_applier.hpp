#pragma once

/// @file property_applier.hpp
/// @brief Applies payload maps to component properties

#include "fwd.hpp"
#include <marshal/core/error.hpp>
#include <marshal/model/object.hpp>
#include <marshal/value/value.hpp>
#include <map>
#include <string>
#include <vector>

namespace marshal_convert {

/// Per-property outcome of PropertyApplier::apply
struct PropertyApplyResult {
    std::vector<std::string> updated;
    std::vector<std::string> failed;
    std::map<std::string, std::string> errors;  // property -> message

    [[nodiscard]] bool all_succeeded() const noexcept { return failed.empty(); }
};

// =============================================================================
// PropertyApplier
// =============================================================================

/// Converts each entry of a property map with try_convert and assigns it.
/// One failing property never prevents the others from being applied.
class PropertyApplier {
public:
    explicit PropertyApplier(const ConversionManager& manager) : m_manager(manager) {}

    /// InvalidArgument if `changes` is not a map
    [[nodiscard]] marshal_core::Result<PropertyApplyResult> apply(marshal_model::Component& component,
                                                                  const marshal_value::Value& changes) const;

    /// Serialized public properties of the component
    [[nodiscard]] marshal_value::Value read(const marshal_model::Component& component) const;

private:
    const ConversionManager& m_manager;
};

} // namespace marshal_convert
