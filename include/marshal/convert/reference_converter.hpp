#pragma once

/// @file reference_converter.hpp
/// @brief Resolves path strings and reference markers to host objects

#include "converter.hpp"
#include <marshal/model/object_model.hpp>
#include <optional>
#include <string>
#include <vector>

namespace marshal_convert {

// =============================================================================
// ReferenceConverter
// =============================================================================

/// Resolves a reference by path against the manager's ObjectModel.
///
/// Input is a bare path string or a map carrying a marker:
/// `{"$ref": p}`, `{"$type": "reference", "$path": p}`, `{"_nodePath": p}`,
/// one of `path`, `nodePath`, `objectPath`, `target`, `reference`, or a
/// map with a single string value.
///
/// A path starting with a configured asset root is loaded from storage;
/// anything else is a `/`-separated chain of node names walked from the
/// loaded scene roots (inactive nodes included). A final segment that is
/// not a child may name a component on the previous node. Every miss
/// produces an absent reference, never an error.
class ReferenceConverter final : public ValueConverter {
public:
    [[nodiscard]] const char* name() const noexcept override { return "ReferenceConverter"; }
    [[nodiscard]] int priority() const noexcept override { return priority::Reference; }

    [[nodiscard]] bool can_convert(const marshal_model::TypeDescriptor& target) const override;

    [[nodiscard]] marshal_core::Result<marshal_model::TypedValue> convert(
        const marshal_value::Value& value,
        const marshal_model::TypeDescriptorPtr& target,
        ConversionContext& ctx) const override;

    /// Null if absent, `{"$ref": path}` for assets, else the hierarchy path
    [[nodiscard]] static marshal_value::Value serialize(const marshal_model::ObjectRef& ref);

    /// Path carried by a reference map; nullopt if no marker is present
    [[nodiscard]] static std::optional<std::string> extract_path(const marshal_value::ValueObject& map);

    /// Walk the live hierarchy; absent reference on any miss
    [[nodiscard]] static marshal_model::ObjectRef resolve_hierarchy(const marshal_model::ObjectModel& model,
                                                                    const std::string& path,
                                                                    const marshal_model::TypeDescriptor& target);

    /// Load from storage; absent reference on a miss or type mismatch
    [[nodiscard]] static marshal_model::ObjectRef resolve_asset(const marshal_model::ObjectModel& model,
                                                                const std::string& path,
                                                                const marshal_model::TypeDescriptor& target);

    /// Non-empty segments of a slash-separated path
    [[nodiscard]] static std::vector<std::string> split_path(const std::string& path);
};

} // namespace marshal_convert
