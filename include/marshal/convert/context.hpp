#pragma once

/// @file context.hpp
/// @brief Per-call conversion state: field path and recorded failures

#include "fwd.hpp"
#include <marshal/core/error.hpp>
#include <marshal/model/fwd.hpp>
#include <marshal/model/typed_value.hpp>
#include <marshal/value/value.hpp>
#include <optional>
#include <string>
#include <vector>

namespace marshal_convert {

/// A nested conversion that failed and was replaced by its default
struct ConversionFailure {
    std::string path;  // "[2]", "spawn.position", "" for the top level
    marshal_core::Error error;
};

// =============================================================================
// ConversionContext
// =============================================================================

/// State threaded through one top-level convert/try_convert call.
/// Nested failures never abort siblings: they are recorded here and the
/// element or field takes its type default.
class ConversionContext {
public:
    explicit ConversionContext(const ConversionManager& manager) : m_manager(manager) {}

    [[nodiscard]] const ConversionManager& manager() const noexcept { return m_manager; }

    /// Shortcut for manager().config()
    [[nodiscard]] const ConverterConfig& config() const;

    /// Shortcut for manager().object_model(); may be null
    [[nodiscard]] const marshal_model::ObjectModel* object_model() const;

    /// Convert a nested value under `segment` ("[3]" or a field name).
    /// On failure the failure is recorded and the type default returned.
    [[nodiscard]] marshal_model::TypedValue convert_nested(const marshal_value::Value& value,
                                                           const marshal_model::TypeDescriptorPtr& type,
                                                           const std::string& segment);

    /// Dotted path of the value currently being converted
    [[nodiscard]] std::string current_path() const;

    void record_failure(marshal_core::Error error);

    [[nodiscard]] bool has_failures() const noexcept { return !m_failures.empty(); }
    [[nodiscard]] const std::vector<ConversionFailure>& failures() const noexcept { return m_failures; }

    /// First recorded unknown-name or unknown-constant error
    [[nodiscard]] std::optional<ConversionFailure> first_caller_error() const;

private:
    const ConversionManager& m_manager;
    std::vector<std::string> m_path;
    std::vector<ConversionFailure> m_failures;
};

} // namespace marshal_convert
