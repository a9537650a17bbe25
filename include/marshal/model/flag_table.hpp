#pragma once

/// @file flag_table.hpp
/// @brief Name <-> bit table backing mask types

#include "fwd.hpp"
#include <marshal/core/error.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace marshal_model {

// =============================================================================
// FlagTable
// =============================================================================

/// Up to 32 named bits plus multi-bit aliases.
///
/// Name lookup ignores case and whitespace, so "Ignore Raycast",
/// "ignoreraycast" and "IGNORE RAYCAST" all resolve to the same bit.
/// Every table carries the aliases `Nothing` (0) and `Everything` (all bits).
class FlagTable {
public:
    static constexpr std::uint32_t bit_count = 32;
    static constexpr std::uint32_t all_bits = 0xFFFFFFFFu;

    explicit FlagTable(std::string name = "LayerMask");

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Name a bit; fails with OutOfRange for bit >= 32
    marshal_core::Result<void> set_bit_name(std::uint32_t bit, std::string name);

    /// Name of a bit, empty if unnamed or out of range
    [[nodiscard]] const std::string& bit_name(std::uint32_t bit) const noexcept;

    /// Register a name for a bit combination
    void add_alias(std::string name, std::uint32_t bits);

    /// Resolve one token: alias, bit name, or a decimal bit index
    [[nodiscard]] std::optional<std::uint32_t> resolve(std::string_view token) const;

    /// Names of the set bits in ascending bit order; unnamed bits yield their index
    [[nodiscard]] std::vector<std::string> decode(std::uint32_t bits) const;

    /// Number of named bits
    [[nodiscard]] std::size_t named_count() const noexcept;

    /// Table with the engine's built-in layers
    [[nodiscard]] static FlagTable default_layers();

    /// Lowercase with whitespace removed
    [[nodiscard]] static std::string normalize(std::string_view name);

private:
    std::string m_name;
    std::array<std::string, bit_count> m_bits;
    std::vector<std::pair<std::string, std::uint32_t>> m_aliases;  // normalized name -> bits
};

} // namespace marshal_model
