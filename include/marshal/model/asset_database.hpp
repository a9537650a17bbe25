#pragma once

/// @file asset_database.hpp
/// @brief Persisted assets addressed by storage-relative path

#include "fwd.hpp"
#include "object.hpp"
#include <marshal/core/error.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace marshal_model {

// =============================================================================
// AssetDatabase
// =============================================================================

/// In-memory registrations backed by an optional project root on disk.
///
/// A path that is not registered in memory is read from `<root>/<path>` as
/// a JSON document `{"type": "...", "data": {...}}`. Disk reads are not
/// cached: every lookup observes the current file.
class AssetDatabase {
public:
    AssetDatabase() = default;
    explicit AssetDatabase(std::filesystem::path root) : m_root(std::move(root)) {}

    void set_root(std::filesystem::path root) { m_root = std::move(root); }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    /// Register an in-memory asset under its path
    void add(AssetPtr asset);

    /// Create, register and return an in-memory asset
    AssetPtr create(std::string type, std::string path,
                    marshal_value::Value data = marshal_value::Value::empty_object());

    bool remove(std::string_view path);

    /// Load by exact path; NotFound, ParseError or TypeMismatch on failure.
    /// An empty type, "Object" or "Asset" accepts any asset type.
    [[nodiscard]] marshal_core::Result<AssetPtr> load(std::string_view path, std::string_view type) const;

    /// True if registered in memory or present on disk
    [[nodiscard]] bool exists(std::string_view path) const;

    [[nodiscard]] std::size_t memory_count() const noexcept { return m_assets.size(); }

    /// Backslashes become '/', leading "./" and '/' are dropped
    [[nodiscard]] static std::string normalize_path(std::string_view path);

private:
    [[nodiscard]] marshal_core::Result<AssetPtr> load_from_disk(const std::string& path) const;

    std::filesystem::path m_root;
    std::map<std::string, AssetPtr, std::less<>> m_assets;
};

} // namespace marshal_model
