#pragma once

/// @file world.hpp
/// @brief In-memory object model: named scenes plus an asset database

#include "fwd.hpp"
#include "object.hpp"
#include "object_model.hpp"
#include "asset_database.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace marshal_model {

// =============================================================================
// Scene
// =============================================================================

/// Ordered set of root nodes; only loaded scenes are visible to lookups
class Scene {
public:
    explicit Scene(std::string name, bool loaded = true)
        : m_name(std::move(name)), m_loaded(loaded) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    [[nodiscard]] bool is_loaded() const noexcept { return m_loaded; }
    void set_loaded(bool loaded) noexcept { m_loaded = loaded; }

    /// Create a new root node
    NodePtr create_root(std::string name);

    /// Adopt an existing node as a root (detached from any parent)
    void add_root(const NodePtr& node);

    bool remove_root(const Node& node);

    [[nodiscard]] const std::vector<NodePtr>& roots() const noexcept { return m_roots; }

    /// First root with exactly this name
    [[nodiscard]] NodePtr find_root(std::string_view name) const;

private:
    std::string m_name;
    bool m_loaded;
    std::vector<NodePtr> m_roots;
};

// =============================================================================
// World
// =============================================================================

/// ObjectModel over scenes and an AssetDatabase
class World : public ObjectModel {
public:
    World() = default;
    explicit World(std::filesystem::path asset_root) : m_assets(std::move(asset_root)) {}

    /// Create a scene (or return the existing one with that name)
    Scene& create_scene(std::string name, bool loaded = true);

    [[nodiscard]] Scene* find_scene(std::string_view name);
    [[nodiscard]] const Scene* find_scene(std::string_view name) const;

    /// Returns false if no such scene exists
    bool set_scene_loaded(std::string_view name, bool loaded);

    [[nodiscard]] std::size_t scene_count() const noexcept { return m_scenes.size(); }

    [[nodiscard]] AssetDatabase& assets() noexcept { return m_assets; }
    [[nodiscard]] const AssetDatabase& assets() const noexcept { return m_assets; }

    // -------------------------------------------------------------------------
    // ObjectModel
    // -------------------------------------------------------------------------

    [[nodiscard]] std::vector<NodePtr> root_nodes() const override;

    [[nodiscard]] marshal_core::Result<AssetPtr> load_asset(std::string_view path,
                                                            std::string_view type) const override;

private:
    std::vector<std::unique_ptr<Scene>> m_scenes;
    AssetDatabase m_assets;
};

} // namespace marshal_model
