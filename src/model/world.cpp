/// @file world.cpp
/// @brief Scene and World implementation

#include <marshal/model/world.hpp>
#include <marshal/core/log.hpp>
#include <algorithm>

namespace marshal_model {

// =============================================================================
// Scene
// =============================================================================

NodePtr Scene::create_root(std::string name) {
    auto node = Node::create(std::move(name));
    m_roots.push_back(node);
    return node;
}

void Scene::add_root(const NodePtr& node) {
    if (!node) {
        return;
    }
    if (auto parent = node->parent()) {
        parent->remove_child(*node);
    }
    m_roots.push_back(node);
}

bool Scene::remove_root(const Node& node) {
    auto it = std::find_if(m_roots.begin(), m_roots.end(),
        [&node](const NodePtr& n) { return n.get() == &node; });
    if (it == m_roots.end()) {
        return false;
    }
    m_roots.erase(it);
    return true;
}

NodePtr Scene::find_root(std::string_view name) const {
    for (const auto& root : m_roots) {
        if (root->name() == name) {
            return root;
        }
    }
    return nullptr;
}

// =============================================================================
// World
// =============================================================================

Scene& World::create_scene(std::string name, bool loaded) {
    if (Scene* existing = find_scene(name)) {
        return *existing;
    }
    m_scenes.push_back(std::make_unique<Scene>(std::move(name), loaded));
    marshal_core::model_logger()->debug("[World] Scene '{}' created (loaded: {})",
        m_scenes.back()->name(), loaded);
    return *m_scenes.back();
}

Scene* World::find_scene(std::string_view name) {
    for (auto& scene : m_scenes) {
        if (scene->name() == name) {
            return scene.get();
        }
    }
    return nullptr;
}

const Scene* World::find_scene(std::string_view name) const {
    for (const auto& scene : m_scenes) {
        if (scene->name() == name) {
            return scene.get();
        }
    }
    return nullptr;
}

bool World::set_scene_loaded(std::string_view name, bool loaded) {
    Scene* scene = find_scene(name);
    if (!scene) {
        return false;
    }
    scene->set_loaded(loaded);
    return true;
}

std::vector<NodePtr> World::root_nodes() const {
    std::vector<NodePtr> roots;
    for (const auto& scene : m_scenes) {
        if (!scene->is_loaded()) {
            continue;
        }
        roots.insert(roots.end(), scene->roots().begin(), scene->roots().end());
    }
    return roots;
}

marshal_core::Result<AssetPtr> World::load_asset(std::string_view path, std::string_view type) const {
    return m_assets.load(path, type);
}

} // namespace marshal_model
