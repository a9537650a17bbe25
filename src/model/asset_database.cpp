/// @file asset_database.cpp
/// @brief AssetDatabase implementation

#include <marshal/model/asset_database.hpp>
#include <marshal/value/json.hpp>
#include <marshal/core/log.hpp>

namespace marshal_model {

namespace {

bool accepts_any(std::string_view type) {
    return type.empty() || type == "Object" || type == "Asset";
}

} // anonymous namespace

void AssetDatabase::add(AssetPtr asset) {
    if (!asset) {
        return;
    }
    auto key = normalize_path(asset->asset_path());
    m_assets.insert_or_assign(std::move(key), std::move(asset));
}

AssetPtr AssetDatabase::create(std::string type, std::string path, marshal_value::Value data) {
    auto asset = Asset::create(std::move(type), normalize_path(path), std::move(data));
    add(asset);
    return asset;
}

bool AssetDatabase::remove(std::string_view path) {
    auto it = m_assets.find(normalize_path(path));
    if (it == m_assets.end()) {
        return false;
    }
    m_assets.erase(it);
    return true;
}

marshal_core::Result<AssetPtr> AssetDatabase::load(std::string_view path, std::string_view type) const {
    auto key = normalize_path(path);
    if (key.empty()) {
        return marshal_core::Err<AssetPtr>(marshal_core::AssetError::not_found(std::string(path)));
    }

    AssetPtr asset;
    auto it = m_assets.find(key);
    if (it != m_assets.end()) {
        asset = it->second;
    } else {
        auto loaded = load_from_disk(key);
        if (!loaded) {
            return loaded;
        }
        asset = std::move(loaded).unwrap();
    }

    if (!accepts_any(type) && !asset->is_a(type)) {
        return marshal_core::Err<AssetPtr>(
            marshal_core::AssetError::type_mismatch(key, std::string(type), asset->type_name()));
    }
    return asset;
}

bool AssetDatabase::exists(std::string_view path) const {
    auto key = normalize_path(path);
    if (m_assets.find(key) != m_assets.end()) {
        return true;
    }
    if (m_root.empty() || key.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(m_root / key, ec);
}

marshal_core::Result<AssetPtr> AssetDatabase::load_from_disk(const std::string& path) const {
    if (m_root.empty()) {
        return marshal_core::Err<AssetPtr>(marshal_core::AssetError::not_found(path));
    }

    auto file = m_root / path;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return marshal_core::Err<AssetPtr>(marshal_core::AssetError::not_found(path));
    }

    auto doc = marshal_value::json::load_file(file);
    if (!doc) {
        return marshal_core::Err<AssetPtr>(marshal_core::AssetError::parse_error(path, doc.error().message()));
    }

    const auto* type = doc->get("type");
    if (!type || !type->is_string()) {
        return marshal_core::Err<AssetPtr>(marshal_core::AssetError::parse_error(path, "missing 'type' string"));
    }

    marshal_value::Value data = marshal_value::Value::empty_object();
    if (const auto* d = doc->get("data")) {
        data = *d;
    }

    marshal_core::model_logger()->debug("[AssetDatabase] Loaded '{}' ({}) from disk", path, type->as_string());
    return Asset::create(type->as_string(), path, std::move(data));
}

std::string AssetDatabase::normalize_path(std::string_view path) {
    std::string p(path);
    for (char& c : p) {
        if (c == '\\') c = '/';
    }
    while (p.rfind("./", 0) == 0) {
        p.erase(0, 2);
    }
    while (!p.empty() && p.front() == '/') {
        p.erase(0, 1);
    }
    return p;
}

} // namespace marshal_model
