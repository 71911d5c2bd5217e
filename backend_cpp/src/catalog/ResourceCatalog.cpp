#include "catalog/ResourceCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace terrascope {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ResourceTemplate parse_template(const std::string& type, const ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("template must be an object");
    }
    ResourceTemplate t;
    t.type = type;
    t.provider = j.value("provider", "");
    t.defaults = map_from_json(j.value("defaults", ordered_json::object()));
    t.required_fields = j.value("required_fields", std::vector<std::string>{});
    t.popular = j.value("popular", false);
    t.description = j.value("description", "");
    return t;
}

}

ResourceCatalog::ResourceCatalog(const std::string& resources_path)
    : resources_path_(resources_path) {
    reload();
}

void ResourceCatalog::clear() {
    templates_.clear();
    index_.clear();
}

OpResult ResourceCatalog::reload() {
    clear();

    if (!fs::exists(resources_path_)) {
        spdlog::error("❌ Error loading resources: {} not found", resources_path_);
        return OpResult::fail(ErrorKind::CATALOG_LOAD, "Catalog file not found: " + resources_path_);
    }

    ordered_json root;
    try {
        std::ifstream f(resources_path_);
        root = ordered_json::parse(f);
    } catch (const std::exception& e) {
        spdlog::error("❌ Error loading resources from {}: {}", resources_path_, e.what());
        return OpResult::fail(ErrorKind::CATALOG_LOAD, e.what());
    }

    if (!root.is_object()) {
        spdlog::error("❌ Error loading resources: {} is not a JSON object", resources_path_);
        return OpResult::fail(ErrorKind::CATALOG_LOAD, "Catalog root must be a JSON object");
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        try {
            ResourceTemplate t = parse_template(it.key(), it.value());
            index_[t.type] = templates_.size();
            templates_.push_back(std::move(t));
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Skipping template '{}': {}", it.key(), e.what());
        }
    }

    spdlog::info("📚 Loaded {} resource types from {}", templates_.size(), resources_path_);
    return OpResult::ok();
}

std::optional<ResourceTemplate> ResourceCatalog::get_template(const std::string& resource_type) const {
    auto it = index_.find(resource_type);
    if (it == index_.end()) return std::nullopt;
    return templates_[it->second];
}

std::vector<ResourceTemplate> ResourceCatalog::list_by_provider(const std::string& provider) const {
    std::string wanted = to_lower(provider);
    std::vector<ResourceTemplate> out;
    for (const auto& t : templates_) {
        if (to_lower(t.provider) == wanted) out.push_back(t);
    }
    return out;
}

std::set<std::string> ResourceCatalog::list_groups() const {
    std::set<std::string> groups;
    for (const auto& t : templates_) {
        if (!t.provider.empty()) groups.insert(t.provider);
    }
    return groups;
}

std::vector<std::string> ResourceCatalog::list_popular(size_t limit) const {
    std::vector<std::string> popular;
    for (const auto& t : templates_) {
        if (popular.size() >= limit) break;
        if (t.popular) popular.push_back(t.type);
    }
    return popular;
}

}
