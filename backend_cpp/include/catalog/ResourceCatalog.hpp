#pragma once
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/Result.hpp"
#include "model/ResourceTypes.hpp"

namespace terrascope {

// Read-only lookup table of resource templates, keyed by resource type and
// kept in file order.
class ResourceCatalog {
public:
    explicit ResourceCatalog(const std::string& resources_path = "data/resources.json");

    // Re-reads the file. A missing or malformed file leaves the catalog empty.
    OpResult reload();

    std::optional<ResourceTemplate> get_template(const std::string& resource_type) const;

    // Case-insensitive provider match, catalog order.
    std::vector<ResourceTemplate> list_by_provider(const std::string& provider) const;

    std::set<std::string> list_groups() const;

    // Popular types in catalog order, truncated to `limit`. No ranking.
    std::vector<std::string> list_popular(size_t limit = 10) const;

    size_t size() const { return templates_.size(); }
    const std::vector<ResourceTemplate>& templates() const { return templates_; }
    const std::string& path() const { return resources_path_; }

private:
    std::string resources_path_;
    std::vector<ResourceTemplate> templates_;
    std::unordered_map<std::string, size_t> index_;

    void clear();
};

}
