#pragma once
#include <string>
#include <vector>
#include "model/Value.hpp"
#include "model/ValueJson.hpp"

namespace terrascope {

struct ResourceTemplate {
    std::string type;                      // e.g. "aws_s3_bucket"
    std::string provider;                  // e.g. "aws", "azurerm"
    ValueMap defaults;
    std::vector<std::string> required_fields;
    bool popular = false;
    std::string description;

    ordered_json to_json() const {
        return {
            {"type", type},
            {"provider", provider},
            {"defaults", map_to_json(defaults)},
            {"required_fields", required_fields},
            {"popular", popular},
            {"description", description}
        };
    }
};

struct ResourceConfig {
    std::string resource_type;
    std::string resource_name;
    ValueMap config;

    ordered_json to_json() const {
        return {
            {"type", resource_type},
            {"name", resource_name},
            {"config", map_to_json(config)}
        };
    }
};

struct ProviderConfig {
    std::string provider_name;
    ValueMap settings;

    ordered_json to_json() const {
        return {{"name", provider_name}, {"settings", map_to_json(settings)}};
    }
};

struct BackendConfig {
    std::string backend_type;              // e.g. "s3", "azurerm"
    ValueMap settings;

    ordered_json to_json() const {
        return {{"type", backend_type}, {"settings", map_to_json(settings)}};
    }
};

// Ordered provider map: rendered in the order the providers were inserted.
using ProviderList = std::vector<ProviderConfig>;

// Non-alphanumeric -> '_', lower-cased. Applied when a name is assigned.
std::string sanitize_identifier(const std::string& name);

// '-' and ' ' -> '_', lower-cased. Applied to the label of a resource block.
std::string safe_resource_name(const std::string& name);

// Required fields absent from the config or holding an empty string.
std::vector<std::string> missing_required_fields(const ResourceTemplate& tmpl, const ValueMap& config);

}
