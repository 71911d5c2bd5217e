#include "workspace/Canvas.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace terrascope {

ordered_json ResourceForm::to_json() const {
    ordered_json fields_json = ordered_json::array();
    const auto& leaves = fields.fields();
    for (size_t i = 0; i < leaves.size(); ++i) {
        auto [group, child] = split_path(leaves[i].first);
        fields_json.push_back({
            {"path", leaves[i].first},
            {"group", child.empty() ? "" : group},
            {"value", value_to_json(leaves[i].second)},
            {"editor", editors[i].to_json()}
        });
    }

    ordered_json groups_json = ordered_json::array();
    for (const auto& g : fields.groups()) {
        groups_json.push_back({{"key", g}, {"label", field_label(g)}});
    }

    return {
        {"type", resource_type},
        {"name", resource_name},
        {"groups", groups_json},
        {"fields", fields_json}
    };
}

Canvas::Canvas(std::shared_ptr<const ResourceCatalog> catalog, ProviderList providers)
    : catalog_(std::move(catalog)), providers_(std::move(providers)) {}

ProviderList Canvas::default_providers() {
    return {
        {"aws", ValueMap{{"region", "us-west-2"}}},
        {"azurerm", ValueMap{{"features", ValueMap{}}}}
    };
}

ResourceConfig* Canvas::find_mutable(const std::string& resource_name) {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const ResourceConfig& r) { return r.resource_name == resource_name; });
    return it == resources_.end() ? nullptr : &*it;
}

const ResourceConfig* Canvas::find(const std::string& resource_name) const {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const ResourceConfig& r) { return r.resource_name == resource_name; });
    return it == resources_.end() ? nullptr : &*it;
}

std::string Canvas::unique_name(const std::string& base) const {
    if (!find(base)) return base;
    for (size_t n = 2;; ++n) {
        std::string candidate = base + "_" + std::to_string(n);
        if (!find(candidate)) return candidate;
    }
}

OpResult Canvas::add_resource(const std::string& resource_type, const std::string& resource_name) {
    auto tmpl = catalog_ ? catalog_->get_template(resource_type) : std::nullopt;
    if (!tmpl) {
        spdlog::warn("⚠️ Unknown resource type '{}'", resource_type);
        return OpResult::fail(ErrorKind::NOT_FOUND, "Unknown resource type: " + resource_type);
    }

    std::string base = resource_name;
    if (base.empty()) {
        auto pos = resource_type.rfind('_');
        std::string suffix = pos == std::string::npos ? resource_type : resource_type.substr(pos + 1);
        base = suffix + "_" + std::to_string(resources_.size());
    }
    base = sanitize_identifier(base);

    ResourceConfig resource;
    resource.resource_type = resource_type;
    resource.resource_name = unique_name(base);
    resource.config = tmpl->defaults;
    resources_.push_back(resource);

    spdlog::info("➕ Added {} '{}'", resource.resource_type, resource.resource_name);
    return OpResult::ok(resource.resource_name);
}

OpResult Canvas::remove_resource(const std::string& resource_name) {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const ResourceConfig& r) { return r.resource_name == resource_name; });
    if (it == resources_.end()) {
        return OpResult::fail(ErrorKind::NOT_FOUND, "No resource named " + resource_name);
    }
    resources_.erase(it);
    spdlog::info("➖ Removed '{}'", resource_name);
    return OpResult::ok(resource_name);
}

std::optional<ResourceForm> Canvas::edit_form(const std::string& resource_name) const {
    const ResourceConfig* resource = find(resource_name);
    if (!resource) return std::nullopt;

    ResourceForm form;
    form.resource_type = resource->resource_type;
    form.resource_name = resource->resource_name;
    form.fields = flatten(resource->config);
    for (const auto& [path, value] : form.fields.fields()) {
        auto [parent, child] = split_path(path);
        form.editors.push_back(editor_for(child.empty() ? parent : child, value));
    }
    return form;
}

OpResult Canvas::apply_edits(const std::string& resource_name, const FlatFieldSet& edits) {
    ResourceConfig* resource = find_mutable(resource_name);
    if (!resource) {
        return OpResult::fail(ErrorKind::NOT_FOUND, "No resource named " + resource_name);
    }

    FlatFieldSet current = flatten(resource->config);
    FlatFieldSet accepted;
    for (const auto& [path, value] : edits.fields()) {
        if (!value.is_scalar()) {
            return OpResult::fail(ErrorKind::INVALID_INPUT, path + ": only scalar values can be edited");
        }

        const Value* existing = current.find(path);
        if (!existing) {
            // Lists and deeper maps are not editable; neither is a scalar's child
            auto [parent_key, child_key] = split_path(path);
            const Value* parent = resource->config.find(parent_key);
            bool dotted = path.find('.') != std::string::npos;
            if (parent && ((!dotted && !parent->is_scalar()) || (dotted && !parent->is_map()) ||
                           (dotted && parent->as_map().contains(child_key)))) {
                return OpResult::fail(ErrorKind::INVALID_INPUT, path + ": field is not editable");
            }

            // New attribute: no editor to check against
            accepted.set(path, value);
            continue;
        }

        auto [parent, child] = split_path(path);
        FieldEditor editor = editor_for(child.empty() ? parent : child, *existing);
        if (auto error = validate_edit(editor, value)) {
            spdlog::warn("⚠️ Rejected edit {}.{}: {}", resource_name, path, *error);
            return OpResult::fail(ErrorKind::INVALID_INPUT, path + ": " + *error);
        }
        accepted.set(path, coerce_edit(editor, value));
    }

    resource->config = merge_edits(resource->config, accepted);
    spdlog::info("✏️ Applied {} edit(s) to '{}'", accepted.size(), resource_name);
    return OpResult::ok(resource_name);
}

void Canvas::set_provider(const ProviderConfig& provider) {
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const ProviderConfig& p) { return p.provider_name == provider.provider_name; });
    if (it != providers_.end()) {
        it->settings = provider.settings;
    } else {
        providers_.push_back(provider);
    }
}

bool Canvas::remove_provider(const std::string& provider_name) {
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const ProviderConfig& p) { return p.provider_name == provider_name; });
    if (it == providers_.end()) return false;
    providers_.erase(it);
    return true;
}

std::string Canvas::render() const {
    return HclWriter::render(resources_, providers_, backend_);
}

std::vector<ValidationIssue> Canvas::validate() const {
    std::vector<ValidationIssue> issues;
    if (!catalog_) return issues;
    for (const auto& r : resources_) {
        auto tmpl = catalog_->get_template(r.resource_type);
        if (!tmpl) continue;
        auto missing = missing_required_fields(*tmpl, r.config);
        if (!missing.empty()) issues.push_back({r.resource_name, missing});
    }
    return issues;
}

}
