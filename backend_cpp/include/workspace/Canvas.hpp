#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/Result.hpp"
#include "catalog/ResourceCatalog.hpp"
#include "forms/FieldReconciler.hpp"
#include "hcl/HclWriter.hpp"
#include "model/ResourceTypes.hpp"

namespace terrascope {

// Editable form of one resource: flat leaves plus the editor each leaf gets.
struct ResourceForm {
    std::string resource_type;
    std::string resource_name;
    FlatFieldSet fields;
    std::vector<FieldEditor> editors;   // parallel to fields.fields()

    ordered_json to_json() const;
};

struct ValidationIssue {
    std::string resource_name;
    std::vector<std::string> missing_fields;
};

// The set of resources being assembled, with the providers and backend they
// are rendered with. Owns every ResourceConfig; callers serialise access.
class Canvas {
public:
    Canvas(std::shared_ptr<const ResourceCatalog> catalog, ProviderList providers = default_providers());

    // aws { region = "us-west-2" }, azurerm { features {} }
    static ProviderList default_providers();

    // Instantiates `resource_type` from its template. An empty name becomes
    // "<last type segment>_<count>". The stored name is sanitized and made
    // unique; it is returned in OpResult::message.
    OpResult add_resource(const std::string& resource_type, const std::string& resource_name = "");
    OpResult remove_resource(const std::string& resource_name);

    const ResourceConfig* find(const std::string& resource_name) const;
    const std::vector<ResourceConfig>& resources() const { return resources_; }
    size_t size() const { return resources_.size(); }

    std::optional<ResourceForm> edit_form(const std::string& resource_name) const;

    // Validates every edit against the editor of the field it replaces, then
    // merges the edits into the resource's config. Nothing changes on failure.
    OpResult apply_edits(const std::string& resource_name, const FlatFieldSet& edits);

    // --- Providers / backend ---
    void set_provider(const ProviderConfig& provider);
    bool remove_provider(const std::string& provider_name);
    const ProviderList& providers() const { return providers_; }

    void set_backend(const BackendConfig& backend) { backend_ = backend; }
    void clear_backend() { backend_.reset(); }
    const std::optional<BackendConfig>& backend() const { return backend_; }

    // --- Output ---
    std::string render() const;
    std::vector<ValidationIssue> validate() const;

private:
    std::shared_ptr<const ResourceCatalog> catalog_;
    std::vector<ResourceConfig> resources_;
    ProviderList providers_;
    std::optional<BackendConfig> backend_;

    ResourceConfig* find_mutable(const std::string& resource_name);
    std::string unique_name(const std::string& base) const;
};

}
