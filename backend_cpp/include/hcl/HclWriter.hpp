#pragma once
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include "core/Result.hpp"
#include "model/ResourceTypes.hpp"

namespace terrascope {

class HclWriter {
public:
    static constexpr const char* kRequiredVersion = ">= 1.0.0";

    explicit HclWriter(const std::string& output_dir = "output");

    // --- RENDERING (pure) ---

    // terraform { required_version ... backend "<type>" { ... } }
    static std::string create_terraform_block(const std::optional<BackendConfig>& backend);

    static std::string create_provider_block(const ProviderConfig& provider);

    static std::string create_resource_block(const ResourceConfig& resource);

    // One attribute (or nested/repeated block) at the given indent, newline-terminated.
    static std::string format_attribute(const std::string& key, const Value& value, int indent = 0);

    // Right-hand side of `key = ...` for a scalar or inline list.
    static std::string format_inline(const Value& value);

    // Complete document: terraform block (only when a backend is supplied),
    // provider blocks, resource blocks, separated by one blank line.
    static std::string render(const std::vector<ResourceConfig>& resources,
                              const ProviderList& providers,
                              const std::optional<BackendConfig>& backend = std::nullopt);

    static bool is_reference(const std::string& s);
    static std::string quote(const std::string& s);
    static std::string format_float(double d);

    // --- OUTPUT ---

    OpResult write_terraform_file(const std::string& filename, const std::string& content) const;

    OpResult generate_main_tf(const std::vector<ResourceConfig>& resources,
                              const ProviderList& providers,
                              const std::optional<BackendConfig>& backend = std::nullopt,
                              const std::string& filename = "main.tf") const;

    const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    std::filesystem::path output_dir_;

    static std::string format_block(const std::string& key, const ValueMap& body, int indent);
    static bool is_block_list(const Value::List& items);
};

}
