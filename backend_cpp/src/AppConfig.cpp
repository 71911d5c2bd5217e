#include "AppConfig.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "workspace/Canvas.hpp"

namespace terrascope {

namespace fs = std::filesystem;

ordered_json AppConfig::to_json() const {
    ordered_json providers_json = ordered_json::object();
    for (const auto& p : providers) providers_json[p.provider_name] = map_to_json(p.settings);

    ordered_json j = {
        {"host", host},
        {"port", port},
        {"catalog_path", catalog_path},
        {"output_dir", output_dir},
        {"main_file", main_file},
        {"terraform_binary", terraform_binary},
        {"history_file", history_file},
        {"log_level", log_level},
        {"providers", providers_json}
    };
    if (backend) j["backend"] = backend->to_json();
    return j;
}

AppConfig load_app_config(const std::string& path) {
    AppConfig config;
    config.providers = Canvas::default_providers();

    if (!fs::exists(path)) {
        spdlog::warn("⚠️ Config {} not found. Using defaults.", path);
        return config;
    }

    ordered_json j;
    try {
        std::ifstream f(path);
        j = ordered_json::parse(f);
    } catch (const std::exception& e) {
        spdlog::error("❌ Failed to parse config {}: {}. Using defaults.", path, e.what());
        return config;
    }

    if (!j.is_object()) {
        spdlog::error("❌ Config {} must be a JSON object. Using defaults.", path);
        return config;
    }

    try {
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.catalog_path = j.value("catalog_path", config.catalog_path);
        config.output_dir = j.value("output_dir", config.output_dir);
        config.main_file = j.value("main_file", config.main_file);
        config.terraform_binary = j.value("terraform_binary", config.terraform_binary);
        config.history_file = j.value("history_file", config.history_file);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const std::exception& e) {
        spdlog::error("❌ Invalid scalar setting in {}: {}", path, e.what());
    }

    if (j.contains("providers")) {
        try {
            ValueMap providers = map_from_json(j["providers"]);
            ProviderList list;
            for (const auto& [name, settings] : providers) {
                if (!settings.is_map()) throw std::invalid_argument("settings of '" + name + "' must be an object");
                list.push_back({name, settings.as_map()});
            }
            config.providers = list;
        } catch (const std::exception& e) {
            spdlog::error("❌ Invalid 'providers' in {}: {}. Using default providers.", path, e.what());
        }
    }

    if (j.contains("backend") && !j["backend"].is_null()) {
        try {
            const auto& b = j["backend"];
            BackendConfig backend;
            backend.backend_type = b.value("type", "");
            backend.settings = map_from_json(b.value("settings", ordered_json::object()));
            config.backend = backend;
        } catch (const std::exception& e) {
            spdlog::error("❌ Invalid 'backend' in {}: {}. No backend configured.", path, e.what());
        }
    }

    spdlog::info("⚙️ Loaded config from {}", path);
    return config;
}

void apply_log_level(const AppConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("⚠️ Unknown log_level '{}'. Keeping info.", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

}
