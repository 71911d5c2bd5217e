#pragma once
#include <optional>
#include <string>
#include "model/ResourceTypes.hpp"

namespace terrascope {

// Process-wide settings. Built once by main and handed to each component.
struct AppConfig {
    std::string host = "127.0.0.1";
    int port = 5002;
    std::string catalog_path = "data/resources.json";
    std::string output_dir = "output";
    std::string main_file = "main.tf";
    std::string terraform_binary = "terraform";
    std::string history_file = "data/run_history.json";
    std::string log_level = "info";
    ProviderList providers;                 // empty -> Canvas::default_providers()
    std::optional<BackendConfig> backend;

    ordered_json to_json() const;
};

// Missing file -> defaults (warning). Malformed file or field -> defaults for
// what could not be read (error).
AppConfig load_app_config(const std::string& path);

// Applies AppConfig::log_level to the default spdlog logger.
void apply_log_level(const AppConfig& config);

}
