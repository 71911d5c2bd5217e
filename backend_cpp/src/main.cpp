#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <signal.h>

#include "AppConfig.hpp"
#include "RunLog.hpp"
#include "catalog/ResourceCatalog.hpp"
#include "forms/FieldReconciler.hpp"
#include "hcl/HclWriter.hpp"
#include "terraform/CommandRunner.hpp"
#include "terraform/DeploymentPipeline.hpp"
#include "terraform/TerraformRunner.hpp"
#include "workspace/Canvas.hpp"

using json = nlohmann::ordered_json;

httplib::Server* global_server_ptr = nullptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

namespace {

int http_status_for(terrascope::ErrorKind kind) {
    switch (kind) {
        case terrascope::ErrorKind::NONE: return 200;
        case terrascope::ErrorKind::NOT_FOUND: return 404;
        case terrascope::ErrorKind::INVALID_INPUT: return 400;
        case terrascope::ErrorKind::SERIALIZATION_AMBIGUITY: return 422;
        case terrascope::ErrorKind::PROCESS_EXECUTION: return 502;
        case terrascope::ErrorKind::CATALOG_LOAD: return 503;
        case terrascope::ErrorKind::WRITE: return 500;
        default: return 500;
    }
}

template <class Json>
void send_json(httplib::Response& res, const Json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, Json::error_handler_t::replace), "application/json");
}

void send_result(httplib::Response& res, const terrascope::OpResult& r) {
    json body = {{"success", r.success}, {"message", r.message}};
    if (!r.success) body["error"] = terrascope::error_kind_to_string(r.error);
    send_json(res, body, http_status_for(r.error));
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, json{{"success", false}, {"error", message}}, status);
}

// Empty body -> {}. Invalid JSON -> 400 and false.
bool parse_body(const httplib::Request& req, httplib::Response& res, json& body) {
    if (req.body.empty()) {
        body = json::object();
        return true;
    }
    body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        spdlog::error("❌ JSON Error. Body length: {}", req.body.length());
        send_error(res, 400, "Invalid JSON body");
        return false;
    }
    return true;
}

}

class TerraScopeServer {
public:
    explicit TerraScopeServer(const terrascope::AppConfig& config)
        : config_(config),
          catalog_(std::make_shared<terrascope::ResourceCatalog>(config.catalog_path)),
          canvas_(catalog_, config.providers.empty() ? terrascope::Canvas::default_providers() : config.providers),
          writer_(config.output_dir),
          run_log_(std::make_shared<terrascope::RunLog>(config.history_file)),
          runner_(std::make_shared<terrascope::ShellCommandRunner>(config.terraform_binary),
                  config.output_dir, run_log_) {
        if (config.backend) canvas_.set_backend(*config.backend);
        setup_routes();
    }

    void run() {
        global_server_ptr = &server_;
        spdlog::info("🚀 TerraScope API listening on {}:{}", config_.host, config_.port);
        if (!server_.listen(config_.host, config_.port)) {
            spdlog::error("❌ Could not bind {}:{}", config_.host, config_.port);
        }
        global_server_ptr = nullptr;
    }

private:
    terrascope::AppConfig config_;
    httplib::Server server_;

    std::shared_ptr<terrascope::ResourceCatalog> catalog_;
    terrascope::Canvas canvas_;
    std::mutex canvas_mutex_;

    terrascope::HclWriter writer_;
    std::shared_ptr<terrascope::RunLog> run_log_;
    terrascope::TerraformRunner runner_;
    std::mutex run_mutex_;  // one terraform invocation at a time

    // --- HELPERS ---

    terrascope::OpResult save_document() {
        std::lock_guard<std::mutex> lock(canvas_mutex_);
        for (const auto& issue : canvas_.validate()) {
            std::string fields;
            for (const auto& f : issue.missing_fields) fields += (fields.empty() ? "" : ", ") + f;
            spdlog::warn("⚠️ '{}' is missing required fields: {}", issue.resource_name, fields);
        }
        return writer_.generate_main_tf(canvas_.resources(), canvas_.providers(),
                                        canvas_.backend(), config_.main_file);
    }

    json resources_json() {
        json list = json::array();
        for (const auto& r : canvas_.resources()) list.push_back(r.to_json());
        return list;
    }

    json providers_json() {
        json list = json::array();
        for (const auto& p : canvas_.providers()) list.push_back(p.to_json());
        return list;
    }

    // --- ROUTE HANDLERS ---

    void handle_add_resource(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        std::string type = body.value("type", "");
        std::string name = body.value("name", "");
        if (type.empty()) return send_error(res, 400, "'type' is required");

        std::lock_guard<std::mutex> lock(canvas_mutex_);
        auto r = canvas_.add_resource(type, name);
        if (!r) return send_result(res, r);
        send_json(res, canvas_.find(r.message)->to_json(), 201);
    }

    void handle_apply_edits(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        std::string name = req.path_params.at("name");

        terrascope::FlatFieldSet edits;
        try {
            edits = terrascope::FlatFieldSet::from_json(body);
        } catch (const std::exception& e) {
            return send_error(res, 400, e.what());
        }

        std::lock_guard<std::mutex> lock(canvas_mutex_);
        auto r = canvas_.apply_edits(name, edits);
        if (!r) return send_result(res, r);
        send_json(res, canvas_.find(name)->to_json());
    }

    void handle_set_provider(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        terrascope::ProviderConfig provider;
        provider.provider_name = req.path_params.at("name");
        try {
            provider.settings = terrascope::map_from_json(body.value("settings", json::object()));
        } catch (const std::exception& e) {
            return send_error(res, 400, e.what());
        }

        std::lock_guard<std::mutex> lock(canvas_mutex_);
        canvas_.set_provider(provider);
        send_json(res, providers_json());
    }

    void handle_set_backend(const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        terrascope::BackendConfig backend;
        try {
            backend.backend_type = body.value("type", "");
            backend.settings = terrascope::map_from_json(body.value("settings", json::object()));
        } catch (const std::exception& e) {
            return send_error(res, 400, e.what());
        }
        if (backend.backend_type.empty()) return send_error(res, 400, "'type' is required");

        std::lock_guard<std::mutex> lock(canvas_mutex_);
        canvas_.set_backend(backend);
        send_json(res, backend.to_json());
    }

    void handle_terraform(const std::string& action, const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        bool auto_approve = body.value("auto_approve", false);

        std::lock_guard<std::mutex> lock(run_mutex_);
        terrascope::StepResult step{false, ""};
        if (action == "init") step = runner_.init();
        else if (action == "plan") step = runner_.plan();
        else if (action == "apply") step = runner_.apply(auto_approve);
        else step = runner_.destroy(auto_approve);
        send_json(res, step.to_json(), step.success ? 200 : 502);
    }

    void handle_pipeline(bool deploy, const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        bool approve = body.value("approve", false);

        std::lock_guard<std::mutex> lock(run_mutex_);
        terrascope::DeploymentPipeline pipeline(runner_, [this]() { return save_document(); });
        auto confirm = [approve](const std::string&) { return approve; };
        auto result = deploy ? pipeline.deploy(confirm) : pipeline.teardown(confirm);
        send_json(res, result.to_json(), result.success ? 200 : 502);
    }

    void setup_routes() {
        // --- CORS HEADERS ---
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            return httplib::Server::HandlerResponse::Unhandled;
        });
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

        // 1. CATALOG
        server_.Get("/api/catalog/groups", [this](const httplib::Request&, httplib::Response& res) {
            json groups = json::array();
            for (const auto& g : catalog_->list_groups()) groups.push_back(g);
            send_json(res, groups);
        });
        server_.Get("/api/catalog/popular", [this](const httplib::Request& req, httplib::Response& res) {
            size_t limit = 10;
            if (req.has_param("limit")) {
                try {
                    limit = std::stoul(req.get_param_value("limit"));
                } catch (const std::exception&) {
                    return send_error(res, 400, "'limit' must be a non-negative integer");
                }
            }
            json list = json::array();
            for (const auto& t : catalog_->list_popular(limit)) list.push_back(t);
            send_json(res, list);
        });
        server_.Get("/api/catalog/providers/:provider", [this](const httplib::Request& req, httplib::Response& res) {
            json list = json::array();
            for (const auto& t : catalog_->list_by_provider(req.path_params.at("provider"))) list.push_back(t.to_json());
            send_json(res, list);
        });
        server_.Get("/api/catalog/templates/:type", [this](const httplib::Request& req, httplib::Response& res) {
            auto t = catalog_->get_template(req.path_params.at("type"));
            if (!t) return send_error(res, 404, "Unknown resource type");
            send_json(res, t->to_json());
        });

        // 2. CANVAS
        server_.Get("/api/resources", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            send_json(res, resources_json());
        });
        server_.Post("/api/resources", [this](const httplib::Request& req, httplib::Response& res) { this->handle_add_resource(req, res); });
        server_.Delete("/api/resources/:name", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            send_result(res, canvas_.remove_resource(req.path_params.at("name")));
        });
        server_.Get("/api/resources/:name/form", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            auto form = canvas_.edit_form(req.path_params.at("name"));
            if (!form) return send_error(res, 404, "No such resource");
            send_json(res, form->to_json());
        });
        server_.Post("/api/resources/:name/form", [this](const httplib::Request& req, httplib::Response& res) { this->handle_apply_edits(req, res); });

        // 3. PROVIDERS / BACKEND
        server_.Get("/api/providers", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            send_json(res, providers_json());
        });
        server_.Put("/api/providers/:name", [this](const httplib::Request& req, httplib::Response& res) { this->handle_set_provider(req, res); });
        server_.Delete("/api/providers/:name", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            if (!canvas_.remove_provider(req.path_params.at("name"))) return send_error(res, 404, "No such provider");
            send_json(res, providers_json());
        });
        server_.Put("/api/backend", [this](const httplib::Request& req, httplib::Response& res) { this->handle_set_backend(req, res); });
        server_.Delete("/api/backend", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            canvas_.clear_backend();
            send_json(res, json{{"success", true}});
        });

        // 4. DOCUMENT
        server_.Get("/api/hcl", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            res.set_content(canvas_.render(), "text/plain");
        });
        server_.Get("/api/validate", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(canvas_mutex_);
            json issues = json::array();
            for (const auto& i : canvas_.validate()) {
                issues.push_back({{"name", i.resource_name}, {"missing_fields", i.missing_fields}});
            }
            send_json(res, json{{"valid", issues.empty()}, {"issues", issues}});
        });
        server_.Post("/api/save", [this](const httplib::Request&, httplib::Response& res) { send_result(res, save_document()); });

        // 5. TERRAFORM
        for (const std::string action : {"init", "plan", "apply", "destroy"}) {
            server_.Post("/api/terraform/" + action, [this, action](const httplib::Request& req, httplib::Response& res) {
                this->handle_terraform(action, req, res);
            });
        }
        server_.Post("/api/deploy", [this](const httplib::Request& req, httplib::Response& res) { this->handle_pipeline(true, req, res); });
        server_.Post("/api/teardown", [this](const httplib::Request& req, httplib::Response& res) { this->handle_pipeline(false, req, res); });
        server_.Get("/api/runs", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, run_log_->to_json());
        });

        server_.Get("/api/hello", [](const httplib::Request&, httplib::Response& res) { res.set_content(R"({"status": "nominal"})", "application/json"); });
    }
};

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "terrascope.json";
    terrascope::AppConfig config = terrascope::load_app_config(config_path);
    terrascope::apply_log_level(config);

    TerraScopeServer app(config);
    app.run(); // This blocks

    return 0;
}
