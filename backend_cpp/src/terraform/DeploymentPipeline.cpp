#include "terraform/DeploymentPipeline.hpp"
#include <spdlog/spdlog.h>

namespace terrascope {

nlohmann::json PipelineResult::to_json() const {
    nlohmann::json steps_json = nlohmann::json::array();
    for (const auto& s : steps) {
        steps_json.push_back({{"step", s.name}, {"success", s.success}, {"message", s.message}});
    }
    return {
        {"success", success},
        {"executed", executed},
        {"message", message},
        {"steps", steps_json}
    };
}

bool DeploymentPipeline::record(PipelineResult& result, const std::string& name, const StepResult& step) {
    result.steps.push_back({name, step.success, step.message});
    result.message = step.message;
    if (!step.success) {
        result.success = false;
        spdlog::error("🛑 Pipeline stopped: terraform {} failed", name);
    }
    return step.success;
}

bool DeploymentPipeline::run_save(PipelineResult& result) {
    if (!save_) return true;
    OpResult saved = save_();
    result.steps.push_back({"save", saved.success, saved.message});
    result.message = saved.message;
    if (!saved.success) {
        result.success = false;
        spdlog::error("🛑 Pipeline stopped: configuration could not be saved");
    }
    return saved.success;
}

bool DeploymentPipeline::run_confirm(PipelineResult& result, const ConfirmFn& confirm,
                                     const std::string& preview, const std::string& action) {
    bool approved = confirm && confirm(preview);
    std::string msg = approved ? action + " approved" : action + " cancelled by user";
    result.steps.push_back({"confirm", true, msg});
    if (!approved) {
        result.message = msg;
        spdlog::info("✋ {}", msg);
    }
    return approved;
}

PipelineResult DeploymentPipeline::deploy(const ConfirmFn& confirm) {
    PipelineResult result;
    if (!run_save(result)) return result;
    if (!record(result, "init", runner_.init())) return result;

    StepResult plan = runner_.plan();
    if (!record(result, "plan", plan)) return result;

    if (!run_confirm(result, confirm, plan.message, "Apply")) return result;

    result.executed = true;
    if (record(result, "apply", runner_.apply(true))) {
        spdlog::info("🚀 Terraform apply completed successfully");
    }
    return result;
}

PipelineResult DeploymentPipeline::teardown(const ConfirmFn& confirm) {
    PipelineResult result;
    if (!run_save(result)) return result;

    StepResult init = runner_.init();
    if (!record(result, "init", init)) return result;

    if (!run_confirm(result, confirm, init.message, "Destroy")) return result;

    result.executed = true;
    if (record(result, "destroy", runner_.destroy(true))) {
        spdlog::info("🧹 Terraform destroy completed successfully");
    }
    return result;
}

}
