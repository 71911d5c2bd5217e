#pragma once
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/Result.hpp"
#include "terraform/TerraformRunner.hpp"

namespace terrascope {

// Receives the output of the step before it (plan / init) and decides
// whether the destructive step runs.
using ConfirmFn = std::function<bool(const std::string& preview)>;

// Writes the configuration document before terraform runs.
using SaveFn = std::function<OpResult()>;

struct PipelineStep {
    std::string name;      // "save", "init", "plan", "confirm", "apply", "destroy"
    bool success;
    std::string message;
};

struct PipelineResult {
    bool success = true;
    bool executed = false; // apply/destroy actually ran
    std::string message;   // message of the last step
    std::vector<PipelineStep> steps;

    nlohmann::json to_json() const;
};

// init -> plan -> confirm -> apply as discrete blocking steps. The first
// failing step ends the run and its message is the result's message.
class DeploymentPipeline {
public:
    DeploymentPipeline(TerraformRunner& runner, SaveFn save = nullptr)
        : runner_(runner), save_(std::move(save)) {}

    // save -> init -> plan -> confirm(plan output) -> apply -auto-approve
    PipelineResult deploy(const ConfirmFn& confirm);

    // save -> init -> confirm(init output) -> destroy -auto-approve
    PipelineResult teardown(const ConfirmFn& confirm);

private:
    TerraformRunner& runner_;
    SaveFn save_;

    bool run_save(PipelineResult& result);
    static bool record(PipelineResult& result, const std::string& name, const StepResult& step);
    static bool run_confirm(PipelineResult& result, const ConfirmFn& confirm,
                            const std::string& preview, const std::string& action);
};

}
