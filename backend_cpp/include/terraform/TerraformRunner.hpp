#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "RunLog.hpp"
#include "terraform/CommandRunner.hpp"

namespace terrascope {

struct StepResult {
    bool success;
    std::string message;   // stdout when the command succeeded, stderr otherwise

    nlohmann::json to_json() const {
        return {{"success", success}, {"message", message}};
    }
};

class TerraformRunner {
public:
    TerraformRunner(std::shared_ptr<ICommandRunner> runner,
                    const std::filesystem::path& working_dir = "output",
                    std::shared_ptr<RunLog> run_log = nullptr);

    // command = {"init", "-no-color"}. A runner that throws is reported as
    // exit code 1 with the exception text as stderr.
    CommandResult run_command(const std::vector<std::string>& command);

    StepResult init();
    StepResult plan();
    StepResult apply(bool auto_approve = false);
    StepResult destroy(bool auto_approve = false);

    const std::filesystem::path& working_dir() const { return working_dir_; }

private:
    std::shared_ptr<ICommandRunner> runner_;
    std::filesystem::path working_dir_;
    std::shared_ptr<RunLog> run_log_;

    void ensure_dir_exists();
    StepResult to_step(const CommandResult& r) const {
        return {r.exit_code == 0, r.exit_code == 0 ? r.stdout_text : r.stderr_text};
    }
};

}
