#include "terraform/TerraformRunner.hpp"
#include <chrono>
#include <numeric>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace terrascope {

namespace fs = std::filesystem;

namespace {

// Invalid UTF-8 sequences become U+FFFD so the text can always be dumped as JSON.
std::string to_valid_utf8(const std::string& text) {
    std::string dumped = nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(dumped).get<std::string>();
}

}

TerraformRunner::TerraformRunner(std::shared_ptr<ICommandRunner> runner,
                                 const fs::path& working_dir,
                                 std::shared_ptr<RunLog> run_log)
    : runner_(std::move(runner)), working_dir_(working_dir), run_log_(std::move(run_log)) {
    ensure_dir_exists();
}

void TerraformRunner::ensure_dir_exists() {
    std::error_code ec;
    fs::create_directories(working_dir_, ec);
    if (ec) {
        spdlog::error("❌ Cannot create working directory {}: {}", working_dir_.string(), ec.message());
    }
}

CommandResult TerraformRunner::run_command(const std::vector<std::string>& command) {
    std::string line = std::accumulate(command.begin(), command.end(), std::string("terraform"),
                                       [](std::string acc, const std::string& part) { return acc + " " + part; });
    spdlog::info("🛠️ Running: {}", line);

    auto t_start = std::chrono::high_resolution_clock::now();
    CommandResult result;
    if (command.empty()) {
        result = {1, "", "No terraform subcommand given"};
    } else {
        try {
            std::vector<std::string> args(command.begin() + 1, command.end());
            result = runner_->run(command.front(), args, working_dir_);
        } catch (const std::exception& e) {
            spdlog::error("💥 Error running Terraform command: {}", e.what());
            result = {1, "", e.what()};
        }
    }
    auto t_end = std::chrono::high_resolution_clock::now();
    result.stdout_text = to_valid_utf8(result.stdout_text);
    result.stderr_text = to_valid_utf8(result.stderr_text);
    double ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    if (result.exit_code == 0) {
        spdlog::info("✅ Command completed successfully in {:.2f} ms", ms);
    } else {
        spdlog::error("❌ Command failed with code {}", result.exit_code);
    }

    if (run_log_) {
        RunRecord record;
        record.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        record.command = line;
        record.exit_code = result.exit_code;
        record.duration_ms = ms;
        record.output = result.exit_code == 0 ? result.stdout_text : result.stderr_text;
        run_log_->add(record);
    }
    return result;
}

StepResult TerraformRunner::init() {
    return to_step(run_command({"init", "-no-color"}));
}

StepResult TerraformRunner::plan() {
    return to_step(run_command({"plan", "-no-color"}));
}

StepResult TerraformRunner::apply(bool auto_approve) {
    std::vector<std::string> command = {"apply", "-no-color"};
    if (auto_approve) command.push_back("-auto-approve");
    return to_step(run_command(command));
}

StepResult TerraformRunner::destroy(bool auto_approve) {
    std::vector<std::string> command = {"destroy", "-no-color"};
    if (auto_approve) command.push_back("-auto-approve");
    return to_step(run_command(command));
}

}
