#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include "RunLog.hpp"
#include "terraform/CommandRunner.hpp"
#include "terraform/DeploymentPipeline.hpp"
#include "terraform/TerraformRunner.hpp"

namespace tests
{
    using namespace terrascope;
    namespace fs = std::filesystem;

    struct Invocation
    {
        std::string subcommand;
        std::vector<std::string> args;
        fs::path cwd;
    };

    // Replays scripted results in order and records every call.
    class ScriptedRunner : public ICommandRunner
    {
    public:
        std::deque<CommandResult> script;
        std::vector<Invocation> calls;
        bool throw_on_run = false;

        CommandResult run(const std::string& subcommand,
                          const std::vector<std::string>& args,
                          const fs::path& cwd) override
        {
            calls.push_back({subcommand, args, cwd});
            if (throw_on_run)
            {
                throw std::runtime_error("terraform: executable file not found");
            }
            if (script.empty())
            {
                return {0, subcommand + " ok", ""};
            }
            CommandResult next = script.front();
            script.pop_front();
            return next;
        }
    };

    class TerraformRunnerTest : public ::testing::Test
    {
    protected:
        fs::path work_dir;
        std::shared_ptr<ScriptedRunner> fake;

        void SetUp() override
        {
            work_dir = fs::temp_directory_path() /
                       (std::string("terrascope_tf_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(work_dir);
            fake = std::make_shared<ScriptedRunner>();
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(work_dir, ec);
        }
    };

    TEST_F(TerraformRunnerTest, CreatesWorkingDirectory)
    {
        TerraformRunner runner(fake, work_dir);
        EXPECT_TRUE(fs::is_directory(work_dir));
        EXPECT_EQ(runner.working_dir(), work_dir);
    }

    TEST_F(TerraformRunnerTest, SubcommandsPassNoColorAndWorkingDir)
    {
        TerraformRunner runner(fake, work_dir);
        runner.init();
        runner.plan();
        runner.apply();
        runner.destroy(true);

        ASSERT_EQ(fake->calls.size(), 4u);
        EXPECT_EQ(fake->calls[0].subcommand, "init");
        EXPECT_EQ(fake->calls[0].args, std::vector<std::string>{"-no-color"});
        EXPECT_EQ(fake->calls[1].subcommand, "plan");
        EXPECT_EQ(fake->calls[2].subcommand, "apply");
        EXPECT_EQ(fake->calls[2].args, std::vector<std::string>{"-no-color"});
        EXPECT_EQ(fake->calls[3].subcommand, "destroy");
        EXPECT_EQ(fake->calls[3].args, (std::vector<std::string>{"-no-color", "-auto-approve"}));
        for (const auto& call : fake->calls)
        {
            EXPECT_EQ(call.cwd, work_dir);
        }
    }

    TEST_F(TerraformRunnerTest, MessageIsStdoutOnSuccessAndStderrOnFailure)
    {
        fake->script = {{0, "Terraform has been successfully initialized!", "warning text"},
                        {1, "partial plan", "Error: Invalid reference"}};
        TerraformRunner runner(fake, work_dir);

        StepResult init = runner.init();
        EXPECT_TRUE(init.success);
        EXPECT_EQ(init.message, "Terraform has been successfully initialized!");

        StepResult plan = runner.plan();
        EXPECT_FALSE(plan.success);
        EXPECT_EQ(plan.message, "Error: Invalid reference");

        auto j = plan.to_json();
        EXPECT_EQ(j["success"], false);
        EXPECT_EQ(j["message"], "Error: Invalid reference");
    }

    TEST_F(TerraformRunnerTest, LaunchFailureBecomesExitCodeOne)
    {
        fake->throw_on_run = true;
        TerraformRunner runner(fake, work_dir);

        CommandResult r = runner.run_command({"init", "-no-color"});
        EXPECT_EQ(r.exit_code, 1);
        EXPECT_EQ(r.stdout_text, "");
        EXPECT_EQ(r.stderr_text, "terraform: executable file not found");

        StepResult step = runner.plan();
        EXPECT_FALSE(step.success);
        EXPECT_EQ(step.message, "terraform: executable file not found");
    }

    TEST_F(TerraformRunnerTest, EmptyCommandFails)
    {
        TerraformRunner runner(fake, work_dir);
        EXPECT_EQ(runner.run_command({}).exit_code, 1);
        EXPECT_TRUE(fake->calls.empty());
    }

    TEST_F(TerraformRunnerTest, RunsAreRecorded)
    {
        auto log = std::make_shared<RunLog>();
        fake->script = {{0, "init done", ""}, {1, "", "plan broke"}};
        TerraformRunner runner(fake, work_dir, log);

        runner.init();
        runner.plan();

        auto records = log->records();
        ASSERT_EQ(records.size(), 2u);
        EXPECT_EQ(records[0].command, "terraform init -no-color");
        EXPECT_EQ(records[0].exit_code, 0);
        EXPECT_EQ(records[0].output, "init done");
        EXPECT_EQ(records[1].command, "terraform plan -no-color");
        EXPECT_EQ(records[1].exit_code, 1);
        EXPECT_EQ(records[1].output, "plan broke");
        EXPECT_GE(records[1].duration_ms, 0.0);

        // Newest first
        auto j = log->to_json();
        ASSERT_EQ(j.size(), 2u);
        EXPECT_EQ(j[0]["command"], "terraform plan -no-color");
    }

    TEST_F(TerraformRunnerTest, RunLogIsBoundedAndPersisted)
    {
        fs::create_directories(work_dir);
        std::string history = (work_dir / "history" / "runs.json").string();
        {
            RunLog log(history);
            for (int i = 0; i < 60; ++i)
            {
                RunRecord r;
                r.command = "terraform plan #" + std::to_string(i);
                r.exit_code = i % 2;
                log.add(r);
            }
            EXPECT_EQ(log.records().size(), RunLog::kMaxRecords);
            EXPECT_EQ(log.records().front().command, "terraform plan #10");
        }

        RunLog reloaded(history);
        auto records = reloaded.records();
        ASSERT_EQ(records.size(), RunLog::kMaxRecords);
        EXPECT_EQ(records.back().command, "terraform plan #59");
        EXPECT_EQ(records.back().exit_code, 1);
    }

    TEST_F(TerraformRunnerTest, CorruptHistoryStartsFresh)
    {
        fs::create_directories(work_dir);
        fs::path history = work_dir / "runs.json";
        std::ofstream(history) << "not json";

        RunLog log(history.string());
        EXPECT_TRUE(log.records().empty());
    }

    TEST_F(TerraformRunnerTest, NonUtf8OutputIsReplaced)
    {
        auto log = std::make_shared<RunLog>();
        fake->script = {{1, "", "Error: \xff\xfe bad bytes"}};
        TerraformRunner runner(fake, work_dir, log);

        StepResult step = runner.plan();
        EXPECT_FALSE(step.success);
        EXPECT_EQ(step.message.rfind("Error: ", 0), 0u);
        EXPECT_NE(step.message.find("bad bytes"), std::string::npos);
        EXPECT_EQ(step.message.find('\xff'), std::string::npos);

        EXPECT_NO_THROW(step.to_json().dump());
        EXPECT_NO_THROW(log->to_json().dump());
    }

    TEST_F(TerraformRunnerTest, NonUtf8RecordDoesNotWipeHistory)
    {
        fs::create_directories(work_dir);
        std::string history = (work_dir / "runs.json").string();
        {
            RunLog log(history);
            RunRecord ok;
            ok.command = "terraform init -no-color";
            log.add(ok);

            RunRecord raw;
            raw.command = "terraform plan -no-color";
            raw.exit_code = 1;
            raw.output = "Fehler: \xe4nderung";
            log.add(raw);
        }

        RunLog reloaded(history);
        auto records = reloaded.records();
        ASSERT_EQ(records.size(), 2u);
        EXPECT_EQ(records[0].command, "terraform init -no-color");
        EXPECT_EQ(records[1].exit_code, 1);
        EXPECT_EQ(records[1].output.rfind("Fehler: ", 0), 0u);
        EXPECT_FALSE(fs::exists(history + ".tmp"));
    }

    // --- Pipeline ---

    TEST_F(TerraformRunnerTest, DeployRunsEveryStepWhenConfirmed)
    {
        fake->script = {{0, "initialized", ""}, {0, "Plan: 1 to add", ""}, {0, "Apply complete!", ""}};
        TerraformRunner runner(fake, work_dir);
        int saves = 0;
        DeploymentPipeline pipeline(runner, [&] { ++saves; return OpResult::ok("main.tf"); });

        std::string previewed;
        PipelineResult result = pipeline.deploy([&](const std::string& preview) {
            previewed = preview;
            return true;
        });

        EXPECT_TRUE(result.success);
        EXPECT_TRUE(result.executed);
        EXPECT_EQ(result.message, "Apply complete!");
        EXPECT_EQ(previewed, "Plan: 1 to add");
        EXPECT_EQ(saves, 1);

        ASSERT_EQ(fake->calls.size(), 3u);
        EXPECT_EQ(fake->calls[2].subcommand, "apply");
        EXPECT_EQ(fake->calls[2].args, (std::vector<std::string>{"-no-color", "-auto-approve"}));

        std::vector<std::string> names;
        for (const auto& s : result.steps) names.push_back(s.name);
        EXPECT_EQ(names, (std::vector<std::string>{"save", "init", "plan", "confirm", "apply"}));
    }

    TEST_F(TerraformRunnerTest, DeployStopsAtFirstFailure)
    {
        fake->script = {{1, "", "Error: Failed to query available provider packages"}};
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner);

        bool asked = false;
        PipelineResult result = pipeline.deploy([&](const std::string&) { return asked = true; });

        EXPECT_FALSE(result.success);
        EXPECT_FALSE(result.executed);
        EXPECT_FALSE(asked);
        EXPECT_EQ(result.message, "Error: Failed to query available provider packages");
        ASSERT_EQ(fake->calls.size(), 1u);
        EXPECT_EQ(fake->calls[0].subcommand, "init");
    }

    TEST_F(TerraformRunnerTest, DeployStopsWhenPlanFails)
    {
        fake->script = {{0, "initialized", ""}, {1, "", "Error: Unsupported argument"}};
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner);

        PipelineResult result = pipeline.deploy([](const std::string&) { return true; });

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.message, "Error: Unsupported argument");
        EXPECT_EQ(fake->calls.size(), 2u);
    }

    TEST_F(TerraformRunnerTest, DeclinedConfirmationSkipsApply)
    {
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner);

        PipelineResult result = pipeline.deploy([](const std::string&) { return false; });

        EXPECT_TRUE(result.success);
        EXPECT_FALSE(result.executed);
        EXPECT_EQ(result.message, "Apply cancelled by user");
        ASSERT_EQ(fake->calls.size(), 2u);
        EXPECT_EQ(fake->calls[1].subcommand, "plan");

        // No decision function counts as a decline
        PipelineResult unattended = pipeline.deploy(nullptr);
        EXPECT_FALSE(unattended.executed);
    }

    TEST_F(TerraformRunnerTest, SaveFailureStopsBeforeTerraform)
    {
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner, [] { return OpResult::fail(ErrorKind::WRITE, "disk full"); });

        PipelineResult result = pipeline.deploy([](const std::string&) { return true; });

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.message, "disk full");
        EXPECT_TRUE(fake->calls.empty());
    }

    TEST_F(TerraformRunnerTest, TeardownInitsThenDestroys)
    {
        fake->script = {{0, "initialized", ""}, {0, "Destroy complete!", ""}};
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner);

        PipelineResult result = pipeline.teardown([](const std::string&) { return true; });

        EXPECT_TRUE(result.success);
        EXPECT_TRUE(result.executed);
        EXPECT_EQ(result.message, "Destroy complete!");
        ASSERT_EQ(fake->calls.size(), 2u);
        EXPECT_EQ(fake->calls[1].subcommand, "destroy");
        EXPECT_EQ(fake->calls[1].args, (std::vector<std::string>{"-no-color", "-auto-approve"}));

        auto j = result.to_json();
        EXPECT_EQ(j["executed"], true);
        EXPECT_EQ(j["steps"].size(), 3u);
    }

    TEST_F(TerraformRunnerTest, TeardownCanBeCancelled)
    {
        TerraformRunner runner(fake, work_dir);
        DeploymentPipeline pipeline(runner);

        PipelineResult result = pipeline.teardown([](const std::string&) { return false; });

        EXPECT_TRUE(result.success);
        EXPECT_FALSE(result.executed);
        EXPECT_EQ(result.message, "Destroy cancelled by user");
        EXPECT_EQ(fake->calls.size(), 1u);
    }

#ifndef _WIN32
    TEST_F(TerraformRunnerTest, ShellRunnerCapturesStreamsAndExitCode)
    {
        fs::create_directories(work_dir);
        ShellCommandRunner shell("sh");

        CommandResult r = shell.run("-c", {"pwd; echo oops 1>&2; exit 3"}, work_dir);
        EXPECT_EQ(r.exit_code, 3);
        fs::path reported(r.stdout_text.substr(0, r.stdout_text.find('\n')));
        EXPECT_EQ(fs::canonical(reported), fs::canonical(work_dir));
        EXPECT_EQ(r.stderr_text, "oops\n");
    }

    TEST_F(TerraformRunnerTest, ShellRunnerDoesNotWaitOnStdin)
    {
        fs::create_directories(work_dir);
        ShellCommandRunner shell("sh");

        auto start = std::chrono::steady_clock::now();
        CommandResult r = shell.run("-c", {"echo 'Enter a value:'; read answer; echo answer=$answer"}, work_dir);
        auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(r.stdout_text, "Enter a value:\nanswer=\n");
        EXPECT_EQ(r.exit_code, 0);
        EXPECT_LT(elapsed, std::chrono::seconds(5));
    }

    TEST_F(TerraformRunnerTest, ShellRunnerReportsMissingBinary)
    {
        fs::create_directories(work_dir);
        auto shell = std::make_shared<ShellCommandRunner>("terrascope-no-such-binary");
        TerraformRunner runner(shell, work_dir);

        StepResult step = runner.init();
        EXPECT_FALSE(step.success);
        EXPECT_NE(step.message.find("terrascope-no-such-binary"), std::string::npos);
    }
#endif
}
