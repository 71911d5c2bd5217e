#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace terrascope {

struct CommandResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

// Runs one terraform subcommand synchronously, buffering all output.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult run(const std::string& subcommand,
                              const std::vector<std::string>& args,
                              const std::filesystem::path& cwd) = 0;
};

class ShellCommandRunner : public ICommandRunner {
public:
    explicit ShellCommandRunner(std::string binary = "terraform") : binary_(std::move(binary)) {}

    // Throws std::runtime_error when the process cannot be launched.
    CommandResult run(const std::string& subcommand,
                      const std::vector<std::string>& args,
                      const std::filesystem::path& cwd) override;

    const std::string& binary() const { return binary_; }

private:
    std::string binary_;
};

}
