#include "terraform/CommandRunner.hpp"
#include "utils/SubProcess.hpp"

namespace terrascope {

namespace fs = std::filesystem;

CommandResult ShellCommandRunner::run(const std::string& subcommand,
                                      const std::vector<std::string>& args,
                                      const fs::path& cwd) {
    std::string cmd = SubProcess::shell_quote(binary_) + " " + subcommand;
    for (const auto& a : args) cmd += " " + SubProcess::shell_quote(a);

    ProcessResult p = SubProcess::run(cmd, cwd.string());
    return {p.exit_code, p.output, p.error_output};
}

}
