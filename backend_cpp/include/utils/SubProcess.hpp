#pragma once
#include <string>
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#define POPEN _popen
#define PCLOSE _pclose
#else
#include <sys/wait.h>
#define POPEN popen
#define PCLOSE pclose
#endif

namespace terrascope {

struct ProcessResult {
    std::string output;        // stdout
    std::string error_output;  // stderr
    int exit_code;
    bool success;
};

class SubProcess {
public:
    // Runs `cmd` through the shell inside `cwd`, blocking until it exits.
    // stdout is read from the pipe, stderr is captured through a temp file.
    // stdin is closed, so a prompting child sees EOF instead of blocking.
    // Throws std::runtime_error when the shell cannot be started.
    static ProcessResult run(const std::string& cmd, const std::string& cwd = "") {
        namespace fs = std::filesystem;

        long long timestamp = std::chrono::system_clock::now().time_since_epoch().count();
        fs::path err_path = fs::temp_directory_path() /
            ("terrascope_" + std::to_string(timestamp) + "_" + std::to_string(rand() % 9999) + ".stderr");

        std::string full_cmd;
        if (!cwd.empty()) {
#ifdef _WIN32
            full_cmd = "cd /d \"" + cwd + "\" && ";
#else
            full_cmd = "cd " + shell_quote(cwd) + " && ";
#endif
        }
#ifdef _WIN32
        full_cmd += cmd + " <NUL 2>" + shell_quote(err_path.string());
#else
        full_cmd += cmd + " </dev/null 2>" + shell_quote(err_path.string());
#endif

        FILE* pipe = POPEN(full_cmd.c_str(), "r");
        if (!pipe) throw std::runtime_error("popen() failed for: " + cmd);

        std::array<char, 128> buffer;
        std::string result;
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            result += buffer.data();
        }

        int status = PCLOSE(pipe);
        int rc = decode_status(status);

        std::string err;
        {
            std::ifstream f(err_path, std::ios::in | std::ios::binary);
            if (f.is_open()) {
                std::stringstream ss;
                ss << f.rdbuf();
                err = ss.str();
            }
        }
        std::error_code ec;
        fs::remove(err_path, ec);

        return { result, err, rc, rc == 0 };
    }

    static std::string shell_quote(const std::string& s) {
#ifdef _WIN32
        return "\"" + s + "\"";
#else
        std::string out = "'";
        for (char c : s) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        return out + "'";
#endif
    }

private:
    static int decode_status(int status) {
        if (status == -1) return -1;
#ifdef _WIN32
        return status;
#else
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return status;
#endif
    }
};

}
