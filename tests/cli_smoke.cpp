#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }

    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("CPANBRIDGE_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "CPANBRIDGE_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();
    const std::string missing_socket = "/tmp/cpanbridge_cli_missing_" + std::to_string(::getpid()) + ".sock";

    {
        const auto result = run_cli(executable, "--version");
        if (result.exit_code != 0 || !expect_contains(result.output, "cpanbridge ")) {
            std::cerr << "--version failed: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--help");
        if (result.exit_code != 0 || !expect_contains(result.output, "serve")) {
            std::cerr << "--help did not list the commands: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "");
        if (result.exit_code != 1) {
            std::cerr << "Running without a command should fail" << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--bogus ping");
        if (result.exit_code != 1 || !expect_contains(result.output, "E_UNKNOWN_OPTION")) {
            std::cerr << "Unknown option was not reported: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "frobnicate");
        if (result.exit_code != 1 || !expect_contains(result.output, "E_UNKNOWN_COMMAND")) {
            std::cerr << "Unknown command was not reported: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--socket " + missing_socket + " call test ping '{oops'");
        if (result.exit_code != 1 || !expect_contains(result.output, "E_INVALID_JSON")) {
            std::cerr << "Invalid JSON parameters were not reported: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--socket " + missing_socket + " call test");
        if (result.exit_code != 1 || !expect_contains(result.output, "E_USAGE")) {
            std::cerr << "Incomplete call was not reported: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--socket " + missing_socket + " ping");
        if (result.exit_code != 2 || !expect_contains(result.output, "E_DAEMON_UNREACHABLE")) {
            std::cerr << "Unreachable daemon was not reported: " << result.output << std::endl;
            return 1;
        }
    }

    {
        const auto result = run_cli(executable, "--socket " + missing_socket + " --max-connections lots ping");
        if (result.exit_code != 1 || !expect_contains(result.output, "E_INVALID_VALUE")) {
            std::cerr << "Invalid option value was not reported: " << result.output << std::endl;
            return 1;
        }
    }

    return 0;
}
