#pragma once
#include <functional>
#include <string>

struct CommandResult {
    int exitCode = -1;
    std::string output;         // captured stdout
    std::string errorOutput;    // captured stderr

    bool ok() const { return exitCode == 0; }
};

// Runs a shell command line, capturing stdout and stderr separately.
// Throws std::runtime_error if the process cannot be spawned.
CommandResult runCommand(const std::string& commandLine);

using CommandRunner = std::function<CommandResult(const std::string&)>;
