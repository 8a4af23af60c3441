#pragma once

#include <string>
#include <vector>

struct CommandResult {
    bool success{false};
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    std::string error;          // formatted failure message, empty on success
    bool timedOut{false};
    bool truncated{false};
};

// Runs one prlctl subcommand. Implementations are called concurrently from the
// request pool and from batch fan-out, so execute() must be thread-safe.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // args excludes the executable itself, e.g. {"start", "{uuid}"}.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
};
