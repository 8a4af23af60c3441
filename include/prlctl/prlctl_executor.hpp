#pragma once

#include "common/server_config.hpp"
#include "prlctl/command_executor.hpp"
#include <cstddef>
#include <string>
#include <vector>

// Spawns prlctl with fork/execvp. No shell is involved, so arguments reach
// prlctl exactly as given. stdin is /dev/null.
class PrlctlExecutor : public CommandExecutor {
public:
    explicit PrlctlExecutor(const ServerConfig& config);
    PrlctlExecutor(std::string executable, int timeoutMs, size_t maxOutputBytes);

    CommandResult execute(const std::vector<std::string>& args) override;

    const std::string& executable() const { return executable_; }

    // "prlctl command failed: <reason>\nstdout: ...\nstderr: ..."
    static std::string formatFailure(const std::string& reason,
                                     const std::string& stdoutText,
                                     const std::string& stderrText);

private:
    std::string describe(const std::vector<std::string>& args) const;

    std::string executable_;
    int timeoutMs_;
    size_t maxOutputBytes_;
};
