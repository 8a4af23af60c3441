#pragma once

#include "prlctl/command_executor.hpp"
#include "prlctl/prlctl_executor.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Records every argument vector and answers with scripted results. Rules are
// checked in this order: contains-rules, queued one-shot results, per
// subcommand results, then an empty success.
class FakeExecutor : public CommandExecutor {
public:
    static CommandResult ok(const std::string& stdoutText = "") {
        CommandResult result;
        result.success = true;
        result.exitCode = 0;
        result.stdoutText = stdoutText;
        return result;
    }

    static CommandResult fail(const std::string& stderrText, int exitCode = 1) {
        CommandResult result;
        result.success = false;
        result.exitCode = exitCode;
        result.stderrText = stderrText;
        result.error = PrlctlExecutor::formatFailure("exit code " + std::to_string(exitCode), "", stderrText);
        return result;
    }

    void respond(const std::string& subcommand, CommandResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        bySubcommand_[subcommand] = std::move(result);
    }

    void respondOnce(const std::string& subcommand, CommandResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        once_[subcommand].push_back(std::move(result));
    }

    // Matches when the space-joined argument vector contains needle.
    void respondWhenContains(const std::string& needle, CommandResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        contains_.emplace_back(needle, std::move(result));
    }

    CommandResult execute(const std::vector<std::string>& args) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(args);

        std::string joined;
        for (const auto& arg : args) {
            joined += (joined.empty() ? "" : " ") + arg;
        }
        for (const auto& rule : contains_) {
            if (joined.find(rule.first) != std::string::npos) {
                return rule.second;
            }
        }

        const std::string subcommand = args.empty() ? "" : args.front();
        auto queued = once_.find(subcommand);
        if (queued != once_.end() && !queued->second.empty()) {
            CommandResult result = queued->second.front();
            queued->second.pop_front();
            return result;
        }
        auto fixed = bySubcommand_.find(subcommand);
        if (fixed != bySubcommand_.end()) {
            return fixed->second;
        }
        return ok();
    }

    std::vector<std::vector<std::string>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::vector<std::string>> callsFor(const std::string& subcommand) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::vector<std::string>> matching;
        for (const auto& call : calls_) {
            if (!call.empty() && call.front() == subcommand) {
                matching.push_back(call);
            }
        }
        return matching;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> calls_;
    std::vector<std::pair<std::string, CommandResult>> contains_;
    std::map<std::string, std::deque<CommandResult>> once_;
    std::map<std::string, CommandResult> bySubcommand_;
};
