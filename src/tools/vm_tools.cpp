#include "tools/vm_tools.hpp"
#include "common/logger.hpp"
#include "common/thread_utils.hpp"
#include "prlctl/output_parser.hpp"
#include "prlctl/sanitizer.hpp"

#include <cstdlib>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace {

struct ConfigStep {
    std::string name;
    bool completed = false;
    std::string error;
    bool retryable = true;
    std::vector<std::string> recoveryCommands;
};

struct BatchItemResult {
    std::string vmId;
    bool success = false;
    std::string message;
};

ToolResult creationFailure(const std::string& vmName, const std::string& message,
                           const std::vector<ConfigStep>& steps, bool vmCreated) {
    size_t completed = 0;
    for (const auto& step : steps) {
        completed += step.completed ? 1 : 0;
    }

    std::string text = "VM: " + vmName + "\n";
    text += "Error: " + message + "\n\n";
    text += "**Configuration Progress:** " + std::to_string(completed) + "/" +
            std::to_string(steps.size()) + " steps completed\n\n";

    if (completed > 0) {
        text += "**✅ Completed Steps:**\n";
        for (const auto& step : steps) {
            if (step.completed) {
                text += "- " + step.name + "\n";
            }
        }
        text += "\n";
    }
    if (completed < steps.size()) {
        text += "**❌ Failed Steps:**\n";
        for (const auto& step : steps) {
            if (!step.completed) {
                text += "- " + step.name;
                if (!step.error.empty()) {
                    text += ": " + step.error;
                }
                if (step.retryable) {
                    text += " (retryable)";
                }
                text += "\n";
            }
        }
        text += "\n";

        text += "**🔄 Recovery Commands:**\n```bash\n";
        for (const auto& step : steps) {
            for (const auto& command : step.recoveryCommands) {
                text += command + "\n";
            }
        }
        text += "```\n\n";
    }

    text += "**VM State:**\n";
    text += std::string("- VM Created: ") + (vmCreated ? "Yes" : "No") + "\n\n";

    text += "**🔍 Troubleshooting:**\n";
    text += "- Check VM status: `prlctl list --all`\n";
    text += "- View VM info: `prlctl list -i \"" + vmName + "\"`\n";

    return ToolResult::error("VM Creation Failed", text);
}

} // namespace

VmTools::VmTools(std::shared_ptr<CommandExecutor> executor,
                 std::shared_ptr<GuestTools> guestTools,
                 const ServerConfig& config)
    : executor_(std::move(executor))
    , guestTools_(std::move(guestTools))
    , vmBootWaitMs_(config.vmBootWaitMs)
    , batchConcurrency_(config.workerThreads) {
    const auto vmId = ArgumentRule::string("vmId", "Name or UUID of the VM").require().length(1, 256);

    schemas_["listVMs"];

    schemas_["createVM"]
        .add(ArgumentRule::string("name", "Name for the new VM").require().length(1, 100)
                 .satisfies([](const nlohmann::json& value) {
                     return !prlctl::sanitizeIdentifier(value.get<std::string>()).empty();
                 }, "must contain at least one letter, digit, '-', '_' or brace"))
        .add(ArgumentRule::string("fromTemplate", "Existing VM or template to clone"))
        .add(ArgumentRule::string("os", "Guest OS type").oneOf({"ubuntu", "debian", "windows-11", "macos", "other"}))
        .add(ArgumentRule::string("distribution", "OS distribution passed to --distribution"))
        .add(ArgumentRule::number("memory", "Memory in MB").range(512, 32768))
        .add(ArgumentRule::number("cpus", "Number of virtual CPUs").range(1, 16))
        .add(ArgumentRule::number("diskSize", "Disk size in GB").range(8, 2048))
        .add(ArgumentRule::boolean("setHostname", "Set the guest hostname to the VM name").defaultsTo(true))
        .add(ArgumentRule::boolean("createUser", "Create a guest user matching the host user").defaultsTo(false))
        .add(ArgumentRule::boolean("enableSshAuth", "Install the host SSH public key").defaultsTo(false));

    schemas_["startVM"].add(vmId);
    schemas_["stopVM"]
        .add(vmId)
        .add(ArgumentRule::boolean("force", "Kill the VM instead of a graceful shutdown").defaultsTo(false));
    schemas_["deleteVM"]
        .add(vmId)
        .add(ArgumentRule::boolean("confirm", "Must be true to delete").defaultsTo(false));
    schemas_["batchOperation"]
        .add(ArgumentRule::stringArray("targetVMs", "Names or UUIDs of the VMs").require()
                 .length(1, kMaxBatchTargets))
        .add(ArgumentRule::string("operation", "Operation to run on every VM").require()
                 .oneOf({"start", "stop", "suspend", "resume", "restart"}))
        .add(ArgumentRule::boolean("force", "Use --kill for stop").defaultsTo(false));
}

const ArgumentSchema& VmTools::schema(const std::string& toolName) const {
    return schemas_.at(toolName);
}

std::string VmTools::currentUserName() {
    if (const passwd* entry = getpwuid(geteuid())) {
        if (entry->pw_name && *entry->pw_name) {
            return entry->pw_name;
        }
    }
    if (const char* user = std::getenv("USER")) {
        return user;
    }
    return "user";
}

bool VmTools::isRunning(const std::string& vmName) {
    CommandResult result = executor_->execute({"list", "--all"});
    if (!result.success) {
        return false;
    }
    const auto vm = prlctl::findVm(prlctl::parseVmList(result.stdoutText), vmName);
    return vm && vm->status == VmStatus::Running;
}

ToolResult VmTools::listVMs(const nlohmann::json& args) {
    if (auto invalid = schema("listVMs").validate(args)) {
        return ToolResult::error("Error listing VMs", *invalid);
    }

    CommandResult result = executor_->execute({"list", "--all"});
    if (!result.success) {
        return ToolResult::error("Error listing VMs", result.error);
    }

    const auto vms = prlctl::parseVmList(result.stdoutText);

    std::string text = "## Virtual Machines\n\n";
    if (vms.empty()) {
        text += "No virtual machines found.\n";
    } else {
        text += "Found " + std::to_string(vms.size()) + " virtual machine(s):\n\n";
        for (size_t i = 0; i < vms.size(); ++i) {
            const auto& vm = vms[i];
            text += "### " + std::to_string(i + 1) + ". " + vm.name + "\n";
            text += "- **UUID**: " + vm.uuid + "\n";
            text += "- **Status**: " +
                    (vm.status == VmStatus::Unknown ? vm.statusText : vmStatusToString(vm.status)) + "\n";
            if (vm.ipAddress) {
                text += "- **IP Address**: " + *vm.ipAddress + "\n";
            }
            text += "\n";
        }
    }
    return ToolResult::text(text);
}

ToolResult VmTools::startVM(const nlohmann::json& args) {
    if (auto invalid = schema("startVM").validate(args)) {
        return ToolResult::error("Error starting VM", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");

    CommandResult result = executor_->execute({"start", prlctl::sanitizeIdentifier(vmId)});
    if (!result.success) {
        return ToolResult::error("Error starting VM", "Failed to start VM '" + vmId + "': " + result.error);
    }
    Logger::info("VM " + vmId + " started");
    return ToolResult::text("✅ **Success**\n\nVM '" + vmId + "' started successfully.\n\n" +
                            formatOutputBlock(result.stdoutText));
}

ToolResult VmTools::stopVM(const nlohmann::json& args) {
    if (auto invalid = schema("stopVM").validate(args)) {
        return ToolResult::error("Error stopping VM", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const bool force = boolArg(args, "force", false);

    std::vector<std::string> command = {"stop", prlctl::sanitizeIdentifier(vmId)};
    if (force) {
        command.push_back("--kill");
    }

    CommandResult result = executor_->execute(command);
    if (!result.success) {
        return ToolResult::error("Error stopping VM", "Failed to stop VM '" + vmId + "': " + result.error);
    }
    const std::string action = force ? "forcefully stopped" : "stopped";
    Logger::info("VM " + vmId + " " + action);
    return ToolResult::text("✅ **Success**\n\nVM '" + vmId + "' " + action + " successfully.\n\n" +
                            formatOutputBlock(result.stdoutText));
}

ToolResult VmTools::deleteVM(const nlohmann::json& args) {
    if (auto invalid = schema("deleteVM").validate(args)) {
        return ToolResult::error("Error deleting VM", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");

    if (!boolArg(args, "confirm", false)) {
        return ToolResult::text(
            "⚠️ **Confirmation Required**\n\nTo delete VM '" + vmId +
            "', please set the 'confirm' parameter to true.\n\n**Warning**: This action is irreversible "
            "and will permanently delete the VM and all its data.");
    }

    CommandResult result = executor_->execute({"delete", prlctl::sanitizeIdentifier(vmId)});
    if (!result.success) {
        return ToolResult::error("Error deleting VM", "Failed to delete VM '" + vmId + "': " + result.error);
    }
    Logger::warning("VM " + vmId + " deleted");
    return ToolResult::text("✅ **Success**\n\nVM '" + vmId + "' has been permanently deleted.\n\n" +
                            formatOutputBlock(result.stdoutText));
}

ToolResult VmTools::batchOperation(const nlohmann::json& args) {
    if (auto invalid = schema("batchOperation").validate(args)) {
        return ToolResult::error("Error executing batch operation", *invalid);
    }
    const auto targets = stringArrayArg(args, "targetVMs");
    const std::string operation = stringArg(args, "operation");
    const bool force = boolArg(args, "force", false);

    auto runOne = [this, &operation, force](const std::string& vmId) {
        std::vector<std::string> command = {operation, prlctl::sanitizeIdentifier(vmId)};
        if (operation == "stop" && force) {
            command.push_back("--kill");
        }
        CommandResult result = executor_->execute(command);
        BatchItemResult item;
        item.vmId = vmId;
        item.success = result.success;
        item.message = result.success ? operation + " completed successfully" : result.error;
        return item;
    };

    // Results come back in the order the VMs were given.
    std::vector<BatchItemResult> results;
    try {
        results = ThreadUtils::mapConcurrently(targets, runOne, batchConcurrency_);
    } catch (const std::system_error& e) {
        Logger::error("Batch " + operation + " could not start worker threads: " + e.what());
        return ToolResult::error("Error executing batch operation",
                                 "Failed to run '" + operation + "' on " + std::to_string(targets.size()) +
                                 " VM(s): " + e.what());
    }

    size_t succeeded = 0;
    for (const auto& item : results) {
        succeeded += item.success ? 1 : 0;
    }
    const size_t failed = results.size() - succeeded;
    Logger::info("Batch " + operation + ": " + std::to_string(succeeded) + " succeeded, " +
                 std::to_string(failed) + " failed");

    std::string text = "## Batch Operation Results\n\n";
    text += "**Operation**: " + operation + (force ? " (forced)" : "") + "\n";
    text += "**Target VMs**: " + std::to_string(targets.size()) + "\n";
    text += "**Successful**: " + std::to_string(succeeded) + "\n";
    text += "**Failed**: " + std::to_string(failed) + "\n\n";
    text += "### Details:\n\n";
    for (const auto& item : results) {
        text += std::string(item.success ? "✅" : "❌") + " **" + item.vmId + "**: " + item.message + "\n";
    }

    ToolResult result = ToolResult::text(text);
    result.isError = failed == results.size();
    return result;
}

ToolResult VmTools::createVM(const nlohmann::json& args) {
    if (auto invalid = schema("createVM").validate(args)) {
        return ToolResult::error("VM Creation Failed", *invalid);
    }
    const std::string name = stringArg(args, "name");
    const std::string vmName = prlctl::sanitizeIdentifier(name);
    const std::string fromTemplate = stringArg(args, "fromTemplate");
    const std::string osType = stringArg(args, "os");
    const std::string distribution = stringArg(args, "distribution");
    const auto memory = intArg(args, "memory");
    const auto cpus = intArg(args, "cpus");
    const auto diskSize = intArg(args, "diskSize");
    const bool wantHostname = boolArg(args, "setHostname", true);
    const bool wantUser = boolArg(args, "createUser", false);
    const bool wantSsh = boolArg(args, "enableSshAuth", false);

    std::vector<ConfigStep> steps;

    CommandResult listed = executor_->execute({"list", "--all"});
    if (listed.success) {
        for (const auto& vm : prlctl::parseVmList(listed.stdoutText)) {
            if (vm.name == vmName) {
                return creationFailure(vmName, "VM with name '" + name + "' already exists", steps, false);
            }
        }
    } else {
        Logger::warning("createVM: could not check for an existing VM named " + vmName);
    }

    std::vector<std::string> command;
    std::string description;
    if (!fromTemplate.empty()) {
        command = {"clone", prlctl::sanitizeIdentifier(fromTemplate), "--name", vmName};
        description = "Cloning VM from template '" + fromTemplate + "' as '" + name + "'";
    } else {
        command = {"create", vmName};
        if (!osType.empty()) {
            command.push_back("--ostype");
            command.push_back(osType);
        }
        if (!distribution.empty()) {
            command.push_back("--distribution");
            command.push_back(distribution);
        }
        description = "Creating new VM '" + name + "'";
        if (!osType.empty()) {
            description += " with OS type '" + osType + "'";
        }
    }

    CommandResult created = executor_->execute(command);
    if (!created.success) {
        std::string retry = "prlctl";
        for (const auto& arg : command) {
            retry += " " + arg;
        }
        steps.push_back({"VM Creation", false, created.error, true, {"# Retry VM creation", retry}});
        return creationFailure(vmName, created.error, steps, false);
    }
    steps.push_back({"VM Creation", true, "", false, {}});
    Logger::info("Created VM " + vmName);

    std::vector<std::string> hardwareResults;
    if (fromTemplate.empty() && (memory || cpus || diskSize)) {
        ConfigStep hardware{"Hardware Configuration", true, "", true, {}};
        std::vector<std::pair<std::vector<std::string>, std::string>> settings;
        if (memory) {
            settings.push_back({{"set", vmName, "--memsize", std::to_string(*memory)},
                                "Memory: " + std::to_string(*memory) + "MB"});
        }
        if (cpus) {
            settings.push_back({{"set", vmName, "--cpus", std::to_string(*cpus)},
                                "CPUs: " + std::to_string(*cpus)});
        }
        if (diskSize) {
            settings.push_back({{"set", vmName, "--device-set", "hdd0", "--size", std::to_string(*diskSize) + "G"},
                                "Disk: " + std::to_string(*diskSize) + "GB"});
        }
        for (const auto& setting : settings) {
            std::string manual = "prlctl";
            for (const auto& arg : setting.first) {
                manual += " " + arg;
            }
            hardware.recoveryCommands.push_back(manual);
            if (!hardware.completed) {
                continue;
            }
            CommandResult applied = executor_->execute(setting.first);
            if (applied.success) {
                hardwareResults.push_back(setting.second);
            } else {
                hardware.completed = false;
                hardware.error = applied.error;
                hardwareResults.push_back("⚠️ Hardware configuration failed: " + applied.error);
            }
        }
        if (hardware.completed) {
            hardware.recoveryCommands.clear();
        }
        steps.push_back(hardware);
    }

    std::vector<std::string> postConfigResults;
    const std::string username = currentUserName();
    if (wantHostname || wantUser || wantSsh) {
        const bool wasRunning = isRunning(vmName);
        bool startedHere = false;
        if (!wasRunning) {
            CommandResult started = executor_->execute({"start", vmName});
            if (started.success) {
                steps.push_back({"VM Start for Configuration", true, "", true, {}});
                startedHere = true;
                ThreadUtils::sleepFor(std::chrono::milliseconds(vmBootWaitMs_));
            } else {
                steps.push_back({"VM Start for Configuration", false, started.error, true,
                                 {"prlctl start " + vmName}});
                postConfigResults.push_back(
                    "⚠️ VM could not be started for configuration. Skipping hostname and user setup.");
            }
        }

        if (isRunning(vmName)) {
            if (wantHostname) {
                const std::string hostname = prlctl::sanitizeHostname(name);
                ToolResult hostnameResult = guestTools_->setHostname({{"vmId", name}, {"hostname", hostname}});
                if (hostnameResult.isError) {
                    steps.push_back({"Hostname Configuration", false, "Hostname setting failed", true,
                                     {"prlctl exec " + vmName + " \"sudo hostnamectl set-hostname " + hostname + "\""}});
                    postConfigResults.push_back("⚠️ Hostname setting failed");
                } else {
                    steps.push_back({"Hostname Configuration", true, "", true, {}});
                    postConfigResults.push_back("Hostname set to: " + hostname);
                }
            }

            if (wantUser || wantSsh) {
                ToolResult sshResult = guestTools_->manageSshAuth(
                    {{"vmId", name}, {"username", username}, {"enablePasswordlessSudo", true}});
                if (sshResult.isError) {
                    steps.push_back({"User and SSH Configuration", false, "SSH configuration failed", true,
                                     {"prlctl exec " + vmName + " \"sudo useradd -m -s /bin/bash " + username + "\"",
                                      "prlctl exec " + vmName + " \"sudo usermod -aG sudo " + username + "\""}});
                    postConfigResults.push_back("⚠️ User/SSH setup failed");
                } else {
                    steps.push_back({"User and SSH Configuration", true, "", true, {}});
                    postConfigResults.push_back("User '" + username + "' created with passwordless sudo and SSH access");
                }
            }

            if (startedHere) {
                CommandResult stopped = executor_->execute({"stop", vmName});
                if (stopped.success) {
                    steps.push_back({"VM Stop after Configuration", true, "", true, {}});
                } else {
                    steps.push_back({"VM Stop after Configuration", false, stopped.error, true,
                                     {"prlctl stop " + vmName, "prlctl stop " + vmName + " --kill"}});
                    postConfigResults.push_back("⚠️ VM could not be stopped: " + stopped.error);
                }
            }
        }
    }

    std::string text = "✅ **Success**\n\n" + description + "\n\n";
    text += "**VM Created:**\n- Name: " + name + "\n";
    for (const auto& line : hardwareResults) {
        text += "- " + line + "\n";
    }
    if (!postConfigResults.empty()) {
        text += "\n**Post-Creation Configuration:**\n";
        for (const auto& line : postConfigResults) {
            text += "- " + line + "\n";
        }
    }

    if (steps.size() > 1) {
        size_t completed = 0;
        for (const auto& step : steps) {
            completed += step.completed ? 1 : 0;
        }
        text += "\n**Configuration Summary:** " + std::to_string(completed) + "/" +
                std::to_string(steps.size()) + " steps completed\n";

        if (completed < steps.size()) {
            text += "\n**⚠️ Failed Steps:**\n";
            for (const auto& step : steps) {
                if (!step.completed) {
                    text += "- " + step.name + (step.error.empty() ? "" : ": " + step.error) +
                            (step.retryable ? " (retryable)" : "") + "\n";
                }
            }

            text += "\n**🛠️ Manual Completion Options:**\n";
            for (const auto& step : steps) {
                if (step.completed) {
                    continue;
                }
                if (step.name == "Hostname Configuration") {
                    text += "- **Set Hostname:** Use `setHostname` tool with vmId: \"" + vmName +
                            "\", hostname: \"" + prlctl::sanitizeHostname(name) + "\"\n";
                } else if (step.name == "User and SSH Configuration") {
                    text += "- **Setup SSH:** Use `manageSshAuth` tool with vmId: \"" + vmName +
                            "\", username: \"" + username + "\"\n";
                } else if (!step.recoveryCommands.empty()) {
                    text += "- **" + step.name + ":** Run recovery commands\n";
                }
            }

            text += "\n**🔄 Recovery Commands:**\n```bash\n";
            for (const auto& step : steps) {
                if (!step.completed) {
                    for (const auto& recovery : step.recoveryCommands) {
                        text += recovery + "\n";
                    }
                }
            }
            text += "```\n";
        }
    }

    text += "\n**📋 VM Management:**\n";
    text += "- Start VM: `prlctl start \"" + vmName + "\"`\n";
    text += "- Stop VM: `prlctl stop \"" + vmName + "\"`\n";
    text += "- VM Status: `prlctl list | grep \"" + vmName + "\"`\n";
    text += "- VM Info: `prlctl list -i \"" + vmName + "\"`\n";
    text += "\n" + formatOutputBlock(created.stdoutText);
    return ToolResult::text(text);
}
