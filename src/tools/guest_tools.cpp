#include "tools/guest_tools.hpp"
#include "common/logger.hpp"
#include "prlctl/output_parser.hpp"
#include "prlctl/sanitizer.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <pwd.h>
#include <regex>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace {

struct HostnameStep {
    std::string name;
    std::string method;
    std::string command;
    bool completed = false;
    std::string error;
};

std::filesystem::path homeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        if (*home != '\0') {
            return home;
        }
    }
    if (const passwd* entry = getpwuid(getuid())) {
        return entry->pw_dir;
    }
    return {};
}

// 2024-01-15T10-30-00-123Z: ISO 8601 with ':' and '.' replaced so it is a
// valid file name everywhere.
std::string fileTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H-%M-%S") << '-'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string joinCommands(const std::vector<std::string>& commands) {
    std::string joined;
    for (const auto& command : commands) {
        if (!joined.empty()) {
            joined += " && ";
        }
        joined += command;
    }
    return joined;
}

ToolResult hostnameFailure(const std::string& vmId, const std::string& hostname, const std::string& message,
                           const std::vector<HostnameStep>& steps, const HostnameStep& failed) {
    std::string text = "VM: " + vmId + "\n";
    text += "Target Hostname: " + hostname + "\n";
    text += "Error: " + message + "\n\n";

    bool anyCompleted = false;
    for (const auto& step : steps) {
        anyCompleted = anyCompleted || step.completed;
    }
    if (anyCompleted) {
        text += "**✅ Completed Steps:**\n";
        for (const auto& step : steps) {
            if (step.completed) {
                text += "- " + step.name + "\n";
            }
        }
        text += "\n";
    }

    text += "**❌ Failed Step:**\n- " + failed.name;
    if (!failed.error.empty()) {
        text += ": " + failed.error;
    }
    text += "\n\n";

    text += "**🛠️ Recovery Options:**\n";
    text += "1. **Start VM and retry:**\n";
    text += "   `prlctl start \"" + vmId + "\"`\n";
    text += "   Wait for VM to fully boot, then retry hostname configuration\n\n";
    text += "2. **Manual hostname configuration:**\n";
    text += "   `prlctl enter \"" + vmId + "\"`\n";
    text += "   Then inside the VM:\n";
    text += "   `sudo hostnamectl set-hostname " + hostname + "`\n";
    text += "   `echo \"" + hostname + "\" | sudo tee /etc/hostname`\n";
    text += "   `sudo hostname " + hostname + "`\n\n";
    text += "**🔍 Troubleshooting:**\n";
    text += "- Check VM status: `prlctl list | grep \"" + vmId + "\"`\n";
    text += "- Test VM exec: `prlctl exec \"" + vmId + "\" \"whoami\"`\n";

    return ToolResult::error("Hostname Configuration Failed", text);
}

} // namespace

GuestTools::GuestTools(std::shared_ptr<CommandExecutor> executor, const ServerConfig& config)
    : executor_(std::move(executor))
    , screenshotDir_(config.screenshotDir) {
    const auto vmId = ArgumentRule::string("vmId", "Name or UUID of the VM").require().length(1, 256);

    schemas_["setHostname"]
        .add(vmId)
        .add(ArgumentRule::string("hostname", "New hostname (RFC 1123)").require().length(1, 253)
                 .satisfies([](const nlohmann::json& value) {
                     return prlctl::isValidHostname(value.get<std::string>());
                 }, "must follow RFC 1123 (letters, digits and hyphens; labels of at most 63 characters "
                    "that do not start or end with a hyphen)"));

    schemas_["manageSshAuth"]
        .add(vmId)
        .add(ArgumentRule::string("username", "Guest account to authorize").require().length(1, 32)
                 .satisfies([](const nlohmann::json& value) {
                     return prlctl::isValidUsername(value.get<std::string>());
                 }, "must match [a-z_][a-z0-9_-]*"))
        .add(ArgumentRule::string("publicKeyPath", "Public key file; defaults to the first key found in ~/.ssh"))
        .add(ArgumentRule::boolean("enablePasswordlessSudo", "Grant the user NOPASSWD sudo").defaultsTo(false));

    schemas_["createTerminalSession"]
        .add(vmId)
        .add(ArgumentRule::string("user", "Guest user to log in as")
                 .satisfies([](const nlohmann::json& value) {
                     return prlctl::isValidUsername(value.get<std::string>());
                 }, "must match [a-z_][a-z0-9_-]*"));

    schemas_["takeScreenshot"]
        .add(vmId)
        .add(ArgumentRule::string("outputPath", "Where to save the PNG; defaults to a temporary file"));
}

const ArgumentSchema& GuestTools::schema(const std::string& toolName) const {
    return schemas_.at(toolName);
}

std::filesystem::path GuestTools::findDefaultPublicKey() {
    const std::filesystem::path sshDir = homeDirectory() / ".ssh";
    for (const char* name : {"id_rsa.pub", "id_ed25519.pub", "id_ecdsa.pub"}) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(sshDir / name, ec)) {
            return sshDir / name;
        }
    }
    return {};
}

std::string GuestTools::extractIpv4(const std::string& text) {
    static const std::regex ipv4(R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))");
    std::smatch match;
    if (std::regex_search(text, match, ipv4)) {
        return match[1].str();
    }
    return "";
}

ToolResult GuestTools::setHostname(const nlohmann::json& args) {
    if (auto invalid = schema("setHostname").validate(args)) {
        return ToolResult::error("Hostname Configuration Failed", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string vmArg = prlctl::sanitizeIdentifier(vmId);
    const std::string hostname = prlctl::sanitizeHostname(stringArg(args, "hostname"));
    const std::string quoted = prlctl::quoteForShell(hostname);

    std::vector<HostnameStep> steps;

    // Step 1: the guest must be running and accept exec.
    HostnameStep statusStep{"VM Status Check", "", "", false, ""};
    CommandResult listed = executor_->execute({"list", "--all"});
    if (!listed.success) {
        statusStep.error = "Cannot check VM status: " + listed.error;
    } else {
        const auto vm = prlctl::findVm(prlctl::parseVmList(listed.stdoutText), vmArg);
        if (!vm) {
            statusStep.error = "VM not found";
        } else if (vm->status != VmStatus::Running) {
            statusStep.error = "VM is not running";
        } else {
            CommandResult echoed = executor_->execute({"exec", vmArg, "echo \"test\""});
            if (!echoed.success) {
                statusStep.error = "VM running but commands fail: " + echoed.error;
            }
        }
    }
    if (!statusStep.error.empty()) {
        Logger::error("setHostname: VM " + vmId + " is not accessible: " + statusStep.error);
        return hostnameFailure(vmId, hostname, "VM '" + vmId + "' is not accessible: " + statusStep.error,
                               steps, statusStep);
    }
    statusStep.completed = true;
    steps.push_back(statusStep);

    const std::vector<HostnameStep> plan = {
        {"Hostnamectl Configuration", "hostnamectl",
         "hostnamectl set-hostname " + quoted, false, ""},
        {"/etc/hostname Configuration", "/etc/hostname",
         "echo " + quoted + " | sudo tee /etc/hostname > /dev/null", false, ""},
        {"Runtime Hostname Configuration", "hostname command",
         "sudo hostname " + quoted, false, ""},
        {"/etc/hosts Configuration", "/etc/hosts",
         "sudo sed -i '/127\\.0\\.1\\.1/d' /etc/hosts 2>/dev/null || true && "
         "echo \"127.0.1.1 \"" + quoted + " | sudo tee -a /etc/hosts > /dev/null", false, ""},
    };
    for (auto step : plan) {
        CommandResult result = executor_->execute({"exec", vmArg, step.command});
        step.completed = result.success;
        if (!result.success) {
            step.error = step.method + " failed: " + result.error;
        }
        steps.push_back(step);
    }

    HostnameStep verifyStep{"Hostname Verification", "verification",
        joinCommands({
            "echo \"=== Hostname Verification ===\"",
            "echo \"Current hostname: $(hostname)\"",
            "echo \"FQDN: $(hostname -f 2>/dev/null || hostname)\"",
            "echo \"/etc/hostname contains: $(cat /etc/hostname 2>/dev/null || echo 'file not found')\"",
            "echo \"Hosts file entries:\"",
            "grep -E \"127\\.0\\.1\\.1|127\\.0\\.0\\.1\" /etc/hosts 2>/dev/null || echo \"no localhost entries found\"",
        }), false, ""};
    std::string verificationOutput;
    std::string currentHostname;
    CommandResult verified = executor_->execute({"exec", vmArg, verifyStep.command});
    if (verified.success) {
        verifyStep.completed = true;
        verificationOutput = verified.stdoutText;
        std::istringstream lines(verified.stdoutText);
        std::string line;
        while (std::getline(lines, line)) {
            const auto marker = line.find("Current hostname:");
            if (marker != std::string::npos) {
                currentHostname = trim(line.substr(marker + std::string("Current hostname:").size()));
                break;
            }
        }
    } else {
        verifyStep.error = "Verification failed: " + verified.error;
        verificationOutput = "Verification failed";
    }
    steps.push_back(verifyStep);

    size_t completedCount = 0;
    bool coreApplied = false;
    for (const auto& step : steps) {
        if (step.completed) {
            ++completedCount;
            coreApplied = coreApplied || step.method == "hostnamectl" || step.method == "/etc/hostname";
        }
    }
    const bool success = currentHostname == hostname;

    std::string text;
    if (success) {
        text = "✅ **Success**\n\n";
    } else if (coreApplied) {
        text = "⚠️ **Partial Success**\n\n";
    } else {
        text = "❌ **Failed**\n\n";
    }
    text += "Hostname configuration completed for VM '" + vmId + "'.\n\n";
    text += "**Target hostname**: " + hostname + "\n";
    text += "**Current hostname**: " + (currentHostname.empty() ? std::string("Unable to determine") : currentHostname) + "\n\n";
    text += "**Configuration Summary:** " + std::to_string(completedCount) + "/" +
            std::to_string(steps.size()) + " methods completed\n\n";

    if (completedCount > 0) {
        text += "**✅ Successful Methods:**\n";
        for (const auto& step : steps) {
            if (step.completed) {
                text += "- " + step.name + (step.method.empty() ? "" : " (" + step.method + ")") + "\n";
            }
        }
        text += "\n";
    }
    if (completedCount < steps.size()) {
        text += "**❌ Failed Methods:**\n";
        for (const auto& step : steps) {
            if (!step.completed) {
                text += "- " + step.name + (step.error.empty() ? "" : ": " + step.error) + "\n";
            }
        }
        text += "\n";
    }

    text += "**Verification Results:**\n```\n" + verificationOutput + "\n```\n\n";

    if (!success && coreApplied) {
        text += "**Note**: Hostname configuration partially succeeded. Some methods failed but core "
                "configuration was applied. The hostname should be properly set after a reboot.\n\n";
    } else if (!success) {
        text += "**Warning**: Critical hostname configuration methods failed. Manual intervention may be required.\n\n";
    }

    text += "**📝 Recommendations:**\n";
    text += "- Restart the VM to ensure all services pick up the new hostname\n";
    text += "- Verify hostname persistence after reboot\n";
    if (hostname.find('.') != std::string::npos) {
        text += "- For FQDN hostnames, ensure DNS is properly configured\n";
    }

    if (completedCount < steps.size()) {
        text += "\n**🛠️ Manual Recovery:**\n";
        text += "- Access VM: `prlctl enter \"" + vmArg + "\"`\n";
        text += "- Set hostname: `sudo hostnamectl set-hostname " + hostname + "`\n";
        text += "- Update file: `echo \"" + hostname + "\" | sudo tee /etc/hostname`\n";
        text += "- Runtime set: `sudo hostname " + hostname + "`\n";
    }

    text += "\n**📋 VM Management:**\n";
    text += "- Check hostname: `prlctl exec \"" + vmArg + "\" \"hostname\"`\n";
    text += "- Restart VM: `prlctl restart \"" + vmArg + "\"`\n";

    if (success) {
        Logger::info("Hostname of VM " + vmId + " set to " + hostname);
    } else {
        Logger::warning("Hostname of VM " + vmId + " not verified as " + hostname);
    }

    ToolResult result = ToolResult::text(text);
    result.isError = !success && !coreApplied;
    return result;
}

ToolResult GuestTools::manageSshAuth(const nlohmann::json& args) {
    const std::string title = "Error configuring SSH authentication";
    if (auto invalid = schema("manageSshAuth").validate(args)) {
        return ToolResult::error(title, *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string username = stringArg(args, "username");
    const bool passwordlessSudo = boolArg(args, "enablePasswordlessSudo", false);

    std::filesystem::path keyPath = stringArg(args, "publicKeyPath");
    if (keyPath.empty()) {
        keyPath = findDefaultPublicKey();
        if (keyPath.empty()) {
            return ToolResult::error(title, "Failed to configure SSH for VM '" + vmId +
                "': No SSH public key found. Please specify publicKeyPath or generate a key with ssh-keygen.");
        }
    }

    std::ifstream keyFile(keyPath);
    if (!keyFile) {
        return ToolResult::error(title, "Failed to configure SSH for VM '" + vmId +
                                 "': Cannot read public key file '" + keyPath.string() + "'");
    }
    std::stringstream keyBuffer;
    keyBuffer << keyFile.rdbuf();
    const std::string publicKey = trim(keyBuffer.str());
    if (publicKey.empty()) {
        return ToolResult::error(title, "Failed to configure SSH for VM '" + vmId +
                                 "': Public key file '" + keyPath.string() + "' is empty");
    }

    const std::string home = "/home/" + username;
    std::vector<std::string> commands = {
        "sudo ssh-keygen -A 2>/dev/null || true",
        "(sudo systemctl enable ssh 2>/dev/null || sudo systemctl enable sshd 2>/dev/null || true)",
        "(sudo systemctl start ssh 2>/dev/null || sudo systemctl start sshd 2>/dev/null || true)",
        "sudo -u " + username + " mkdir -p " + home + "/.ssh",
        "sudo chmod 700 " + home + "/.ssh",
        "echo " + prlctl::quoteForShell(publicKey) + " | sudo tee -a " + home + "/.ssh/authorized_keys > /dev/null",
        "sudo chown " + username + ":" + username + " " + home + "/.ssh/authorized_keys",
        "sudo chmod 600 " + home + "/.ssh/authorized_keys",
    };
    if (passwordlessSudo) {
        commands.push_back("echo '" + username + " ALL=(ALL) NOPASSWD:ALL' | sudo tee /etc/sudoers.d/" +
                           username + " > /dev/null");
        commands.push_back("sudo chmod 440 /etc/sudoers.d/" + username);
    }
    commands.push_back(R"cmd(ip -4 addr show | grep -oP "(?<=inet )[\d.]+(?=/)" | grep -v "127.0.0.1" | head -1)cmd");

    Logger::info("Configuring SSH access for " + username + " on VM " + vmId + " with key " + keyPath.string());
    CommandResult result = executor_->execute({"exec", prlctl::sanitizeIdentifier(vmId), joinCommands(commands)});
    if (!result.success) {
        return ToolResult::error(title, "Failed to configure SSH for VM '" + vmId + "': " + result.error);
    }

    std::string vmIp = extractIpv4(result.stdoutText);
    if (vmIp.empty()) {
        vmIp = "VM_IP_ADDRESS";
    }

    std::string text = "✅ **Success**\n\nSSH authentication configured for user '" + username +
                       "' on VM '" + vmId + "'.\n\n";
    text += "**Configuration applied:**\n";
    text += "- SSH host keys generated/verified\n";
    text += "- SSH service enabled and started\n";
    text += "- Public key from '" + keyPath.string() + "' added to authorized_keys\n";
    if (passwordlessSudo) {
        text += "- Passwordless sudo enabled for " + username + "\n";
    }
    text += "\n**To connect:**\n```bash\nssh " + username + "@" + vmIp + "\n```\n\n";
    text += "**Note**: If the IP address above shows as 'VM_IP_ADDRESS', run `prlctl list -f` to get the actual IP.";
    return ToolResult::text(text);
}

ToolResult GuestTools::createTerminalSession(const nlohmann::json& args) {
    if (auto invalid = schema("createTerminalSession").validate(args)) {
        return ToolResult::error("Error preparing terminal session", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string vmArg = prlctl::sanitizeIdentifier(vmId);
    const std::string user = stringArg(args, "user");

    std::string command = "prlctl enter " + vmArg;
    if (!user.empty()) {
        command += " --user " + user;
    }

    std::string text = "## Terminal Session Instructions\n\n";
    text += "To open an interactive terminal session to VM '" + vmId + "', run the following command in your terminal:\n\n";
    text += "```bash\n" + command + "\n```\n\n";
    if (user.empty()) {
        text += "**Note**: This will connect as the default user. To connect as a specific user, add the `--user` parameter.\n\n";
    }
    text += "### Alternative SSH Connection\n\n";
    text += "If the VM has SSH enabled and you know its IP address, you can also connect via SSH:\n\n";
    text += "```bash\n# First, get the VM's IP address\n";
    text += "prlctl list -f --json | jq '.[] | select(.name==\"" + vmArg + "\") | .ip_configured'\n\n";
    text += "# Then connect via SSH\nssh " + (user.empty() ? std::string("username") : user) + "@<vm-ip-address>\n```\n\n";
    text += "**Tip**: Use the `manageSshAuth` tool to set up passwordless SSH access with your public key.";
    return ToolResult::text(text);
}

ToolResult GuestTools::takeScreenshot(const nlohmann::json& args) {
    const std::string title = "Error capturing screenshot";
    if (auto invalid = schema("takeScreenshot").validate(args)) {
        return ToolResult::error(title, *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string vmArg = prlctl::sanitizeIdentifier(vmId);
    const std::string note = "\n\n**Note**: Make sure the VM is running and Parallels Tools are installed.";

    std::filesystem::path target = stringArg(args, "outputPath");
    if (target.empty()) {
        std::filesystem::path dir = screenshotDir_;
        if (dir.empty()) {
            std::error_code ec;
            dir = std::filesystem::temp_directory_path(ec);
            if (ec) {
                dir = "/tmp";
            }
        }
        target = dir / ("parallels-" + vmArg + "-" + fileTimestamp() + ".png");
    }

    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return ToolResult::error(title, "Failed to capture screenshot for VM '" + vmId +
                "': cannot create directory '" + target.parent_path().string() + "': " + ec.message() + note);
        }
    }

    CommandResult result = executor_->execute({"capture", vmArg, "--file", target.string()});
    if (!result.success) {
        return ToolResult::error(title, "Failed to capture screenshot for VM '" + vmId + "': " + result.error + note);
    }

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return ToolResult::error(title, "Failed to capture screenshot for VM '" + vmId +
                                 "': Screenshot file was not created successfully" + note);
    }

    Logger::info("Screenshot of VM " + vmId + " saved to " + target.string());
    return ToolResult::text("✅ **Success**\n\nScreenshot captured for VM '" + vmId + "'.\n\n**Saved to**: " +
                            target.string() + "\n\n" + formatOutputBlock(result.stdoutText));
}
