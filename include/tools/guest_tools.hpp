#pragma once

#include "common/server_config.hpp"
#include "prlctl/command_executor.hpp"
#include "tools/argument_schema.hpp"
#include "tools/tool_result.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

// Tools that reach into a running guest (prlctl exec / capture) or tell the
// user how to: setHostname, manageSshAuth, createTerminalSession, takeScreenshot.
class GuestTools {
public:
    GuestTools(std::shared_ptr<CommandExecutor> executor, const ServerConfig& config);

    ToolResult setHostname(const nlohmann::json& args);
    ToolResult manageSshAuth(const nlohmann::json& args);
    ToolResult createTerminalSession(const nlohmann::json& args);
    ToolResult takeScreenshot(const nlohmann::json& args);

    // Throws std::out_of_range for names this class does not handle.
    const ArgumentSchema& schema(const std::string& toolName) const;

    // ~/.ssh/id_rsa.pub, id_ed25519.pub, id_ecdsa.pub; empty when none exists.
    static std::filesystem::path findDefaultPublicKey();

    // First dotted-quad in text, or empty.
    static std::string extractIpv4(const std::string& text);

private:
    std::shared_ptr<CommandExecutor> executor_;
    std::filesystem::path screenshotDir_;
    std::map<std::string, ArgumentSchema> schemas_;
};
