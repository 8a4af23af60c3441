#pragma once

#include "common/server_config.hpp"
#include "prlctl/command_executor.hpp"
#include "tools/argument_schema.hpp"
#include "tools/guest_tools.hpp"
#include "tools/tool_result.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <cstddef>
#include <string>

// VM lifecycle tools. createVM reuses GuestTools for hostname and SSH setup.
class VmTools {
public:
    // Upper bound on targetVMs for one batchOperation call.
    static constexpr size_t kMaxBatchTargets = 50;

    VmTools(std::shared_ptr<CommandExecutor> executor,
            std::shared_ptr<GuestTools> guestTools,
            const ServerConfig& config);

    ToolResult listVMs(const nlohmann::json& args);
    ToolResult createVM(const nlohmann::json& args);
    ToolResult startVM(const nlohmann::json& args);
    ToolResult stopVM(const nlohmann::json& args);
    ToolResult deleteVM(const nlohmann::json& args);
    ToolResult batchOperation(const nlohmann::json& args);

    // Throws std::out_of_range for names this class does not handle.
    const ArgumentSchema& schema(const std::string& toolName) const;

    // Login name of the user running the server.
    static std::string currentUserName();

private:
    bool isRunning(const std::string& vmName);

    std::shared_ptr<CommandExecutor> executor_;
    std::shared_ptr<GuestTools> guestTools_;
    int vmBootWaitMs_;
    size_t batchConcurrency_;
    std::map<std::string, ArgumentSchema> schemas_;
};
