#pragma once

#include "prlctl/command_executor.hpp"
#include "tools/argument_schema.hpp"
#include "tools/tool_result.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

// listSnapshots, takeSnapshot and restoreSnapshot.
class SnapshotTools {
public:
    explicit SnapshotTools(std::shared_ptr<CommandExecutor> executor);

    ToolResult listSnapshots(const nlohmann::json& args);
    ToolResult takeSnapshot(const nlohmann::json& args);
    ToolResult restoreSnapshot(const nlohmann::json& args);

    // Throws std::out_of_range for names this class does not handle.
    const ArgumentSchema& schema(const std::string& toolName) const;

private:
    std::shared_ptr<CommandExecutor> executor_;
    std::map<std::string, ArgumentSchema> schemas_;
};
