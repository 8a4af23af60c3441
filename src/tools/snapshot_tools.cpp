#include "tools/snapshot_tools.hpp"
#include "common/logger.hpp"
#include "prlctl/output_parser.hpp"
#include "prlctl/sanitizer.hpp"

SnapshotTools::SnapshotTools(std::shared_ptr<CommandExecutor> executor)
    : executor_(std::move(executor)) {
    const auto vmId = ArgumentRule::string("vmId", "Name or UUID of the VM").require().length(1, 256);

    schemas_["listSnapshots"].add(vmId);
    schemas_["takeSnapshot"]
        .add(vmId)
        .add(ArgumentRule::string("name", "Name for the snapshot").require().length(1, 100))
        .add(ArgumentRule::string("description", "Optional description for the snapshot"));
    schemas_["restoreSnapshot"]
        .add(vmId)
        .add(ArgumentRule::string("snapshotId", "UUID or name of the snapshot to restore").require().length(1, 256));
}

const ArgumentSchema& SnapshotTools::schema(const std::string& toolName) const {
    return schemas_.at(toolName);
}

ToolResult SnapshotTools::listSnapshots(const nlohmann::json& args) {
    if (auto invalid = schema("listSnapshots").validate(args)) {
        return ToolResult::error("Error listing snapshots", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");

    CommandResult result = executor_->execute({"snapshot-list", prlctl::sanitizeIdentifier(vmId)});
    if (!result.success) {
        return ToolResult::error("Error listing snapshots",
                                 "Failed to list snapshots for VM '" + vmId + "': " + result.error);
    }

    const auto snapshots = prlctl::parseSnapshotList(result.stdoutText);

    std::string text = "## Snapshots for VM '" + vmId + "'\n\n";
    if (snapshots.empty()) {
        text += "No snapshots found for this VM.\n";
    } else {
        text += "Found " + std::to_string(snapshots.size()) + " snapshot(s):\n\n";
        for (size_t i = 0; i < snapshots.size(); ++i) {
            const auto& snapshot = snapshots[i];
            text += "### " + std::to_string(i + 1) + ". " + snapshot.name;
            if (snapshot.current) {
                text += " ⭐ (Current)";
            }
            text += "\n";
            text += "- **ID**: " + snapshot.id + "\n";
            text += "- **Date**: " + snapshot.date + "\n\n";
        }
    }
    return ToolResult::text(text);
}

ToolResult SnapshotTools::takeSnapshot(const nlohmann::json& args) {
    if (auto invalid = schema("takeSnapshot").validate(args)) {
        return ToolResult::error("Error creating snapshot", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string name = stringArg(args, "name");
    const std::string description = stringArg(args, "description");

    // The name and description are argv entries, never shell text.
    std::vector<std::string> command = {"snapshot", prlctl::sanitizeIdentifier(vmId), "--name", name};
    if (!description.empty()) {
        command.push_back("--description");
        command.push_back(description);
    }

    CommandResult result = executor_->execute(command);
    if (!result.success) {
        return ToolResult::error("Error creating snapshot",
                                 "Failed to create snapshot for VM '" + vmId + "': " + result.error);
    }

    Logger::info("Snapshot '" + name + "' created for VM " + vmId);
    std::string text = "✅ **Success**\n\nSnapshot '" + name + "' created successfully for VM '" + vmId + "'.";
    if (!description.empty()) {
        text += "\n\n**Description**: " + description;
    }
    text += "\n\n" + formatOutputBlock(result.stdoutText);
    return ToolResult::text(text);
}

ToolResult SnapshotTools::restoreSnapshot(const nlohmann::json& args) {
    if (auto invalid = schema("restoreSnapshot").validate(args)) {
        return ToolResult::error("Error restoring snapshot", *invalid);
    }
    const std::string vmId = stringArg(args, "vmId");
    const std::string snapshotId = stringArg(args, "snapshotId");
    const std::string snapshotArg =
        prlctl::isValidUuid(snapshotId) ? snapshotId : prlctl::sanitizeIdentifier(snapshotId);

    CommandResult result = executor_->execute(
        {"snapshot-switch", prlctl::sanitizeIdentifier(vmId), "--id", snapshotArg});
    if (!result.success) {
        if (result.error.find("snapshot") != std::string::npos &&
            result.error.find("not found") != std::string::npos) {
            return ToolResult::error("Snapshot not found",
                                     "The specified snapshot '" + snapshotId + "' was not found for VM '" + vmId +
                                     "'.\n\nUse the 'listSnapshots' tool to see available snapshots for this VM.");
        }
        return ToolResult::error("Error restoring snapshot",
                                 "Failed to restore snapshot for VM '" + vmId + "': " + result.error);
    }

    Logger::info("VM " + vmId + " restored to snapshot " + snapshotId);
    return ToolResult::text(
        "✅ **Success**\n\nVM '" + vmId + "' has been restored to snapshot '" + snapshotId + "'.\n\n"
        "**Note**: The VM state has been reverted to the snapshot point. Any changes made after the "
        "snapshot was taken have been discarded.\n\n" + formatOutputBlock(result.stdoutText));
}
