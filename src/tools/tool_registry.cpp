#include "tools/tool_registry.hpp"
#include "tools/guest_tools.hpp"
#include "tools/snapshot_tools.hpp"
#include "tools/vm_tools.hpp"

namespace {

ToolDescriptor describe(const std::string& name, const std::string& description, const ArgumentSchema& schema) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = description;
    descriptor.inputSchema = schema.toJsonSchema();
    return descriptor;
}

} // namespace

void registerDefaultTools(ToolDispatcher& dispatcher,
                          std::shared_ptr<CommandExecutor> executor,
                          const ServerConfig& config) {
    auto guest = std::make_shared<GuestTools>(executor, config);
    auto snapshots = std::make_shared<SnapshotTools>(executor);
    auto vms = std::make_shared<VmTools>(executor, guest, config);

    dispatcher.registerTool(
        describe("listVMs", "List all Parallels virtual machines with their status and IP address",
                 vms->schema("listVMs")),
        [vms](const nlohmann::json& args) { return vms->listVMs(args); });
    dispatcher.registerTool(
        describe("createVM", "Create a new VM from scratch or by cloning a template, "
                 "optionally configuring hardware, hostname and SSH access",
                 vms->schema("createVM")),
        [vms](const nlohmann::json& args) { return vms->createVM(args); });
    dispatcher.registerTool(
        describe("startVM", "Start a virtual machine", vms->schema("startVM")),
        [vms](const nlohmann::json& args) { return vms->startVM(args); });
    dispatcher.registerTool(
        describe("stopVM", "Stop a virtual machine, forcefully when force is true", vms->schema("stopVM")),
        [vms](const nlohmann::json& args) { return vms->stopVM(args); });
    dispatcher.registerTool(
        describe("deleteVM", "Permanently delete a virtual machine (requires confirm=true)",
                 vms->schema("deleteVM")),
        [vms](const nlohmann::json& args) { return vms->deleteVM(args); });
    dispatcher.registerTool(
        describe("takeSnapshot", "Create a snapshot of a virtual machine", snapshots->schema("takeSnapshot")),
        [snapshots](const nlohmann::json& args) { return snapshots->takeSnapshot(args); });
    dispatcher.registerTool(
        describe("restoreSnapshot", "Revert a virtual machine to a snapshot", snapshots->schema("restoreSnapshot")),
        [snapshots](const nlohmann::json& args) { return snapshots->restoreSnapshot(args); });
    dispatcher.registerTool(
        describe("listSnapshots", "List the snapshots of a virtual machine", snapshots->schema("listSnapshots")),
        [snapshots](const nlohmann::json& args) { return snapshots->listSnapshots(args); });
    dispatcher.registerTool(
        describe("takeScreenshot", "Capture the screen of a running virtual machine to a PNG file",
                 guest->schema("takeScreenshot")),
        [guest](const nlohmann::json& args) { return guest->takeScreenshot(args); });
    dispatcher.registerTool(
        describe("createTerminalSession", "Show how to open an interactive terminal session to a VM",
                 guest->schema("createTerminalSession")),
        [guest](const nlohmann::json& args) { return guest->createTerminalSession(args); });
    dispatcher.registerTool(
        describe("manageSshAuth", "Install the host SSH public key for a guest user, "
                 "optionally with passwordless sudo",
                 guest->schema("manageSshAuth")),
        [guest](const nlohmann::json& args) { return guest->manageSshAuth(args); });
    dispatcher.registerTool(
        describe("batchOperation", "Run start, stop, suspend, resume or restart on several VMs at once",
                 vms->schema("batchOperation")),
        [vms](const nlohmann::json& args) { return vms->batchOperation(args); });
    dispatcher.registerTool(
        describe("setHostname", "Set the hostname inside a running VM", guest->schema("setHostname")),
        [guest](const nlohmann::json& args) { return guest->setHostname(args); });
}
