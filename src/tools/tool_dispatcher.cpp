#include "tools/tool_dispatcher.hpp"

void ToolDispatcher::registerTool(const std::string& name, ToolHandler handler) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    registerTool(descriptor, std::move(handler));
}

void ToolDispatcher::registerTool(const ToolDescriptor& descriptor, ToolHandler handler) {
    auto it = byName_.find(descriptor.name);
    if (it != byName_.end()) {
        entries_[it->second] = Entry{descriptor, std::move(handler)};
        return;
    }
    byName_[descriptor.name] = entries_.size();
    entries_.push_back(Entry{descriptor, std::move(handler)});
}

ToolResult ToolDispatcher::dispatch(const std::string& name, const nlohmann::json& args) const {
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        throw UnknownToolError(name);
    }
    return entries_[it->second].handler(args);
}

bool ToolDispatcher::hasTool(const std::string& name) const {
    return byName_.count(name) > 0;
}

std::vector<std::string> ToolDispatcher::listRegistered() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.descriptor.name);
    }
    return names;
}

std::vector<ToolDescriptor> ToolDispatcher::listDescriptors() const {
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(entries_.size());
    for (const auto& entry : entries_) {
        descriptors.push_back(entry.descriptor);
    }
    return descriptors;
}
