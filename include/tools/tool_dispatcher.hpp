#pragma once

#include "tools/tool_result.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

class UnknownToolError : public std::runtime_error {
public:
    explicit UnknownToolError(const std::string& toolName)
        : std::runtime_error("Unknown tool: " + toolName)
        , toolName_(toolName) {}

    const std::string& toolName() const { return toolName_; }

private:
    std::string toolName_;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
};

using ToolHandler = std::function<ToolResult(const nlohmann::json&)>;

// Name -> handler registry. Filled once at startup, then only read, so
// dispatch() may run on any number of threads without locking.
class ToolDispatcher {
public:
    // A second registration under the same name replaces the handler and
    // keeps the original position.
    void registerTool(const std::string& name, ToolHandler handler);
    void registerTool(const ToolDescriptor& descriptor, ToolHandler handler);

    // Throws UnknownToolError for unregistered names. Exceptions thrown by the
    // handler pass through untouched.
    ToolResult dispatch(const std::string& name, const nlohmann::json& args) const;

    bool hasTool(const std::string& name) const;
    std::vector<std::string> listRegistered() const;
    std::vector<ToolDescriptor> listDescriptors() const;

private:
    struct Entry {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> byName_;
};
