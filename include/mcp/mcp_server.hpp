#pragma once

#include "common/parallel_task_manager.hpp"
#include "common/server_config.hpp"
#include "tools/tool_dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

// MCP over newline-delimited JSON-RPC 2.0. One message per line in, one
// response per line out. Only protocol messages are written to the output
// stream.
class McpServer {
public:
    static constexpr const char* kServerName = "prlbridge";
    static constexpr const char* kServerVersion = "1.0.0";
    static constexpr const char* kDefaultProtocolVersion = "2024-11-05";

    // JSON-RPC error codes
    static constexpr int kParseError = -32700;
    static constexpr int kInvalidRequest = -32600;
    static constexpr int kMethodNotFound = -32601;
    static constexpr int kInvalidParams = -32602;
    static constexpr int kInternalError = -32603;

    McpServer(const ServerConfig& config, const ToolDispatcher& dispatcher);

    // Serves until in reaches EOF. tools/call runs on the worker pool; every
    // other method is answered inline. Returns after all in-flight calls have
    // written their responses.
    void run(std::istream& in, std::ostream& out);

    // Handles one raw line. nullopt when nothing should be sent back.
    std::optional<nlohmann::json> handleLine(const std::string& line);

    // Handles one parsed message synchronously, tools/call included.
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);

private:
    nlohmann::json initialize(const nlohmann::json& params) const;
    nlohmann::json listTools() const;
    nlohmann::json callTool(const nlohmann::json& id, const nlohmann::json& params) const;
    void write(std::ostream& out, const nlohmann::json& message);

    const ToolDispatcher& dispatcher_;
    ParallelTaskManager pool_;
    std::mutex writeMutex_;
};
