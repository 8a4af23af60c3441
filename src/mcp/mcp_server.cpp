#include "mcp/mcp_server.hpp"
#include "common/logger.hpp"
#include <istream>
#include <ostream>

namespace {

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

bool isToolCallRequest(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") && message.contains("method") &&
           message.at("method").is_string() && message.at("method").get<std::string>() == "tools/call";
}

} // namespace

McpServer::McpServer(const ServerConfig& config, const ToolDispatcher& dispatcher)
    : dispatcher_(dispatcher)
    , pool_(config.workerThreads) {
}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

void McpServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (isBlank(line)) {
            continue;
        }

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            Logger::warning("Discarding unparsable message");
            write(out, makeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        if (isToolCallRequest(message)) {
            pool_.addTask([this, &out, message]() {
                if (auto response = handleMessage(message)) {
                    write(out, *response);
                }
            });
            continue;
        }

        if (auto response = handleMessage(message)) {
            write(out, *response);
        }
    }

    pool_.waitForAll();
    Logger::info("Input closed, all requests answered");
}

std::optional<nlohmann::json> McpServer::handleLine(const std::string& line) {
    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return makeError(nullptr, kParseError, "Parse error");
    }
    return handleMessage(message);
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    const bool notification = !message.contains("id");
    const nlohmann::json id = notification ? nlohmann::json() : message.at("id");

    if (!message.contains("method") || !message.at("method").is_string()) {
        if (notification) {
            Logger::warning("Ignoring notification without a method");
            return std::nullopt;
        }
        return makeError(id, kInvalidRequest, "Invalid Request: method must be a string");
    }

    const std::string method = message.at("method").get<std::string>();
    if (notification) {
        Logger::debug("Notification: " + method);
        return std::nullopt;
    }

    const nlohmann::json params = message.contains("params") ? message.at("params") : nlohmann::json::object();

    if (method == "initialize") {
        return makeResult(id, initialize(params));
    }
    if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return makeResult(id, listTools());
    }
    if (method == "tools/call") {
        return callTool(id, params);
    }

    Logger::warning("Unknown method: " + method);
    return makeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::initialize(const nlohmann::json& params) const {
    std::string protocolVersion = kDefaultProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params.at("protocolVersion").is_string()) {
        protocolVersion = params.at("protocolVersion").get<std::string>();
    }

    if (params.is_object() && params.contains("clientInfo") && params.at("clientInfo").is_object()) {
        const auto& client = params.at("clientInfo");
        Logger::info("Client connected: " +
                     (client.contains("name") && client.at("name").is_string()
                          ? client.at("name").get<std::string>() : std::string("unknown")) +
                     ", protocol " + protocolVersion);
    }

    return {
        {"protocolVersion", protocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
    };
}

nlohmann::json McpServer::listTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : dispatcher_.listDescriptors()) {
        tools.push_back({
            {"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", descriptor.inputSchema}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::callTool(const nlohmann::json& id, const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
        return makeError(id, kInvalidParams, "Invalid params: tool name is required");
    }
    const std::string name = params.at("name").get<std::string>();
    nlohmann::json arguments = params.contains("arguments") ? params.at("arguments") : nlohmann::json::object();
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    Logger::info("Tool call: " + name);
    try {
        ToolResult result = dispatcher_.dispatch(name, arguments);
        if (result.isError) {
            Logger::warning("Tool " + name + " returned an error result");
        }
        return makeResult(id, result.toJson());
    } catch (const UnknownToolError& e) {
        Logger::warning(e.what());
        return makeError(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        Logger::error("Tool " + name + " threw: " + e.what());
        return makeError(id, kInternalError, e.what());
    }
}

void McpServer::write(std::ostream& out, const nlohmann::json& message) {
    // Invalid UTF-8 from prlctl output is replaced rather than failing the dump.
    const std::string text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(writeMutex_);
    out << text << '\n';
    out.flush();
}
