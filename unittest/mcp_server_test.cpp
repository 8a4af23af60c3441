#include <gtest/gtest.h>
#include "mcp/mcp_server.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

class McpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_.registerTool(ToolDescriptor{"echo", "Echo the arguments back"},
                                 [](const json& args) { return ToolResult::text(args.dump()); });
        dispatcher_.registerTool(ToolDescriptor{"fails", "Always reports an error"},
                                 [](const json&) { return ToolResult::error("Broken", "it failed"); });
        dispatcher_.registerTool(ToolDescriptor{"throws", "Throws from the handler"},
                                 [](const json&) -> ToolResult { throw std::runtime_error("exploded"); });
        config_.workerThreads = 2;
        server_ = std::make_unique<McpServer>(config_, dispatcher_);
    }

    json request(const json& id, const std::string& method, const json& params = json::object()) {
        json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
        auto response = server_->handleMessage(message);
        EXPECT_TRUE(response.has_value());
        return response ? *response : json();
    }

    ServerConfig config_;
    ToolDispatcher dispatcher_;
    std::unique_ptr<McpServer> server_;
};

// Test that initialize echoes the client protocol version
TEST_F(McpServerTest, InitializeEchoesProtocolVersion) {
    json response = request(1, "initialize", {{"protocolVersion", "2025-03-26"},
                                              {"clientInfo", {{"name", "test-client"}}}});
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "prlbridge");
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

// Test the protocol version used when the client sends none
TEST_F(McpServerTest, InitializeDefaultsProtocolVersion) {
    json response = request("init", "initialize");
    EXPECT_EQ(response["id"], "init");
    EXPECT_EQ(response["result"]["protocolVersion"], McpServer::kDefaultProtocolVersion);
}

// Test ping
TEST_F(McpServerTest, PingReturnsEmptyResult) {
    json response = request(7, "ping");
    EXPECT_EQ(response["result"], json::object());
}

// Test that notifications are never answered
TEST_F(McpServerTest, NotificationsGetNoResponse) {
    EXPECT_FALSE(server_->handleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    EXPECT_FALSE(server_->handleMessage({{"jsonrpc", "2.0"}, {"method", "tools/call"},
                                         {"params", {{"name", "echo"}}}}).has_value());
}

// Test malformed JSON input
TEST_F(McpServerTest, ParseError) {
    auto response = server_->handleLine("{not json");
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE((*response)["id"].is_null());
    EXPECT_EQ((*response)["error"]["code"], McpServer::kParseError);
}

// Test requests that are not valid JSON-RPC
TEST_F(McpServerTest, InvalidRequests) {
    auto notObject = server_->handleLine("[1,2]");
    ASSERT_TRUE(notObject.has_value());
    EXPECT_EQ((*notObject)["error"]["code"], McpServer::kInvalidRequest);

    auto noMethod = server_->handleMessage({{"jsonrpc", "2.0"}, {"id", 3}});
    ASSERT_TRUE(noMethod.has_value());
    EXPECT_EQ((*noMethod)["id"], 3);
    EXPECT_EQ((*noMethod)["error"]["code"], McpServer::kInvalidRequest);
}

// Test an unsupported method
TEST_F(McpServerTest, UnknownMethod) {
    json response = request(4, "resources/list");
    EXPECT_EQ(response["error"]["code"], McpServer::kMethodNotFound);
}

// Test that tools/list keeps registration order
TEST_F(McpServerTest, ListToolsInRegistrationOrder) {
    json response = request(5, "tools/list");
    const json& tools = response["result"]["tools"];
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["description"], "Echo the arguments back");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tools[2]["name"], "throws");
}

// Test a successful tools/call
TEST_F(McpServerTest, CallToolReturnsContent) {
    json response = request(6, "tools/call", {{"name", "echo"}, {"arguments", {{"x", 1}}}});
    const json& result = response["result"];
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_EQ(result["content"][0]["text"], "{\"x\":1}");
    EXPECT_FALSE(result.contains("isError"));
}

// Test tools/call without arguments
TEST_F(McpServerTest, CallToolWithNullArguments) {
    json response = request(6, "tools/call", {{"name", "echo"}, {"arguments", nullptr}});
    EXPECT_EQ(response["result"]["content"][0]["text"], "{}");
}

// Test that tool failures come back as isError results
TEST_F(McpServerTest, ToolErrorIsAResultNotAProtocolError) {
    json response = request(8, "tools/call", {{"name", "fails"}});
    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_EQ(response["result"]["content"][0]["text"], "❌ **Broken**\n\nit failed");
}

// Test calling a tool that is not registered
TEST_F(McpServerTest, UnknownToolIsInvalidParams) {
    json response = request(9, "tools/call", {{"name", "nope"}});
    EXPECT_EQ(response["error"]["code"], McpServer::kInvalidParams);
    EXPECT_NE(response["error"]["message"].get<std::string>().find("Unknown tool"), std::string::npos);
}

// Test tools/call without a name
TEST_F(McpServerTest, MissingToolNameIsInvalidParams) {
    json response = request(10, "tools/call", {{"arguments", json::object()}});
    EXPECT_EQ(response["error"]["code"], McpServer::kInvalidParams);
}

// Test a handler that throws
TEST_F(McpServerTest, ThrowingHandlerIsInternalError) {
    json response = request(11, "tools/call", {{"name", "throws"}});
    EXPECT_EQ(response["error"]["code"], McpServer::kInternalError);
    EXPECT_EQ(response["error"]["message"], "exploded");
}

// Test the stdio loop end to end
TEST_F(McpServerTest, RunAnswersEveryRequest) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "garbage\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"a\":1}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\",\"params\":{\"name\":\"fails\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"tools/list\"}\n");
    std::ostringstream out;

    server_->run(in, out);

    std::istringstream lines(out.str());
    std::string line;
    std::set<int> ids;
    int parseErrors = 0;
    while (std::getline(lines, line)) {
        json message = json::parse(line);
        EXPECT_EQ(message["jsonrpc"], "2.0");
        if (message["id"].is_null()) {
            EXPECT_EQ(message["error"]["code"], McpServer::kParseError);
            ++parseErrors;
        } else {
            ids.insert(message["id"].get<int>());
        }
    }
    EXPECT_EQ(parseErrors, 1);
    EXPECT_EQ(ids, (std::set<int>{1, 2, 3, 4}));
}
