#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "mcp/mcp_server.hpp"
#include "prlctl/prlctl_executor.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    CommandLineOptions options;
    try {
        options = parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    // Help and version never touch configuration or logging
    if (options.showHelp) {
        printUsage();
        return 0;
    }
    if (options.showVersion) {
        std::cout << McpServer::kServerName << " version " << McpServer::kServerVersion << "\n";
        return 0;
    }

    try {
        ServerConfig config = loadServerConfig(options);

        if (!Logger::initialize(config.logFile, config.logLevel)) {
            std::cerr << "Failed to initialize logger" << std::endl;
            return 1;
        }

        // A client that disconnects mid-response must not kill the process.
        std::signal(SIGPIPE, SIG_IGN);

        auto executor = std::make_shared<PrlctlExecutor>(config);
        ToolDispatcher dispatcher;
        registerDefaultTools(dispatcher, executor, config);

        Logger::info(std::string(McpServer::kServerName) + " v" + McpServer::kServerVersion + " - MCP server running");
        std::string toolList;
        for (const auto& name : dispatcher.listRegistered()) {
            toolList += (toolList.empty() ? "" : ", ") + name;
        }
        Logger::info("Registered tools: " + toolList);
        Logger::debug("prlctl: " + executor->executable() + ", timeout " +
                      std::to_string(config.commandTimeoutMs) + " ms, " +
                      std::to_string(config.workerThreads) + " worker(s)");

        McpServer server(config, dispatcher);
        server.run(std::cin, std::cout);

        Logger::shutdown();
        return 0;
    } catch (const std::exception& e) {
        if (Logger::isInitialized()) {
            Logger::fatal(std::string("Fatal error: ") + e.what());
            Logger::shutdown();
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return 1;
    }
}
