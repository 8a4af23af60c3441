#pragma once

#include "common/logger.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Runtime settings for the MCP server and the prlctl executor.
struct ServerConfig {
    std::string prlctlPath = "prlctl";
    int commandTimeoutMs = 300000;        // 0 disables the timeout
    size_t maxOutputBytes = 10 * 1024 * 1024;
    size_t workerThreads = 4;
    std::string logFile;                  // empty: stderr only
    LogLevel logLevel = LogLevel::INFO;
    int vmBootWaitMs = 5000;              // createVM waits this long after starting a VM
    std::string screenshotDir;            // empty: system temp directory
};

struct CommandLineOptions {
    bool showHelp = false;
    bool showVersion = false;
    std::string configPath;
    std::map<std::string, std::string> overrides;   // flag name without dashes -> value
};

// Parses argv. Throws std::runtime_error on unknown flags or a missing value.
CommandLineOptions parseCommandLine(int argc, char** argv);

// Applies a JSON config file onto config. Throws std::runtime_error when the
// file cannot be read, is not valid JSON, or holds a value of the wrong type.
void applyConfigFile(const std::string& path, ServerConfig& config);

// Applies PRLBRIDGE_* environment variables onto config.
void applyEnvironment(ServerConfig& config);

// Applies --flag overrides onto config.
void applyOverrides(const std::map<std::string, std::string>& overrides, ServerConfig& config);

// defaults < config file < environment < command line
ServerConfig loadServerConfig(const CommandLineOptions& options);

void printUsage();
