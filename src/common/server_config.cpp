#include "common/server_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Flags that take a value, mapped to the override key used by applyOverrides.
const std::map<std::string, std::string>& valueFlags() {
    static const std::map<std::string, std::string> flags = {
        {"--prlctl", "prlctl"},
        {"--timeout", "timeout"},
        {"--max-output", "max-output"},
        {"--workers", "workers"},
        {"--log-file", "log-file"},
        {"--log-level", "log-level"},
        {"--boot-wait", "boot-wait"},
        {"--screenshot-dir", "screenshot-dir"},
    };
    return flags;
}

long long parseInteger(const std::string& setting, const std::string& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + setting + ": '" + value + "' is not an integer");
    }
}

int parseNonNegative(const std::string& setting, const std::string& value) {
    long long parsed = parseInteger(setting, value);
    if (parsed < 0 || parsed > 24LL * 60 * 60 * 1000) {
        throw std::runtime_error("Invalid value for " + setting + ": " + value);
    }
    return static_cast<int>(parsed);
}

size_t parsePositive(const std::string& setting, const std::string& value) {
    long long parsed = parseInteger(setting, value);
    if (parsed <= 0) {
        throw std::runtime_error("Invalid value for " + setting + ": must be greater than zero");
    }
    return static_cast<size_t>(parsed);
}

LogLevel parseLevel(const std::string& setting, const std::string& value) {
    try {
        return Logger::parseLogLevel(value);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid value for " + setting + ": " + e.what());
    }
}

std::string jsonString(const json& doc, const std::string& key) {
    if (!doc[key].is_string()) {
        throw std::runtime_error("Config key '" + key + "' must be a string");
    }
    return doc[key].get<std::string>();
}

long long jsonInteger(const json& doc, const std::string& key) {
    if (!doc[key].is_number_integer()) {
        throw std::runtime_error("Config key '" + key + "' must be an integer");
    }
    return doc[key].get<long long>();
}

} // namespace

CommandLineOptions parseCommandLine(int argc, char** argv) {
    CommandLineOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            options.configPath = argv[++i];
        } else {
            auto it = valueFlags().find(arg);
            if (it == valueFlags().end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            options.overrides[it->second] = argv[++i];
        }
    }

    return options;
}

void applyConfigFile(const std::string& path, ServerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path);
    }

    if (doc.contains("prlctlPath")) {
        config.prlctlPath = jsonString(doc, "prlctlPath");
    }
    if (doc.contains("commandTimeoutMs")) {
        config.commandTimeoutMs = parseNonNegative("commandTimeoutMs",
                                                   std::to_string(jsonInteger(doc, "commandTimeoutMs")));
    }
    if (doc.contains("maxOutputBytes")) {
        config.maxOutputBytes = parsePositive("maxOutputBytes",
                                              std::to_string(jsonInteger(doc, "maxOutputBytes")));
    }
    if (doc.contains("workerThreads")) {
        config.workerThreads = parsePositive("workerThreads",
                                             std::to_string(jsonInteger(doc, "workerThreads")));
    }
    if (doc.contains("logFile")) {
        config.logFile = jsonString(doc, "logFile");
    }
    if (doc.contains("logLevel")) {
        config.logLevel = parseLevel("logLevel", jsonString(doc, "logLevel"));
    }
    if (doc.contains("vmBootWaitMs")) {
        config.vmBootWaitMs = parseNonNegative("vmBootWaitMs",
                                               std::to_string(jsonInteger(doc, "vmBootWaitMs")));
    }
    if (doc.contains("screenshotDir")) {
        config.screenshotDir = jsonString(doc, "screenshotDir");
    }
}

void applyEnvironment(ServerConfig& config) {
    if (const char* value = std::getenv("PRLBRIDGE_PRLCTL")) {
        config.prlctlPath = value;
    }
    if (const char* value = std::getenv("PRLBRIDGE_TIMEOUT_MS")) {
        config.commandTimeoutMs = parseNonNegative("PRLBRIDGE_TIMEOUT_MS", value);
    }
    if (const char* value = std::getenv("PRLBRIDGE_WORKERS")) {
        config.workerThreads = parsePositive("PRLBRIDGE_WORKERS", value);
    }
    if (const char* value = std::getenv("PRLBRIDGE_LOG_FILE")) {
        config.logFile = value;
    }
    if (const char* value = std::getenv("PRLBRIDGE_LOG_LEVEL")) {
        config.logLevel = parseLevel("PRLBRIDGE_LOG_LEVEL", value);
    }
}

void applyOverrides(const std::map<std::string, std::string>& overrides, ServerConfig& config) {
    for (const auto& entry : overrides) {
        const std::string& key = entry.first;
        const std::string& value = entry.second;
        const std::string setting = "--" + key;

        if (key == "prlctl") {
            config.prlctlPath = value;
        } else if (key == "timeout") {
            config.commandTimeoutMs = parseNonNegative(setting, value);
        } else if (key == "max-output") {
            config.maxOutputBytes = parsePositive(setting, value);
        } else if (key == "workers") {
            config.workerThreads = parsePositive(setting, value);
        } else if (key == "log-file") {
            config.logFile = value;
        } else if (key == "log-level") {
            config.logLevel = parseLevel(setting, value);
        } else if (key == "boot-wait") {
            config.vmBootWaitMs = parseNonNegative(setting, value);
        } else if (key == "screenshot-dir") {
            config.screenshotDir = value;
        } else {
            throw std::runtime_error("Unknown option: " + setting);
        }
    }

    if (config.prlctlPath.empty()) {
        throw std::runtime_error("prlctl path must not be empty");
    }
}

ServerConfig loadServerConfig(const CommandLineOptions& options) {
    ServerConfig config;
    if (!options.configPath.empty()) {
        applyConfigFile(options.configPath, config);
    }
    applyEnvironment(config);
    applyOverrides(options.overrides, config);
    return config;
}

void printUsage() {
    std::cout << "Usage: prlbridge [options]\n"
              << "Serves Parallels Desktop (prlctl) operations as MCP tools over stdio.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "  -c, --config PATH      JSON configuration file\n"
              << "  --prlctl PATH          prlctl executable (default: prlctl)\n"
              << "  --timeout MS           Per-command timeout, 0 disables (default: 300000)\n"
              << "  --max-output BYTES     Captured output limit per stream (default: 10485760)\n"
              << "  --workers N            Concurrent tool calls (default: 4)\n"
              << "  --log-file PATH        Also append log lines to PATH\n"
              << "  --log-level LEVEL      debug, info, warning, error or fatal (default: info)\n"
              << "  --boot-wait MS         Wait after starting a VM during createVM (default: 5000)\n"
              << "  --screenshot-dir PATH  Default directory for takeScreenshot\n"
              << "\n"
              << "Environment:\n"
              << "  PRLBRIDGE_PRLCTL, PRLBRIDGE_TIMEOUT_MS, PRLBRIDGE_WORKERS,\n"
              << "  PRLBRIDGE_LOG_FILE, PRLBRIDGE_LOG_LEVEL\n";
}
