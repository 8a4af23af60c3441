#pragma once

#include "common/server_config.hpp"
#include "prlctl/command_executor.hpp"
#include "tools/tool_dispatcher.hpp"
#include <memory>

// Registers every prlctl tool with its description and input schema. The
// handlers share ownership of the executor.
void registerDefaultTools(ToolDispatcher& dispatcher,
                          std::shared_ptr<CommandExecutor> executor,
                          const ServerConfig& config);
