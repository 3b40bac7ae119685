#pragma once

#include "mcp/MCPServer.hpp"

namespace mcpd {

/**
 * @brief Register the default tools, resource and prompts
 *
 * Entries are registered with origin builtin and priority 0. Kinds whose
 * feature gate is off are skipped.
 */
void register_builtins(MCPServer& server);

} // namespace mcpd
