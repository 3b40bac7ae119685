#pragma once

#include "core/Features.hpp"

namespace mcpd {

/**
 * @brief MCP tool that echoes a message back to the caller
 */
class EchoTool {
public:
    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "message" parameter
     * @return Text content "Echo: <message>"
     * @throws McpError -32602 if message is missing or not a string
     */
    json execute(const json& args) const;
};

} // namespace mcpd
