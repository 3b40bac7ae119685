#pragma once

#include "core/Features.hpp"

namespace mcpd {

/**
 * @brief MCP tool performing basic arithmetic on two numbers
 *
 * Supports add, subtract, multiply and divide. Division by zero is a tool
 * failure (result with isError), not a protocol error.
 */
class CalculatorTool {
public:
    static ToolInfo get_info();

    /**
     * @param args JSON object with "operation", "a" and "b"
     * @return Text content "<a> <op> <b> = <result>"
     * @throws McpError -32602 for missing operands or an unknown operation
     */
    json execute(const json& args) const;

    /**
     * @brief Render a number without a trailing ".0" for integral values
     */
    static std::string format_number(double value);
};

} // namespace mcpd
