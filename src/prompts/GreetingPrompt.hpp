#pragma once

#include "core/Features.hpp"

namespace mcpd {

/**
 * @brief Prompt producing a greeting for a named person
 *
 * Arguments: "name" (default "World") and "time_of_day" (morning,
 * afternoon, evening, night or day).
 */
class GreetingPrompt {
public:
    static PromptInfo get_info();

    /**
     * @param args JSON object of string arguments
     * @return Object with "description" and one user message
     * @throws McpError -32602 for an unknown time_of_day
     */
    json render(const json& args) const;
};

} // namespace mcpd
