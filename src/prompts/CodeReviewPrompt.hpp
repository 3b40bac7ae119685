#pragma once

#include "core/Features.hpp"

namespace mcpd {

/**
 * @brief Prompt asking for a review of a code snippet
 */
class CodeReviewPrompt {
public:
    static PromptInfo get_info();

    /**
     * @param args "code" (required), "language" and "focus" (optional)
     * @return Object with "description" and an assistant/user message pair
     * @throws McpError -32602 for missing code or an unknown focus
     */
    json render(const json& args) const;
};

} // namespace mcpd
