#include "CodeReviewPrompt.hpp"
#include <algorithm>
#include <array>

namespace mcpd {

namespace {

constexpr std::array<const char*, 5> kFocusAreas = {"general", "security", "performance", "style", "bugs"};

json text_message(const char* role, const std::string& text) {
    return {
        {"role", role},
        {"content", {{"type", "text"}, {"text", text}}}
    };
}

} // namespace

PromptInfo CodeReviewPrompt::get_info() {
    return {
        "code_review",
        "Review a code snippet and suggest improvements",
        {
            {"code", "The code to review", true, {}},
            {"language", "Programming language of the code", false, {}},
            {"focus", "Aspect to focus the review on", false,
             std::vector<std::string>(kFocusAreas.begin(), kFocusAreas.end())}
        }
    };
}

json CodeReviewPrompt::render(const json& args) const {
    auto code_it = args.find("code");
    if (code_it == args.end() || !code_it->is_string()) {
        throw McpError::invalid_params("Code parameter is required");
    }
    const std::string code = code_it->get<std::string>();
    const std::string language = args.value("language", std::string("unknown"));
    const std::string focus = args.value("focus", std::string("general"));

    if (std::find(kFocusAreas.begin(), kFocusAreas.end(), focus) == kFocusAreas.end()) {
        throw McpError::invalid_params("Invalid focus: " + focus);
    }

    return {
        {"description", "Code review prompt for " + language + " code focusing on " + focus},
        {"messages", json::array({
            text_message("assistant",
                         "You are an expert code reviewer. Please review the following " + language
                         + " code with a focus on " + focus + ". Provide constructive feedback on code"
                         " quality, potential issues, and suggestions for improvement."),
            text_message("user", "Please review this " + language + " code:\n\n```" + language + "\n"
                                 + code + "\n```")
        })}
    };
}

} // namespace mcpd
