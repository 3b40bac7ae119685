#include "Builtins.hpp"
#include "prompts/CodeReviewPrompt.hpp"
#include "prompts/GreetingPrompt.hpp"
#include "resources/TextResource.hpp"
#include "tools/CalculatorTool.hpp"
#include "tools/EchoTool.hpp"
#include <spdlog/spdlog.h>
#include <memory>

namespace mcpd {

void register_builtins(MCPServer& server) {
    auto& features = server.features();

    if (features.tools.is_enabled()) {
        auto echo_tool = std::make_shared<EchoTool>();
        server.register_tool(
            EchoTool::get_info(),
            [echo_tool](const json& args) {
                return echo_tool->execute(args);
            },
            RegisterMode::Reject, 0, EntryOrigin::Builtin
        );

        auto calculator_tool = std::make_shared<CalculatorTool>();
        server.register_tool(
            CalculatorTool::get_info(),
            [calculator_tool](const json& args) {
                return calculator_tool->execute(args);
            },
            RegisterMode::Reject, 0, EntryOrigin::Builtin
        );
    }

    if (features.resources.is_enabled()) {
        auto hello = std::make_shared<TextResource>(TextResource::hello());
        server.register_resource(
            hello->info(),
            [hello](const std::string& uri) {
                return hello->read(uri);
            },
            RegisterMode::Reject, 0, EntryOrigin::Builtin
        );
    }

    if (features.prompts.is_enabled()) {
        auto greeting = std::make_shared<GreetingPrompt>();
        server.register_prompt(
            GreetingPrompt::get_info(),
            [greeting](const json& args) {
                return greeting->render(args);
            },
            RegisterMode::Reject, 0, EntryOrigin::Builtin
        );

        auto code_review = std::make_shared<CodeReviewPrompt>();
        server.register_prompt(
            CodeReviewPrompt::get_info(),
            [code_review](const json& args) {
                return code_review->render(args);
            },
            RegisterMode::Reject, 0, EntryOrigin::Builtin
        );
    }

    spdlog::info("Built-in handlers registered: {} tools, {} resources, {} prompts",
                 features.tools.size(), features.resources.size(), features.prompts.size());
}

} // namespace mcpd
