#include "EchoTool.hpp"
#include <spdlog/spdlog.h>

namespace mcpd {

ToolInfo EchoTool::get_info() {
    return {
        "echo",
        "Echo back the provided message",
        {
            {"type", "object"},
            {"properties", {
                {"message", {
                    {"type", "string"},
                    {"description", "The message to echo back"}
                }}
            }},
            {"required", json::array({"message"})}
        }
    };
}

json EchoTool::execute(const json& args) const {
    auto it = args.find("message");
    if (it == args.end()) {
        throw McpError::invalid_params("Missing required parameter: message");
    }
    if (!it->is_string()) {
        throw McpError::invalid_params("message must be a string");
    }

    spdlog::debug("EchoTool: echoing {} bytes", it->get_ref<const std::string&>().size());
    return {
        {"content", json::array({
            {{"type", "text"}, {"text", "Echo: " + it->get<std::string>()}}
        })},
        {"isError", false}
    };
}

} // namespace mcpd
