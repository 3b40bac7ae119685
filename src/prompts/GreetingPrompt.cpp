#include "GreetingPrompt.hpp"

namespace mcpd {

PromptInfo GreetingPrompt::get_info() {
    return {
        "greeting",
        "Generate a greeting message",
        {
            {"name", "Name of the person to greet", false, {}},
            {"time_of_day", "Time of day for the greeting", false,
             {"morning", "afternoon", "evening", "night", "day"}}
        }
    };
}

json GreetingPrompt::render(const json& args) const {
    const std::string name = args.value("name", std::string("World"));
    const std::string time_of_day = args.value("time_of_day", std::string("day"));

    std::string greeting;
    if (time_of_day == "morning") {
        greeting = "Good morning";
    } else if (time_of_day == "afternoon") {
        greeting = "Good afternoon";
    } else if (time_of_day == "evening") {
        greeting = "Good evening";
    } else if (time_of_day == "night") {
        greeting = "Good night";
    } else if (time_of_day == "day") {
        greeting = "Hello";
    } else {
        throw McpError::invalid_params("Invalid time_of_day: " + time_of_day);
    }

    return {
        {"description", "A " + time_of_day + " greeting for " + name},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", {
                    {"type", "text"},
                    {"text", greeting + ", " + name + "! How can I help you today?"}
                }}
            }
        })}
    };
}

} // namespace mcpd
