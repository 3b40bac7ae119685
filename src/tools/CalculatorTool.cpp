#include "CalculatorTool.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace mcpd {

namespace {

double require_number(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) {
        throw McpError::invalid_params(std::string("Parameter '") + key + "' is required and must be a number");
    }
    return it->get<double>();
}

json text_result(const std::string& text, bool is_error) {
    return {
        {"content", json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", is_error}
    };
}

} // namespace

ToolInfo CalculatorTool::get_info() {
    return {
        "calculator",
        "Perform basic arithmetic on two numbers",
        {
            {"type", "object"},
            {"properties", {
                {"operation", {
                    {"type", "string"},
                    {"description", "Operation to perform"},
                    {"enum", json::array({"add", "subtract", "multiply", "divide"})}
                }},
                {"a", {
                    {"type", "number"},
                    {"description", "First operand"}
                }},
                {"b", {
                    {"type", "number"},
                    {"description", "Second operand"}
                }}
            }},
            {"required", json::array({"operation", "a", "b"})}
        }
    };
}

std::string CalculatorTool::format_number(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    return json(value).dump();
}

json CalculatorTool::execute(const json& args) const {
    auto op_it = args.find("operation");
    if (op_it == args.end() || !op_it->is_string()) {
        throw McpError::invalid_params("Parameter 'operation' is required and must be a string");
    }
    const std::string operation = op_it->get<std::string>();
    const double a = require_number(args, "a");
    const double b = require_number(args, "b");

    double result = 0;
    const char* symbol = "";
    if (operation == "add") {
        result = a + b;
        symbol = "+";
    } else if (operation == "subtract") {
        result = a - b;
        symbol = "-";
    } else if (operation == "multiply") {
        result = a * b;
        symbol = "*";
    } else if (operation == "divide") {
        if (b == 0) {
            spdlog::debug("CalculatorTool: division by zero");
            return text_result("Division by zero", true);
        }
        result = a / b;
        symbol = "/";
    } else {
        throw McpError::invalid_params("Unknown operation: " + operation);
    }

    return text_result(format_number(a) + " " + symbol + " " + format_number(b) + " = " + format_number(result),
                       false);
}

} // namespace mcpd
