#include "Errors.hpp"

namespace mcpd {

McpError::McpError(int code, const std::string& message, json data)
    : std::runtime_error(message), code_(code), data_(std::move(data)) {
}

json McpError::to_json() const {
    json error = {
        {"code", code_},
        {"message", what()}
    };
    if (!data_.is_null()) {
        error["data"] = data_;
    }
    return error;
}

McpError McpError::parse_error(const std::string& message) {
    return McpError(error_code::kParseError, "Parse error: " + message);
}

McpError McpError::invalid_request(const std::string& message) {
    return McpError(error_code::kInvalidRequest, "Invalid Request: " + message);
}

McpError McpError::method_not_found(const std::string& method) {
    return McpError(error_code::kMethodNotFound, "Method not found: " + method);
}

McpError McpError::invalid_params(const std::string& message) {
    return McpError(error_code::kInvalidParams, "Invalid params: " + message);
}

McpError McpError::internal_error(const std::string& message) {
    return McpError(error_code::kInternalError, "Internal error: " + message);
}

RegistryError::RegistryError(RegistryErrorReason reason, int domain_code, const std::string& message)
    : McpError(reason == RegistryErrorReason::InvalidDefinition ? error_code::kInvalidParams : domain_code,
               message,
               json{{"reason", to_string(reason)}}),
      reason_(reason) {
}

const char* to_string(RegistryErrorReason reason) {
    switch (reason) {
        case RegistryErrorReason::DuplicateName:
            return "duplicate_name";
        case RegistryErrorReason::InvalidDefinition:
            return "invalid_definition";
        case RegistryErrorReason::NotFound:
            return "not_found";
        case RegistryErrorReason::Disabled:
            return "disabled";
    }
    return "unknown";
}

} // namespace mcpd
