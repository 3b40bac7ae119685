#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Fixed JSON-RPC error codes
 *
 * The -32000 series holds one code per protocol domain.
 */
namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr int kTransportError = -32000;
constexpr int kAuthError = -32001;
constexpr int kResourceError = -32002;
constexpr int kToolError = -32003;
constexpr int kPromptError = -32004;
} // namespace error_code

/**
 * @brief Exception carrying a JSON-RPC error code
 *
 * Thrown anywhere below the router; the router converts it into an
 * error envelope for the originating request.
 */
class McpError : public std::runtime_error {
public:
    McpError(int code, const std::string& message, json data = nullptr);

    int code() const { return code_; }
    const json& data() const { return data_; }

    /**
     * @brief Build the "error" member of a response envelope
     */
    json to_json() const;

    static McpError parse_error(const std::string& message);
    static McpError invalid_request(const std::string& message);
    static McpError method_not_found(const std::string& method);
    static McpError invalid_params(const std::string& message);
    static McpError internal_error(const std::string& message);

private:
    int code_;
    json data_;
};

/**
 * @brief Why a registry operation was refused
 */
enum class RegistryErrorReason {
    DuplicateName,
    InvalidDefinition,
    NotFound,
    Disabled
};

/**
 * @brief Registry failure mapped to the registry's domain code
 *
 * InvalidDefinition is reported as -32602, every other reason uses the
 * domain code of the registry that raised it.
 */
class RegistryError : public McpError {
public:
    RegistryError(RegistryErrorReason reason, int domain_code, const std::string& message);

    RegistryErrorReason reason() const { return reason_; }

private:
    RegistryErrorReason reason_;
};

/**
 * @brief Raised for invalid configuration at construction time
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* to_string(RegistryErrorReason reason);

} // namespace mcpd
