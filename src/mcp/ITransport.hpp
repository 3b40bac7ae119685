#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Abstract interface for line-oriented MCP transports
 *
 * Implementations hand raw payloads to the server (parsing happens in the
 * router so malformed input can be answered with a parse error) and write
 * whole JSON-RPC messages back.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next raw payload from the transport
     * @return Payload text, or nullopt on EOF/error
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace mcpd
