#pragma once

#include "core/Errors.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2025-03-26";

/**
 * @brief What a single wire message turned out to be
 */
enum class MessageKind {
    Request,       ///< has an "id" member (even when it is null)
    Notification,  ///< has a method and no "id" member
    Response,      ///< has result/error; ignored by this server
    Invalid        ///< structurally broken; answered with -32600
};

/**
 * @brief One classified JSON-RPC message
 */
struct Envelope {
    MessageKind kind = MessageKind::Invalid;
    std::string method;
    json params;          // null when the member is absent
    json id;              // meaningful for Request (and Invalid, when recoverable)
    std::string problem;  // reason for Invalid

    bool expects_reply() const { return kind == MessageKind::Request || kind == MessageKind::Invalid; }
};

/**
 * @brief Decoded body of one inbound transmission
 */
struct Payload {
    std::vector<json> messages;
    bool is_batch = false;
};

/**
 * @brief Parse raw text into one message or a batch
 * @throws McpError -32700 for malformed JSON, -32600 for an empty batch
 *         or a top-level value that is neither object nor array
 */
Payload parse_payload(const std::string& text);

/**
 * @brief Classify a message; never throws
 *
 * The presence of the "id" member alone separates requests from
 * notifications: {"id": null} is a request.
 */
Envelope classify(const json& message);

json make_result_response(const json& id, const json& result);
json make_error_response(const json& id, const McpError& error);
json make_error_response(const json& id, int code, const std::string& message);
json make_notification(const std::string& method, const json& params);

/**
 * @brief Key used to index in-flight requests by id
 */
std::string request_key(const json& id);

} // namespace mcpd
