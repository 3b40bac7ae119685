#include "JsonRpc.hpp"

namespace mcpd {

namespace {

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

Envelope invalid(std::string problem, json id = nullptr) {
    Envelope envelope;
    envelope.kind = MessageKind::Invalid;
    envelope.problem = std::move(problem);
    envelope.id = std::move(id);
    return envelope;
}

} // namespace

Payload parse_payload(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw McpError::parse_error(e.what());
    }

    Payload payload;
    if (document.is_array()) {
        if (document.empty()) {
            throw McpError::invalid_request("batch cannot be empty");
        }
        payload.is_batch = true;
        payload.messages.reserve(document.size());
        for (auto& item : document) {
            payload.messages.push_back(std::move(item));
        }
        return payload;
    }

    if (!document.is_object()) {
        throw McpError::invalid_request("message must be an object or an array");
    }
    payload.messages.push_back(std::move(document));
    return payload;
}

Envelope classify(const json& message) {
    if (!message.is_object()) {
        return invalid("message must be a JSON object");
    }

    json id = nullptr;
    const auto id_it = message.find("id");
    const bool has_id = id_it != message.end();
    if (has_id) {
        if (!is_valid_id(*id_it)) {
            return invalid("id must be a string, number, or null");
        }
        id = *id_it;
    }

    const auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || !version_it->is_string() || *version_it != kJsonRpcVersion) {
        return invalid("jsonrpc must be \"2.0\"", id);
    }

    const auto method_it = message.find("method");
    if (method_it == message.end()) {
        const bool has_result = message.contains("result");
        const bool has_error = message.contains("error");
        if (has_id && has_result != has_error) {
            Envelope envelope;
            envelope.kind = MessageKind::Response;
            envelope.id = id;
            return envelope;
        }
        return invalid("missing method field", id);
    }

    if (!method_it->is_string() || method_it->get_ref<const std::string&>().empty()) {
        return invalid("method must be a non-empty string", id);
    }

    Envelope envelope;
    envelope.method = method_it->get<std::string>();
    envelope.id = id;
    envelope.kind = has_id ? MessageKind::Request : MessageKind::Notification;

    const auto params_it = message.find("params");
    if (params_it != message.end()) {
        if (!params_it->is_object() && !params_it->is_array()) {
            if (!has_id) {
                // Still a notification: it is dropped, never answered
                envelope.problem = "params must be an object or an array";
                return envelope;
            }
            return invalid("params must be an object or an array", id);
        }
        envelope.params = *params_it;
    }

    return envelope;
}

json make_result_response(const json& id, const json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

json make_error_response(const json& id, const McpError& error) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error.to_json()}
    };
}

json make_error_response(const json& id, int code, const std::string& message) {
    return make_error_response(id, McpError(code, message));
}

json make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

std::string request_key(const json& id) {
    return id.dump();
}

} // namespace mcpd
