#include "DispatchTable.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>

namespace mcpd {

namespace {

const json& object_params(const json& params) {
    static const json empty = json::object();
    if (params.is_null()) {
        return empty;
    }
    if (!params.is_object()) {
        throw McpError::invalid_params("params must be an object");
    }
    return params;
}

std::string require_string(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end()) {
        throw McpError::invalid_params(std::string("Missing required parameter: ") + key);
    }
    if (!it->is_string()) {
        throw McpError::invalid_params(std::string("Parameter '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

json optional_object(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        throw McpError::invalid_params(std::string("Parameter '") + key + "' must be an object");
    }
    return *it;
}

size_t parse_cursor(const json& params) {
    auto it = params.find("cursor");
    if (it == params.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_string()) {
        throw McpError::invalid_params("cursor must be a string");
    }
    const auto& cursor = it->get_ref<const std::string&>();
    if (cursor.empty() || cursor.find_first_not_of("0123456789") != std::string::npos) {
        throw McpError::invalid_params("Invalid cursor: " + cursor);
    }
    try {
        return static_cast<size_t>(std::stoull(cursor));
    } catch (const std::out_of_range&) {
        throw McpError::invalid_params("Invalid cursor: " + cursor);
    }
}

template <typename Entry>
json paginate(const std::vector<Entry>& entries, const json& params, const char* key) {
    const size_t offset = parse_cursor(object_params(params));

    json items = json::array();
    for (size_t i = offset; i < entries.size() && items.size() < DispatchTable::kPageSize; ++i) {
        items.push_back(entries[i].definition);
    }

    json result = {{key, std::move(items)}};
    if (offset < entries.size() && entries.size() - offset > DispatchTable::kPageSize) {
        result["nextCursor"] = std::to_string(offset + DispatchTable::kPageSize);
    }
    return result;
}

json wrap_tool_result(json result) {
    if (result.is_object() && result.contains("content")) {
        if (!result.contains("isError")) {
            result["isError"] = false;
        }
        return result;
    }

    std::string text = result.is_string() ? result.get<std::string>() : result.dump();
    return {
        {"content", json::array({{{"type", "text"}, {"text", std::move(text)}}})},
        {"isError", false}
    };
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

DispatchTable::DispatchTable(Features& features, SessionStore& sessions, NotificationHub& hub,
                             ServerIdentity identity)
    : features_(features), sessions_(sessions), hub_(hub), identity_(std::move(identity)) {
    install_defaults();
}

void DispatchTable::on_request(const std::string& method, MethodHandler handler) {
    requests_[method] = std::move(handler);
}

void DispatchTable::on_notification(const std::string& method, NotificationHandler handler) {
    notifications_[method] = std::move(handler);
}

const MethodHandler* DispatchTable::find_request(const std::string& method) const {
    auto it = requests_.find(method);
    return it == requests_.end() ? nullptr : &it->second;
}

const NotificationHandler* DispatchTable::find_notification(const std::string& method) const {
    auto it = notifications_.find(method);
    return it == notifications_.end() ? nullptr : &it->second;
}

bool DispatchTable::allowed_before_initialize(const std::string& method) {
    return method == "initialize" || method == "ping";
}

void DispatchTable::install_defaults() {
    on_request("initialize", [this](const json& params, const CallContext& context) {
        return handle_initialize(params, context);
    });
    on_request("ping", [](const json&, const CallContext&) {
        return json::object();
    });

    on_request("tools/list", [this](const json& params, const CallContext&) {
        return handle_tools_list(params);
    });
    on_request("tools/call", [this](const json& params, const CallContext& context) {
        return handle_tools_call(params, context);
    });

    on_request("resources/list", [this](const json& params, const CallContext&) {
        return handle_resources_list(params);
    });
    on_request("resources/templates/list", [this](const json& params, const CallContext&) {
        return handle_resource_templates_list(params);
    });
    on_request("resources/read", [this](const json& params, const CallContext&) {
        return handle_resources_read(params);
    });
    on_request("resources/subscribe", [this](const json& params, const CallContext& context) {
        return handle_resources_subscribe(params, context);
    });
    on_request("resources/unsubscribe", [this](const json& params, const CallContext& context) {
        return handle_resources_unsubscribe(params, context);
    });

    on_request("prompts/list", [this](const json& params, const CallContext&) {
        return handle_prompts_list(params);
    });
    on_request("prompts/get", [this](const json& params, const CallContext&) {
        return handle_prompts_get(params);
    });

    on_request("logging/setLevel", [this](const json& params, const CallContext& context) {
        return handle_logging_set_level(params, context);
    });
    on_request("completion/complete", [this](const json& params, const CallContext&) {
        return handle_completion_complete(params);
    });

    on_notification("notifications/initialized", [this](const json& params, const CallContext& context) {
        handle_initialized_notification(params, context);
    });
    on_notification("notifications/progress", [](const json& params, const CallContext& context) {
        spdlog::debug("Client progress on session {}: {}", context.session_id, params.dump());
    });
    on_notification("notifications/roots/list_changed", [](const json&, const CallContext& context) {
        spdlog::info("Client roots changed on session {}", context.session_id);
    });
}

json DispatchTable::handle_initialize(const json& params, const CallContext& context) {
    if (!params.is_object()) {
        throw McpError::invalid_params("initialize requires a params object");
    }

    const std::string client_version = params.value("protocolVersion", std::string());
    const json client_info = params.value("clientInfo", json::object());
    spdlog::info("Initialize from client {} {} (protocol {})",
                 client_info.value("name", std::string("unknown")),
                 client_info.value("version", std::string("unknown")),
                 client_version.empty() ? "unspecified" : client_version);
    if (!client_version.empty() && client_version != kProtocolVersion) {
        spdlog::warn("Client requested protocol version {}, server speaks {}", client_version, kProtocolVersion);
    }

    json capabilities = features_.capabilities();
    if (!sessions_.try_initialize(context.session_id, capabilities)) {
        throw McpError::invalid_request("Session already initialized");
    }
    sessions_.set_attribute(context.session_id, "clientInfo", client_info);
    sessions_.set_attribute(context.session_id, "clientCapabilities",
                            params.value("capabilities", json::object()));

    json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", std::move(capabilities)},
        {"serverInfo", {
            {"name", identity_.name},
            {"version", identity_.version}
        }}
    };
    if (identity_.instructions) {
        result["instructions"] = *identity_.instructions;
    }
    return result;
}

json DispatchTable::handle_tools_list(const json& params) {
    return paginate(features_.tools.list(), params, "tools");
}

json DispatchTable::handle_tools_call(const json& params, const CallContext& context) {
    const auto& args = object_params(params);
    const std::string name = require_string(args, "name");
    const json arguments = optional_object(args, "arguments");

    auto entry = features_.tools.checkout(name);
    spdlog::debug("Calling tool {} for session {}", name, context.session_id);

    const bool report_progress = !context.progress_token.is_null();
    if (report_progress) {
        hub_.notify_progress(context.session_id, context.progress_token, 0, 1);
    }

    json result;
    try {
        result = entry.handler(arguments);
    } catch (const std::exception& e) {
        hub_.log_message(LogLevel::Error, "tools", {{"tool", name}, {"error", e.what()}}, context.session_id);
        throw;
    }

    if (report_progress) {
        hub_.notify_progress(context.session_id, context.progress_token, 1, 1);
    }
    return wrap_tool_result(std::move(result));
}

json DispatchTable::handle_resources_list(const json& params) {
    return paginate(features_.resources.list(), params, "resources");
}

json DispatchTable::handle_resource_templates_list(const json& params) {
    return paginate(features_.resource_templates.list(), params, "resourceTemplates");
}

json DispatchTable::handle_resources_read(const json& params) {
    const std::string uri = require_string(object_params(params), "uri");
    if (!features_.resources.is_enabled()) {
        throw RegistryError(RegistryErrorReason::Disabled, error_code::kResourceError,
                            "Feature 'resources' is disabled");
    }

    auto entry = features_.match_resource(uri);
    if (!entry) {
        throw McpError(error_code::kResourceError, "Resource not found: " + uri);
    }

    json contents;
    try {
        contents = entry->handler(uri);
    } catch (const McpError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpError(error_code::kResourceError, "Failed to read resource " + uri + ": " + e.what());
    }

    if (!contents.is_array()) {
        contents = json::array({std::move(contents)});
    }
    for (auto& item : contents) {
        if (item.is_object() && !item.contains("uri")) {
            item["uri"] = uri;
        }
    }
    return {{"contents", std::move(contents)}};
}

json DispatchTable::handle_resources_subscribe(const json& params, const CallContext& context) {
    const std::string uri = require_string(object_params(params), "uri");
    if (!features_.match_resource(uri)) {
        throw McpError(error_code::kResourceError, "Resource not found: " + uri);
    }
    require_session(context.session_id);
    hub_.subscribe(context.session_id, uri);
    forget_if_removed(context.session_id);
    spdlog::debug("Session {} subscribed to {}", context.session_id, uri);
    return json::object();
}

json DispatchTable::handle_resources_unsubscribe(const json& params, const CallContext& context) {
    const std::string uri = require_string(object_params(params), "uri");
    if (hub_.unsubscribe(context.session_id, uri)) {
        spdlog::debug("Session {} unsubscribed from {}", context.session_id, uri);
    }
    return json::object();
}

json DispatchTable::handle_prompts_list(const json& params) {
    return paginate(features_.prompts.list(), params, "prompts");
}

json DispatchTable::handle_prompts_get(const json& params) {
    const auto& args = object_params(params);
    const std::string name = require_string(args, "name");
    const json arguments = optional_object(args, "arguments");

    for (const auto& [key, value] : arguments.items()) {
        if (!value.is_string()) {
            throw McpError::invalid_params("Prompt argument '" + key + "' must be a string");
        }
    }

    auto entry = features_.prompts.checkout(name);
    for (const auto& declared : entry.definition.value("arguments", json::array())) {
        const std::string argument = declared.value("name", std::string());
        if (declared.value("required", false) && !arguments.contains(argument)) {
            throw McpError::invalid_params("Missing required argument: " + argument);
        }
    }

    json result = entry.handler(arguments);
    if (!result.is_object() || !result.contains("messages") || !result["messages"].is_array()) {
        throw McpError::internal_error("Prompt '" + name + "' produced no messages");
    }
    if (!result.contains("description") && entry.definition.contains("description")) {
        result["description"] = entry.definition["description"];
    }
    return result;
}

json DispatchTable::handle_logging_set_level(const json& params, const CallContext& context) {
    if (!features_.logging_enabled.load()) {
        throw McpError::method_not_found("logging/setLevel");
    }

    const std::string name = require_string(object_params(params), "level");
    auto level = parse_log_level(name);
    if (!level) {
        throw McpError::invalid_params("Unknown log level: " + name);
    }
    require_session(context.session_id);
    hub_.set_log_level(context.session_id, *level);
    forget_if_removed(context.session_id);
    spdlog::debug("Session {} log level set to {}", context.session_id, name);
    return json::object();
}

json DispatchTable::handle_completion_complete(const json& params) {
    if (!features_.completion_enabled.load()) {
        throw McpError::method_not_found("completion/complete");
    }

    const auto& args = object_params(params);
    auto ref_it = args.find("ref");
    if (ref_it == args.end() || !ref_it->is_object()) {
        throw McpError::invalid_params("Missing required parameter: ref");
    }
    auto argument_it = args.find("argument");
    if (argument_it == args.end() || !argument_it->is_object()) {
        throw McpError::invalid_params("Missing required parameter: argument");
    }
    const std::string argument_name = require_string(*argument_it, "name");
    const std::string prefix = argument_it->value("value", std::string());

    json values = json::array();
    size_t total = 0;
    if (ref_it->value("type", std::string()) == "ref/prompt") {
        auto prompt = features_.prompts.find(ref_it->value("name", std::string()));
        if (prompt) {
            for (const auto& declared : prompt->definition.value("arguments", json::array())) {
                if (declared.value("name", std::string()) != argument_name) {
                    continue;
                }
                json candidates = declared.value("completions", declared.value("enum", json::array()));
                for (const auto& candidate : candidates) {
                    if (!candidate.is_string() || !starts_with(candidate.get<std::string>(), prefix)) {
                        continue;
                    }
                    ++total;
                    if (values.size() < kMaxCompletions) {
                        values.push_back(candidate);
                    }
                }
            }
        }
    }

    return {
        {"completion", {
            {"values", values},
            {"total", total},
            {"hasMore", total > values.size()}
        }}
    };
}

void DispatchTable::require_session(const std::string& session_id) const {
    if (!sessions_.contains(session_id)) {
        throw McpError(error_code::kTransportError, "Session not found");
    }
}

// Removal may have run between the check and the write
void DispatchTable::forget_if_removed(const std::string& session_id) {
    if (!sessions_.contains(session_id)) {
        hub_.drop_session(session_id);
        throw McpError(error_code::kTransportError, "Session not found");
    }
}

void DispatchTable::handle_initialized_notification(const json&, const CallContext& context) {
    sessions_.mark_active(context.session_id);
    spdlog::info("Client initialized on session {}", context.session_id);
}

} // namespace mcpd
