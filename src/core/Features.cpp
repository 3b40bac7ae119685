#include "Features.hpp"
#include <stdexcept>

namespace mcpd {

namespace {

void require_string(const json& object, const char* key, const std::string& what) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw std::invalid_argument(what + " requires a non-empty '" + key + "' string");
    }
}

void require_optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
}

bool looks_like_uri(const std::string& uri) {
    return uri.find("://") != std::string::npos || uri.rfind("file:", 0) == 0;
}

void validate_mime_type(const json& definition) {
    auto it = definition.find("mimeType");
    if (it == definition.end()) {
        return;
    }
    if (!it->is_string()) {
        throw std::invalid_argument("'mimeType' must be a string");
    }
    const auto& mime = it->get_ref<const std::string&>();
    auto slash = mime.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == mime.size()
        || mime.find('/', slash + 1) != std::string::npos) {
        throw std::invalid_argument("invalid MIME type: " + mime);
    }
}

void put_if_not_empty(json& object, const char* key, const std::string& value) {
    if (!value.empty()) {
        object[key] = value;
    }
}

std::string template_prefix(const std::string& uri_template) {
    return uri_template.substr(0, uri_template.find('{'));
}

} // namespace

ToolEntry make_tool_entry(const ToolInfo& info, ToolHandler handler, int priority, EntryOrigin origin) {
    json definition = {
        {"name", info.name},
        {"inputSchema", info.input_schema.is_null() ? json{{"type", "object"}} : info.input_schema}
    };
    put_if_not_empty(definition, "description", info.description);
    return ToolEntry{info.name, std::move(definition), std::move(handler), priority, origin};
}

ResourceEntry make_resource_entry(const ResourceInfo& info, ResourceHandler handler,
                                  int priority, EntryOrigin origin) {
    json definition = {
        {"uri", info.uri},
        {"name", info.name}
    };
    put_if_not_empty(definition, "description", info.description);
    put_if_not_empty(definition, "mimeType", info.mime_type);
    return ResourceEntry{info.uri, std::move(definition), std::move(handler), priority, origin};
}

ResourceEntry make_resource_template_entry(const ResourceTemplateInfo& info, ResourceHandler handler,
                                           int priority, EntryOrigin origin) {
    json definition = {
        {"uriTemplate", info.uri_template},
        {"name", info.name}
    };
    put_if_not_empty(definition, "description", info.description);
    put_if_not_empty(definition, "mimeType", info.mime_type);
    return ResourceEntry{info.uri_template, std::move(definition), std::move(handler), priority, origin};
}

PromptEntry make_prompt_entry(const PromptInfo& info, PromptHandler handler, int priority, EntryOrigin origin) {
    json definition = {{"name", info.name}};
    put_if_not_empty(definition, "description", info.description);
    if (!info.arguments.empty()) {
        json arguments = json::array();
        for (const auto& argument : info.arguments) {
            json item = {{"name", argument.name}, {"required", argument.required}};
            put_if_not_empty(item, "description", argument.description);
            if (!argument.completions.empty()) {
                item["completions"] = argument.completions;
            }
            arguments.push_back(std::move(item));
        }
        definition["arguments"] = std::move(arguments);
    }
    return PromptEntry{info.name, std::move(definition), std::move(handler), priority, origin};
}

void validate_tool_definition(const ToolEntry& entry) {
    const auto& definition = entry.definition;
    if (!definition.is_object()) {
        throw std::invalid_argument("definition must be an object");
    }
    require_optional_string(definition, "description");

    auto schema_it = definition.find("inputSchema");
    if (schema_it == definition.end() || !schema_it->is_object()) {
        throw std::invalid_argument("'inputSchema' must be an object");
    }
    const auto& schema = *schema_it;
    auto type_it = schema.find("type");
    if (type_it == schema.end() || !type_it->is_string() || *type_it != "object") {
        throw std::invalid_argument("'inputSchema.type' must be \"object\"");
    }
    if (schema.contains("properties") && !schema["properties"].is_object()) {
        throw std::invalid_argument("'inputSchema.properties' must be an object");
    }
    if (schema.contains("required")) {
        const auto& required = schema["required"];
        if (!required.is_array()) {
            throw std::invalid_argument("'inputSchema.required' must be an array");
        }
        for (const auto& item : required) {
            if (!item.is_string()) {
                throw std::invalid_argument("'inputSchema.required' entries must be strings");
            }
        }
    }
}

void validate_resource_definition(const ResourceEntry& entry) {
    const auto& definition = entry.definition;
    if (!definition.is_object()) {
        throw std::invalid_argument("definition must be an object");
    }
    require_string(definition, "uri", "resource");
    require_string(definition, "name", "resource");
    require_optional_string(definition, "description");
    if (!looks_like_uri(definition["uri"].get<std::string>())) {
        throw std::invalid_argument("invalid URI format: " + definition["uri"].get<std::string>());
    }
    if (definition["uri"] != entry.name) {
        throw std::invalid_argument("resource key must equal its URI");
    }
    validate_mime_type(definition);
}

void validate_resource_template_definition(const ResourceEntry& entry) {
    const auto& definition = entry.definition;
    if (!definition.is_object()) {
        throw std::invalid_argument("definition must be an object");
    }
    require_string(definition, "uriTemplate", "resource template");
    require_string(definition, "name", "resource template");
    const auto uri_template = definition["uriTemplate"].get<std::string>();
    if (!looks_like_uri(uri_template)) {
        throw std::invalid_argument("invalid URI template: " + uri_template);
    }
    if (uri_template.find('{') == std::string::npos) {
        throw std::invalid_argument("URI template has no variables: " + uri_template);
    }
    validate_mime_type(definition);
}

void validate_prompt_definition(const PromptEntry& entry) {
    const auto& definition = entry.definition;
    if (!definition.is_object()) {
        throw std::invalid_argument("definition must be an object");
    }
    require_string(definition, "name", "prompt");
    require_optional_string(definition, "description");

    auto args_it = definition.find("arguments");
    if (args_it == definition.end()) {
        return;
    }
    if (!args_it->is_array()) {
        throw std::invalid_argument("'arguments' must be an array");
    }
    for (const auto& argument : *args_it) {
        if (!argument.is_object()) {
            throw std::invalid_argument("prompt arguments must be objects");
        }
        require_string(argument, "name", "prompt argument");
        if (argument.contains("required") && !argument["required"].is_boolean()) {
            throw std::invalid_argument("'required' must be a boolean");
        }
    }
}

Features::Features()
    : tools("tools", error_code::kToolError, validate_tool_definition),
      resources("resources", error_code::kResourceError, validate_resource_definition),
      resource_templates("resource_templates", error_code::kResourceError,
                         validate_resource_template_definition),
      prompts("prompts", error_code::kPromptError, validate_prompt_definition) {
}

std::optional<ResourceEntry> Features::match_resource(const std::string& uri) const {
    if (auto exact = resources.find(uri)) {
        return exact;
    }
    for (auto& entry : resource_templates.list()) {
        const auto prefix = template_prefix(entry.name);
        if (!prefix.empty() && uri.size() > prefix.size() && uri.compare(0, prefix.size(), prefix) == 0) {
            return entry;
        }
    }
    return std::nullopt;
}

json Features::capabilities() const {
    json capabilities = json::object();
    if (logging_enabled.load()) {
        capabilities["logging"] = json::object();
    }
    if (tools.is_enabled()) {
        capabilities["tools"] = {{"listChanged", true}};
    }
    if (resources.is_enabled()) {
        capabilities["resources"] = {{"subscribe", true}, {"listChanged", true}};
    }
    if (prompts.is_enabled()) {
        capabilities["prompts"] = {{"listChanged", true}};
    }
    if (completion_enabled.load()) {
        capabilities["completions"] = json::object();
    }
    return capabilities;
}

} // namespace mcpd
