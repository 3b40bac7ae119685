#pragma once

#include "core/Registry.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Metadata for a concrete resource
 */
struct ResourceInfo {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

/**
 * @brief Metadata for a parameterized resource family (RFC 6570 template)
 */
struct ResourceTemplateInfo {
    std::string uri_template;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
    std::vector<std::string> completions;  // candidate values for completion/complete
};

/**
 * @brief Metadata for a prompt template
 */
struct PromptInfo {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

/**
 * @brief Executes a tool
 * @param arguments JSON object with tool arguments
 * @return Tool result; a value without "content" is wrapped as text
 */
using ToolHandler = std::function<json(const json& arguments)>;

/**
 * @brief Reads resource contents
 * @param uri Requested URI (for templates, the expanded URI)
 * @return Array of content objects, or a single content object
 */
using ResourceHandler = std::function<json(const std::string& uri)>;

/**
 * @brief Renders a prompt
 * @param arguments JSON object of string arguments
 * @return Object with "messages" and optional "description"
 */
using PromptHandler = std::function<json(const json& arguments)>;

using ToolRegistry = Registry<ToolHandler>;
using ResourceRegistry = Registry<ResourceHandler>;
using PromptRegistry = Registry<PromptHandler>;

using ToolEntry = ToolRegistry::Entry;
using ResourceEntry = ResourceRegistry::Entry;
using PromptEntry = PromptRegistry::Entry;

ToolEntry make_tool_entry(const ToolInfo& info, ToolHandler handler,
                          int priority = 0, EntryOrigin origin = EntryOrigin::Dynamic);

ResourceEntry make_resource_entry(const ResourceInfo& info, ResourceHandler handler,
                                  int priority = 0, EntryOrigin origin = EntryOrigin::Dynamic);

ResourceEntry make_resource_template_entry(const ResourceTemplateInfo& info, ResourceHandler handler,
                                           int priority = 0, EntryOrigin origin = EntryOrigin::Dynamic);

PromptEntry make_prompt_entry(const PromptInfo& info, PromptHandler handler,
                              int priority = 0, EntryOrigin origin = EntryOrigin::Dynamic);

/**
 * @brief Definition validators used by the feature registries
 *
 * Each throws std::invalid_argument describing the first problem found.
 */
void validate_tool_definition(const ToolEntry& entry);
void validate_resource_definition(const ResourceEntry& entry);
void validate_resource_template_definition(const ResourceEntry& entry);
void validate_prompt_definition(const PromptEntry& entry);

/**
 * @brief All feature registries and gates of one server instance
 *
 * Constructed once at startup and shared by reference with the dispatch
 * table and the router.
 */
class Features {
public:
    Features();

    Features(const Features&) = delete;
    Features& operator=(const Features&) = delete;

    ToolRegistry tools;
    ResourceRegistry resources;
    ResourceRegistry resource_templates;
    PromptRegistry prompts;

    std::atomic<bool> logging_enabled{true};
    std::atomic<bool> completion_enabled{true};

    /**
     * @brief Resolve a URI against resources, then templates
     * @return Entry whose handler serves the URI, or nullopt
     */
    std::optional<ResourceEntry> match_resource(const std::string& uri) const;

    /**
     * @brief Capability object advertised in the initialize result
     */
    json capabilities() const;
};

} // namespace mcpd
