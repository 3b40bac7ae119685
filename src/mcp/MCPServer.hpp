#pragma once

#include "ITransport.hpp"
#include "core/Config.hpp"
#include "core/Features.hpp"
#include "core/SessionStore.hpp"
#include "mcp/DispatchTable.hpp"
#include "mcp/HttpTransport.hpp"
#include "mcp/NotificationHub.hpp"
#include "mcp/ProtocolRouter.hpp"
#include "mcp/StreamMultiplexer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief MCP server implementing JSON-RPC 2.0 over stdio or HTTP
 *
 * Owns every component of one server instance: the feature registries,
 * the session store, the notification hub, the dispatch table, the router
 * and, for the HTTP transport, the stream multiplexer and HTTP binding.
 * Registry changes are announced to clients automatically.
 */
class MCPServer {
public:
    /**
     * @brief Construct server from a validated configuration
     * @throws ConfigError if the configuration is invalid
     */
    explicit MCPServer(const Config& config);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     * @throws RegistryError on duplicate name (with RegisterMode::Reject) or invalid schema
     */
    void register_tool(const ToolInfo& info, ToolHandler handler,
                       RegisterMode mode = RegisterMode::Reject, int priority = 0,
                       EntryOrigin origin = EntryOrigin::Dynamic);

    void register_resource(const ResourceInfo& info, ResourceHandler handler,
                           RegisterMode mode = RegisterMode::Reject, int priority = 0,
                           EntryOrigin origin = EntryOrigin::Dynamic);

    void register_resource_template(const ResourceTemplateInfo& info, ResourceHandler handler,
                                    RegisterMode mode = RegisterMode::Reject, int priority = 0,
                                    EntryOrigin origin = EntryOrigin::Dynamic);

    void register_prompt(const PromptInfo& info, PromptHandler handler,
                         RegisterMode mode = RegisterMode::Reject, int priority = 0,
                         EntryOrigin origin = EntryOrigin::Dynamic);

    void unregister_tool(const std::string& name);
    void unregister_resource(const std::string& uri);
    void unregister_prompt(const std::string& name);

    /**
     * @brief Tell subscribers that a resource's content changed
     * @return Number of live streams the notification reached
     */
    size_t notify_resource_updated(const std::string& uri);

    /**
     * @brief Send a notifications/message to every session admitting the level
     */
    size_t log_message(LogLevel level, const std::string& logger, const json& data);

    /**
     * @brief Serve a single implicit session over a line transport
     *
     * Blocks until stop() is called or the transport reaches EOF.
     * Notifications queued for the session are written between replies.
     */
    void run(ITransport& transport);

    /**
     * @brief Bind the HTTP endpoint and serve on background threads
     * @throws std::runtime_error if the transport is not HTTP or binding fails
     */
    void start_http();

    /**
     * @brief Block until the HTTP listener stops
     */
    void wait();

    /**
     * @brief Stop the transports, close every stream and the session sweeper
     */
    void stop();

    /**
     * @brief Ask the stdio loop to exit after the current message
     *
     * Only flips an atomic flag, so it may be called from a signal handler.
     */
    void request_stop() { running_ = false; }

    bool is_running() const;

    /**
     * @brief Bound HTTP port, valid after start_http()
     */
    int http_port() const;

    const Config& config() const { return config_; }
    Features& features() { return features_; }
    SessionStore& sessions() { return sessions_; }
    NotificationHub& hub() { return hub_; }
    ProtocolRouter& router() { return router_; }
    StreamMultiplexer* multiplexer() { return multiplexer_.get(); }

private:
    void flush_notifications(ITransport& transport, EventStream& channel, std::uint64_t generation);

    Config config_;
    Features features_;
    SessionStore sessions_;
    NotificationHub hub_;
    DispatchTable dispatch_;
    ProtocolRouter router_;
    std::unique_ptr<StreamMultiplexer> multiplexer_;
    std::unique_ptr<HttpTransport> http_;
    std::atomic<bool> running_{false};
};

} // namespace mcpd
