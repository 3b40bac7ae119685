#pragma once

#include "core/Features.hpp"
#include "core/SessionStore.hpp"
#include "mcp/NotificationHub.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Who is calling, passed to every dispatched handler
 */
struct CallContext {
    std::string session_id;
    json request_id;      // null for notifications
    json progress_token;  // params._meta.progressToken, null when absent
};

/**
 * @brief Identity reported in the initialize result
 */
struct ServerIdentity {
    std::string name = "mcpd";
    std::string version = "0.1.0";
    std::optional<std::string> instructions;
};

using MethodHandler = std::function<json(const json& params, const CallContext& context)>;
using NotificationHandler = std::function<void(const json& params, const CallContext& context)>;

/**
 * @brief Maps protocol method names to handlers
 *
 * The standard MCP methods are installed at construction; they close over
 * the feature registries, the session store and the notification hub,
 * which the table references but does not own. Handlers report failures
 * by throwing McpError (or a subclass); the router converts them.
 */
class DispatchTable {
public:
    /**
     * @brief Entries returned per page by the list methods
     */
    static constexpr size_t kPageSize = 50;

    /**
     * @brief Values returned at most by completion/complete
     */
    static constexpr size_t kMaxCompletions = 100;

    DispatchTable(Features& features, SessionStore& sessions, NotificationHub& hub,
                  ServerIdentity identity);

    DispatchTable(const DispatchTable&) = delete;
    DispatchTable& operator=(const DispatchTable&) = delete;

    /**
     * @brief Install or replace a request handler
     */
    void on_request(const std::string& method, MethodHandler handler);

    /**
     * @brief Install or replace a notification handler
     */
    void on_notification(const std::string& method, NotificationHandler handler);

    const MethodHandler* find_request(const std::string& method) const;
    const NotificationHandler* find_notification(const std::string& method) const;

    /**
     * @brief Methods a session may call before completing the handshake
     */
    static bool allowed_before_initialize(const std::string& method);

    const ServerIdentity& identity() const { return identity_; }

private:
    void install_defaults();

    json handle_initialize(const json& params, const CallContext& context);
    json handle_tools_list(const json& params);
    json handle_tools_call(const json& params, const CallContext& context);
    json handle_resources_list(const json& params);
    json handle_resource_templates_list(const json& params);
    json handle_resources_read(const json& params);
    json handle_resources_subscribe(const json& params, const CallContext& context);
    json handle_resources_unsubscribe(const json& params, const CallContext& context);
    json handle_prompts_list(const json& params);
    json handle_prompts_get(const json& params);
    json handle_logging_set_level(const json& params, const CallContext& context);
    json handle_completion_complete(const json& params);

    void handle_initialized_notification(const json& params, const CallContext& context);

    /// Hub state recorded for a session must not outlive the session's removal.
    void require_session(const std::string& session_id) const;
    void forget_if_removed(const std::string& session_id);

    Features& features_;
    SessionStore& sessions_;
    NotificationHub& hub_;
    ServerIdentity identity_;

    std::unordered_map<std::string, MethodHandler> requests_;
    std::unordered_map<std::string, NotificationHandler> notifications_;
};

} // namespace mcpd
