#pragma once

#include "mcp/EventStream.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Severity of a notifications/message event (RFC 5424 order)
 */
enum class LogLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Best-effort delivery of server-initiated notifications
 *
 * Holds one server-initiated channel per session plus the per-session
 * interest that filters delivery (resource subscriptions, minimum log
 * level). Publishing collects the target channels under the lock and
 * pushes to them after releasing it; a push never blocks, so a stuck
 * client cannot stall the publisher or the other sessions.
 */
class NotificationHub {
public:
    using SessionFilter = std::function<bool(const std::string& session_id)>;

    /**
     * @param retention Events kept per channel for resumption
     * @param queue_limit Pending events per live consumer
     */
    NotificationHub(size_t retention, size_t queue_limit);

    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    /**
     * @brief Get the session's channel, creating it on first use
     *
     * The channel outlives individual connections so cursors keep
     * increasing across reconnects.
     */
    std::shared_ptr<EventStream> open_channel(const std::string& session_id);

    std::shared_ptr<EventStream> channel(const std::string& session_id) const;

    /**
     * @brief Close the channel and forget every interest of the session
     */
    void drop_session(const std::string& session_id);

    /**
     * @brief Push a notification to every channel whose session passes the filter
     * @return Number of live consumers the notification was queued for
     */
    size_t publish(const SessionFilter& filter, const json& notification);

    size_t publish_to_session(const std::string& session_id, const json& notification);
    size_t broadcast(const json& notification);

    void subscribe(const std::string& session_id, const std::string& uri);
    bool unsubscribe(const std::string& session_id, const std::string& uri);
    bool is_subscribed(const std::string& session_id, const std::string& uri) const;

    void set_log_level(const std::string& session_id, LogLevel level);
    LogLevel log_level(const std::string& session_id) const;

    /**
     * @brief notifications/<kind>/list_changed to every session
     * @param kind Registry kind ("tools", "resources", "resource_templates", "prompts")
     */
    size_t notify_list_changed(const std::string& kind);

    /**
     * @brief notifications/resources/updated to subscribers of the URI
     */
    size_t notify_resource_updated(const std::string& uri);

    /**
     * @brief notifications/message to sessions whose level admits it
     * @param session_id Restrict to one session, or every session when empty
     */
    size_t log_message(LogLevel level, const std::string& logger, const json& data,
                       const std::string& session_id = "");

    /**
     * @brief notifications/progress for a request carrying a progress token
     */
    size_t notify_progress(const std::string& session_id, const json& progress_token,
                           double progress, std::optional<double> total = std::nullopt);

    size_t channel_count() const;

private:
    struct Interest {
        std::set<std::string> subscriptions;
        LogLevel level = LogLevel::Info;
    };

    const size_t retention_;
    const size_t queue_limit_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EventStream>> channels_;
    std::unordered_map<std::string, Interest> interests_;
};

} // namespace mcpd
