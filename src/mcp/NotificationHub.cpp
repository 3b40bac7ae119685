#include "NotificationHub.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <vector>

namespace mcpd {

namespace {

constexpr std::array<const char*, 8> kLevelNames = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

std::string list_changed_method(const std::string& kind) {
    if (kind == "resource_templates") {
        return "notifications/resources/list_changed";
    }
    return "notifications/" + kind + "/list_changed";
}

} // namespace

const char* to_string(LogLevel level) {
    return kLevelNames[static_cast<size_t>(level)];
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (name == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

NotificationHub::NotificationHub(size_t retention, size_t queue_limit)
    : retention_(retention), queue_limit_(queue_limit) {
}

std::shared_ptr<EventStream> NotificationHub::open_channel(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = channels_[session_id];
    if (!slot || slot->is_closed()) {
        slot = std::make_shared<EventStream>(session_id, retention_, queue_limit_);
        spdlog::debug("Opened notification channel {} for session {}", slot->handle(), session_id);
    }
    return slot;
}

std::shared_ptr<EventStream> NotificationHub::channel(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(session_id);
    return it == channels_.end() ? nullptr : it->second;
}

void NotificationHub::drop_session(const std::string& session_id) {
    std::shared_ptr<EventStream> stream;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = channels_.find(session_id);
        if (it != channels_.end()) {
            stream = std::move(it->second);
            channels_.erase(it);
        }
        interests_.erase(session_id);
    }
    if (stream) {
        stream->close();
    }
}

size_t NotificationHub::publish(const SessionFilter& filter, const json& notification) {
    std::vector<std::shared_ptr<EventStream>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        targets.reserve(channels_.size());
        for (const auto& [session_id, stream] : channels_) {
            if (!filter || filter(session_id)) {
                targets.push_back(stream);
            }
        }
    }

    size_t delivered = 0;
    for (const auto& stream : targets) {
        if (stream->push(notification)) {
            ++delivered;
        }
    }

    spdlog::debug("Published {} to {} of {} channels",
                  notification.value("method", std::string("notification")), delivered, targets.size());
    return delivered;
}

size_t NotificationHub::publish_to_session(const std::string& session_id, const json& notification) {
    return publish([&session_id](const std::string& id) { return id == session_id; }, notification);
}

size_t NotificationHub::broadcast(const json& notification) {
    return publish(nullptr, notification);
}

void NotificationHub::subscribe(const std::string& session_id, const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    interests_[session_id].subscriptions.insert(uri);
}

bool NotificationHub::unsubscribe(const std::string& session_id, const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = interests_.find(session_id);
    if (it == interests_.end()) {
        return false;
    }
    return it->second.subscriptions.erase(uri) > 0;
}

bool NotificationHub::is_subscribed(const std::string& session_id, const std::string& uri) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = interests_.find(session_id);
    return it != interests_.end() && it->second.subscriptions.count(uri) > 0;
}

void NotificationHub::set_log_level(const std::string& session_id, LogLevel level) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    interests_[session_id].level = level;
}

LogLevel NotificationHub::log_level(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = interests_.find(session_id);
    return it == interests_.end() ? LogLevel::Info : it->second.level;
}

size_t NotificationHub::notify_list_changed(const std::string& kind) {
    return broadcast(make_notification(list_changed_method(kind), json::object()));
}

size_t NotificationHub::notify_resource_updated(const std::string& uri) {
    // the filter runs under the shared lock; read interests_ directly
    return publish([this, &uri](const std::string& session_id) {
        auto it = interests_.find(session_id);
        return it != interests_.end() && it->second.subscriptions.count(uri) > 0;
    }, make_notification("notifications/resources/updated", {{"uri", uri}}));
}

size_t NotificationHub::log_message(LogLevel level, const std::string& logger, const json& data,
                                    const std::string& session_id) {
    json params = {{"level", to_string(level)}, {"data", data}};
    if (!logger.empty()) {
        params["logger"] = logger;
    }

    return publish([this, level, &session_id](const std::string& id) {
        if (!session_id.empty() && id != session_id) {
            return false;
        }
        auto it = interests_.find(id);
        const LogLevel minimum = it == interests_.end() ? LogLevel::Info : it->second.level;
        return level >= minimum;
    }, make_notification("notifications/message", params));
}

size_t NotificationHub::notify_progress(const std::string& session_id, const json& progress_token,
                                        double progress, std::optional<double> total) {
    json params = {{"progressToken", progress_token}, {"progress", progress}};
    if (total) {
        params["total"] = *total;
    }
    return publish_to_session(session_id, make_notification("notifications/progress", params));
}

size_t NotificationHub::channel_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return channels_.size();
}

} // namespace mcpd
