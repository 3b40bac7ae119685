#include "SessionStore.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <random>

namespace mcpd {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Active:
            return "active";
        case SessionState::Idle:
            return "idle";
        case SessionState::Expired:
            return "expired";
    }
    return "unknown";
}

SessionStore::Session::Session(std::string session_id, Clock::time_point now)
    : id(std::move(session_id)), created_at(now), last_activity(now.time_since_epoch().count()) {
}

SessionStore::SessionStore(std::chrono::milliseconds timeout, std::chrono::milliseconds sweep_interval)
    : timeout_(timeout), sweep_interval_(sweep_interval) {
    if (timeout_.count() > 0 && sweep_interval_.count() > 0) {
        sweeper_ = std::thread([this]() { sweeper_loop(); });
        spdlog::debug("Session sweeper started (timeout {} ms, interval {} ms)",
                      timeout_.count(), sweep_interval_.count());
    }
}

SessionStore::~SessionStore() {
    stop();
}

void SessionStore::stop() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
        spdlog::debug("Session sweeper stopped");
    }
}

void SessionStore::sweeper_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex_);
            if (sweeper_cv_.wait_for(lock, sweep_interval_, [this] { return sweeper_stop_; })) {
                return;
            }
        }

        try {
            sweep(Clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Session sweep failed: {}", e.what());
        }
    }
}

std::string SessionStore::generate_session_id() {
    // random_device is backed by the kernel CSPRNG on the supported platforms
    static thread_local std::random_device rd;
    std::uint32_t words[4];
    for (auto& word : words) {
        word = rd();
    }
    // RFC 4122 version 4 layout
    words[1] = (words[1] & 0xffff0fffu) | 0x00004000u;
    words[2] = (words[2] & 0x3fffffffu) | 0x80000000u;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%04x%08x",
                  words[0], words[1] >> 16, words[1] & 0xffffu,
                  words[2] >> 16, words[2] & 0xffffu, words[3]);
    return buffer;
}

std::string SessionStore::create() {
    const auto now = Clock::now();
    std::string id;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        do {
            id = generate_session_id();
        } while (sessions_.count(id) > 0);
        sessions_.emplace(id, std::make_shared<Session>(id, now));
    }
    spdlog::info("Created session: {}", id);
    return id;
}

std::optional<SessionStore::Resolved> SessionStore::resolve(const std::optional<std::string>& presented_id) {
    if (!presented_id || presented_id->empty()) {
        return Resolved{create(), true};
    }

    const auto now = Clock::now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(*presented_id);
    if (it == sessions_.end() || is_expired(*it->second, now)) {
        spdlog::debug("Rejected session id presented by client");
        return std::nullopt;
    }

    auto& session = *it->second;
    session.last_activity.store(now.time_since_epoch().count(), std::memory_order_release);
    auto idle = SessionState::Idle;
    session.state.compare_exchange_strong(idle, SessionState::Active);
    return Resolved{session.id, false};
}

bool SessionStore::touch(const std::string& session_id, Clock::time_point now) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    auto& session = *it->second;
    const auto stamp = now.time_since_epoch().count();
    auto current = session.last_activity.load(std::memory_order_acquire);
    while (current < stamp
           && !session.last_activity.compare_exchange_weak(current, stamp, std::memory_order_acq_rel)) {
    }
    auto idle = SessionState::Idle;
    session.state.compare_exchange_strong(idle, SessionState::Active);
    return true;
}

bool SessionStore::bind_stream(const std::string& session_id, StreamHandle stream) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    session->streams.insert(stream);
    return true;
}

bool SessionStore::unbind_stream(const std::string& session_id, StreamHandle stream) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    return session->streams.erase(stream) > 0;
}

bool SessionStore::is_expired(const Session& session, Clock::time_point now) const {
    if (timeout_.count() <= 0) {
        return false;
    }
    const Clock::time_point last{Clock::duration(session.last_activity.load(std::memory_order_acquire))};
    return now - last > timeout_;
}

size_t SessionStore::sweep(Clock::time_point now) {
    if (timeout_.count() <= 0) {
        return 0;
    }

    std::vector<std::pair<std::string, std::vector<StreamHandle>>> removed;
    {
        // Exclusive: no touch() can interleave with the expiry decision
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& session = *it->second;
            if (is_expired(session, now)) {
                session.state.store(SessionState::Expired);
                std::vector<StreamHandle> streams;
                {
                    std::lock_guard<std::mutex> guard(session.mutex);
                    streams.assign(session.streams.begin(), session.streams.end());
                    session.streams.clear();
                }
                removed.emplace_back(session.id, std::move(streams));
                it = sessions_.erase(it);
                continue;
            }

            const Clock::time_point last{Clock::duration(session.last_activity.load())};
            if (now - last > timeout_ / 2) {
                auto active = SessionState::Active;
                session.state.compare_exchange_strong(active, SessionState::Idle);
            }
            ++it;
        }
    }

    for (const auto& item : removed) {
        spdlog::info("Expired session: {}", item.first);
    }
    if (!removed.empty()) {
        spdlog::info("Cleaned up {} expired sessions", removed.size());
    }
    notify_removed(removed);
    return removed.size();
}

bool SessionStore::terminate(const std::string& session_id) {
    std::vector<std::pair<std::string, std::vector<StreamHandle>>> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        std::vector<StreamHandle> streams;
        {
            std::lock_guard<std::mutex> guard(it->second->mutex);
            streams.assign(it->second->streams.begin(), it->second->streams.end());
            it->second->streams.clear();
        }
        removed.emplace_back(session_id, std::move(streams));
        sessions_.erase(it);
    }

    spdlog::info("Terminated session: {}", session_id);
    notify_removed(removed);
    return true;
}

void SessionStore::notify_removed(const std::vector<std::pair<std::string, std::vector<StreamHandle>>>& removed) {
    if (removed.empty()) {
        return;
    }
    RemovalListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = removal_listener_;
    }
    if (!listener) {
        return;
    }
    for (const auto& [session_id, streams] : removed) {
        try {
            listener(session_id, streams);
        } catch (const std::exception& e) {
            spdlog::error("Session cleanup for {} failed: {}", session_id, e.what());
        }
    }
}

bool SessionStore::try_initialize(const std::string& session_id, const json& capabilities) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    if (session->initialized) {
        return false;
    }
    session->initialized = true;
    session->capabilities = capabilities;
    return true;
}

bool SessionStore::is_initialized(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    return session->initialized;
}

void SessionStore::mark_active(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return;
    }
    auto state = session->state.load();
    while ((state == SessionState::Created || state == SessionState::Idle)
           && !session->state.compare_exchange_weak(state, SessionState::Active)) {
    }
}

bool SessionStore::set_attribute(const std::string& session_id, const std::string& key, json value) {
    auto session = find(session_id);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    session->attributes[key] = std::move(value);
    return true;
}

std::optional<json> SessionStore::attribute(const std::string& session_id, const std::string& key) const {
    auto session = find(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(session->mutex);
    auto it = session->attributes.find(key);
    if (it == session->attributes.end()) {
        return std::nullopt;
    }
    return *it;
}

bool SessionStore::contains(const std::string& session_id) const {
    return find(session_id) != nullptr;
}

std::optional<SessionInfo> SessionStore::snapshot(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return std::nullopt;
    }

    SessionInfo info;
    info.id = session->id;
    info.created_at = session->created_at;
    info.last_activity_at = Clock::time_point{Clock::duration(session->last_activity.load())};
    info.state = session->state.load();
    std::lock_guard<std::mutex> guard(session->mutex);
    info.initialized = session->initialized;
    info.capabilities = session->capabilities;
    info.stream_bindings.assign(session->streams.begin(), session->streams.end());
    info.attributes = session->attributes;
    return info;
}

size_t SessionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionStore::session_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

void SessionStore::set_removal_listener(RemovalListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    removal_listener_ = std::move(listener);
}

std::shared_ptr<SessionStore::Session> SessionStore::find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

} // namespace mcpd
