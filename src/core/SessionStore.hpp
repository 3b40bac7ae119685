#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

using StreamHandle = std::uint64_t;

enum class SessionState {
    Created,
    Active,
    Idle,
    Expired
};

const char* to_string(SessionState state);

/**
 * @brief Copy of one session's state at a point in time
 */
struct SessionInfo {
    std::string id;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_activity_at;
    SessionState state = SessionState::Created;
    bool initialized = false;
    json capabilities;
    std::vector<StreamHandle> stream_bindings;
    json attributes = json::object();
};

/**
 * @brief Tracks client sessions, their activity and their bound streams
 *
 * Sessions are minted with an unguessable random id, kept alive by touch(),
 * and removed either by terminate() or by the background sweep once idle
 * longer than the configured timeout. Removal notifies the removal
 * listener with the streams that were bound to the session so the owner
 * of those streams can close them.
 *
 * Locking: resolve/touch/bind take the shared lock (per-session fields are
 * atomics or guarded by a per-session mutex); create/sweep/terminate take
 * the exclusive lock. Because touch() needs the shared lock, it is ordered
 * strictly before or after any sweep decision.
 */
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Called after a session was removed (expiry or termination)
     * @param session_id Removed session
     * @param streams Streams that were bound to it
     */
    using RemovalListener = std::function<void(const std::string& session_id,
                                               const std::vector<StreamHandle>& streams)>;

    struct Resolved {
        std::string session_id;
        bool is_new = false;
    };

    /**
     * @param timeout Inactivity after which a session expires (zero: never)
     * @param sweep_interval Period of the background sweep (zero: no sweeper thread)
     */
    SessionStore(std::chrono::milliseconds timeout, std::chrono::milliseconds sweep_interval);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Mint a new session with a fresh random id
     */
    std::string create();

    /**
     * @brief Resolve the id a client presented
     *
     * - no id: a new session is minted (is_new = true)
     * - known, live id: touched and returned (is_new = false)
     * - unknown or expired id: nullopt; nothing is fabricated and the
     *   caller decides whether to reject or mint
     */
    std::optional<Resolved> resolve(const std::optional<std::string>& presented_id);

    /**
     * @brief Record activity; returns false for unknown sessions
     */
    bool touch(const std::string& session_id, Clock::time_point now = Clock::now());

    bool bind_stream(const std::string& session_id, StreamHandle stream);
    bool unbind_stream(const std::string& session_id, StreamHandle stream);

    /**
     * @brief Remove every session inactive for longer than the timeout
     * @return Number of removed sessions
     */
    size_t sweep(Clock::time_point now = Clock::now());

    /**
     * @brief Remove a session immediately, bypassing the timeout
     * @return false if the session did not exist
     */
    bool terminate(const std::string& session_id);

    /**
     * @brief Complete the initialize handshake for a session
     *
     * Freezes the advertised capability set. Returns false when the session
     * is unknown or was already initialized.
     */
    bool try_initialize(const std::string& session_id, const json& capabilities);

    bool is_initialized(const std::string& session_id) const;

    /**
     * @brief Move a Created/Idle session to Active
     */
    void mark_active(const std::string& session_id);

    bool set_attribute(const std::string& session_id, const std::string& key, json value);
    std::optional<json> attribute(const std::string& session_id, const std::string& key) const;

    bool contains(const std::string& session_id) const;
    std::optional<SessionInfo> snapshot(const std::string& session_id) const;
    size_t size() const;
    std::vector<std::string> session_ids() const;

    void set_removal_listener(RemovalListener listener);

    /**
     * @brief Stop the background sweeper (idempotent)
     */
    void stop();

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    struct Session {
        Session(std::string session_id, Clock::time_point now);

        const std::string id;
        const Clock::time_point created_at;
        std::atomic<Clock::rep> last_activity;
        std::atomic<SessionState> state{SessionState::Created};

        mutable std::mutex mutex;  // guards the fields below
        bool initialized = false;
        json capabilities;
        std::set<StreamHandle> streams;
        json attributes = json::object();
    };

    std::shared_ptr<Session> find(const std::string& session_id) const;
    bool is_expired(const Session& session, Clock::time_point now) const;
    void notify_removed(const std::vector<std::pair<std::string, std::vector<StreamHandle>>>& removed);
    void sweeper_loop();

    static std::string generate_session_id();

    const std::chrono::milliseconds timeout_;
    const std::chrono::milliseconds sweep_interval_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    std::mutex listener_mutex_;
    RemovalListener removal_listener_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
    std::thread sweeper_;
};

} // namespace mcpd
