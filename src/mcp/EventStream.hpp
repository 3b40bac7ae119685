#pragma once

#include "core/SessionStore.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief One pushed message and its cursor
 */
struct StreamEvent {
    std::uint64_t cursor = 0;
    json message;
};

/**
 * @brief Ordered, resumable sequence of server-sent events
 *
 * Every pushed message gets the next cursor (strictly increasing, starting
 * at 1, never reused for the lifetime of the stream). The last `retention`
 * events are kept so a reconnecting consumer can replay what it missed.
 *
 * At most one consumer is attached at a time; attaching again supersedes
 * the previous consumer. Messages pushed while a consumer is attached are
 * queued for it up to `queue_limit`; beyond that they are dropped for the
 * live consumer (they stay in the retention buffer). push() never blocks
 * on the consumer.
 */
class EventStream {
public:
    enum class WaitStatus {
        Event,     ///< an event was returned
        Timeout,   ///< nothing arrived in time
        Finished,  ///< finish() was called and everything was delivered
        Closed     ///< closed, or this consumer was superseded
    };

    struct Attachment {
        std::uint64_t generation = 0;
        size_t replayed = 0;
        bool gap = false;  ///< requested cursor fell outside the retention window
    };

    /**
     * @param session_id Owning session
     * @param retention Number of events kept for replay (0: no replay)
     * @param queue_limit Pending events allowed for the live consumer
     */
    EventStream(std::string session_id, size_t retention, size_t queue_limit);

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    StreamHandle handle() const { return handle_; }
    const std::string& session_id() const { return session_id_; }

    /**
     * @brief Append a message
     * @return true if it was queued for a live consumer
     */
    bool push(const json& message);

    /**
     * @brief Attach a consumer, optionally resuming after a cursor
     *
     * With a cursor still inside the retention window, every retained event
     * after it is queued again in cursor order. An older cursor resumes
     * from now and reports a gap.
     */
    Attachment attach(std::optional<std::uint64_t> last_cursor = std::nullopt);

    /**
     * @brief Release the consumer if it is still the current one
     */
    void detach(std::uint64_t generation);

    /**
     * @brief Wait for the next event for a consumer
     */
    WaitStatus next(std::uint64_t generation, std::chrono::milliseconds timeout, StreamEvent& out);

    /**
     * @brief No further pushes; the consumer drains what is pending
     */
    void finish();

    /**
     * @brief Stop the stream immediately and wake the consumer
     */
    void close();

    bool is_closed() const;
    bool has_consumer() const;
    std::uint64_t last_cursor() const;
    size_t dropped() const;

    /**
     * @brief Render one event as an SSE frame ("id: N\ndata: ...\n\n")
     */
    static std::string format(const StreamEvent& event);

private:
    const StreamHandle handle_;
    const std::string session_id_;
    const size_t retention_;
    const size_t queue_limit_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_cursor_ = 1;
    std::uint64_t generation_ = 0;
    bool attached_ = false;
    bool finished_ = false;
    bool closed_ = false;
    size_t dropped_ = 0;
    std::deque<StreamEvent> retained_;
    std::deque<StreamEvent> pending_;
};

} // namespace mcpd
