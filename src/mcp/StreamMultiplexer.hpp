#pragma once

#include "core/SessionStore.hpp"
#include "core/WorkerPool.hpp"
#include "mcp/EventStream.hpp"
#include "mcp/NotificationHub.hpp"
#include "mcp/ProtocolRouter.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief The parts of an HTTP request the multiplexer looks at
 */
struct InboundCall {
    std::string body;
    std::string accept;
    std::optional<std::string> session_id;     // Mcp-Session-Id
    std::optional<std::string> last_event_id;  // Last-Event-ID
};

/**
 * @brief How a reply is delivered
 */
enum class DeliveryMode {
    Empty,   ///< status only, no body
    Json,    ///< one JSON document (object or array)
    Stream   ///< server-sent events read from `stream`
};

/**
 * @brief What the HTTP binding has to send back
 *
 * For Stream replies the binding drains `stream` with `generation` and
 * calls StreamMultiplexer::release_stream() when the connection ends.
 */
struct Reply {
    int status = 200;
    DeliveryMode mode = DeliveryMode::Empty;
    std::optional<std::string> session_id;
    json body;
    std::shared_ptr<EventStream> stream;
    std::uint64_t generation = 0;
};

struct MultiplexerOptions {
    bool prefer_streaming = false;
    size_t stream_queue_limit = 1024;
    unsigned int batch_threads = 4;
};

/**
 * @brief Chooses between a JSON body and an event stream per inbound call
 *
 * POST carries requests: answered with 202 when nothing needs a reply,
 * one JSON document for a single request, and an event stream (one event
 * per response, in completion order) for several requests or when the
 * client asks for streaming. GET attaches to the session's long-lived
 * server-initiated channel with optional resumption. DELETE terminates
 * the session.
 *
 * Every stream the multiplexer hands out is bound to its session in the
 * SessionStore and tracked here until released, so session removal can
 * close all of them.
 */
class StreamMultiplexer {
public:
    /**
     * @brief Idle time after which a stream connection gets a keep-alive comment
     */
    static constexpr std::chrono::seconds kKeepAliveInterval{15};

    StreamMultiplexer(ProtocolRouter& router, SessionStore& sessions, NotificationHub& hub,
                      MultiplexerOptions options);
    ~StreamMultiplexer();

    StreamMultiplexer(const StreamMultiplexer&) = delete;
    StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

    Reply handle_post(const InboundCall& call);
    Reply handle_get(const InboundCall& call);
    Reply handle_delete(const InboundCall& call);

    /**
     * @brief A stream connection ended (client gone or stream finished)
     */
    void release_stream(const std::shared_ptr<EventStream>& stream, std::uint64_t generation);

    /**
     * @brief Close the streams of a removed session
     *
     * Wired to the SessionStore removal listener.
     */
    void on_session_removed(const std::string& session_id, const std::vector<StreamHandle>& streams);

    /**
     * @brief Close every tracked stream and stop the batch workers
     */
    void shutdown();

    size_t open_stream_count() const;

    static bool accepts_event_stream(const std::string& accept);
    static bool accepts_only_event_stream(const std::string& accept);

private:
    Reply respond_json(std::vector<json> messages, bool is_batch, const std::string& session_id);
    Reply respond_stream(std::vector<json> messages, const std::string& session_id);

    void track(const std::shared_ptr<EventStream>& stream);
    void untrack(StreamHandle handle);

    static Reply error_reply(int status, const McpError& error);
    /// True for an initialize request, which a batch runs ahead of its siblings.
    static bool is_initialize(const nlohmann::json& message);

    ProtocolRouter& router_;
    SessionStore& sessions_;
    NotificationHub& hub_;
    MultiplexerOptions options_;

    mutable std::mutex streams_mutex_;
    std::unordered_map<StreamHandle, std::shared_ptr<EventStream>> streams_;

    WorkerPool batch_pool_;
};

} // namespace mcpd
