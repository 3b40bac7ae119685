#pragma once

#include "core/SessionStore.hpp"
#include "core/WorkerPool.hpp"
#include "mcp/DispatchTable.hpp"
#include "mcp/JsonRpc.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief A request currently being handled
 */
struct InFlightRecord {
    json id;
    std::string method;
    std::string session_id;
    std::chrono::steady_clock::time_point received_at;
    std::uint64_t token = 0;  // unique per dispatch, survives id reuse
};

/**
 * @brief JSON-RPC state machine in front of the dispatch table
 *
 * Each session starts Uninitialized and only accepts initialize (and ping)
 * until the handshake succeeds; it then stays Initialized for its whole
 * lifetime. The initialized flag lives in the SessionStore so every
 * connection of a session sees the same state.
 *
 * The router is the fault boundary: whatever a handler throws becomes an
 * error response for that request alone. Notifications never produce a
 * response, whatever their handler does.
 *
 * With a non-zero timeout, handlers run on the router's worker pool and
 * are waited for at most that long; a late result is discarded.
 */
class ProtocolRouter {
public:
    /**
     * @param dispatch Method table (the router installs notifications/cancelled)
     * @param sessions Session store holding the handshake state
     * @param timeout Execution bound per request (zero: handlers run inline, unbounded)
     * @param worker_threads Handler threads used when the bound is active
     */
    ProtocolRouter(DispatchTable& dispatch, SessionStore& sessions,
                   std::chrono::milliseconds timeout, unsigned int worker_threads);
    ~ProtocolRouter();

    ProtocolRouter(const ProtocolRouter&) = delete;
    ProtocolRouter& operator=(const ProtocolRouter&) = delete;

    /**
     * @brief Route one decoded message
     * @return The response, or nullopt for notifications, client responses
     *         and requests cancelled while in flight
     */
    std::optional<json> handle_message(const json& message, const std::string& session_id);

    /**
     * @brief Parse and route a raw payload sequentially
     *
     * Malformed JSON yields a -32700 response with a null id. A batch is
     * answered with an array of the responses it produced.
     *
     * @return nullopt when nothing needs a reply
     */
    std::optional<json> handle_payload(const std::string& text, const std::string& session_id);

    /**
     * @brief Mark an in-flight request as cancelled
     * @return true if the request was in flight
     */
    bool cancel(const std::string& session_id, const json& request_id);

    size_t in_flight_count() const;
    std::vector<InFlightRecord> in_flight() const;

    /**
     * @brief Stop the handler pool (idempotent)
     */
    void shutdown();

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::optional<json> dispatch_request(const Envelope& envelope, const std::string& session_id);
    void dispatch_notification(const Envelope& envelope, const std::string& session_id);

    json invoke(const MethodHandler& handler, const json& params, const CallContext& context);

    /**
     * @brief Remove a dispatch from the in-flight set
     *
     * Only the record carrying `token` is removed, so a newer request that
     * reused the id of a cancelled one keeps its record.
     *
     * @return true if this dispatch had been cancelled meanwhile
     */
    bool complete(const std::string& key, std::uint64_t token);

    static std::string in_flight_key(const std::string& session_id, const json& id);

    DispatchTable& dispatch_;
    SessionStore& sessions_;
    const std::chrono::milliseconds timeout_;
    std::unique_ptr<WorkerPool> pool_;

    mutable std::mutex in_flight_mutex_;
    std::unordered_map<std::string, InFlightRecord> in_flight_;
    std::unordered_set<std::uint64_t> cancelled_;
    std::uint64_t next_token_ = 1;
};

} // namespace mcpd
