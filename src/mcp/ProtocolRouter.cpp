#include "ProtocolRouter.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <stdexcept>

namespace mcpd {

ProtocolRouter::ProtocolRouter(DispatchTable& dispatch, SessionStore& sessions,
                               std::chrono::milliseconds timeout, unsigned int worker_threads)
    : dispatch_(dispatch), sessions_(sessions), timeout_(timeout) {
    if (timeout_.count() > 0) {
        pool_ = std::make_unique<WorkerPool>(worker_threads, "handlers");
    }

    dispatch_.on_notification("notifications/cancelled", [this](const json& params, const CallContext& context) {
        if (!params.is_object() || !params.contains("requestId")) {
            throw McpError::invalid_params("Missing required parameter: requestId");
        }
        const json& request_id = params["requestId"];
        if (cancel(context.session_id, request_id)) {
            spdlog::info("Request {} cancelled by client: {}", request_id.dump(),
                         params.value("reason", std::string("no reason given")));
        } else {
            spdlog::debug("Cancellation for request {} ignored, not in flight", request_id.dump());
        }
    });
}

ProtocolRouter::~ProtocolRouter() {
    shutdown();
}

void ProtocolRouter::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

std::optional<json> ProtocolRouter::handle_message(const json& message, const std::string& session_id) {
    Envelope envelope = classify(message);

    switch (envelope.kind) {
        case MessageKind::Response:
            spdlog::debug("Ignoring client response for id {}", envelope.id.dump());
            return std::nullopt;

        case MessageKind::Notification:
            if (!envelope.problem.empty()) {
                spdlog::warn("Dropping malformed notification {}: {}", envelope.method, envelope.problem);
                return std::nullopt;
            }
            dispatch_notification(envelope, session_id);
            return std::nullopt;

        case MessageKind::Invalid:
            spdlog::warn("Invalid request: {}", envelope.problem);
            return make_error_response(envelope.id, McpError::invalid_request(envelope.problem));

        case MessageKind::Request:
            return dispatch_request(envelope, session_id);
    }
    return std::nullopt;
}

std::optional<json> ProtocolRouter::handle_payload(const std::string& text, const std::string& session_id) {
    Payload payload;
    try {
        payload = parse_payload(text);
    } catch (const McpError& e) {
        spdlog::warn("Rejected payload: {}", e.what());
        return make_error_response(nullptr, e);
    }

    if (!payload.is_batch) {
        return handle_message(payload.messages.front(), session_id);
    }

    json responses = json::array();
    for (const auto& message : payload.messages) {
        if (auto response = handle_message(message, session_id)) {
            responses.push_back(std::move(*response));
        }
    }
    if (responses.empty()) {
        return std::nullopt;
    }
    return responses;
}

std::optional<json> ProtocolRouter::dispatch_request(const Envelope& envelope, const std::string& session_id) {
    const json& id = envelope.id;

    if (!DispatchTable::allowed_before_initialize(envelope.method) && !sessions_.is_initialized(session_id)) {
        spdlog::warn("Rejected {} before initialize on session {}", envelope.method, session_id);
        return make_error_response(id, McpError::invalid_request("Server not initialized"));
    }

    const MethodHandler* handler = dispatch_.find_request(envelope.method);
    if (!handler) {
        spdlog::warn("Unknown method: {}", envelope.method);
        return make_error_response(id, McpError::method_not_found(envelope.method));
    }

    const std::string key = in_flight_key(session_id, id);
    std::uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        if (in_flight_.count(key) > 0) {
            return make_error_response(id, McpError::invalid_request("Request id already in flight: " + id.dump()));
        }
        token = next_token_++;
        in_flight_.emplace(key, InFlightRecord{id, envelope.method, session_id,
                                               std::chrono::steady_clock::now(), token});
    }

    CallContext context{session_id, id, nullptr};
    if (envelope.params.is_object()) {
        auto meta = envelope.params.find("_meta");
        if (meta != envelope.params.end() && meta->is_object() && meta->contains("progressToken")) {
            context.progress_token = (*meta)["progressToken"];
        }
    }

    spdlog::debug("Dispatching {} (id {}) for session {}", envelope.method, id.dump(), session_id);

    json response;
    try {
        response = make_result_response(id, invoke(*handler, envelope.params, context));
    } catch (const McpError& e) {
        spdlog::error("{} (id {}) failed with {}: {}", envelope.method, id.dump(), e.code(), e.what());
        response = make_error_response(id, e);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{} (id {}) rejected params: {}", envelope.method, id.dump(), e.what());
        response = make_error_response(id, McpError::invalid_params(e.what()));
    } catch (const json::exception& e) {
        spdlog::error("{} (id {}) rejected params: {}", envelope.method, id.dump(), e.what());
        response = make_error_response(id, McpError::invalid_params(e.what()));
    } catch (const std::exception& e) {
        spdlog::error("{} (id {}) faulted: {}", envelope.method, id.dump(), e.what());
        response = make_error_response(id, McpError::internal_error(e.what()));
    } catch (...) {
        spdlog::error("{} (id {}) faulted with a non-standard exception", envelope.method, id.dump());
        response = make_error_response(id, McpError(error_code::kInternalError, "Internal error"));
    }

    if (complete(key, token)) {
        spdlog::info("Discarding result of cancelled request {} ({})", id.dump(), envelope.method);
        return std::nullopt;
    }
    return response;
}

void ProtocolRouter::dispatch_notification(const Envelope& envelope, const std::string& session_id) {
    if (envelope.method != "notifications/cancelled" && !sessions_.is_initialized(session_id)) {
        spdlog::debug("Dropping {} before initialize on session {}", envelope.method, session_id);
        return;
    }

    const NotificationHandler* handler = dispatch_.find_notification(envelope.method);
    if (!handler) {
        spdlog::debug("No handler for notification {}", envelope.method);
        return;
    }

    CallContext context{session_id, nullptr, nullptr};
    try {
        (*handler)(envelope.params, context);
    } catch (const McpError& e) {
        spdlog::warn("Notification {} failed with {}: {}", envelope.method, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Notification {} failed: {}", envelope.method, e.what());
    } catch (...) {
        spdlog::warn("Notification {} failed with a non-standard exception", envelope.method);
    }
}

json ProtocolRouter::invoke(const MethodHandler& handler, const json& params, const CallContext& context) {
    if (!pool_) {
        return handler(params, context);
    }

    // Copies: a timed-out task keeps running after this frame is gone
    auto future = pool_->submit([handler, params, context]() {
        return handler(params, context);
    });
    if (future.wait_for(timeout_) == std::future_status::timeout) {
        throw McpError(error_code::kInternalError, "Request timed out",
                       json{{"timeoutMs", timeout_.count()}});
    }
    return future.get();
}

bool ProtocolRouter::complete(const std::string& key, std::uint64_t token) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(key);
    if (it != in_flight_.end() && it->second.token == token) {
        in_flight_.erase(it);
        return false;
    }
    return cancelled_.erase(token) > 0;
}

bool ProtocolRouter::cancel(const std::string& session_id, const json& request_id) {
    const std::string key = in_flight_key(session_id, request_id);
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end()) {
        return false;
    }
    cancelled_.insert(it->second.token);
    in_flight_.erase(it);
    return true;
}

size_t ProtocolRouter::in_flight_count() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

std::vector<InFlightRecord> ProtocolRouter::in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    std::vector<InFlightRecord> records;
    records.reserve(in_flight_.size());
    for (const auto& [key, record] : in_flight_) {
        records.push_back(record);
    }
    return records;
}

std::string ProtocolRouter::in_flight_key(const std::string& session_id, const json& id) {
    return session_id + '\n' + request_key(id);
}

} // namespace mcpd
