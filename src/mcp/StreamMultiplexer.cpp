#include "StreamMultiplexer.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <future>
#include <utility>

namespace mcpd {

namespace {

std::optional<std::uint64_t> parse_event_id(const std::string& value) {
    if (value.empty() || value.size() > 19 || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return std::stoull(value);
}

} // namespace

StreamMultiplexer::StreamMultiplexer(ProtocolRouter& router, SessionStore& sessions, NotificationHub& hub,
                                     MultiplexerOptions options)
    : router_(router),
      sessions_(sessions),
      hub_(hub),
      options_(options),
      batch_pool_(options.batch_threads, "batches") {
}

StreamMultiplexer::~StreamMultiplexer() {
    shutdown();
}

bool StreamMultiplexer::accepts_event_stream(const std::string& accept) {
    return accept.find("text/event-stream") != std::string::npos;
}

bool StreamMultiplexer::accepts_only_event_stream(const std::string& accept) {
    return accepts_event_stream(accept)
        && accept.find("application/json") == std::string::npos
        && accept.find("*/*") == std::string::npos;
}

bool StreamMultiplexer::is_initialize(const json& message) {
    return message.is_object() && message.contains("id") && message.value("method", json()) == "initialize";
}

Reply StreamMultiplexer::error_reply(int status, const McpError& error) {
    Reply reply;
    reply.status = status;
    reply.mode = DeliveryMode::Json;
    reply.body = make_error_response(nullptr, error);
    return reply;
}

Reply StreamMultiplexer::handle_post(const InboundCall& call) {
    Payload payload;
    try {
        payload = parse_payload(call.body);
    } catch (const McpError& e) {
        spdlog::warn("Rejected POST body: {}", e.what());
        return error_reply(400, e);
    }

    auto resolved = sessions_.resolve(call.session_id);
    if (!resolved) {
        return error_reply(404, McpError(error_code::kTransportError, "Session not found"));
    }
    const std::string session_id = resolved->session_id;

    size_t requests = 0;
    for (const auto& message : payload.messages) {
        if (classify(message).expects_reply()) {
            ++requests;
        }
    }

    Reply reply;
    if (requests == 0) {
        for (const auto& message : payload.messages) {
            router_.handle_message(message, session_id);
        }
        reply.status = 202;
    } else {
        const bool streaming = requests == 1
            ? accepts_only_event_stream(call.accept)
                || (options_.prefer_streaming && accepts_event_stream(call.accept))
            : accepts_event_stream(call.accept);

        spdlog::debug("POST with {} messages ({} requests) on session {} answered as {}",
                      payload.messages.size(), requests, session_id, streaming ? "stream" : "json");
        reply = streaming
            ? respond_stream(std::move(payload.messages), session_id)
            : respond_json(std::move(payload.messages), payload.is_batch, session_id);
    }

    reply.session_id = session_id;
    return reply;
}

Reply StreamMultiplexer::respond_json(std::vector<json> messages, bool is_batch, const std::string& session_id) {
    std::vector<std::optional<json>> results(messages.size());
    if (messages.size() == 1) {
        results[0] = router_.handle_message(messages[0], session_id);
    } else {
        for (size_t i = 0; i < messages.size(); ++i) {
            if (is_initialize(messages[i])) {
                results[i] = router_.handle_message(messages[i], session_id);
            }
        }
        std::vector<std::pair<size_t, std::future<std::optional<json>>>> futures;
        futures.reserve(messages.size());
        for (size_t i = 0; i < messages.size(); ++i) {
            if (is_initialize(messages[i])) {
                continue;
            }
            futures.emplace_back(i, batch_pool_.submit([this, message = std::move(messages[i]), session_id]() {
                return router_.handle_message(message, session_id);
            }));
        }
        for (auto& [index, future] : futures) {
            results[index] = future.get();
        }
    }

    Reply reply;
    if (is_batch) {
        json responses = json::array();
        for (auto& result : results) {
            if (result) {
                responses.push_back(std::move(*result));
            }
        }
        if (!responses.empty()) {
            reply.mode = DeliveryMode::Json;
            reply.body = std::move(responses);
        }
    } else if (results.front()) {
        reply.mode = DeliveryMode::Json;
        reply.body = std::move(*results.front());
    }

    // everything got cancelled
    if (reply.mode == DeliveryMode::Empty) {
        reply.status = 202;
    }
    return reply;
}

Reply StreamMultiplexer::respond_stream(std::vector<json> messages, const std::string& session_id) {
    auto stream = std::make_shared<EventStream>(session_id, 0,
                                                std::max(options_.stream_queue_limit, messages.size()));
    const auto attachment = stream->attach();
    if (!sessions_.bind_stream(session_id, stream->handle())) {
        stream->close();
        return error_reply(404, McpError(error_code::kTransportError, "Session not found"));
    }
    track(stream);

    // initialize has to land before the members that depend on it
    std::vector<json> deferred;
    deferred.reserve(messages.size());
    for (auto& message : messages) {
        if (!is_initialize(message)) {
            deferred.push_back(std::move(message));
            continue;
        }
        try {
            if (auto response = router_.handle_message(message, session_id)) {
                stream->push(*response);
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to route streamed message on session {}: {}", session_id, e.what());
        }
    }
    if (deferred.empty()) {
        stream->finish();
    }

    auto remaining = std::make_shared<std::atomic<size_t>>(deferred.size());
    try {
        for (auto& message : deferred) {
            batch_pool_.submit([this, stream, remaining, session_id, message = std::move(message)]() {
                try {
                    if (auto response = router_.handle_message(message, session_id)) {
                        stream->push(*response);
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Failed to route streamed message on session {}: {}", session_id, e.what());
                }
                if (remaining->fetch_sub(1) == 1) {
                    stream->finish();
                }
            });
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to schedule batch on session {}: {}", session_id, e.what());
        stream->close();
        sessions_.unbind_stream(session_id, stream->handle());
        untrack(stream->handle());
        throw;
    }

    Reply reply;
    reply.mode = DeliveryMode::Stream;
    reply.stream = std::move(stream);
    reply.generation = attachment.generation;
    return reply;
}

Reply StreamMultiplexer::handle_get(const InboundCall& call) {
    if (!accepts_event_stream(call.accept)) {
        return error_reply(405, McpError(error_code::kTransportError,
                                         "GET requires Accept: text/event-stream"));
    }

    auto resolved = sessions_.resolve(call.session_id);
    if (!resolved) {
        return error_reply(404, McpError(error_code::kTransportError, "Session not found"));
    }
    const std::string session_id = resolved->session_id;

    std::optional<std::uint64_t> last_cursor;
    if (call.last_event_id) {
        last_cursor = parse_event_id(*call.last_event_id);
        if (!last_cursor) {
            spdlog::warn("Ignoring malformed Last-Event-ID on session {}", session_id);
        }
    }

    Reply reply;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto channel = hub_.open_channel(session_id);
        if (!sessions_.bind_stream(session_id, channel->handle())) {
            hub_.drop_session(session_id);
            return error_reply(404, McpError(error_code::kTransportError, "Session not found"));
        }
        if (channel->has_consumer()) {
            spdlog::info("New GET stream supersedes the previous one on session {}", session_id);
        }
        reply.generation = channel->attach(last_cursor).generation;
        streams_[channel->handle()] = channel;
        reply.stream = std::move(channel);
    }

    reply.mode = DeliveryMode::Stream;
    reply.session_id = session_id;
    return reply;
}

Reply StreamMultiplexer::handle_delete(const InboundCall& call) {
    if (!call.session_id || call.session_id->empty()) {
        return error_reply(400, McpError(error_code::kTransportError, "Missing Mcp-Session-Id header"));
    }
    if (!sessions_.terminate(*call.session_id)) {
        return error_reply(404, McpError(error_code::kTransportError, "Session not found"));
    }

    Reply reply;
    reply.status = 200;
    return reply;
}

void StreamMultiplexer::release_stream(const std::shared_ptr<EventStream>& stream, std::uint64_t generation) {
    if (!stream) {
        return;
    }

    std::lock_guard<std::mutex> lock(streams_mutex_);
    stream->detach(generation);
    if (stream->has_consumer()) {
        // superseded, the newer connection owns the binding
        return;
    }
    if (hub_.channel(stream->session_id()) != stream) {
        stream->close();
    }
    sessions_.unbind_stream(stream->session_id(), stream->handle());
    streams_.erase(stream->handle());
    spdlog::debug("Released stream {} of session {}", stream->handle(), stream->session_id());
}

void StreamMultiplexer::on_session_removed(const std::string& session_id, const std::vector<StreamHandle>& streams) {
    std::vector<std::shared_ptr<EventStream>> closing;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto handle : streams) {
            auto it = streams_.find(handle);
            if (it != streams_.end()) {
                closing.push_back(std::move(it->second));
                streams_.erase(it);
            }
        }
        for (auto it = streams_.begin(); it != streams_.end();) {
            if (it->second->session_id() == session_id) {
                closing.push_back(std::move(it->second));
                it = streams_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& stream : closing) {
        stream->close();
    }
    hub_.drop_session(session_id);
    spdlog::debug("Closed {} streams of removed session {}", closing.size(), session_id);
}

void StreamMultiplexer::shutdown() {
    std::vector<std::shared_ptr<EventStream>> closing;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& [handle, stream] : streams_) {
            closing.push_back(std::move(stream));
        }
        streams_.clear();
    }
    for (const auto& stream : closing) {
        stream->close();
    }
    batch_pool_.shutdown();
}

size_t StreamMultiplexer::open_stream_count() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

void StreamMultiplexer::track(const std::shared_ptr<EventStream>& stream) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_[stream->handle()] = stream;
}

void StreamMultiplexer::untrack(StreamHandle handle) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.erase(handle);
}

} // namespace mcpd
