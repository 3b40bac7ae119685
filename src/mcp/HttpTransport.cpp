#include "HttpTransport.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpd {

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";
constexpr const char* kLastEventHeader = "Last-Event-ID";
constexpr const char* kKeepAliveFrame = ": keep-alive\n\n";

void set_json_error(httplib::Response& res, int status, const McpError& error) {
    res.status = status;
    res.set_content(make_error_response(nullptr, error).dump(), "application/json");
}

} // namespace

HttpTransport::HttpTransport(StreamMultiplexer& multiplexer, std::shared_ptr<const IAuthenticator> authenticator,
                             HttpTransportOptions options)
    : multiplexer_(multiplexer),
      authenticator_(std::move(authenticator)),
      options_(std::move(options)) {
    if (!authenticator_) {
        throw std::invalid_argument("Authenticator cannot be null");
    }

    const unsigned int threads = options_.threads == 0 ? 1 : options_.threads;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setup_routes();
}

HttpTransport::~HttpTransport() {
    stop();
}

bool HttpTransport::origin_allowed(const std::vector<std::string>& allowed, const std::string& origin) {
    for (const auto& pattern : allowed) {
        if (pattern == "*" || pattern == origin) {
            return true;
        }
        if (pattern.size() > 2 && pattern.compare(0, 2, "*.") == 0) {
            const std::string suffix = pattern.substr(1);
            if (origin.size() > suffix.size()
                && origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return true;
            }
        }
    }
    return false;
}

InboundCall HttpTransport::to_call(const httplib::Request& req) {
    InboundCall call;
    call.body = req.body;
    call.accept = req.get_header_value("Accept");
    if (req.has_header(kSessionHeader)) {
        call.session_id = req.get_header_value(kSessionHeader);
    }
    if (req.has_header(kLastEventHeader)) {
        call.last_event_id = req.get_header_value(kLastEventHeader);
    }
    return call;
}

void HttpTransport::apply_cors(const httplib::Request& req, httplib::Response& res) const {
    const std::string origin = req.get_header_value("Origin");
    res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers",
                   "Content-Type, Accept, Authorization, X-API-Key, Mcp-Session-Id, Last-Event-ID");
    res.set_header("Access-Control-Expose-Headers", kSessionHeader);
}

bool HttpTransport::admit(const httplib::Request& req, httplib::Response& res) const {
    if (req.has_header("Origin")) {
        const std::string origin = req.get_header_value("Origin");
        if (!origin_allowed(options_.cors_origins, origin)) {
            spdlog::warn("Rejected request from origin {}", origin);
            set_json_error(res, 403, McpError(error_code::kTransportError, "Origin not allowed"));
            return false;
        }
    }

    Credentials credentials;
    if (req.has_header("Authorization")) {
        credentials.bearer_token = parse_bearer_token(req.get_header_value("Authorization"));
    }
    if (req.has_header("X-API-Key")) {
        credentials.api_key = req.get_header_value("X-API-Key");
    }
    if (!authenticator_->authenticate(credentials)) {
        res.set_header("WWW-Authenticate", "Bearer");
        set_json_error(res, 401, McpError(error_code::kAuthError, "Unauthorized"));
        return false;
    }
    return true;
}

template <typename Handler>
void HttpTransport::serve(const httplib::Request& req, httplib::Response& res, Handler&& handler) {
    apply_cors(req, res);
    if (!admit(req, res)) {
        return;
    }
    try {
        write_reply(handler(to_call(req)), res);
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
        set_json_error(res, 500, McpError::internal_error(e.what()));
    }
    spdlog::debug("{}:{} - \"{} {}\" {}", req.remote_addr, req.remote_port, req.method, req.path, res.status);
}

void HttpTransport::setup_routes() {
    const std::string& endpoint = options_.endpoint;

    server_.Options(endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        apply_cors(req, res);
        res.status = 204;
    });

    server_.Post(endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        serve(req, res, [this](const InboundCall& call) { return multiplexer_.handle_post(call); });
    });

    server_.Get(endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        serve(req, res, [this](const InboundCall& call) { return multiplexer_.handle_get(call); });
    });

    server_.Delete(endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        serve(req, res, [this](const InboundCall& call) { return multiplexer_.handle_delete(call); });
    });
}

void HttpTransport::write_reply(Reply reply, httplib::Response& res) {
    res.status = reply.status;
    if (reply.session_id) {
        res.set_header(kSessionHeader, *reply.session_id);
    }

    switch (reply.mode) {
        case DeliveryMode::Empty:
            return;

        case DeliveryMode::Json:
            res.set_content(reply.body.dump(), "application/json");
            return;

        case DeliveryMode::Stream:
            break;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");

    auto stream = std::move(reply.stream);
    const auto generation = reply.generation;
    res.set_chunked_content_provider(
        "text/event-stream",
        [stream, generation](size_t, httplib::DataSink& sink) {
            StreamEvent event;
            switch (stream->next(generation, StreamMultiplexer::kKeepAliveInterval, event)) {
                case EventStream::WaitStatus::Event: {
                    const std::string frame = EventStream::format(event);
                    return sink.write(frame.data(), frame.size());
                }
                case EventStream::WaitStatus::Timeout: {
                    const std::string frame = kKeepAliveFrame;
                    return sink.write(frame.data(), frame.size());
                }
                case EventStream::WaitStatus::Finished:
                    sink.done();
                    return true;
                case EventStream::WaitStatus::Closed:
                    return false;
            }
            return false;
        },
        [this, stream, generation](bool) {
            multiplexer_.release_stream(stream, generation);
        });
}

void HttpTransport::start() {
    if (running_.load()) {
        return;
    }

    if (options_.port == 0) {
        port_ = server_.bind_to_any_port(options_.bind_address);
    } else {
        port_ = server_.bind_to_port(options_.bind_address, options_.port) ? options_.port : -1;
    }
    if (port_ < 0) {
        throw std::runtime_error("Failed to bind " + options_.bind_address + ":" + std::to_string(options_.port));
    }

    running_ = true;
    listener_ = std::thread([this]() {
        spdlog::info("Listening on http://{}:{}{}", options_.bind_address, port_, options_.endpoint);
        if (!server_.listen_after_bind()) {
            spdlog::error("HTTP listener on port {} stopped with an error", port_);
        }
        running_ = false;
    });

    // stop() is a no-op until the accept loop runs
    while (running_.load() && !server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void HttpTransport::wait() {
    if (listener_.joinable()) {
        listener_.join();
    }
}

void HttpTransport::stop() {
    if (server_.is_running()) {
        spdlog::info("Stopping HTTP listener on port {}", port_);
        server_.stop();
    }
    wait();
    running_ = false;
}

} // namespace mcpd
