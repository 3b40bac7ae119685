#include "MCPServer.hpp"
#include "mcp/JsonRpc.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpd {

namespace {

std::chrono::milliseconds seconds_to_ms(std::uint32_t seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds) * 1000);
}

const Config& validated(const Config& config) {
    config.validate();
    return config;
}

bool is_http(const Config& config) {
    return config.transport == TransportKind::Http;
}

} // namespace

MCPServer::MCPServer(const Config& config)
    : config_(validated(config)),
      sessions_(is_http(config) ? seconds_to_ms(config.http.session_timeout_s) : std::chrono::milliseconds(0),
                is_http(config) ? seconds_to_ms(config.http.sweep_interval_s) : std::chrono::milliseconds(0)),
      hub_(config.http.stream_retention, config.http.stream_queue_limit),
      dispatch_(features_, sessions_, hub_,
                ServerIdentity{config.server.name, config.server.version, config.server.instructions}),
      router_(dispatch_, sessions_, std::chrono::milliseconds(config.server.request_timeout_ms),
              config.server.worker_threads) {
    features_.tools.set_enabled(config_.features.tools);
    features_.resources.set_enabled(config_.features.resources);
    features_.resource_templates.set_enabled(config_.features.resources);
    features_.prompts.set_enabled(config_.features.prompts);
    features_.logging_enabled = config_.features.logging;
    features_.completion_enabled = config_.features.completion;

    auto announce = [this](const std::string& kind) { hub_.notify_list_changed(kind); };
    features_.tools.set_change_listener(announce);
    features_.resources.set_change_listener(announce);
    features_.resource_templates.set_change_listener(announce);
    features_.prompts.set_change_listener(announce);

    if (is_http(config_)) {
        MultiplexerOptions options;
        options.prefer_streaming = config_.http.prefer_streaming;
        options.stream_queue_limit = config_.http.stream_queue_limit;
        options.batch_threads = config_.server.worker_threads;
        multiplexer_ = std::make_unique<StreamMultiplexer>(router_, sessions_, hub_, options);

        sessions_.set_removal_listener([this](const std::string& session_id,
                                              const std::vector<StreamHandle>& streams) {
            multiplexer_->on_session_removed(session_id, streams);
        });
    } else {
        sessions_.set_removal_listener([this](const std::string& session_id, const std::vector<StreamHandle>&) {
            hub_.drop_session(session_id);
        });
    }

    spdlog::info("MCPServer {} {} initialized ({} transport)",
                 config_.server.name, config_.server.version, to_string(config_.transport));
}

MCPServer::~MCPServer() {
    stop();
    sessions_.set_removal_listener(nullptr);
    router_.shutdown();
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler, RegisterMode mode, int priority,
                              EntryOrigin origin) {
    features_.tools.register_entry(make_tool_entry(info, std::move(handler), priority, origin), mode);
}

void MCPServer::register_resource(const ResourceInfo& info, ResourceHandler handler, RegisterMode mode,
                                  int priority, EntryOrigin origin) {
    features_.resources.register_entry(make_resource_entry(info, std::move(handler), priority, origin), mode);
}

void MCPServer::register_resource_template(const ResourceTemplateInfo& info, ResourceHandler handler,
                                           RegisterMode mode, int priority, EntryOrigin origin) {
    features_.resource_templates.register_entry(
        make_resource_template_entry(info, std::move(handler), priority, origin), mode);
}

void MCPServer::register_prompt(const PromptInfo& info, PromptHandler handler, RegisterMode mode, int priority,
                                EntryOrigin origin) {
    features_.prompts.register_entry(make_prompt_entry(info, std::move(handler), priority, origin), mode);
}

void MCPServer::unregister_tool(const std::string& name) {
    features_.tools.unregister(name);
}

void MCPServer::unregister_resource(const std::string& uri) {
    features_.resources.unregister(uri);
}

void MCPServer::unregister_prompt(const std::string& name) {
    features_.prompts.unregister(name);
}

size_t MCPServer::notify_resource_updated(const std::string& uri) {
    return hub_.notify_resource_updated(uri);
}

size_t MCPServer::log_message(LogLevel level, const std::string& logger, const json& data) {
    if (!features_.logging_enabled.load()) {
        return 0;
    }
    return hub_.log_message(level, logger, data);
}

void MCPServer::run(ITransport& transport) {
    const std::string session_id = sessions_.create();
    auto channel = hub_.open_channel(session_id);
    const auto generation = channel->attach().generation;
    sessions_.bind_stream(session_id, channel->handle());

    running_ = true;
    spdlog::info("MCPServer starting main loop on session {}", session_id);

    while (running_ && transport.is_open()) {
        auto payload = transport.read_message();
        if (!payload) {
            spdlog::info("Input closed, stopping server");
            break;
        }

        sessions_.touch(session_id);
        std::optional<json> reply;
        try {
            reply = router_.handle_payload(*payload, session_id);
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            reply = make_error_response(nullptr, McpError::internal_error(e.what()));
        }

        flush_notifications(transport, *channel, generation);
        if (reply) {
            transport.write_message(*reply);
        }
    }

    flush_notifications(transport, *channel, generation);
    channel->detach(generation);
    sessions_.terminate(session_id);

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::flush_notifications(ITransport& transport, EventStream& channel, std::uint64_t generation) {
    StreamEvent event;
    while (channel.next(generation, std::chrono::milliseconds(0), event) == EventStream::WaitStatus::Event) {
        transport.write_message(event.message);
    }
}

void MCPServer::start_http() {
    if (!multiplexer_) {
        throw std::runtime_error("HTTP transport is not configured");
    }
    if (http_) {
        return;
    }

    std::shared_ptr<const IAuthenticator> authenticator;
    if (config_.auth.enabled) {
        authenticator = std::make_shared<ApiKeyAuthenticator>(config_.auth.api_keys);
    } else {
        authenticator = std::make_shared<AllowAllAuthenticator>();
    }

    HttpTransportOptions options;
    options.bind_address = config_.http.bind_address;
    options.port = config_.http.port;
    options.endpoint = config_.http.endpoint;
    options.cors_origins = config_.http.cors_origins;
    options.threads = config_.http.threads;

    http_ = std::make_unique<HttpTransport>(*multiplexer_, std::move(authenticator), std::move(options));
    http_->start();
    running_ = true;
}

void MCPServer::wait() {
    if (http_) {
        http_->wait();
    }
}

void MCPServer::stop() {
    if (running_.exchange(false)) {
        spdlog::info("MCPServer stop requested");
    }
    // Streams first, so blocked stream writers return before the listener joins them
    if (multiplexer_) {
        multiplexer_->shutdown();
    }
    if (http_) {
        http_->stop();
    }
    sessions_.stop();
}

bool MCPServer::is_running() const {
    if (http_) {
        return http_->is_running();
    }
    return running_.load();
}

int MCPServer::http_port() const {
    return http_ ? http_->port() : -1;
}

} // namespace mcpd
