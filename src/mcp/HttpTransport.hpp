#pragma once

#include "mcp/Authenticator.hpp"
#include "mcp/StreamMultiplexer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>

namespace mcpd {

struct HttpTransportOptions {
    std::string bind_address = "127.0.0.1";
    int port = 8080;  // 0 picks an ephemeral port
    std::string endpoint = "/mcp";
    std::vector<std::string> cors_origins = {"*"};
    unsigned int threads = 8;
};

/**
 * @brief HTTP binding of the MCP endpoint on top of cpp-httplib
 *
 * Serves POST, GET, DELETE and OPTIONS on one endpoint. Origin checks and
 * authentication happen here, before the multiplexer sees the call; the
 * multiplexer's Reply is then written as a JSON body or as a chunked
 * text/event-stream response.
 */
class HttpTransport {
public:
    HttpTransport(StreamMultiplexer& multiplexer, std::shared_ptr<const IAuthenticator> authenticator,
                  HttpTransportOptions options);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /**
     * @brief Bind the socket and serve on a background thread
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * @brief Block until the listener thread exits
     */
    void wait();

    /**
     * @brief Stop accepting connections and join the listener (idempotent)
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Bound port, valid after start()
     */
    int port() const { return port_; }

    /**
     * @brief Check an Origin header against the allow list
     *
     * Entries are "*", an exact origin, or "*.suffix" matching any origin
     * ending in ".suffix".
     */
    static bool origin_allowed(const std::vector<std::string>& allowed, const std::string& origin);

private:
    void setup_routes();

    template <typename Handler>
    void serve(const httplib::Request& req, httplib::Response& res, Handler&& handler);

    bool admit(const httplib::Request& req, httplib::Response& res) const;
    void apply_cors(const httplib::Request& req, httplib::Response& res) const;
    void write_reply(Reply reply, httplib::Response& res);

    static InboundCall to_call(const httplib::Request& req);

    StreamMultiplexer& multiplexer_;
    std::shared_ptr<const IAuthenticator> authenticator_;
    HttpTransportOptions options_;

    httplib::Server server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    int port_ = -1;
};

} // namespace mcpd
