#include "mcp/HttpTransport.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/Builtins.hpp"
#include "tools/EchoTool.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <set>
#include <sstream>
#include <thread>

using namespace mcpd;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

json request(const json& id, const std::string& method, const json& params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

json initialize_params() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"clientInfo", {{"name", "e2e-client"}, {"version", "1.0"}}},
        {"capabilities", json::object()}
    };
}

std::vector<json> parse_lines(const std::string& output) {
    std::vector<json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            messages.push_back(json::parse(line));
        }
    }
    return messages;
}

// Collect the data payloads of an SSE body
std::vector<json> parse_events(const std::string& body) {
    std::vector<json> events;
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 6, "data: ") == 0) {
            events.push_back(json::parse(line.substr(6)));
        }
    }
    return events;
}

} // namespace

TEST(StdioEndToEndTest, FullConversation) {
    std::ostringstream input;
    input << request(1, "initialize", initialize_params()).dump() << "\n"
          << json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump() << "\n"
          << "\n"
          << request(2, "tools/list").dump() << "\n"
          << request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}).dump() << "\n"
          << request(4, "resources/read", {{"uri", "text://hello"}}).dump() << "\n"
          << request(5, "prompts/get", {{"name", "greeting"}, {"arguments", {{"name", "Ada"}}}}).dump() << "\n"
          << "not json\n";

    std::istringstream in(input.str());
    std::ostringstream out;

    Config config;
    config.transport = TransportKind::Stdio;
    MCPServer server(config);
    register_builtins(server);

    StdioTransport transport(in, out);
    server.run(transport);

    auto messages = parse_lines(out.str());
    ASSERT_EQ(messages.size(), 6);

    EXPECT_EQ(messages[0]["result"]["protocolVersion"], kProtocolVersion);
    EXPECT_EQ(messages[0]["result"]["serverInfo"]["name"], "mcpd");
    EXPECT_EQ(messages[1]["result"]["tools"].size(), 2);
    EXPECT_EQ(messages[2]["result"]["content"][0]["text"], "Echo: hello");
    EXPECT_EQ(messages[3]["result"]["contents"][0]["text"], "Hello, World!");
    EXPECT_EQ(messages[4]["result"]["messages"][0]["content"]["text"],
              "Hello, Ada! How can I help you today?");
    EXPECT_EQ(messages[5]["error"]["code"], error_code::kParseError);
}

class HttpEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        features.tools.register_entry(make_tool_entry(EchoTool::get_info(), [](const json& args) {
            return EchoTool().execute(args);
        }));
        sessions.set_removal_listener([this](const std::string& id, const std::vector<StreamHandle>& streams) {
            multiplexer.on_session_removed(id, streams);
        });
    }

    void TearDown() override {
        multiplexer.shutdown();
        if (http) {
            http->stop();
        }
        sessions.set_removal_listener(nullptr);
    }

    void start(std::shared_ptr<const IAuthenticator> authenticator = std::make_shared<AllowAllAuthenticator>(),
               std::vector<std::string> cors_origins = {"*"}) {
        HttpTransportOptions options;
        options.port = 0;
        options.threads = 4;
        options.cors_origins = std::move(cors_origins);
        http = std::make_unique<HttpTransport>(multiplexer, std::move(authenticator), options);
        http->start();
        ASSERT_GT(http->port(), 0);
        client = std::make_unique<httplib::Client>("127.0.0.1", http->port());
        client->set_read_timeout(5, 0);
    }

    httplib::Result post(const json& body, const std::string& session_id = "",
                         httplib::Headers headers = {}) {
        headers.emplace("Accept", "application/json, text/event-stream");
        if (!session_id.empty()) {
            headers.emplace("Mcp-Session-Id", session_id);
        }
        return client->Post("/mcp", headers, body.dump(), "application/json");
    }

    std::string open_session() {
        auto res = post(request(1, "initialize", initialize_params()));
        EXPECT_TRUE(res);
        if (!res) {
            return "";
        }
        EXPECT_EQ(res->status, 200);
        const std::string id = res->get_header_value("Mcp-Session-Id");
        auto ack = post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, id);
        EXPECT_TRUE(ack);
        if (ack) {
            EXPECT_EQ(ack->status, 202);
        }
        return id;
    }

    Features features;
    SessionStore sessions{60000ms, 0ms};
    NotificationHub hub{64, 256};
    DispatchTable table{features, sessions, hub, ServerIdentity{"e2e-server", "1.2.3", std::nullopt}};
    ProtocolRouter router{table, sessions, 5000ms, 2};
    StreamMultiplexer multiplexer{router, sessions, hub, MultiplexerOptions{}};
    std::unique_ptr<HttpTransport> http;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(HttpEndToEndTest, SessionLifecycle) {
    start();

    auto init = post(request(1, "initialize", initialize_params()));
    ASSERT_TRUE(init);
    EXPECT_EQ(init->status, 200);
    const std::string session_id = init->get_header_value("Mcp-Session-Id");
    ASSERT_FALSE(session_id.empty());

    json init_body = json::parse(init->body);
    EXPECT_EQ(init_body["result"]["serverInfo"]["name"], "e2e-server");
    EXPECT_EQ(init_body["result"]["protocolVersion"], kProtocolVersion);

    auto ack = post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, session_id);
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack->status, 202);
    EXPECT_TRUE(ack->body.empty());

    auto call = post(request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "over http"}}}}),
                     session_id);
    ASSERT_TRUE(call);
    EXPECT_EQ(call->status, 200);
    EXPECT_EQ(call->get_header_value("Mcp-Session-Id"), session_id);
    EXPECT_EQ(json::parse(call->body)["result"]["content"][0]["text"], "Echo: over http");

    auto removed = client->Delete("/mcp", httplib::Headers{{"Mcp-Session-Id", session_id}});
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->status, 200);

    auto after = post(request(3, "ping"), session_id);
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 404);
}

TEST_F(HttpEndToEndTest, TransportErrors) {
    start();

    auto unknown = post(request(1, "ping"), "no-such-session");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);
    EXPECT_EQ(json::parse(unknown->body)["error"]["code"], error_code::kTransportError);

    auto malformed = client->Post("/mcp", std::string("{oops"), "application/json");
    ASSERT_TRUE(malformed);
    EXPECT_EQ(malformed->status, 400);
    EXPECT_EQ(json::parse(malformed->body)["error"]["code"], error_code::kParseError);

    auto no_session = client->Delete("/mcp");
    ASSERT_TRUE(no_session);
    EXPECT_EQ(no_session->status, 400);

    const std::string session_id = open_session();
    auto get = client->Get("/mcp", httplib::Headers{{"Accept", "application/json"},
                                                    {"Mcp-Session-Id", session_id}});
    ASSERT_TRUE(get);
    EXPECT_EQ(get->status, 405);
}

TEST_F(HttpEndToEndTest, BatchStreamedAsEvents) {
    start();
    const std::string session_id = open_session();

    json batch = json::array();
    for (int i = 0; i < 5; ++i) {
        batch.push_back(request(i, "ping"));
    }
    auto res = post(batch, session_id);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);

    auto events = parse_events(res->body);
    ASSERT_EQ(events.size(), 5);
    std::set<int> ids;
    for (const auto& event : events) {
        ids.insert(event["id"].get<int>());
    }
    EXPECT_EQ(ids.size(), 5);

    // the finished stream is released once the response completes
    for (int i = 0; i < 100 && multiplexer.open_stream_count() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(multiplexer.open_stream_count(), 0);
}

TEST_F(HttpEndToEndTest, GetStreamDeliversNotifications) {
    start();
    const std::string session_id = open_session();

    std::string received;
    std::thread listener([&]() {
        httplib::Client sse("127.0.0.1", http->port());
        sse.set_read_timeout(5, 0);
        sse.Get("/mcp", httplib::Headers{{"Accept", "text/event-stream"}, {"Mcp-Session-Id", session_id}},
                [&received](const char* data, size_t length) {
                    received.append(data, length);
                    return received.find("\n\n") == std::string::npos;
                });
    });

    for (int i = 0; i < 200 && multiplexer.open_stream_count() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(multiplexer.open_stream_count(), 1);
    EXPECT_EQ(hub.notify_list_changed("tools"), 1);
    listener.join();

    auto events = parse_events(received);
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0]["method"], "notifications/tools/list_changed");
    EXPECT_EQ(received.compare(0, 4, "id: "), 0);
}

TEST_F(HttpEndToEndTest, PreflightAndOrigin) {
    start(std::make_shared<AllowAllAuthenticator>(), {"http://localhost:3000"});

    auto preflight = client->Options("/mcp", httplib::Headers{{"Origin", "http://localhost:3000"}});
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 204);
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "http://localhost:3000");

    auto foreign = post(request(1, "initialize", initialize_params()), "",
                        httplib::Headers{{"Origin", "http://evil.example"}});
    ASSERT_TRUE(foreign);
    EXPECT_EQ(foreign->status, 403);
    EXPECT_EQ(sessions.size(), 0);
}

TEST_F(HttpEndToEndTest, ApiKeyAuthentication) {
    start(std::make_shared<ApiKeyAuthenticator>(std::vector<std::string>{"secret"}));

    auto anonymous = post(request(1, "initialize", initialize_params()));
    ASSERT_TRUE(anonymous);
    EXPECT_EQ(anonymous->status, 401);
    EXPECT_EQ(anonymous->get_header_value("WWW-Authenticate"), "Bearer");
    EXPECT_EQ(json::parse(anonymous->body)["error"]["code"], error_code::kAuthError);
    EXPECT_EQ(sessions.size(), 0);

    auto bearer = post(request(1, "initialize", initialize_params()), "",
                       httplib::Headers{{"Authorization", "Bearer secret"}});
    ASSERT_TRUE(bearer);
    EXPECT_EQ(bearer->status, 200);

    auto header = post(request(1, "initialize", initialize_params()), "",
                       httplib::Headers{{"X-API-Key", "secret"}});
    ASSERT_TRUE(header);
    EXPECT_EQ(header->status, 200);
    EXPECT_EQ(sessions.size(), 2);
}
