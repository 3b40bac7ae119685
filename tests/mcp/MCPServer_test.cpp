#include "mcp/JsonRpc.hpp"
#include "mcp/MCPServer.hpp"
#include "MockTransport.hpp"
#include <gtest/gtest.h>

using namespace mcpd;
using json = nlohmann::json;

namespace {

json request(int id, const std::string& method, const json& params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Config stdio_config() {
    Config config;
    config.transport = TransportKind::Stdio;
    config.server.name = "test-server";
    config.server.worker_threads = 2;
    return config;
}

} // namespace

class MCPServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<MCPServer>(stdio_config());
    }

    // Handshake every session needs before other requests are served
    void push_handshake() {
        transport.push_request(request(100, "initialize", {
            {"protocolVersion", kProtocolVersion},
            {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}},
            {"capabilities", json::object()}
        }));
        transport.push_request({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    }

    json pop_handshake() {
        return transport.pop_response();
    }

    MockTransport transport;
    std::unique_ptr<MCPServer> server;
};

TEST_F(MCPServerTest, ToolsListEmpty) {
    push_handshake();
    transport.push_request(request(1, "tools/list"));

    server->run(transport);

    json init = pop_handshake();
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "test-server");

    json response = transport.pop_response();
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    ASSERT_TRUE(response["result"]["tools"].is_array());
    EXPECT_EQ(response["result"]["tools"].size(), 0);
    EXPECT_FALSE(transport.has_responses());
}

TEST_F(MCPServerTest, RegisterAndCallTool) {
    ToolInfo info{
        "test_tool",
        "A test tool",
        {
            {"type", "object"},
            {"properties", {
                {"input", {{"type", "string"}}}
            }}
        }
    };

    bool tool_called = false;
    server->register_tool(info, [&tool_called](const json& args) -> json {
        tool_called = true;
        return {{"result", "success"}, {"input", args["input"]}};
    });

    push_handshake();
    transport.push_request(request(1, "tools/list"));
    transport.push_request(request(2, "tools/call", {
        {"name", "test_tool"},
        {"arguments", {{"input", "test_value"}}}
    }));

    server->run(transport);
    pop_handshake();

    json list_response = transport.pop_response();
    ASSERT_EQ(list_response["result"]["tools"].size(), 1);
    EXPECT_EQ(list_response["result"]["tools"][0]["name"], "test_tool");

    json call_response = transport.pop_response();
    EXPECT_EQ(call_response["id"], 2);
    EXPECT_TRUE(tool_called);
    EXPECT_EQ(call_response["result"]["isError"], false);
    const std::string text = call_response["result"]["content"][0]["text"];
    EXPECT_EQ(json::parse(text)["input"], "test_value");
}

TEST_F(MCPServerTest, CallNonexistentTool) {
    push_handshake();
    transport.push_request(request(1, "tools/call", {
        {"name", "nonexistent_tool"},
        {"arguments", json::object()}
    }));

    server->run(transport);
    pop_handshake();

    json response = transport.pop_response();
    EXPECT_EQ(response["id"], 1);
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], error_code::kToolError);
}

TEST_F(MCPServerTest, InvalidMethod) {
    push_handshake();
    transport.push_request(request(1, "invalid/method"));

    server->run(transport);
    pop_handshake();

    json response = transport.pop_response();
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["error"]["code"], error_code::kMethodNotFound);
}

TEST_F(MCPServerTest, RequestBeforeInitializeRejected) {
    transport.push_request(request(1, "tools/list"));
    transport.push_request(request(2, "ping"));

    server->run(transport);

    json rejected = transport.pop_response();
    EXPECT_EQ(rejected["error"]["code"], error_code::kInvalidRequest);
    json ping = transport.pop_response();
    EXPECT_EQ(ping["id"], 2);
    EXPECT_TRUE(ping.contains("result"));
}

TEST_F(MCPServerTest, MalformedPayloadAnsweredWithParseError) {
    transport.push_raw("{\"jsonrpc\": \"2.0\", \"id\": ");
    transport.push_request(request(2, "ping"));

    server->run(transport);

    json error = transport.pop_response();
    EXPECT_TRUE(error["id"].is_null());
    EXPECT_EQ(error["error"]["code"], error_code::kParseError);

    // the loop keeps serving after a bad line
    EXPECT_EQ(transport.pop_response()["id"], 2);
}

TEST_F(MCPServerTest, BatchAnsweredWithArray) {
    push_handshake();
    transport.push_raw(json::array({request(1, "ping"), request(2, "tools/list")}).dump());

    server->run(transport);
    pop_handshake();

    json batch = transport.pop_response();
    ASSERT_TRUE(batch.is_array());
    EXPECT_EQ(batch.size(), 2);
}

TEST_F(MCPServerTest, MultipleRequests) {
    ToolInfo info{"counter", "Counts calls", {{"type", "object"}}};
    int call_count = 0;

    server->register_tool(info, [&call_count](const json&) -> json {
        call_count++;
        return {{"count", call_count}};
    });

    push_handshake();
    for (int i = 1; i <= 3; i++) {
        transport.push_request(request(i, "tools/call", {
            {"name", "counter"},
            {"arguments", json::object()}
        }));
    }

    server->run(transport);
    pop_handshake();

    EXPECT_EQ(call_count, 3);
    int response_count = 0;
    while (transport.has_responses()) {
        json response = transport.pop_response();
        response_count++;
        EXPECT_EQ(response["id"], response_count);
    }
    EXPECT_EQ(response_count, 3);
}

TEST_F(MCPServerTest, ListChangedWrittenBeforeNextReply) {
    ToolInfo info{"adder", "Registers another tool", {{"type", "object"}}};
    MCPServer* raw = server.get();
    server->register_tool(info, [raw](const json&) -> json {
        raw->register_tool({"added", "Added at runtime", {{"type", "object"}}},
                           [](const json&) -> json { return "added"; });
        return "done";
    });

    push_handshake();
    transport.push_request(request(1, "tools/call", {{"name", "adder"}, {"arguments", json::object()}}));

    server->run(transport);
    pop_handshake();

    json notification = transport.pop_response();
    EXPECT_EQ(notification["method"], "notifications/tools/list_changed");
    EXPECT_FALSE(notification.contains("id"));

    json reply = transport.pop_response();
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"]["content"][0]["text"], "done");
    EXPECT_TRUE(server->features().tools.contains("added"));
}

TEST_F(MCPServerTest, SessionEndsWithInput) {
    push_handshake();
    server->run(transport);

    EXPECT_FALSE(server->is_running());
    EXPECT_EQ(server->sessions().size(), 0);
    EXPECT_EQ(server->hub().channel_count(), 0);
}

TEST_F(MCPServerTest, DuplicateRegistrationRejected) {
    ToolInfo info{"dup", "", {{"type", "object"}}};
    server->register_tool(info, [](const json&) -> json { return 1; });
    EXPECT_THROW(server->register_tool(info, [](const json&) -> json { return 2; }), RegistryError);
    EXPECT_NO_THROW(server->register_tool(info, [](const json&) -> json { return 3; }, RegisterMode::Replace));
    EXPECT_EQ(server->features().tools.size(), 1);

    server->unregister_tool("dup");
    EXPECT_THROW(server->unregister_tool("dup"), RegistryError);
}

TEST(MCPServerConfigTest, InvalidConfigRejected) {
    Config config;
    config.http.port = 0;
    EXPECT_THROW(MCPServer server(config), ConfigError);
}

TEST(MCPServerConfigTest, HttpStartRequiresHttpTransport) {
    MCPServer server(stdio_config());
    EXPECT_EQ(server.multiplexer(), nullptr);
    EXPECT_THROW(server.start_http(), std::runtime_error);
}

TEST(MCPServerConfigTest, DisabledFeaturesHiddenFromCapabilities) {
    Config config = stdio_config();
    config.features.prompts = false;
    config.features.completion = false;
    MCPServer server(config);

    json caps = server.features().capabilities();
    EXPECT_FALSE(caps.contains("prompts"));
    EXPECT_FALSE(caps.contains("completions"));
    EXPECT_TRUE(caps.contains("tools"));
}
