#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpd {

using json = nlohmann::json;

struct ServerSection {
    std::string name = "mcpd";
    std::string version = "0.1.0";
    std::optional<std::string> instructions;
    std::uint32_t request_timeout_ms = 30000;  // 0 disables the execution bound
    std::uint32_t worker_threads = 4;
};

enum class TransportKind {
    Http,
    Stdio
};

struct HttpSection {
    std::string bind_address = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string endpoint = "/mcp";
    std::vector<std::string> cors_origins = {"*"};
    std::uint32_t session_timeout_s = 3600;
    std::uint32_t sweep_interval_s = 60;
    std::uint32_t stream_retention = 256;
    std::uint32_t stream_queue_limit = 1024;
    bool prefer_streaming = false;
    std::uint32_t threads = 8;
};

struct AuthSection {
    bool enabled = false;
    std::vector<std::string> api_keys;
};

struct LoggingSection {
    std::string level = "info";
    std::optional<std::string> file;
};

struct FeatureSection {
    bool tools = true;
    bool resources = true;
    bool prompts = true;
    bool logging = true;
    bool completion = true;
};

/**
 * @brief Complete server configuration
 *
 * Every key has a default, so an empty JSON object is a valid config file.
 * Read once at startup; nothing reloads it.
 */
struct Config {
    ServerSection server;
    TransportKind transport = TransportKind::Http;
    HttpSection http;
    AuthSection auth;
    LoggingSection logging;
    FeatureSection features;

    /**
     * @brief Load configuration from a JSON file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static Config from_file(const std::filesystem::path& path);

    /**
     * @brief Build configuration from a parsed JSON document
     * @throws ConfigError on type mismatches
     */
    static Config from_json(const json& document);

    json to_json() const;

    /**
     * @brief Check cross-field constraints
     * @throws ConfigError describing the first violation
     */
    void validate() const;
};

const char* to_string(TransportKind kind);

} // namespace mcpd
