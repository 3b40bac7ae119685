#include "Config.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>

namespace mcpd {

namespace {

// Integers are range-checked against the target width instead of wrapping
template <typename T>
T read_integer(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }

    constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    constexpr auto min = static_cast<std::int64_t>(std::numeric_limits<T>::min());
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <= max;
    } else {
        const auto number = value.get<std::int64_t>();
        in_range = number >= min && (number < 0 || static_cast<std::uint64_t>(number) <= max);
    }
    if (!in_range) {
        throw ConfigError(std::string("'") + key + "' is out of range: " + value.dump());
    }
    return value.get<T>();
}

template <typename T>
void read_key(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        target = read_integer<T>(*it, key);
    } else {
        target = it->get<T>();
    }
}

template <typename T>
void read_optional(const json& section, const char* key, std::optional<T>& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& section_of(const json& document, const char* name) {
    static const json empty = json::object();
    auto it = document.find(name);
    if (it == document.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

} // namespace

const char* to_string(TransportKind kind) {
    return kind == TransportKind::Stdio ? "stdio" : "http";
}

Config Config::from_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Failed to read config file: " + path.string());
    }

    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return from_json(document);
}

Config Config::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    Config config;
    try {
        const auto& server = section_of(document, "server");
        read_key(server, "name", config.server.name);
        read_key(server, "version", config.server.version);
        read_optional(server, "instructions", config.server.instructions);
        read_key(server, "request_timeout_ms", config.server.request_timeout_ms);
        read_key(server, "worker_threads", config.server.worker_threads);

        const auto& transport = section_of(document, "transport");
        std::string kind = to_string(config.transport);
        read_key(transport, "type", kind);
        if (kind == "http") {
            config.transport = TransportKind::Http;
        } else if (kind == "stdio") {
            config.transport = TransportKind::Stdio;
        } else {
            throw ConfigError("unknown transport type: " + kind);
        }

        const auto& http = section_of(document, "http");
        read_key(http, "bind_address", config.http.bind_address);
        read_key(http, "port", config.http.port);
        read_key(http, "endpoint", config.http.endpoint);
        read_key(http, "cors_origins", config.http.cors_origins);
        read_key(http, "session_timeout_s", config.http.session_timeout_s);
        read_key(http, "sweep_interval_s", config.http.sweep_interval_s);
        read_key(http, "stream_retention", config.http.stream_retention);
        read_key(http, "stream_queue_limit", config.http.stream_queue_limit);
        read_key(http, "prefer_streaming", config.http.prefer_streaming);
        read_key(http, "threads", config.http.threads);

        const auto& auth = section_of(document, "auth");
        read_key(auth, "enabled", config.auth.enabled);
        read_key(auth, "api_keys", config.auth.api_keys);

        const auto& logging = section_of(document, "logging");
        read_key(logging, "level", config.logging.level);
        read_optional(logging, "file", config.logging.file);

        const auto& features = section_of(document, "features");
        read_key(features, "tools", config.features.tools);
        read_key(features, "resources", config.features.resources);
        read_key(features, "prompts", config.features.prompts);
        read_key(features, "logging", config.features.logging);
        read_key(features, "completion", config.features.completion);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    return config;
}

json Config::to_json() const {
    json document = {
        {"server", {
            {"name", server.name},
            {"version", server.version},
            {"request_timeout_ms", server.request_timeout_ms},
            {"worker_threads", server.worker_threads}
        }},
        {"transport", {
            {"type", to_string(transport)}
        }},
        {"http", {
            {"bind_address", http.bind_address},
            {"port", http.port},
            {"endpoint", http.endpoint},
            {"cors_origins", http.cors_origins},
            {"session_timeout_s", http.session_timeout_s},
            {"sweep_interval_s", http.sweep_interval_s},
            {"stream_retention", http.stream_retention},
            {"stream_queue_limit", http.stream_queue_limit},
            {"prefer_streaming", http.prefer_streaming},
            {"threads", http.threads}
        }},
        {"auth", {
            {"enabled", auth.enabled},
            {"api_keys", auth.api_keys}
        }},
        {"logging", {
            {"level", logging.level}
        }},
        {"features", {
            {"tools", features.tools},
            {"resources", features.resources},
            {"prompts", features.prompts},
            {"logging", features.logging},
            {"completion", features.completion}
        }}
    };
    if (server.instructions) {
        document["server"]["instructions"] = *server.instructions;
    }
    if (logging.file) {
        document["logging"]["file"] = *logging.file;
    }
    return document;
}

void Config::validate() const {
    if (server.name.empty()) {
        throw ConfigError("server.name cannot be empty");
    }
    if (server.worker_threads == 0) {
        throw ConfigError("server.worker_threads must be greater than 0");
    }

    if (transport == TransportKind::Http) {
        if (http.port == 0) {
            throw ConfigError("http.port must be greater than 0");
        }
        if (http.endpoint.empty() || http.endpoint.front() != '/') {
            throw ConfigError("http.endpoint must start with '/'");
        }
        if (http.session_timeout_s == 0) {
            throw ConfigError("http.session_timeout_s must be greater than 0");
        }
        if (http.sweep_interval_s == 0) {
            throw ConfigError("http.sweep_interval_s must be greater than 0");
        }
        if (http.threads == 0) {
            throw ConfigError("http.threads must be greater than 0");
        }
    }
    if (http.stream_retention == 0 || http.stream_queue_limit == 0) {
        throw ConfigError("http.stream_retention and http.stream_queue_limit must be greater than 0");
    }

    if (auth.enabled && auth.api_keys.empty()) {
        throw ConfigError("API key authentication enabled but no API keys provided");
    }

    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off") {
        throw ConfigError("unknown logging.level: " + logging.level);
    }
}

} // namespace mcpd
