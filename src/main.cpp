#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "mcp/JsonRpc.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/Builtins.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};
    mcpd::MCPServer* global_server = nullptr;

    void signal_handler(int) {
        shutdown_requested = true;
        if (global_server) {
            global_server->request_stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    /**
     * @brief Route logging to stderr (stdout may carry the protocol) and an optional rotating file
     */
    bool configure_logging(const std::string& level_name, const std::optional<std::string>& file) {
        auto level = spdlog::level::from_str(level_name);
        if (level == spdlog::level::off && level_name != "off") {
            std::cerr << "Invalid log level: " << level_name << std::endl;
            return false;
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (file) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(*file, 10 * 1024 * 1024, 3));
        }

        auto logger = std::make_shared<spdlog::logger>("mcpd", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return true;
    }

    int generate_config(const std::string& output, bool force) {
        const std::string text = mcpd::Config{}.to_json().dump(2);
        if (output == "-") {
            std::cout << text << std::endl;
            return 0;
        }
        if (std::filesystem::exists(output) && !force) {
            spdlog::error("Configuration file already exists: {}", output);
            spdlog::error("Use --force to overwrite");
            return 1;
        }

        std::ofstream out(output);
        if (!out) {
            spdlog::error("Cannot write configuration file: {}", output);
            return 1;
        }
        out << text << std::endl;
        spdlog::info("Generated configuration file: {}", output);
        return 0;
    }

    int validate_config(const std::string& file) {
        spdlog::info("Validating configuration file: {}", file);
        try {
            mcpd::Config::from_file(file).validate();
        } catch (const mcpd::ConfigError& e) {
            spdlog::error("Invalid configuration: {}", e.what());
            return 1;
        }
        spdlog::info("Configuration file is valid");
        return 0;
    }

    void show_info(const mcpd::Config& config) {
        std::cout << config.server.name << " " << config.server.version << "\n"
                  << "Protocol version: " << mcpd::kProtocolVersion << "\n"
                  << "Transport: " << mcpd::to_string(config.transport) << "\n"
                  << "Endpoint: http://" << config.http.bind_address << ":" << config.http.port
                  << config.http.endpoint << "\n"
                  << "Features:\n"
                  << "  tools: " << std::boolalpha << config.features.tools << "\n"
                  << "  resources: " << config.features.resources << "\n"
                  << "  prompts: " << config.features.prompts << "\n"
                  << "  logging: " << config.features.logging << "\n"
                  << "  completion: " << config.features.completion << std::endl;
    }

    int start_server(const mcpd::Config& config) {
        mcpd::MCPServer server(config);
        mcpd::register_builtins(server);

        // Store global reference for signal handler
        global_server = &server;
        setup_signal_handlers();

        if (config.transport == mcpd::TransportKind::Stdio) {
            mcpd::StdioTransport transport;
            server.run(transport);
        } else {
            server.start_http();
            while (!shutdown_requested && server.is_running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        server.stop();
        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"mcpd - Model Context Protocol server (JSON-RPC over HTTP and stdio)"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Configuration file (JSON)")->check(CLI::ExistingFile);

    std::optional<std::string> log_level;
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Verbose logging (same as --log-level debug)");

    bool version = false;
    app.add_flag("--version", version, "Print version information");

    auto* start_cmd = app.add_subcommand("start", "Start the MCP server (default)");
    std::optional<std::string> name;
    std::optional<std::string> bind;
    std::optional<std::uint16_t> port;
    bool use_stdio = false;
    start_cmd->add_option("--name", name, "Server name");
    start_cmd->add_option("--bind", bind, "HTTP bind address");
    start_cmd->add_option("--port", port, "HTTP port");
    start_cmd->add_flag("--stdio", use_stdio, "Serve over stdin/stdout instead of HTTP");

    auto* config_cmd = app.add_subcommand("config", "Write a default configuration file");
    std::string output = "mcpd.json";
    bool force = false;
    config_cmd->add_option("-o,--output", output, "Output file ('-' for stdout)");
    config_cmd->add_flag("--force", force, "Overwrite an existing file");

    auto* validate_cmd = app.add_subcommand("validate", "Validate a configuration file");
    std::string validate_file;
    validate_cmd->add_option("file", validate_file, "Configuration file to validate")->required();

    auto* info_cmd = app.add_subcommand("info", "Show server information");

    app.require_subcommand(0, 1);
    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcpd version " << mcpd::Config{}.server.version << std::endl;
        return 0;
    }

    mcpd::Config config;
    try {
        if (!config_file.empty()) {
            config = mcpd::Config::from_file(config_file);
        }
    } catch (const mcpd::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::string level = log_level.value_or(config.logging.level);
    if (verbose && !log_level) {
        level = "debug";
    }
    if (!configure_logging(level, config.logging.file)) {
        return 1;
    }

    if (*config_cmd) {
        return generate_config(output, force);
    }
    if (*validate_cmd) {
        return validate_config(validate_file);
    }
    if (*info_cmd) {
        show_info(config);
        return 0;
    }

    // start, explicitly or by default
    if (name) {
        config.server.name = *name;
    }
    if (bind) {
        config.http.bind_address = *bind;
    }
    if (port) {
        config.http.port = *port;
    }
    if (use_stdio) {
        config.transport = mcpd::TransportKind::Stdio;
    }
    config.logging.level = level;

    spdlog::info("Starting {} {}", config.server.name, config.server.version);
    spdlog::info("Log level: {}", level);

    try {
        return start_server(config);
    } catch (const mcpd::ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
