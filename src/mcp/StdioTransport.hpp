#pragma once

#include "ITransport.hpp"
#include <iostream>
#include <mutex>

namespace mcpd {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited JSON payloads from stdin and writes one message
 * per line to stdout with flush. Blank lines are skipped. Logging must go
 * to stderr while this transport is in use.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
};

} // namespace mcpd
