#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcpd {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            spdlog::debug("Skipping blank input line");
            continue;
        }
        spdlog::debug("Read message: {}", line);
        return line;
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return std::nullopt;
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        out_ << serialized << std::endl;  // std::endl flushes automatically
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace mcpd
