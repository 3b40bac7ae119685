#include "MockTransport.hpp"

namespace mcpd {

std::optional<std::string> MockTransport::read_message() {
    if (!open_ || requests_.empty()) {
        return std::nullopt;  // EOF
    }

    std::string request = std::move(requests_.front());
    requests_.pop();
    return request;
}

void MockTransport::write_message(const json& message) {
    if (open_) {
        responses_.push(message);
    }
}

bool MockTransport::is_open() const {
    return open_;
}

void MockTransport::push_request(const json& request) {
    requests_.push(request.dump());
}

void MockTransport::push_raw(const std::string& payload) {
    requests_.push(payload);
}

json MockTransport::pop_response() {
    if (responses_.empty()) {
        return json();
    }

    json response = responses_.front();
    responses_.pop();
    return response;
}

bool MockTransport::has_responses() const {
    return !responses_.empty();
}

void MockTransport::close() {
    open_ = false;
}

} // namespace mcpd
