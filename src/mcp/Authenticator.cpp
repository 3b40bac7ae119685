#include "Authenticator.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpd {

namespace {

// Compares every byte so the time taken does not reveal the matching prefix
bool keys_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace

std::optional<Principal> AllowAllAuthenticator::authenticate(const Credentials&) const {
    return Principal{"anonymous"};
}

ApiKeyAuthenticator::ApiKeyAuthenticator(std::vector<std::string> api_keys)
    : api_keys_(std::move(api_keys)) {
    if (api_keys_.empty()) {
        throw std::invalid_argument("API key authenticator requires at least one key");
    }
    spdlog::info("API key authentication enabled with {} keys", api_keys_.size());
}

std::optional<Principal> ApiKeyAuthenticator::authenticate(const Credentials& credentials) const {
    const std::optional<std::string>& presented = credentials.bearer_token ? credentials.bearer_token
                                                                           : credentials.api_key;
    if (!presented || presented->empty()) {
        spdlog::warn("Request without credentials rejected");
        return std::nullopt;
    }

    for (size_t i = 0; i < api_keys_.size(); ++i) {
        if (keys_equal(*presented, api_keys_[i])) {
            return Principal{"api-key-" + std::to_string(i)};
        }
    }
    spdlog::warn("Request with invalid API key rejected");
    return std::nullopt;
}

std::optional<std::string> parse_bearer_token(const std::string& authorization) {
    static const std::string scheme = "Bearer ";
    if (authorization.size() <= scheme.size() || authorization.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }
    return authorization.substr(scheme.size());
}

} // namespace mcpd
