#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mcpd {

/**
 * @brief Credentials presented with an HTTP request
 */
struct Credentials {
    std::optional<std::string> bearer_token;  // Authorization: Bearer <token>
    std::optional<std::string> api_key;       // X-API-Key
};

/**
 * @brief Authenticated caller
 */
struct Principal {
    std::string id;
};

/**
 * @brief Abstract interface for credential verification
 *
 * Consulted by the HTTP binding before a request reaches the router.
 */
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    /**
     * @brief Verify credentials
     * @return Principal, or nullopt when the caller is not authorized
     */
    virtual std::optional<Principal> authenticate(const Credentials& credentials) const = 0;
};

/**
 * @brief Accepts every caller as "anonymous"
 */
class AllowAllAuthenticator : public IAuthenticator {
public:
    std::optional<Principal> authenticate(const Credentials& credentials) const override;
};

/**
 * @brief Accepts callers presenting one of a fixed set of API keys
 *
 * The key may arrive as a bearer token or in X-API-Key; the bearer token
 * wins when both are present.
 */
class ApiKeyAuthenticator : public IAuthenticator {
public:
    explicit ApiKeyAuthenticator(std::vector<std::string> api_keys);

    std::optional<Principal> authenticate(const Credentials& credentials) const override;

private:
    std::vector<std::string> api_keys_;
};

/**
 * @brief Split an Authorization header into its bearer token
 * @return Token, or nullopt for other schemes
 */
std::optional<std::string> parse_bearer_token(const std::string& authorization);

} // namespace mcpd
