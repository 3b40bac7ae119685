#include "mcp/Authenticator.hpp"
#include "mcp/HttpTransport.hpp"
#include <gtest/gtest.h>

using namespace mcpd;

TEST(AuthenticatorTest, AllowAllAcceptsAnonymous) {
    AllowAllAuthenticator auth;
    auto principal = auth.authenticate(Credentials{});
    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(principal->id, "anonymous");
}

TEST(AuthenticatorTest, ApiKeyFromBearerOrHeader) {
    ApiKeyAuthenticator auth({"k1", "k2"});

    Credentials bearer;
    bearer.bearer_token = "k2";
    auto by_bearer = auth.authenticate(bearer);
    ASSERT_TRUE(by_bearer.has_value());
    EXPECT_EQ(by_bearer->id, "api-key-1");

    Credentials header;
    header.api_key = "k1";
    EXPECT_TRUE(auth.authenticate(header).has_value());
}

TEST(AuthenticatorTest, ApiKeyRejectsMissingOrWrongKey) {
    ApiKeyAuthenticator auth({"secret"});
    EXPECT_FALSE(auth.authenticate(Credentials{}).has_value());

    Credentials wrong;
    wrong.api_key = "secreT";
    EXPECT_FALSE(auth.authenticate(wrong).has_value());

    Credentials prefix;
    prefix.api_key = "secretX";
    EXPECT_FALSE(auth.authenticate(prefix).has_value());
}

TEST(AuthenticatorTest, BearerTokenWinsOverHeader) {
    ApiKeyAuthenticator auth({"good"});
    Credentials both;
    both.bearer_token = "bad";
    both.api_key = "good";
    EXPECT_FALSE(auth.authenticate(both).has_value());
}

TEST(AuthenticatorTest, EmptyKeyListRejected) {
    EXPECT_THROW(ApiKeyAuthenticator(std::vector<std::string>{}), std::invalid_argument);
}

TEST(AuthenticatorTest, ParseBearerToken) {
    EXPECT_EQ(parse_bearer_token("Bearer abc"), std::optional<std::string>("abc"));
    EXPECT_FALSE(parse_bearer_token("Bearer ").has_value());
    EXPECT_FALSE(parse_bearer_token("Basic dXNlcjpwYXNz").has_value());
    EXPECT_FALSE(parse_bearer_token("").has_value());
}

TEST(OriginTest, AllowList) {
    const std::vector<std::string> allowed = {"http://localhost:3000", "*.example.com"};
    EXPECT_TRUE(HttpTransport::origin_allowed(allowed, "http://localhost:3000"));
    EXPECT_TRUE(HttpTransport::origin_allowed(allowed, "https://app.example.com"));
    EXPECT_FALSE(HttpTransport::origin_allowed(allowed, "https://example.com.evil.net"));
    EXPECT_FALSE(HttpTransport::origin_allowed(allowed, "http://localhost:4000"));

    EXPECT_TRUE(HttpTransport::origin_allowed({"*"}, "http://anything"));
    EXPECT_FALSE(HttpTransport::origin_allowed({}, "http://anything"));
}
