#include <catch2/catch.hpp>
#include "auth/discovery.hpp"

using namespace mcpgate;

static ServerRequest with_headers(std::map<std::string, std::string> headers) {
    ServerRequest req;
    req.method = "GET";
    req.path = "/.well-known/oauth-protected-resource";
    req.headers = std::move(headers);
    return req;
}

TEST_CASE("request_origin: host header with http default", "[discovery]") {
    REQUIRE(request_origin(with_headers({{"host", "mcp.example.com:8000"}}))
            == "http://mcp.example.com:8000");
}

TEST_CASE("request_origin: forwarded proto honoured", "[discovery]") {
    auto req = with_headers({{"host", "mcp.example.com"}, {"x-forwarded-proto", "HTTPS, http"}});
    REQUIRE(request_origin(req) == "https://mcp.example.com");
}

TEST_CASE("request_origin: unknown proto and missing host fall back", "[discovery]") {
    auto req = with_headers({{"x-forwarded-proto", "gopher"}});
    REQUIRE(request_origin(req) == "http://localhost");
}

TEST_CASE("authorization_server_metadata: required fields", "[discovery]") {
    auto doc = authorization_server_metadata();
    REQUIRE(doc["issuer"] == kAuthorizationServerIssuer);
    REQUIRE(doc.contains("authorization_endpoint"));
    REQUIRE(doc.contains("token_endpoint"));
    REQUIRE(doc.contains("jwks_uri"));
    REQUIRE(doc["response_types_supported"] == nlohmann::json::array({"code"}));
    REQUIRE(doc["grant_types_supported"] ==
            nlohmann::json::array({"authorization_code", "refresh_token"}));
    REQUIRE(doc["scopes_supported"] == nlohmann::json::array({"openid", "email", "profile"}));
}

TEST_CASE("protected_resource_metadata: resource derived from origin", "[discovery]") {
    auto doc = protected_resource_metadata("https://mcp.example.com");
    REQUIRE(doc["resource"] == "https://mcp.example.com/sse");
    REQUIRE(doc["authorization_servers"] ==
            nlohmann::json::array({kAuthorizationServerIssuer}));
    REQUIRE(doc["scopes_supported"].size() == 3);
}

TEST_CASE("well_known_response: serves known documents", "[discovery]") {
    auto as = well_known_response("oauth-authorization-server", "http://h");
    REQUIRE(as.status == 200);
    REQUIRE(as.content_type == "application/json");
    REQUIRE(nlohmann::json::parse(as.body)["issuer"] == kAuthorizationServerIssuer);

    auto oidc = well_known_response("openid-configuration", "http://h");
    REQUIRE(oidc.status == 200);
    REQUIRE(oidc.body == as.body);

    auto pr = well_known_response("oauth-protected-resource", "http://h");
    REQUIRE(nlohmann::json::parse(pr.body)["resource"] == "http://h/sse");
}

TEST_CASE("well_known_response: unknown document is 404", "[discovery]") {
    auto r = well_known_response("security.txt", "http://h");
    REQUIRE(r.status == 404);
    REQUIRE(nlohmann::json::parse(r.body)["error"] == "not_found");
}
