#include "authorization_gate.hpp"
#include "discovery.hpp"
#include "../util.hpp"

#include <iostream>

namespace mcpgate {

const std::vector<std::string>& default_protected_prefixes() {
    static const std::vector<std::string> prefixes = {"/sse", "/messages", "/messages/"};
    return prefixes;
}

const std::vector<std::string>& default_discovery_prefixes() {
    static const std::vector<std::string> prefixes = {"/.well-known", "/sse/.well-known"};
    return prefixes;
}

std::string extract_bearer_token(const std::string& authorization_header) {
    auto parts = split_whitespace(authorization_header);
    if (parts.size() != 2 || to_lower(parts[0]) != "bearer") return "";
    return parts[1];
}

AuthorizationGate::AuthorizationGate(TokenValidator& validator, GateOptions options)
    : validator_(validator), options_(std::move(options)) {}

static bool matches_any(const std::string& path, const std::vector<std::string>& prefixes) {
    for (const auto& p : prefixes) {
        if (starts_with(path, p)) return true;
    }
    return false;
}

bool AuthorizationGate::is_protected(const std::string& path) const {
    return matches_any(path, options_.protected_prefixes);
}

bool AuthorizationGate::is_discovery(const std::string& path) const {
    return matches_any(path, options_.discovery_prefixes);
}

static ServerResponse unauthorized(const ServerRequest& req, const ValidationResult& result) {
    ServerResponse resp = json_response(401, {
        {"error", "unauthorized"},
        {"reason", validation_error_name(result.error)},
        {"message", result.message}
    });

    std::string challenge = "Bearer";
    if (result.error != ValidationError::MissingCredential) {
        challenge += " error=\"invalid_token\",";
    }
    challenge += " resource_metadata=\"" + protected_resource_metadata_url(request_origin(req)) + "\"";
    resp.headers["WWW-Authenticate"] = challenge;
    return resp;
}

GateDecision AuthorizationGate::evaluate(ServerRequest& req) const {
    GateDecision decision;

    if (req.method == "OPTIONS" || is_discovery(req.path)) return decision;
    if (!is_protected(req.path)) return decision;

    std::string token = extract_bearer_token(req.header("authorization"));
    req.headers.erase("authorization");

    ValidationResult result = validator_.validate(token);
    if (!result.ok) {
        std::cerr << "[auth] Rejected " << req.method << " " << req.path << ": "
                  << validation_error_name(result.error) << "\n";
        decision.outcome = GateOutcome::Rejected;
        decision.rejection = unauthorized(req, result);
        return decision;
    }

    req.auth = std::move(result.payload);
    return decision;
}

} // namespace mcpgate
