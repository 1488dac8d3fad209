#pragma once
#include "token_validator.hpp"
#include "../server/request.hpp"
#include <string>
#include <vector>

namespace mcpgate {

// Paths that carry tool invocations and the event stream.
const std::vector<std::string>& default_protected_prefixes();

// Unauthenticated discovery surface (well-known documents).
const std::vector<std::string>& default_discovery_prefixes();

struct GateOptions {
    std::vector<std::string> protected_prefixes = default_protected_prefixes();
    std::vector<std::string> discovery_prefixes = default_discovery_prefixes();
};

enum class GateOutcome { Forwarded, Rejected };

struct GateDecision {
    GateOutcome outcome = GateOutcome::Forwarded;
    ServerResponse rejection;   // populated only when Rejected

    bool forwarded() const { return outcome == GateOutcome::Forwarded; }
};

// Token from "Bearer <token>": scheme case-insensitive, exactly two
// whitespace-separated parts. Anything else yields "".
std::string extract_bearer_token(const std::string& authorization_header);

// Pipeline stage deciding whether one request may reach the route handlers.
class AuthorizationGate {
public:
    // The validator must outlive the gate.
    explicit AuthorizationGate(TokenValidator& validator, GateOptions options = {});

    // On Forwarded for a protected path, the validated payload is stored in
    // req.auth and the Authorization header is removed from req.
    GateDecision evaluate(ServerRequest& req) const;

    bool is_protected(const std::string& path) const;
    bool is_discovery(const std::string& path) const;

private:
    TokenValidator& validator_;
    GateOptions options_;
};

} // namespace mcpgate
