#pragma once
#include "expiry_cache.hpp"
#include "../http.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpgate {

enum class ValidationError {
    None,
    MissingCredential,
    ValidationUnreachable,
    InvalidCredential,
    AudienceMismatch,
    CredentialExpired
};

// Stable name used in 401 bodies ("InvalidCredential", ...).
std::string validation_error_name(ValidationError err);

// Either ok with a non-empty payload, or a failure with error + message.
struct ValidationResult {
    bool ok = false;
    nlohmann::json payload;
    ValidationError error = ValidationError::None;
    std::string message;

    static ValidationResult success(nlohmann::json payload);
    static ValidationResult failure(ValidationError error, std::string message);
};

struct TokenValidatorOptions {
    std::string client_id;
    std::string introspection_url;
    uint32_t cache_ttl_seconds = 600;
    uint32_t timeout_seconds = 5;
};

// Validates bearer credentials against a tokeninfo-style introspection
// endpoint and caches successes for min(remaining lifetime, max TTL).
class TokenValidator {
public:
    using Clock = std::function<uint64_t()>;

    // Throws std::invalid_argument if options.client_id is empty.
    // The HttpClient must outlive the validator.
    TokenValidator(TokenValidatorOptions options, HttpClient& http,
                   Clock clock = nullptr);

    ValidationResult validate(const std::string& credential);

    // TTL ceiling after the 30 second floor.
    uint32_t max_ttl() const { return max_ttl_; }

    size_t cached_count() const { return cache_.size(); }
    std::optional<uint64_t> cached_expiry(const std::string& credential) const {
        return cache_.expires_at(credential);
    }

    // Drop expired cache entries; returns how many were removed.
    size_t evict_expired();

    // Absolute expiry from "exp", else now + "expires_in", else now.
    // Accepts numbers and numeric strings; anything unparseable fails closed.
    static double extract_expiry(const nlohmann::json& payload, uint64_t now);

private:
    TokenValidatorOptions options_;
    uint32_t max_ttl_;
    HttpClient& http_;
    Clock clock_;
    ExpiryCache<std::string, nlohmann::json> cache_;
};

} // namespace mcpgate
