#include "token_validator.hpp"
#include "../config.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace mcpgate {

std::string validation_error_name(ValidationError err) {
    switch (err) {
        case ValidationError::None:                  return "None";
        case ValidationError::MissingCredential:     return "MissingCredential";
        case ValidationError::ValidationUnreachable: return "ValidationUnreachable";
        case ValidationError::InvalidCredential:     return "InvalidCredential";
        case ValidationError::AudienceMismatch:      return "AudienceMismatch";
        case ValidationError::CredentialExpired:     return "CredentialExpired";
    }
    return "InvalidCredential";
}

ValidationResult ValidationResult::success(nlohmann::json payload) {
    ValidationResult r;
    r.ok = true;
    r.payload = std::move(payload);
    return r;
}

ValidationResult ValidationResult::failure(ValidationError error, std::string message) {
    ValidationResult r;
    r.ok = false;
    r.error = error;
    r.message = std::move(message);
    return r;
}

TokenValidator::TokenValidator(TokenValidatorOptions options, HttpClient& http,
                               Clock clock)
    : options_(std::move(options))
    , max_ttl_(std::max(kMinCacheTtlSeconds, options_.cache_ttl_seconds))
    , http_(http)
    , clock_(clock ? std::move(clock) : Clock(epoch_seconds)) {
    if (options_.client_id.empty()) {
        throw std::invalid_argument("OAuth client_id is required");
    }
    if (options_.introspection_url.empty()) {
        options_.introspection_url = kDefaultIntrospectionUrl;
    }
}

// Number, or a string that parses completely as one.
static std::optional<double> numeric_field(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        try {
            size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double TokenValidator::extract_expiry(const nlohmann::json& payload, uint64_t now) {
    const double fallback = static_cast<double>(now);
    if (payload.contains("exp") && !payload["exp"].is_null()) {
        return numeric_field(payload["exp"]).value_or(fallback);
    }
    if (payload.contains("expires_in") && !payload["expires_in"].is_null()) {
        auto in = numeric_field(payload["expires_in"]);
        return in ? fallback + *in : fallback;
    }
    return fallback;
}

// "aud", or "issued_to" when aud is missing, null or empty. An aud of any
// other non-string type yields nullopt and never matches a client id.
static std::optional<std::string> token_audience(const nlohmann::json& payload) {
    auto it = payload.find("aud");
    bool absent = it == payload.end() || it->is_null() ||
                  (it->is_string() && it->get_ref<const std::string&>().empty());
    if (!absent) {
        if (!it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }
    auto issued = payload.find("issued_to");
    if (issued != payload.end() && issued->is_string()) return issued->get<std::string>();
    return std::string();
}

ValidationResult TokenValidator::validate(const std::string& credential) {
    if (credential.empty()) {
        return ValidationResult::failure(ValidationError::MissingCredential,
                                         "Missing access token");
    }

    uint64_t now = clock_();
    if (auto cached = cache_.get(credential, now)) {
        return ValidationResult::success(std::move(*cached));
    }

    std::string url = options_.introspection_url;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "access_token=" + url_encode(credential);

    HttpResponse resp = http_.get(url, {{"Accept", "application/json"}},
                                  static_cast<long>(options_.timeout_seconds));
    if (resp.status_code == 0) {
        std::string detail = resp.error.empty() ? "no response" : resp.error;
        std::cerr << "[auth] Introspection unreachable: " << detail << "\n";
        return ValidationResult::failure(ValidationError::ValidationUnreachable,
                                         "Token validation failed: " + detail);
    }
    if (resp.status_code != 200) {
        return ValidationResult::failure(ValidationError::InvalidCredential,
                                         "Invalid access token");
    }

    nlohmann::json payload = nlohmann::json::parse(resp.body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object() || payload.empty()) {
        std::cerr << "[auth] Introspection returned a non-object body\n";
        return ValidationResult::failure(ValidationError::InvalidCredential,
                                         "Invalid access token");
    }

    auto audience = token_audience(payload);
    if (!audience || *audience != options_.client_id) {
        return ValidationResult::failure(ValidationError::AudienceMismatch,
                                         "Token audience mismatch");
    }

    double expiry = extract_expiry(payload, now);
    double remaining = expiry - static_cast<double>(now);
    if (!(remaining > 0.0)) {
        return ValidationResult::failure(ValidationError::CredentialExpired,
                                         "Access token expired");
    }

    double ttl = std::min(remaining, static_cast<double>(max_ttl_));
    cache_.put(credential, payload, now + static_cast<uint64_t>(std::floor(ttl)));
    return ValidationResult::success(std::move(payload));
}

size_t TokenValidator::evict_expired() {
    return cache_.evict_expired(clock_());
}

} // namespace mcpgate
