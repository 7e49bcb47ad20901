#include "service_error.hpp"
#include <spdlog/spdlog.h>

namespace support_assistant {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:       return "InvalidInput";
        case ErrorKind::Timeout:            return "Timeout";
        case ErrorKind::AuthFailure:        return "AuthFailure";
        case ErrorKind::BadUpstreamRequest: return "BadUpstreamRequest";
        case ErrorKind::RateLimited:        return "RateLimited";
        case ErrorKind::UpstreamError:      return "UpstreamError";
        case ErrorKind::ConfigMissing:      return "ConfigMissing";
        case ErrorKind::Unknown:            return "Unknown";
    }
    return "Unknown";
}

bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:
        case ErrorKind::RateLimited:
        case ErrorKind::UpstreamError:
            return true;
        case ErrorKind::InvalidInput:
        case ErrorKind::AuthFailure:
        case ErrorKind::BadUpstreamRequest:
        case ErrorKind::ConfigMissing:
        case ErrorKind::Unknown:
            return false;
    }
    return false;
}

ServiceError::ServiceError(ErrorKind kind, const std::string& message, int status, std::string user_message)
    : std::runtime_error(message), kind_(kind), status_(status), user_message_(std::move(user_message)) {}

ServiceError ServiceError::invalid_input(const std::string& detail) {
    return ServiceError(ErrorKind::InvalidInput, detail, 400, "Message is required");
}

ServiceError ServiceError::timeout(long timeout_ms) {
    return ServiceError(ErrorKind::Timeout,
                        "Request timeout after " + std::to_string(timeout_ms) + " ms",
                        504,
                        "The AI service took too long to respond. Please try again.");
}

ServiceError ServiceError::auth_failure(long upstream_status) {
    return ServiceError(ErrorKind::AuthFailure,
                        "Authentication failed (" + std::to_string(upstream_status) + ")",
                        500,
                        "AI service authentication failed. Please check API key.");
}

ServiceError ServiceError::bad_upstream_request() {
    return ServiceError(ErrorKind::BadUpstreamRequest, "Bad request", 400, "Invalid request to AI service.");
}

ServiceError ServiceError::rate_limited() {
    return ServiceError(ErrorKind::RateLimited, "Rate limit exceeded", 429,
                        "Service is busy. Please try again in a moment.");
}

ServiceError ServiceError::upstream_error(long upstream_status) {
    return ServiceError(ErrorKind::UpstreamError,
                        "OpenRouter error: " + std::to_string(upstream_status),
                        500,
                        "Failed to generate response. Please try again.");
}

ServiceError ServiceError::config_missing(const std::string& key) {
    return ServiceError(ErrorKind::ConfigMissing, key + " not configured", 500,
                        "AI service not configured. Please add " + key + ".");
}

ServiceError ServiceError::unknown(const std::string& detail) {
    return ServiceError(ErrorKind::Unknown, detail.empty() ? "Unknown error" : detail, 500,
                        "An unexpected error occurred. Please try again.");
}

ServiceError map_http_status(long status, const std::string& body) {
    spdlog::error("❌ Completion API Error [{}]: {}", status, body);

    switch (status) {
        case 429:
            return ServiceError::rate_limited();
        case 401:
        case 403:
            return ServiceError::auth_failure(status);
        case 400:
            return ServiceError::bad_upstream_request();
        default:
            return ServiceError::upstream_error(status);
    }
}

} // namespace support_assistant
