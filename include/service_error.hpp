#pragma once
#include <stdexcept>
#include <string>

namespace support_assistant {

enum class ErrorKind {
    InvalidInput,
    Timeout,
    AuthFailure,
    BadUpstreamRequest,
    RateLimited,
    UpstreamError,
    ConfigMissing,
    Unknown
};

const char* error_kind_name(ErrorKind kind);

// Whether the caller may re-invoke with the same inputs. The core never retries.
bool is_retryable(ErrorKind kind);

// One error type for every failure of the answer pipeline. what() holds the
// internal diagnostic; user_message() is the only text that may reach the UI.
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message, int status, std::string user_message);

    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }
    const std::string& user_message() const { return user_message_; }

    static ServiceError invalid_input(const std::string& detail);
    static ServiceError timeout(long timeout_ms);
    static ServiceError auth_failure(long upstream_status);
    static ServiceError bad_upstream_request();
    static ServiceError rate_limited();
    static ServiceError upstream_error(long upstream_status);
    static ServiceError config_missing(const std::string& key);
    static ServiceError unknown(const std::string& detail);

private:
    ErrorKind kind_;
    int status_;
    std::string user_message_;
};

// Maps a non-2xx provider status to its error kind. The body is only logged.
ServiceError map_http_status(long status, const std::string& body);

} // namespace support_assistant
