#pragma once
#include <map>
#include <string>

namespace support_assistant {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 30000;
};

enum class TransportStatus {
    Completed, // a status line arrived, whatever the code
    TimedOut,  // the deadline fired and the transfer was aborted
    Failed     // DNS, TLS, connection reset and the like
};

struct HttpResponse {
    TransportStatus transport = TransportStatus::Completed;
    long status = 0;
    std::string body;
    std::string error_message;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // One POST, bounded by request.timeout_ms. Must not retry.
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

// libcurl-backed transport. The timeout is enforced by curl, which aborts
// the in-flight transfer when it expires.
class CprTransport : public HttpTransport {
public:
    HttpResponse post(const HttpRequest& request) override;
};

} // namespace support_assistant
