#include "llm/HttpTransport.hpp"
#include <chrono>
#include <cpr/cpr.h>

namespace support_assistant {

HttpResponse CprTransport::post(const HttpRequest& request) {
    cpr::Header header;
    for (const auto& [name, value] : request.headers) {
        header[name] = value;
    }

    cpr::Response r = cpr::Post(cpr::Url{request.url},
                                header,
                                cpr::Body{request.body},
                                cpr::Timeout{std::chrono::milliseconds(request.timeout_ms)});

    HttpResponse out;
    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        out.transport = TransportStatus::TimedOut;
        out.error_message = r.error.message;
        return out;
    }
    if (r.error.code != cpr::ErrorCode::OK) {
        out.transport = TransportStatus::Failed;
        out.error_message = r.error.message;
        return out;
    }

    out.status = r.status_code;
    out.body = std::move(r.text);
    return out;
}

} // namespace support_assistant
