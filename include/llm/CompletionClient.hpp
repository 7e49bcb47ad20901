#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ConfigManager.hpp"
#include "llm/HttpTransport.hpp"
#include "prompt/ChatTypes.hpp"

namespace support_assistant {

struct CompletionRequest {
    std::vector<ChatMessage> messages;
    int max_tokens = 500;
    double temperature = 0.3;
    long timeout_ms = 30000;
    std::string organization_name; // empty: the configured one
};

struct CompletionResponse {
    std::string reply;
    std::string model;
};

class CompletionClient {
public:
    static constexpr const char* kFallbackReply = "I'm sorry, I couldn't generate a response.";

    CompletionClient(ServiceConfig config, std::shared_ptr<HttpTransport> transport);

    // Throws ServiceError for every failure: ConfigMissing without a key,
    // Timeout when the deadline fires, the mapped kind for non-2xx statuses,
    // Unknown for anything else. Never retries.
    CompletionResponse complete(const CompletionRequest& request);

    // Same as above with max_tokens, temperature and timeout from the config.
    CompletionResponse complete(const std::vector<ChatMessage>& messages);

    nlohmann::json build_payload(const CompletionRequest& request) const;
    HttpRequest build_http_request(const CompletionRequest& request) const;

    // choices[0].message.content, or kFallbackReply when missing or empty.
    static std::string extract_reply(const std::string& body);

    const std::string& model() const { return config_.model; }

private:
    ServiceConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace support_assistant
