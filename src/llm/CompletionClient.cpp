#include "llm/CompletionClient.hpp"
#include "service_error.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace support_assistant {

using json = nlohmann::json;

CompletionClient::CompletionClient(ServiceConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport))
{
    if (config_.timeout_ms <= 0) {
        spdlog::warn("⚠️ timeout_ms must be positive (got {}), using {} ms",
                     config_.timeout_ms, ServiceConfig::kDefaultTimeoutMs);
        config_.timeout_ms = ServiceConfig::kDefaultTimeoutMs;
    }
}

json CompletionClient::build_payload(const CompletionRequest& request) const {
    return json{
        {"model", config_.model},
        {"messages", request.messages},
        {"max_tokens", request.max_tokens},
        {"temperature", request.temperature}
    };
}

HttpRequest CompletionClient::build_http_request(const CompletionRequest& request) const {
    const std::string& organization =
        request.organization_name.empty() ? config_.organization_name : request.organization_name;

    HttpRequest http;
    http.url = config_.api_url;
    http.headers = {
        {"Authorization", "Bearer " + config_.api_key},
        {"Content-Type", "application/json"},
        {"HTTP-Referer", config_.referer},
        {"X-Title", organization + " Support Chat"}
    };
    http.body = build_payload(request).dump(-1, ' ', false, json::error_handler_t::replace);
    http.timeout_ms = request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;
    return http;
}

std::string CompletionClient::extract_reply(const std::string& body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) return kFallbackReply;

    auto choices = data.find("choices");
    if (choices == data.end() || !choices->is_array() || choices->empty()) return kFallbackReply;

    const json& first = (*choices)[0];
    if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) return kFallbackReply;

    const json& message = first["message"];
    auto content = message.find("content");
    if (content == message.end() || !content->is_string()) return kFallbackReply;

    std::string reply = content->get<std::string>();
    return reply.empty() ? kFallbackReply : reply;
}

CompletionResponse CompletionClient::complete(const std::vector<ChatMessage>& messages) {
    CompletionRequest request;
    request.messages = messages;
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;
    request.timeout_ms = config_.timeout_ms;
    return complete(request);
}

CompletionResponse CompletionClient::complete(const CompletionRequest& request) {
    if (config_.api_key.empty()) {
        spdlog::error("🚨 OPENROUTER_API_KEY not configured");
        throw ServiceError::config_missing("OPENROUTER_API_KEY");
    }

    spdlog::info("🚀 Sending request to model: {}", config_.model);
    auto start = std::chrono::high_resolution_clock::now();

    HttpRequest http = build_http_request(request);
    HttpResponse r;
    try {
        r = transport_->post(http);
    } catch (const ServiceError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("❌ Unexpected transport error: {}", e.what());
        throw ServiceError::unknown(e.what());
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();

    switch (r.transport) {
        case TransportStatus::TimedOut:
            spdlog::warn("⏱️ Completion request cancelled after {:.0f} ms (budget {} ms)", duration, http.timeout_ms);
            throw ServiceError::timeout(http.timeout_ms);
        case TransportStatus::Failed:
            spdlog::error("❌ Completion transport failure: {}", r.error_message);
            throw ServiceError::unknown(r.error_message);
        case TransportStatus::Completed:
            break;
    }

    if (r.status < 200 || r.status >= 300) {
        throw map_http_status(r.status, r.body);
    }

    CompletionResponse response;
    response.reply = extract_reply(r.body);
    response.model = config_.model;

    spdlog::info("✅ Response received in {:.0f} ms", duration);
    return response;
}

} // namespace support_assistant
