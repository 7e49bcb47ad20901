#include "chat_service.hpp"
#include "prompt/ConversationBuilder.hpp"
#include "service_error.hpp"
#include <chrono>
#include <ctime>
#include <spdlog/spdlog.h>

namespace support_assistant {

namespace {

// Absent and null both mean "not supplied".
std::optional<std::string> optional_string(const nlohmann::json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ServiceError::invalid_input(std::string(field) + " must be a string");
    }
    return it->get<std::string>();
}

} // namespace

ChatRequest ChatRequest::from_json(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ServiceError::invalid_input("request body must be an object");
    }

    ChatRequest request;
    auto message = optional_string(body, "message");
    if (!message) {
        throw ServiceError::invalid_input("message missing or not a string");
    }
    request.message = std::move(*message);
    request.organization_name = optional_string(body, "companyName").value_or("");
    request.knowledge_context = optional_string(body, "knowledgeContext");

    auto history = body.find("conversationHistory");
    if (history == body.end() || history->is_null()) return request;
    if (!history->is_array()) {
        throw ServiceError::invalid_input("conversationHistory must be an array");
    }
    for (const auto& item : *history) {
        if (!item.is_object() || !item.contains("role") || !item["role"].is_string() ||
            !item.contains("content") || !item["content"].is_string()) {
            throw ServiceError::invalid_input("malformed conversationHistory entry");
        }
        auto role = parse_role(item["role"].get<std::string>());
        if (!role) {
            throw ServiceError::invalid_input("unknown role in conversationHistory");
        }
        request.history.push_back({*role, item["content"].get<std::string>()});
    }
    return request;
}

ChatService::ChatService(
    ServiceConfig config,
    std::shared_ptr<const KnowledgeBase> knowledge_base,
    std::shared_ptr<CompletionClient> client,
    std::shared_ptr<LogManager> logs)
    : config_(std::move(config)),
      engine_(std::move(knowledge_base)),
      client_(std::move(client)),
      logs_(std::move(logs)) {}

ChatReply ChatService::answer(const ChatRequest& request) {
    auto start_time = std::chrono::high_resolution_clock::now();

    InteractionLog entry{};
    entry.timestamp = std::time(nullptr);
    entry.organization = request.organization_name.empty() ? config_.organization_name : request.organization_name;
    entry.user_query = request.message;
    entry.model = client_->model();
    entry.status = 200;

    auto record = [&]() {
        entry.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start_time).count();
        if (logs_) logs_->add_log(entry);
    };

    try {
        ChatReply reply = answer_internal(request, entry);
        record();
        spdlog::info("[chat] Response generated successfully");
        return reply;
    } catch (const ServiceError& e) {
        entry.status = e.status();
        entry.error_kind = error_kind_name(e.kind());
        record();
        spdlog::error("[chat] {} ({}): {}", entry.error_kind, e.status(), e.what());
        throw;
    } catch (const std::exception& e) {
        ServiceError wrapped = ServiceError::unknown(e.what());
        entry.status = wrapped.status();
        entry.error_kind = error_kind_name(wrapped.kind());
        record();
        spdlog::error("[chat] Unexpected error: {}", e.what());
        throw wrapped;
    }
}

ChatReply ChatService::answer_internal(const ChatRequest& request, InteractionLog& entry) {
    if (request.message.empty()) {
        spdlog::error("[chat] Invalid message received");
        throw ServiceError::invalid_input("Message is required");
    }

    spdlog::info("[chat] Processing for {}: \"{}\"", entry.organization, request.message);

    // 1. Context: caller-supplied, or retrieved from the corpus
    std::string context;
    entry.term_count = static_cast<int>(QueryTokenizer::extract_terms(request.message).size());
    if (request.knowledge_context) {
        context = *request.knowledge_context;
        spdlog::info("[chat] Knowledge context provided: {}", context.empty() ? "no" : "yes");
    } else {
        RetrievedContext retrieved = engine_.retrieve_context(request.message, config_.top_k, config_.min_score);
        context = std::move(retrieved.context);
        for (const auto& chunk : retrieved.chunks) {
            entry.chunk_ids.push_back(chunk->id);
        }
    }

    // 2. Grounded conversation
    ConversationBuilder builder(entry.organization);
    Conversation conversation = builder.build(request.message, context, request.history, config_.max_history);
    entry.has_context = conversation.has_context;

    // 3. Completion
    CompletionRequest completion;
    completion.messages = std::move(conversation.messages);
    completion.max_tokens = config_.max_tokens;
    completion.temperature = config_.temperature;
    completion.timeout_ms = config_.timeout_ms;
    completion.organization_name = entry.organization;

    CompletionResponse response = client_->complete(completion);

    ChatReply reply;
    reply.reply = std::move(response.reply);
    reply.has_context = conversation.has_context;
    reply.model = std::move(response.model);
    return reply;
}

} // namespace support_assistant
