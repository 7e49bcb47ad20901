#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ConfigManager.hpp"
#include "LogManager.hpp"
#include "knowledge_base.hpp"
#include "llm/CompletionClient.hpp"
#include "prompt/ChatTypes.hpp"
#include "retrieval_engine.hpp"

namespace support_assistant {

struct ChatRequest {
    std::string message;
    std::vector<ChatMessage> history;         // already trimmed by the caller; snapshot per call
    std::string organization_name;            // empty: the configured one
    std::optional<std::string> knowledge_context; // precomputed context skips retrieval

    // Parses a POST /chat body. Throws ServiceError (InvalidInput) on a
    // missing message or a field of the wrong type.
    static ChatRequest from_json(const nlohmann::json& body);
};

struct ChatReply {
    std::string reply;
    bool has_context = false;
    std::string model;
};

// The "answer this message" entry point: retrieve, ground, complete.
class ChatService {
public:
    ChatService(
        ServiceConfig config,
        std::shared_ptr<const KnowledgeBase> knowledge_base,
        std::shared_ptr<CompletionClient> client,
        std::shared_ptr<LogManager> logs
    );

    // Throws ServiceError only.
    ChatReply answer(const ChatRequest& request);

    const RetrievalEngine& retriever() const { return engine_; }

private:
    ServiceConfig config_;
    RetrievalEngine engine_;
    std::shared_ptr<CompletionClient> client_;
    std::shared_ptr<LogManager> logs_;

    ChatReply answer_internal(const ChatRequest& request, InteractionLog& entry);
};

} // namespace support_assistant
