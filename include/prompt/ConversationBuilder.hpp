#pragma once
#include <string>
#include <vector>
#include "prompt/ChatTypes.hpp"

namespace support_assistant {

struct Conversation {
    std::vector<ChatMessage> messages;
    bool has_context = false;
};

class ConversationBuilder {
public:
    static constexpr size_t kDefaultMaxHistory = 6;
    static constexpr const char* kNoInformationReply =
        "I'm sorry, I don't have information about that. Please contact our support team for assistance.";
    static constexpr const char* kPartialInformationReply =
        "I don't have specific information about that. Please contact our support team for assistance.";

    explicit ConversationBuilder(std::string organization_name)
        : organization_name_(std::move(organization_name)) {}

    /**
     * System prompt, then the most recent max_history entries of history,
     * then the user message verbatim. System-role entries in history are
     * skipped so the only system message is the first one. The system prompt is the refusal
     * template when context is blank, otherwise the grounded template.
     */
    Conversation build(
        const std::string& user_message,
        const std::string& context,
        const std::vector<ChatMessage>& history,
        size_t max_history = kDefaultMaxHistory
    ) const;

    std::string build_system_prompt(const std::string& context, bool has_context) const;

    static bool is_blank(const std::string& text);

private:
    std::string organization_name_;
};

} // namespace support_assistant
