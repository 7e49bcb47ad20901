#include "prompt/ConversationBuilder.hpp"

namespace support_assistant {

bool ConversationBuilder::is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

std::string ConversationBuilder::build_system_prompt(const std::string& context, bool has_context) const {
    if (!has_context) {
        return
            "You are a professional customer support agent for " + organization_name_ + ".\n\n"
            "CRITICAL: The user's question does not match any information in your knowledge base.\n\n"
            "You MUST respond with exactly:\n"
            "\"" + std::string(kNoInformationReply) + "\"\n\n"
            "Do NOT attempt to answer the question. Do NOT make up any information.";
    }

    return
        "You are a professional customer support agent for " + organization_name_ + ".\n\n"
        "STRICT RULES YOU MUST FOLLOW:\n"
        "1. Answer ONLY using the information provided in the CONTEXT below.\n"
        "2. If the CONTEXT doesn't fully answer the question, say what you know and mention you don't have more details.\n"
        "3. NEVER invent or assume information not in the CONTEXT.\n"
        "4. Be helpful, professional, and concise.\n"
        "5. Use a friendly but professional tone.\n"
        "6. When answering questions, synthesize the information naturally - don't just quote the sources.\n\n"
        "CONTEXT FROM KNOWLEDGE BASE:\n" + context + "\n\n"
        "---END OF CONTEXT---\n\n"
        "Answer the user's question using ONLY the information above. If you cannot answer from the context, say \"" +
        std::string(kPartialInformationReply) + "\"";
}

Conversation ConversationBuilder::build(
    const std::string& user_message,
    const std::string& context,
    const std::vector<ChatMessage>& history,
    size_t max_history) const
{
    Conversation conversation;
    conversation.has_context = !is_blank(context);

    conversation.messages.push_back({Role::System, build_system_prompt(context, conversation.has_context)});

    // Only the leading system message may carry the system role.
    std::vector<const ChatMessage*> turns;
    for (const auto& message : history) {
        if (message.role != Role::System) turns.push_back(&message);
    }

    size_t first = turns.size() > max_history ? turns.size() - max_history : 0;
    for (size_t i = first; i < turns.size(); ++i) {
        conversation.messages.push_back(*turns[i]);
    }

    conversation.messages.push_back({Role::User, user_message});
    return conversation;
}

} // namespace support_assistant
