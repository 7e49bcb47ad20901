#include "prompt/ContextFormatter.hpp"

namespace support_assistant {

std::string ContextFormatter::format(const std::vector<RetrievalResult>& results, size_t max_chars) {
    std::string context;

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& chunk = results[i].chunk;
        std::string entry = (context.empty() ? std::string() : std::string(kSeparator)) +
                            "[Document " + std::to_string(i + 1) + ": " + chunk->title + "]\n" +
                            chunk->content;

        if (max_chars != std::string::npos && context.length() + entry.length() > max_chars) {
            break;
        }
        context += entry;
    }
    return context;
}

} // namespace support_assistant
