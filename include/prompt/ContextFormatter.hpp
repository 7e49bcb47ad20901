#pragma once
#include <string>
#include <vector>
#include "chunk_scorer.hpp"

namespace support_assistant {

class ContextFormatter {
public:
    static constexpr const char* kSeparator = "\n\n---\n\n";

    // "[Document N: <title>]\n<content>" blocks in rank order. An empty result
    // list yields an empty string, which downstream means "no context".
    static std::string format(const std::vector<RetrievalResult>& results,
                              size_t max_chars = std::string::npos);
};

} // namespace support_assistant
