#pragma once
#include <string>
#include <vector>

namespace support_assistant {

// Deduplicated query terms in first-seen order. Entries are lowercase,
// longer than two characters and never stop words.
using TermSet = std::vector<std::string>;

class QueryTokenizer {
public:
    static TermSet extract_terms(const std::string& query);
    static bool is_stop_word(const std::string& word);

    static constexpr size_t kMinTermLength = 3;
};

} // namespace support_assistant
