#include "query_tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace support_assistant {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "and", "are", "as", "at", "be", "by", "for", "from",
        "has", "he", "in", "is", "it", "its", "of", "on", "or", "that",
        "the", "to", "was", "were", "will", "with", "what", "where", "when",
        "who", "why", "how", "can", "could", "would", "should", "do", "does",
        "did", "have", "had", "i", "my", "me", "we", "you", "your", "they",
        "this", "these", "those", "am", "been", "being", "there", "here",
        "just", "about", "also", "some", "any", "all", "more", "other",
        "such", "no", "not", "only", "same", "so", "than", "too", "very"
    };
    return words;
}

bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

} // namespace

bool QueryTokenizer::is_stop_word(const std::string& word) {
    return stop_words().count(word) > 0;
}

TermSet QueryTokenizer::extract_terms(const std::string& query) {
    // Lowercase and blank out everything that is neither a word character nor whitespace.
    std::string normalized;
    normalized.reserve(query.size());
    for (unsigned char c : query) {
        if (is_word_char(c)) {
            normalized.push_back(static_cast<char>(std::tolower(c)));
        } else {
            normalized.push_back(' ');
        }
    }

    TermSet terms;
    std::istringstream stream(normalized);
    std::string word;
    while (stream >> word) {
        if (word.size() < kMinTermLength) continue;
        if (is_stop_word(word)) continue;
        if (std::find(terms.begin(), terms.end(), word) != terms.end()) continue;
        terms.push_back(word);
    }
    return terms;
}

} // namespace support_assistant
